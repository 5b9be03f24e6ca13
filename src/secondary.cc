/*
 Copyright (C) 2017-2024 Fredrik Öhrström (gpl-3.0-or-later)

 This program is free software: you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation, either version 3 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#include"secondary.h"

#include<ctype.h>

using namespace std;

const char *toString(ProbeResult r)
{
    switch (r)
    {
#define X(name) case ProbeResult::name: return #name;
LIST_OF_PROBE_RESULTS
#undef X
    }
    return "?";
}

bool isValidSecondaryMask(const string &mask)
{
    if (mask.length() != 16) return false;
    for (size_t i=0; i<mask.length(); ++i)
    {
        char c = toupper((uchar)mask[i]);
        // The id is bcd.
        if (i < 8 && !((c >= '0' && c <= '9') || c == 'F')) return false;
        if (i >= 8 && !isHexChar(c)) return false;
    }
    return true;
}

bool matchesSecondaryMask(const string &mask, const string &address)
{
    if (!isValidSecondaryMask(mask) || address.length() != 16) return false;

    for (int i=0; i<8; ++i)
    {
        char m = toupper((uchar)mask[i]);
        if (m != 'F' && m != toupper((uchar)address[i])) return false;
    }
    // Manufacturer, version and type are wildcards only when all digits are F.
    int fields[3][2] = { { 8, 4 }, { 12, 2 }, { 14, 2 } };
    for (auto &f : fields)
    {
        string m = mask.substr(f[0], f[1]);
        string a = address.substr(f[0], f[1]);
        for (char &c : m) c = toupper((uchar)c);
        for (char &c : a) c = toupper((uchar)c);
        if (m == string(f[1], 'F')) continue;
        if (m != a) return false;
    }
    return true;
}

bool buildSelectFrame(const string &mask, Frame *frame)
{
    if (!isValidSecondaryMask(mask))
    {
        warning("(secondary) bad mask \"%s\"\n", mask.c_str());
        return false;
    }

    vector<uchar> bytes;
    if (!hex2bin(mask, &bytes) || bytes.size() != 8) return false;

    *frame = Frame();
    frame->kind = FrameKind::Long;
    frame->c_field = C_SND_UD | C_FCB;
    frame->a_field = MBUS_NETWORK_LAYER_ADDRESS;
    frame->ci_field = CI_SELECT_SLAVE;
    // Assuming mask 12345678 2C2D 01 07
    frame->payload.push_back(bytes[3]); // id 78
    frame->payload.push_back(bytes[2]); // id 56
    frame->payload.push_back(bytes[1]); // id 34
    frame->payload.push_back(bytes[0]); // id 12
    frame->payload.push_back(bytes[5]); // mfct 2D
    frame->payload.push_back(bytes[4]); // mfct 2C
    frame->payload.push_back(bytes[6]); // version
    frame->payload.push_back(bytes[7]); // type
    sealFrame(frame);
    return true;
}

ProbeResult probeSecondary(FrameTransport *transport, const string &mask, int timeout_ms)
{
    Frame select;
    if (!buildSelectFrame(mask, &select)) return ProbeResult::Nothing;

    vector<uchar> bytes;
    if (packFrame(select, &bytes) != MBusError::OK) return ProbeResult::Nothing;
    if (transport->send(bytes) != MBusError::OK) return ProbeResult::Nothing;

    vector<uchar> reply;
    MBusError rc = transport->receive(&reply, timeout_ms);
    if (rc == MBusError::Timeout)
    {
        debug("(secondary) %s nothing\n", mask.c_str());
        return ProbeResult::Nothing;
    }

    // Several slaves acking at the same time garble the single character.
    if (rc == MBusError::OK && reply.size() == 1 && reply[0] == MBUS_ACK)
    {
        debug("(secondary) %s single\n", mask.c_str());
        return ProbeResult::Single;
    }
    debug("(secondary) %s collision\n", mask.c_str());
    return ProbeResult::Collision;
}

MBusError readSecondaryAddress(FrameTransport *transport, int timeout_ms, string *address)
{
    Frame req = buildReqUd2(MBUS_NETWORK_LAYER_ADDRESS, true);
    vector<uchar> bytes;
    MBusError rc = packFrame(req, &bytes);
    if (rc != MBusError::OK) return rc;
    rc = transport->send(bytes);
    if (rc != MBusError::OK) return rc;

    vector<uchar> reply;
    rc = transport->receive(&reply, timeout_ms);
    if (rc != MBusError::OK) return rc;

    Frame frame;
    size_t len = 0;
    rc = parseMBusFrame(reply, &frame, &len);
    if (rc != MBusError::OK) return rc;

    TPLHeader tpl;
    if (frame.kind != FrameKind::Long ||
        !parseTPLHeader(frame.ci_field, frame.payload, &tpl) ||
        !tpl.long_header)
    {
        verbose("(secondary) reply carries no long header: %s\n", frame.str().c_str());
        return MBusError::UnexpectedFrame;
    }

    *address = tostrprintf("%08X%04X%02X%02X", tpl.id, tpl.mfct, tpl.version, tpl.type);
    return MBusError::OK;
}

static MBusError scan(FrameTransport *transport, int timeout_ms, const string &mask, vector<string> *found)
{
    ProbeResult r = probeSecondary(transport, mask, timeout_ms);
    if (r == ProbeResult::Nothing) return MBusError::OK;

    if (r == ProbeResult::Single)
    {
        string address;
        MBusError rc = readSecondaryAddress(transport, timeout_ms, &address);
        if (rc != MBusError::OK) return rc;
        verbose("(secondary) found %s\n", address.c_str());
        found->push_back(address);
        return MBusError::OK;
    }

    size_t pos = mask.find('F');
    if (pos == string::npos || pos >= 8)
    {
        warning("(secondary) unresolvable collision for %s\n", mask.c_str());
        return MBusError::OK;
    }
    for (char d = '0'; d <= '9'; ++d)
    {
        string m = mask;
        m[pos] = d;
        MBusError rc = scan(transport, timeout_ms, m, found);
        if (rc != MBusError::OK) return rc;
    }
    return MBusError::OK;
}

MBusError scanSecondary(FrameTransport *transport, int timeout_ms, vector<string> *found)
{
    found->clear();
    return scan(transport, timeout_ms, "FFFFFFFFFFFFFFFF", found);
}
