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

#include"dvparser.h"
#include"frame.h"

using namespace std;

const char *toString(FrameKind k)
{
    switch (k)
    {
#define X(name) case FrameKind::name: return #name;
LIST_OF_FRAME_KINDS
#undef X
    }
    return "?";
}

bool Frame::operator==(const Frame &f) const
{
    return kind == f.kind &&
        c_field == f.c_field &&
        a_field == f.a_field &&
        ci_field == f.ci_field &&
        payload == f.payload &&
        checksum == f.checksum &&
        crc == f.crc &&
        more_records_follow == f.more_records_follow &&
        encrypted == f.encrypted &&
        dll_mfct == f.dll_mfct &&
        dll_id == f.dll_id &&
        dll_version == f.dll_version &&
        dll_type == f.dll_type;
}

string Frame::str() const
{
    string s;
    switch (kind)
    {
    case FrameKind::Acknowledge:
        return "ack";
    case FrameKind::Short:
        return tostrprintf("short c=%02x a=%02x", c_field, a_field);
    case FrameKind::Control:
        return tostrprintf("control c=%02x a=%02x ci=%02x", c_field, a_field, ci_field);
    case FrameKind::Long:
        s = tostrprintf("long c=%02x a=%02x ci=%02x len=%zu", c_field, a_field, ci_field, payload.size());
        break;
    case FrameKind::Wireless:
        s = tostrprintf("wireless c=%02x m=%04x id=%08x v=%02x t=%02x ci=%02x len=%zu",
                        c_field, dll_mfct, dll_id, dll_version, dll_type, ci_field, payload.size());
        break;
    }
    if (encrypted) s += " encrypted";
    if (more_records_follow) s += " more";
    return s;
}

bool parseTPLHeader(uchar ci, const vector<uchar> &payload, TPLHeader *tpl)
{
    *tpl = TPLHeader();

    if (ci == CI_SHORT_TPL)
    {
        // ACC STS CFG CFG
        if (payload.size() < 4) return false;
        tpl->found = true;
        tpl->acc = payload[0];
        tpl->sts = payload[1];
        tpl->cfg = payload[3] << 8 | payload[2];
        tpl->header_len = 4;
        return true;
    }
    if (ci == CI_LONG_TPL)
    {
        // ID ID ID ID M M V T ACC STS CFG CFG
        if (payload.size() < 12) return false;
        tpl->found = true;
        tpl->long_header = true;
        tpl->id = (uint32_t)payload[3] << 24 | payload[2] << 16 | payload[1] << 8 | payload[0];
        tpl->mfct = payload[5] << 8 | payload[4];
        tpl->version = payload[6];
        tpl->type = payload[7];
        tpl->acc = payload[8];
        tpl->sts = payload[9];
        tpl->cfg = payload[11] << 8 | payload[10];
        tpl->header_len = 12;
        return true;
    }
    return true;
}

bool isEncryptedFrame(uchar c_field, uchar ci_field)
{
    if (c_field & 0x80) return true;
    return ci_field >= 0x7a && ci_field <= 0x8b;
}

bool moreRecordsFollow(uchar ci_field, const vector<uchar> &payload)
{
    TPLHeader tpl;
    if (!parseTPLHeader(ci_field, payload, &tpl)) return false;

    size_t offset = 0;
    if (tpl.found) offset = tpl.header_len;
    else if (ci_field != CI_NO_TPL && ci_field != CI_DATA_SEND) return false;

    DVScan scan;
    if (!scanDV(payload, offset, &scan)) return false;
    return scan.more_records_follow;
}

static int securityModeOf(uchar ci_field, const vector<uchar> &payload)
{
    TPLHeader tpl;
    if (!parseTPLHeader(ci_field, payload, &tpl)) return 0;
    return tpl.securityMode();
}

static void deriveFlags(Frame *frame)
{
    frame->more_records_follow = false;
    frame->encrypted = false;
    if (frame->kind == FrameKind::Acknowledge) return;
    if (frame->kind == FrameKind::Short)
    {
        frame->encrypted = isEncryptedFrame(frame->c_field, 0);
        return;
    }
    int mode = securityModeOf(frame->ci_field, frame->payload);
    frame->encrypted = mode != 0 || isEncryptedFrame(frame->c_field, frame->ci_field);
    if (mode == 0)
    {
        frame->more_records_follow = moreRecordsFollow(frame->ci_field, frame->payload);
    }
}

static uchar wiredChecksum(const Frame &frame)
{
    uchar cs = frame.c_field + frame.a_field;
    if (frame.kind == FrameKind::Short) return cs;
    cs += frame.ci_field;
    if (frame.payload.size() > 0) cs += mbusChecksum(&frame.payload[0], frame.payload.size());
    return cs;
}

MBusError parseMBusFrame(const vector<uchar> &data, Frame *frame, size_t *frame_length)
{
    *frame = Frame();
    *frame_length = 0;

    if (data.size() == 0) return MBusError::FrameIncomplete;

    if (data[0] == MBUS_ACK)
    {
        frame->kind = FrameKind::Acknowledge;
        *frame_length = 1;
        debug("(mbus) received e5 single byte frame\n");
        return MBusError::OK;
    }

    if (data[0] == MBUS_SHORT_START)
    {
        // 10 C A CS 16
        if (data.size() < 5)
        {
            debug("(mbus) less than 5 bytes, partial short frame\n");
            return MBusError::FrameIncomplete;
        }
        if (data[4] != MBUS_STOP)
        {
            verbose("(mbus) short frame has no stop byte\n");
            return MBusError::FrameMalformed;
        }
        frame->kind = FrameKind::Short;
        frame->c_field = data[1];
        frame->a_field = data[2];
        frame->checksum = data[3];
        *frame_length = 5;
        uchar cs = wiredChecksum(*frame);
        if (cs != frame->checksum)
        {
            verbose("(mbus) short frame checksum %02x expected %02x\n", frame->checksum, cs);
            return MBusError::ChecksumMismatch;
        }
        deriveFlags(frame);
        return MBusError::OK;
    }

    if (data[0] != MBUS_LONG_START)
    {
        verbose("(mbus) unknown start byte %02x\n", data[0]);
        return MBusError::FrameMalformed;
    }

    // 68 L L 68 C A CI data CS 16
    if (data.size() < 4)
    {
        debug("(mbus) less than 4 bytes, partial frame\n");
        return MBusError::FrameIncomplete;
    }
    if (data[1] != data[2])
    {
        verbose("(mbus) lengths not matching %02x %02x\n", data[1], data[2]);
        return MBusError::FrameMalformed;
    }
    if (data[3] != MBUS_LONG_START)
    {
        verbose("(mbus) second start byte missing\n");
        return MBusError::FrameMalformed;
    }
    size_t len = data[1];
    if (len < 3)
    {
        verbose("(mbus) length %zu too short for a control frame\n", len);
        return MBusError::FrameMalformed;
    }
    size_t total = len+4+1+1; // start(4)+cs(1)+stop(1)
    if (data.size() < total)
    {
        debug("(mbus) not enough bytes, partial frame %zu %zu\n", data.size(), total);
        return MBusError::FrameIncomplete;
    }
    if (data[total-1] != MBUS_STOP)
    {
        verbose("(mbus) frame has no stop byte\n");
        return MBusError::FrameMalformed;
    }

    frame->kind = (len == 3) ? FrameKind::Control : FrameKind::Long;
    frame->c_field = data[4];
    frame->a_field = data[5];
    frame->ci_field = data[6];
    frame->payload.insert(frame->payload.end(), data.begin()+7, data.begin()+4+len);
    frame->checksum = data[4+len];
    *frame_length = total;

    uchar cs = wiredChecksum(*frame);
    if (cs != frame->checksum)
    {
        verbose("(mbus) checksum %02x expected %02x\n", frame->checksum, cs);
        return MBusError::ChecksumMismatch;
    }

    deriveFlags(frame);
    debug("(mbus) parsed %s\n", frame->str().c_str());
    return MBusError::OK;
}

MBusError parseWMBusFrame(const vector<uchar> &data, Frame *frame, size_t *frame_length)
{
    *frame = Frame();
    *frame_length = 0;

    if (data.size() == 0) return MBusError::FrameIncomplete;

    // L C M M A A A A V T CI payload CRC CRC
    size_t len = data[0];
    if (len < 10)
    {
        verbose("(wmbus) length %zu too short for a wmbus frame\n", len);
        return MBusError::FrameMalformed;
    }
    size_t total = len+1+2;
    if (data.size() < total)
    {
        debug("(wmbus) not enough bytes, partial frame %zu %zu\n", data.size(), total);
        return MBusError::FrameIncomplete;
    }

    frame->kind = FrameKind::Wireless;
    frame->c_field = data[1];
    frame->dll_mfct = data[3] << 8 | data[2];
    frame->dll_id = (uint32_t)data[7] << 24 | data[6] << 16 | data[5] << 8 | data[4];
    frame->dll_version = data[8];
    frame->dll_type = data[9];
    frame->ci_field = data[10];
    frame->payload.insert(frame->payload.end(), data.begin()+11, data.begin()+len+1);
    frame->crc = data[len+2] << 8 | data[len+1];
    *frame_length = total;

    deriveFlags(frame);

    if (frame->encrypted)
    {
        debug("(wmbus) encrypted frame, crc check deferred\n");
    }
    else
    {
        uint16_t crc = crc16_EN13757_block(&data[0], len+1);
        if (crc != frame->crc)
        {
            verbose("(wmbus) crc %04x expected %04x\n", frame->crc, crc);
            return MBusError::ChecksumMismatch;
        }
    }

    debug("(wmbus) parsed %s\n", frame->str().c_str());
    return MBusError::OK;
}

MBusError packFrame(const Frame &frame, vector<uchar> *out)
{
    out->clear();

    switch (frame.kind)
    {
    case FrameKind::Acknowledge:
        out->push_back(MBUS_ACK);
        return MBusError::OK;

    case FrameKind::Short:
        out->push_back(MBUS_SHORT_START);
        out->push_back(frame.c_field);
        out->push_back(frame.a_field);
        out->push_back(wiredChecksum(frame));
        out->push_back(MBUS_STOP);
        return MBusError::OK;

    case FrameKind::Control:
    case FrameKind::Long:
    {
        if (frame.kind == FrameKind::Control && frame.payload.size() != 0)
        {
            warning("(mbus) control frame cannot carry a payload\n");
            return MBusError::FrameMalformed;
        }
        if (frame.kind == FrameKind::Long && frame.payload.size() == 0)
        {
            warning("(mbus) long frame without payload is a control frame\n");
            return MBusError::FrameMalformed;
        }
        if (frame.payload.size() > MBUS_MAX_LONG_PAYLOAD)
        {
            warning("(mbus) payload of %zu bytes does not fit in a long frame\n", frame.payload.size());
            return MBusError::FrameMalformed;
        }
        uchar len = 3+frame.payload.size();
        out->push_back(MBUS_LONG_START);
        out->push_back(len);
        out->push_back(len);
        out->push_back(MBUS_LONG_START);
        out->push_back(frame.c_field);
        out->push_back(frame.a_field);
        out->push_back(frame.ci_field);
        out->insert(out->end(), frame.payload.begin(), frame.payload.end());
        out->push_back(wiredChecksum(frame));
        out->push_back(MBUS_STOP);
        return MBusError::OK;
    }

    case FrameKind::Wireless:
    {
        if (frame.payload.size() > WMBUS_MAX_PAYLOAD)
        {
            warning("(wmbus) payload of %zu bytes does not fit in a wmbus frame\n", frame.payload.size());
            return MBusError::FrameMalformed;
        }
        out->push_back(10+frame.payload.size());
        out->push_back(frame.c_field);
        out->push_back(frame.dll_mfct & 0xff);
        out->push_back(frame.dll_mfct >> 8);
        out->push_back(frame.dll_id & 0xff);
        out->push_back((frame.dll_id >> 8) & 0xff);
        out->push_back((frame.dll_id >> 16) & 0xff);
        out->push_back((frame.dll_id >> 24) & 0xff);
        out->push_back(frame.dll_version);
        out->push_back(frame.dll_type);
        out->push_back(frame.ci_field);
        out->insert(out->end(), frame.payload.begin(), frame.payload.end());
        uint16_t crc = crc16_EN13757_block(&(*out)[0], out->size());
        out->push_back(crc & 0xff);
        out->push_back(crc >> 8);
        return MBusError::OK;
    }
    }
    return MBusError::FrameMalformed;
}

MBusError verifyDeferredCrc(const Frame &frame)
{
    if (frame.kind != FrameKind::Wireless) return MBusError::OK;

    vector<uchar> bytes;
    MBusError rc = packFrame(frame, &bytes);
    if (rc != MBusError::OK) return rc;
    uint16_t crc = bytes[bytes.size()-1] << 8 | bytes[bytes.size()-2];
    if (crc != frame.crc)
    {
        verbose("(wmbus) deferred crc %04x expected %04x\n", frame.crc, crc);
        return MBusError::ChecksumMismatch;
    }
    return MBusError::OK;
}

void sealFrame(Frame *frame)
{
    frame->checksum = 0;
    frame->crc = 0;
    if (frame->kind == FrameKind::Wireless)
    {
        vector<uchar> bytes;
        if (packFrame(*frame, &bytes) == MBusError::OK)
        {
            frame->crc = bytes[bytes.size()-1] << 8 | bytes[bytes.size()-2];
        }
    }
    else if (frame->kind != FrameKind::Acknowledge)
    {
        frame->checksum = wiredChecksum(*frame);
    }
    deriveFlags(frame);
}

static Frame shortFrame(uchar c, uchar address)
{
    Frame f;
    f.kind = FrameKind::Short;
    f.c_field = c;
    f.a_field = address;
    sealFrame(&f);
    return f;
}

static Frame longFrame(uchar c, uchar address, uchar ci, const vector<uchar> &payload)
{
    Frame f;
    f.kind = payload.size() == 0 ? FrameKind::Control : FrameKind::Long;
    f.c_field = c;
    f.a_field = address;
    f.ci_field = ci;
    f.payload = payload;
    sealFrame(&f);
    return f;
}

Frame buildSndNke(uchar address)
{
    return shortFrame(C_SND_NKE, address);
}

Frame buildReqUd2(uchar address, bool fcb)
{
    return shortFrame(C_REQ_UD2 | (fcb ? C_FCB : 0), address);
}

Frame buildReqUd1(uchar address, bool fcb)
{
    return shortFrame(C_REQ_UD1 | (fcb ? C_FCB : 0), address);
}

Frame buildApplicationReset(uchar address, bool fcb)
{
    return longFrame(C_SND_UD | (fcb ? C_FCB : 0), address, CI_APPLICATION_RESET, vector<uchar>());
}

Frame buildFullFrameRequest(uchar address, uint16_t signature, bool fcb)
{
    vector<uchar> payload;
    payload.push_back(signature & 0xff);
    payload.push_back(signature >> 8);
    return longFrame(C_SND_UD | (fcb ? C_FCB : 0), address, CI_FULL_FRAME_REQUEST, payload);
}

Frame buildWMBusFullFrameRequest(const Frame &compact, uint16_t signature)
{
    Frame f;
    f.kind = FrameKind::Wireless;
    f.c_field = C_SND_UD;
    f.dll_mfct = compact.dll_mfct;
    f.dll_id = compact.dll_id;
    f.dll_version = compact.dll_version;
    f.dll_type = compact.dll_type;
    f.ci_field = CI_FULL_FRAME_REQUEST;
    f.payload.push_back(signature & 0xff);
    f.payload.push_back(signature >> 8);
    sealFrame(&f);
    return f;
}
