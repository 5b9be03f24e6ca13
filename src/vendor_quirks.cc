/*
 Copyright (C) 2024 Fredrik Öhrström (gpl-3.0-or-later)

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

#include"vendor_quirks.h"

using namespace std;

string manufacturerFlag(int m_field) {
    char a = (m_field/1024)%32+64;
    char b = (m_field/32)%32+64;
    char c = (m_field)%32+64;

    string flag;
    flag += a;
    flag += b;
    flag += c;
    return flag;
}

int manufacturerCode(const string &flag)
{
    if (flag.length() != 3) return -1;
    for (char c : flag)
    {
        if (c < 'A' || c > 'Z') return -1;
    }
    return MANFCODE(flag[0], flag[1], flag[2]);
}

const char *toString(CrcErrorKind k)
{
    switch (k)
    {
#define X(name) case CrcErrorKind::name: return #name;
LIST_OF_CRC_ERROR_KINDS
#undef X
    }
    return "?";
}

const char *toString(Tolerance t)
{
    switch (t)
    {
    case Tolerance::NoOpinion: return "NoOpinion";
    case Tolerance::Tolerate: return "Tolerate";
    case Tolerance::Reject: return "Reject";
    }
    return "?";
}

VendorQuirks::VendorQuirks() : policies_mutex_("policies_mutex")
{
}

void VendorQuirks::registerCrcPolicy(uint16_t mfct, CrcTolerancePolicy policy)
{
    WITH(policies_mutex_, registerCrcPolicy);
    if (policies_.count(mfct) > 0)
    {
        debug("(quirks) replacing crc policy for %s\n", manufacturerFlag(mfct).c_str());
    }
    policies_[mfct] = policy;
}

bool VendorQuirks::unregisterCrcPolicy(uint16_t mfct)
{
    WITH(policies_mutex_, unregisterCrcPolicy);
    return policies_.erase(mfct) > 0;
}

bool VendorQuirks::hasCrcPolicy(uint16_t mfct)
{
    WITH(policies_mutex_, hasCrcPolicy);
    return policies_.count(mfct) > 0;
}

vector<uint16_t> VendorQuirks::registeredManufacturers()
{
    WITH(policies_mutex_, registeredManufacturers);
    vector<uint16_t> r;
    for (auto &p : policies_) r.push_back(p.first);
    return r;
}

Tolerance VendorQuirks::tolerateCrcFailure(uint16_t mfct, const DeviceInfo &di, CrcErrorKind kind, const CrcErrorContext &ctx)
{
    CrcTolerancePolicy policy;
    {
        WITH(policies_mutex_, tolerateCrcFailure);
        auto i = policies_.find(mfct);
        if (i == policies_.end()) return Tolerance::NoOpinion;
        policy = i->second;
    }
    // The policy runs without the lock held, it might be slow or register other policies.
    Tolerance t = policy(mfct, di, kind, ctx);
    debug("(quirks) %s %s crc failure block %d: %s\n",
          manufacturerFlag(mfct).c_str(), toString(kind), ctx.block_index, toString(t));
    return t;
}

Tolerance qundisThirdBlockQuirk(uint16_t mfct, const DeviceInfo &di, CrcErrorKind kind, const CrcErrorContext &ctx)
{
    if (mfct != MANUFACTURER_QDS) return Tolerance::NoOpinion;
    if (kind != CrcErrorKind::Block) return Tolerance::NoOpinion;
    if (ctx.block_index != 2) return Tolerance::NoOpinion;

    verbose("(quirks) tolerating known qds crc issue in block 3 (calc %04x recv %04x)\n",
            ctx.crc_expected, ctx.crc_received);
    return Tolerance::Tolerate;
}

void registerBuiltinQuirks(VendorQuirks *vq)
{
    vq->registerCrcPolicy(MANUFACTURER_QDS, qundisThirdBlockQuirk);
}
