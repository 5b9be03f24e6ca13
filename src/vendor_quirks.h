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

#ifndef VENDOR_QUIRKS_H
#define VENDOR_QUIRKS_H

#include"threads.h"
#include"util.h"

#include<functional>
#include<map>
#include<stdint.h>
#include<string>
#include<vector>

#define MANFCODE(a,b,c) ((a-64)*1024+(b-64)*32+(c-64))

#define MANUFACTURER_KAM MANFCODE('K','A','M')
#define MANUFACTURER_QDS MANFCODE('Q','D','S')
#define MANUFACTURER_TCH MANFCODE('T','C','H')

std::string manufacturerFlag(int m_field);
// Returns -1 if the flag is not three letters A-Z.
int manufacturerCode(const std::string &flag);

#define LIST_OF_CRC_ERROR_KINDS \
    X(Frame) \
    X(Block)

enum class CrcErrorKind {
#define X(name) name,
LIST_OF_CRC_ERROR_KINDS
#undef X
};

const char *toString(CrcErrorKind k);

struct DeviceInfo
{
    uint16_t mfct {};
    uint32_t id {};
    uchar version {};
    uchar type {};
};

struct CrcErrorContext
{
    int block_index {}; // -1 for frame level errors.
    int total_blocks {};
    uint16_t crc_expected {};
    uint16_t crc_received {};
};

enum class Tolerance
{
    NoOpinion, // Let the next decision maker decide, the default is to fail.
    Tolerate,
    Reject
};

const char *toString(Tolerance t);

typedef std::function<Tolerance(uint16_t mfct,
                                const DeviceInfo &di,
                                CrcErrorKind kind,
                                const CrcErrorContext &ctx)> CrcTolerancePolicy;

// Manufacturer specific crc quirks. One policy per manufacturer,
// registered and looked up from the readout tasks concurrently.
struct VendorQuirks
{
    VendorQuirks();

    void registerCrcPolicy(uint16_t mfct, CrcTolerancePolicy policy);
    bool unregisterCrcPolicy(uint16_t mfct);
    bool hasCrcPolicy(uint16_t mfct);
    std::vector<uint16_t> registeredManufacturers();

    Tolerance tolerateCrcFailure(uint16_t mfct, const DeviceInfo &di, CrcErrorKind kind, const CrcErrorContext &ctx);

private:

    RecursiveMutex policies_mutex_;
    std::map<uint16_t,CrcTolerancePolicy> policies_;
};

// Qundis heat cost allocators send a broken crc in the third block.
Tolerance qundisThirdBlockQuirk(uint16_t mfct, const DeviceInfo &di, CrcErrorKind kind, const CrcErrorContext &ctx);

void registerBuiltinQuirks(VendorQuirks *vq);

#endif
