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

#ifndef BLOCKS_H
#define BLOCKS_H

#include"errors.h"
#include"util.h"
#include"vendor_quirks.h"

#include<vector>

// A type A block is 14 data bytes followed by a 2 byte crc (little endian).
// The last block may be shorter but always ends with the crc.
#define BLOCK_SIZE 16
#define BLOCK_DATA_SIZE 14
#define BLOCK_CRC_SIZE 2

struct Block
{
    int index {};
    std::vector<uchar> data;
    uint16_t crc_received {};
    uint16_t crc_calculated {};
    bool checked {};   // False when the check was deferred, the payload is encrypted.
    bool valid {};
    bool tolerated {}; // Invalid but accepted by a vendor quirk.
};

// Split the payload into blocks and check each block crc. Failing blocks are
// tagged individually and offered to the vendor quirks (if any) before the
// verdict. An encrypted payload is only split, the crc bytes are not
// meaningful until the payload has been decrypted.
MBusError verifyBlocks(const std::vector<uchar> &payload,
                       bool encrypted,
                       std::vector<Block> *blocks,
                       const DeviceInfo *di = NULL,
                       VendorQuirks *quirks = NULL);

// Concatenate the data portions of the blocks in order.
void extractBlockData(const std::vector<Block> &blocks, std::vector<uchar> *out);

// Insert a crc after every 14 data bytes.
void addBlockCrcs(const std::vector<uchar> &data, std::vector<uchar> *out);

#endif
