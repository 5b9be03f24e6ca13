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

#ifndef WMBUS_DECODER_H
#define WMBUS_DECODER_H

#include"blocks.h"
#include"compact_cache.h"
#include"crypto.h"
#include"telegram.h"
#include"vendor_quirks.h"

#include<map>
#include<vector>

// Decodes single wireless frames: compact expansion, decryption, block
// crc checks and learning of the record formats of full frames.
struct WMBusDecoder
{
    WMBusDecoder(CompactFrameCache *cache, VendorQuirks *quirks);

    void addKey(uint32_t id, const std::vector<uchar> &key);
    bool hasKey(uint32_t id);
    void setTagLength(int len) { tag_length_ = len; }
    void setInsertCrc(bool b) { insert_crc_ = b; }
    // The bytes after the tpl header are type A blocks with a crc every 14 bytes.
    void setTypeABlocks(bool b) { type_a_blocks_ = b; }

    // Decode one frame. The telegram payload is the tpl header followed by
    // the plaintext records. For an expanded compact frame it is the rebuilt records.
    // When a compact frame refers to an unknown format, full_frame_request
    // is set and request holds the frame to transmit to the meter.
    MBusError decode(const std::vector<uchar> &bytes,
                     Telegram *t,
                     bool *full_frame_request,
                     Frame *request);

private:

    bool tolerateFrameCrc(const Frame &frame, uint16_t expected);

    CompactFrameCache *cache_ {};
    VendorQuirks *quirks_ {};
    std::map<uint32_t,std::vector<uchar>> keys_;
    int tag_length_ { 12 };
    bool insert_crc_ {};
    bool type_a_blocks_ {};
};

#endif
