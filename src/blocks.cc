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

#include"blocks.h"

using namespace std;

MBusError verifyBlocks(const vector<uchar> &payload,
                       bool encrypted,
                       vector<Block> *blocks,
                       const DeviceInfo *di,
                       VendorQuirks *quirks)
{
    blocks->clear();

    size_t num_blocks = (payload.size()+BLOCK_SIZE-1)/BLOCK_SIZE;
    size_t last = payload.size() % BLOCK_SIZE;
    if (last != 0 && last < BLOCK_CRC_SIZE)
    {
        verbose("(blocks) last block has %zu bytes, too short to hold a crc\n", last);
        return MBusError::FrameMalformed;
    }

    bool failed = false;
    size_t offset = 0;
    for (size_t i = 0; i < num_blocks; ++i)
    {
        size_t len = BLOCK_SIZE;
        if (offset+len > payload.size()) len = payload.size()-offset;
        size_t data_len = len-BLOCK_CRC_SIZE;

        Block b;
        b.index = i;
        b.data.insert(b.data.end(), payload.begin()+offset, payload.begin()+offset+data_len);
        b.crc_received = payload[offset+data_len+1] << 8 | payload[offset+data_len];
        offset += len;

        if (encrypted)
        {
            blocks->push_back(b);
            continue;
        }

        b.checked = true;
        b.crc_calculated = crc16_EN13757_block(safeButUnsafeVectorPtr(b.data), b.data.size());
        b.valid = b.crc_calculated == b.crc_received;

        if (!b.valid)
        {
            Tolerance t = Tolerance::NoOpinion;
            if (quirks != NULL && di != NULL)
            {
                CrcErrorContext ctx;
                ctx.block_index = i;
                ctx.total_blocks = num_blocks;
                ctx.crc_expected = b.crc_calculated;
                ctx.crc_received = b.crc_received;
                t = quirks->tolerateCrcFailure(di->mfct, *di, CrcErrorKind::Block, ctx);
            }
            if (t == Tolerance::Tolerate)
            {
                b.tolerated = true;
            }
            else
            {
                verbose("(blocks) crc error in block %zu of %zu, got %04x expected %04x\n",
                        i, num_blocks, b.crc_received, b.crc_calculated);
                failed = true;
            }
        }
        blocks->push_back(b);
    }

    if (encrypted)
    {
        debug("(blocks) split %zu encrypted blocks, crc check deferred\n", num_blocks);
        return MBusError::OK;
    }
    return failed ? MBusError::BlockCrcMismatch : MBusError::OK;
}

void extractBlockData(const vector<Block> &blocks, vector<uchar> *out)
{
    out->clear();
    for (auto &b : blocks)
    {
        out->insert(out->end(), b.data.begin(), b.data.end());
    }
}

void addBlockCrcs(const vector<uchar> &data, vector<uchar> *out)
{
    out->clear();
    for (size_t offset = 0; offset < data.size(); offset += BLOCK_DATA_SIZE)
    {
        size_t len = BLOCK_DATA_SIZE;
        if (offset+len > data.size()) len = data.size()-offset;
        uint16_t crc = crc16_EN13757_block(&data[offset], len);
        out->insert(out->end(), data.begin()+offset, data.begin()+offset+len);
        out->push_back(crc & 0xff);
        out->push_back(crc >> 8);
    }
}
