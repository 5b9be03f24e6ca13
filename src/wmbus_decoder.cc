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

#include"wmbus_decoder.h"

using namespace std;

WMBusDecoder::WMBusDecoder(CompactFrameCache *cache, VendorQuirks *quirks) :
    cache_(cache), quirks_(quirks)
{
}

void WMBusDecoder::addKey(uint32_t id, const vector<uchar> &key)
{
    keys_[id] = key;
}

bool WMBusDecoder::hasKey(uint32_t id)
{
    return keys_.count(id) > 0;
}

static DeviceInfo deviceInfo(const Frame &frame)
{
    DeviceInfo di;
    di.mfct = frame.dll_mfct;
    di.id = frame.dll_id;
    di.version = frame.dll_version;
    di.type = frame.dll_type;
    return di;
}

bool WMBusDecoder::tolerateFrameCrc(const Frame &frame, uint16_t expected)
{
    if (quirks_ == NULL) return false;
    CrcErrorContext ctx;
    ctx.block_index = -1;
    ctx.crc_expected = expected;
    ctx.crc_received = frame.crc;
    Tolerance t = quirks_->tolerateCrcFailure(frame.dll_mfct, deviceInfo(frame), CrcErrorKind::Frame, ctx);
    if (t == Tolerance::Tolerate)
    {
        notice("(wmbus) tolerating frame crc error from %s %08x\n",
               manufacturerFlag(frame.dll_mfct).c_str(), frame.dll_id);
        return true;
    }
    return false;
}

static uint16_t expectedCrc(const Frame &frame)
{
    vector<uchar> bytes;
    if (packFrame(frame, &bytes) != MBusError::OK) return 0;
    return bytes[bytes.size()-1] << 8 | bytes[bytes.size()-2];
}

MBusError WMBusDecoder::decode(const vector<uchar> &bytes,
                               Telegram *t,
                               bool *full_frame_request,
                               Frame *request)
{
    *full_frame_request = false;
    *t = Telegram();

    Frame frame;
    size_t frame_length = 0;
    MBusError rc = parseWMBusFrame(bytes, &frame, &frame_length);
    if (rc == MBusError::ChecksumMismatch && frame_length > 0)
    {
        if (!tolerateFrameCrc(frame, expectedCrc(frame))) return rc;
        rc = MBusError::OK;
    }
    if (rc != MBusError::OK) return rc;

    t->kind = frame.kind;
    t->c_field = frame.c_field;
    t->ci_field = frame.ci_field;
    t->mfct = frame.dll_mfct;
    t->id = frame.dll_id;
    t->version = frame.dll_version;
    t->type = frame.dll_type;
    t->num_frames = 1;

    if (frame.ci_field == CI_COMPACT_FRAME)
    {
        bool hit = false;
        vector<uchar> records;
        CacheEntry entry;
        rc = expandCompactFrame(frame, cache_, &hit, &records, &entry);
        if (rc != MBusError::OK) return rc;
        if (!hit)
        {
            uint16_t sig = 0;
            signatureFor(frame, &sig);
            *request = buildWMBusFullFrameRequest(frame, sig);
            *full_frame_request = true;
            return MBusError::OK;
        }
        t->compact = true;
        t->payload = records;
        verbose("(wmbus) %s\n", t->str().c_str());
        return MBusError::OK;
    }

    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl)) return MBusError::FrameMalformed;
    if (tpl.found)
    {
        if (tpl.long_header)
        {
            t->mfct = tpl.mfct;
            t->id = tpl.id;
            t->version = tpl.version;
            t->type = tpl.type;
        }
        t->access_number = tpl.acc;
        t->has_access_number = true;
    }

    vector<uchar> payload;
    // A ci in the encrypted range may still declare security mode 0.
    bool needs_key = frame.encrypted && !(tpl.found && tpl.securityMode() == 0);
    if (needs_key)
    {
        auto k = keys_.find(t->id);
        if (k == keys_.end())
        {
            verbose("(wmbus) no key for %08x\n", t->id);
            return MBusError::InvalidCryptoContext;
        }
        CryptoContext ctx;
        ctx.key = k->second;
        ctx.tag_length = tag_length_;
        ctx.insert_crc = insert_crc_;
        rc = decryptedPayload(frame, ctx, &payload);
        if (rc != MBusError::OK) return rc;
        t->encrypted = true;
    }
    else
    {
        payload = frame.payload;
    }

    if (frame.encrypted)
    {
        rc = verifyDeferredCrc(frame);
        if (rc == MBusError::ChecksumMismatch && tolerateFrameCrc(frame, expectedCrc(frame))) rc = MBusError::OK;
        if (rc != MBusError::OK) return rc;
    }

    if (type_a_blocks_)
    {
        size_t hl = tpl.found ? tpl.header_len : 0;
        vector<uchar> structured(payload.begin()+hl, payload.end());
        vector<Block> blocks;
        DeviceInfo di = deviceInfo(frame);
        rc = verifyBlocks(structured, false, &blocks, &di, quirks_);
        if (rc != MBusError::OK) return rc;
        vector<uchar> data;
        extractBlockData(blocks, &data);
        payload.resize(hl);
        payload.insert(payload.end(), data.begin(), data.end());
    }

    if (cache_ != NULL && learnFormat(frame, payload, cache_))
    {
        debug("(wmbus) learnt format of %08x\n", t->id);
    }

    t->payload = payload;
    verbose("(wmbus) %s\n", t->str().c_str());
    return MBusError::OK;
}
