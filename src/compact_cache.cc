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

#include"compact_cache.h"
#include"dvparser.h"

#include<stdlib.h>

using namespace std;

CompactFrameCache::CompactFrameCache(size_t capacity) : cache_mutex_("cache_mutex")
{
    if (capacity < COMPACT_CACHE_MIN_CAPACITY)
    {
        warning("(compact) cache capacity %zu raised to %d\n", capacity, COMPACT_CACHE_MIN_CAPACITY);
        capacity = COMPACT_CACHE_MIN_CAPACITY;
    }
    if (capacity > COMPACT_CACHE_MAX_CAPACITY)
    {
        warning("(compact) cache capacity %zu lowered to %d\n", capacity, COMPACT_CACHE_MAX_CAPACITY);
        capacity = COMPACT_CACHE_MAX_CAPACITY;
    }
    capacity_ = capacity;
}

size_t CompactFrameCache::size()
{
    WITH(cache_mutex_, size);
    return entries_.size();
}

bool CompactFrameCache::lookup(uint16_t signature, CacheEntry *entry)
{
    WITH(cache_mutex_, lookup);
    stats_.lookups++;
    auto i = entries_.find(signature);
    if (i == entries_.end())
    {
        stats_.misses++;
        debug("(compact) miss %04x\n", signature);
        return false;
    }
    stats_.hits++;
    // Move to the front.
    lru_.splice(lru_.begin(), lru_, i->second.second);
    i->second.first.last_seen = time(NULL);
    i->second.first.access_count++;
    *entry = i->second.first;
    debug("(compact) hit %04x\n", signature);
    return true;
}

bool CompactFrameCache::contains(uint16_t signature)
{
    WITH(cache_mutex_, contains);
    return entries_.count(signature) > 0;
}

void CompactFrameCache::evictIfFull()
{
    while (entries_.size() >= capacity_ && lru_.size() > 0)
    {
        uint16_t victim = lru_.back();
        lru_.pop_back();
        entries_.erase(victim);
        stats_.evictions++;
        debug("(compact) evicted %04x\n", victim);
    }
}

void CompactFrameCache::insert(uint16_t signature, const CacheEntry &entry)
{
    WITH(cache_mutex_, insert);

    CacheEntry e = entry;
    e.signature = signature;
    if (e.last_seen == 0) e.last_seen = time(NULL);

    stats_.insertions++;
    auto i = entries_.find(signature);
    if (i != entries_.end())
    {
        lru_.splice(lru_.begin(), lru_, i->second.second);
        i->second.first = e;
        debug("(compact) replaced %04x\n", signature);
        return;
    }

    evictIfFull();
    lru_.push_front(signature);
    entries_[signature] = make_pair(e, lru_.begin());
    debug("(compact) inserted %04x format %s\n", signature, bin2hex(e.format).c_str());
}

bool CompactFrameCache::remove(uint16_t signature)
{
    WITH(cache_mutex_, remove);
    auto i = entries_.find(signature);
    if (i == entries_.end()) return false;
    lru_.erase(i->second.second);
    entries_.erase(i);
    return true;
}

void CompactFrameCache::clear()
{
    WITH(cache_mutex_, clear);
    lru_.clear();
    entries_.clear();
}

int CompactFrameCache::removeStale(time_t max_age, time_t now)
{
    WITH(cache_mutex_, removeStale);
    int n = 0;
    for (auto i = entries_.begin(); i != entries_.end(); )
    {
        if (now - i->second.first.last_seen > max_age)
        {
            debug("(compact) removing stale %04x\n", i->first);
            lru_.erase(i->second.second);
            i = entries_.erase(i);
            n++;
        }
        else
        {
            ++i;
        }
    }
    return n;
}

CacheStats CompactFrameCache::stats()
{
    WITH(cache_mutex_, stats);
    return stats_;
}

vector<uint16_t> CompactFrameCache::recency()
{
    WITH(cache_mutex_, recency);
    return vector<uint16_t>(lru_.begin(), lru_.end());
}

bool CompactFrameCache::save(const string &file)
{
    string content;
    {
        WITH(cache_mutex_, save);
        for (auto i = lru_.rbegin(); i != lru_.rend(); ++i)
        {
            CacheEntry &e = entries_[*i].first;
            content += tostrprintf("%04x %04x %08x %02x %02x %ld %d %s\n",
                                  e.signature, e.mfct, e.id, e.version, e.type,
                                  (long)e.last_seen, e.access_count, bin2hex(e.format).c_str());
        }
    }
    return saveFile(file, content);
}

bool CompactFrameCache::load(const string &file)
{
    vector<string> lines;
    if (loadFile(file, &lines) != 0) return false;

    int n = 0;
    for (string &line : lines)
    {
        trimWhitespace(&line);
        if (line.length() == 0 || line[0] == '#') continue;
        vector<string> parts = splitString(line, ' ');
        CacheEntry e;
        bool invalid = false;
        if (parts.size() == 8)
        {
            e.signature = strtol(parts[0].c_str(), NULL, 16);
            e.mfct = strtol(parts[1].c_str(), NULL, 16);
            e.id = strtoul(parts[2].c_str(), NULL, 16);
            e.version = strtol(parts[3].c_str(), NULL, 16);
            e.type = strtol(parts[4].c_str(), NULL, 16);
            e.last_seen = atol(parts[5].c_str());
            e.access_count = atoi(parts[6].c_str());
            if (!isHexStringStrict(parts[7], &invalid) || invalid || !hex2bin(parts[7], &e.format))
            {
                invalid = true;
            }
        }
        else
        {
            invalid = true;
        }
        if (invalid)
        {
            warning("(compact) skipping bad line in %s: %s\n", file.c_str(), line.c_str());
            continue;
        }
        insert(e.signature, e);
        n++;
    }
    verbose("(compact) loaded %d formats from %s\n", n, file.c_str());
    return true;
}

// Offset of the first record in the payload, -1 if the ci does not carry records.
static int recordOffset(uchar ci, const vector<uchar> &payload)
{
    TPLHeader tpl;
    if (!parseTPLHeader(ci, payload, &tpl)) return -1;
    if (tpl.found) return tpl.header_len;
    if (ci == CI_NO_TPL || ci == CI_DATA_SEND) return 0;
    return -1;
}

bool signatureFor(const Frame &frame, uint16_t *signature)
{
    if (frame.ci_field == CI_COMPACT_FRAME)
    {
        if (frame.payload.size() < 4) return false;
        *signature = frame.payload[1] << 8 | frame.payload[0];
        return true;
    }
    if (frame.encrypted) return false;

    CacheEntry e;
    if (!buildCacheEntry(frame, frame.payload, &e)) return false;
    *signature = e.signature;
    return true;
}

bool buildCacheEntry(const Frame &frame, const vector<uchar> &payload, CacheEntry *entry)
{
    int offset = recordOffset(frame.ci_field, payload);
    if (offset < 0) return false;

    DVScan scan;
    if (!scanDV(payload, offset, &scan)) return false;
    if (scan.format_bytes.size() == 0) return false;

    *entry = CacheEntry();
    entry->format = scan.format_bytes;
    entry->signature = formatSignature(scan.format_bytes);

    TPLHeader tpl;
    parseTPLHeader(frame.ci_field, payload, &tpl);
    if (tpl.long_header)
    {
        entry->mfct = tpl.mfct;
        entry->id = tpl.id;
        entry->version = tpl.version;
        entry->type = tpl.type;
    }
    else
    {
        entry->mfct = frame.dll_mfct;
        entry->id = frame.dll_id;
        entry->version = frame.dll_version;
        entry->type = frame.dll_type;
    }
    return true;
}

bool learnFormat(const Frame &frame, const vector<uchar> &payload, CompactFrameCache *cache)
{
    CacheEntry e;
    if (!buildCacheEntry(frame, payload, &e)) return false;
    cache->insert(e.signature, e);
    return true;
}

MBusError buildCompactFrame(const Frame &full, Frame *compact)
{
    if (full.encrypted)
    {
        verbose("(compact) cannot compact an encrypted frame\n");
        return MBusError::UnexpectedFrame;
    }
    int offset = recordOffset(full.ci_field, full.payload);
    if (offset < 0) return MBusError::UnexpectedFrame;

    DVScan scan;
    if (!scanDV(full.payload, offset, &scan)) return MBusError::FrameMalformed;

    uint16_t sig = formatSignature(scan.format_bytes);
    uint16_t crc = crc16_EN13757(safeButUnsafeVectorPtr(scan.value_bytes), scan.value_bytes.size());

    Frame f = full;
    f.ci_field = CI_COMPACT_FRAME;
    f.payload.clear();
    f.payload.push_back(sig & 0xff);
    f.payload.push_back(sig >> 8);
    f.payload.push_back(crc & 0xff);
    f.payload.push_back(crc >> 8);
    f.payload.insert(f.payload.end(), scan.value_bytes.begin(), scan.value_bytes.end());
    sealFrame(&f);
    *compact = f;
    return MBusError::OK;
}

MBusError expandCompactFrame(const Frame &compact,
                             CompactFrameCache *cache,
                             bool *hit,
                             vector<uchar> *records,
                             CacheEntry *entry)
{
    *hit = false;
    if (compact.ci_field != CI_COMPACT_FRAME) return MBusError::UnexpectedFrame;
    if (compact.payload.size() < 4)
    {
        verbose("(compact) compact frame too short\n");
        return MBusError::FrameMalformed;
    }

    uint16_t sig = compact.payload[1] << 8 | compact.payload[0];
    uint16_t got = compact.payload[3] << 8 | compact.payload[2];
    vector<uchar> values(compact.payload.begin()+4, compact.payload.end());

    uint16_t crc = crc16_EN13757(safeButUnsafeVectorPtr(values), values.size());
    if (got != crc)
    {
        verbose("(compact) data crc %04x expected %04x\n", got, crc);
        return MBusError::ChecksumMismatch;
    }

    if (!cache->lookup(sig, entry))
    {
        verbose("(compact) format %04x unknown, full frame needed\n", sig);
        return MBusError::OK;
    }

    if (!mergeFormatAndValues(entry->format, values, records))
    {
        verbose("(compact) values do not match format %04x\n", sig);
        return MBusError::FrameMalformed;
    }
    *hit = true;
    debugPayload("(compact) expanded", *records);
    return MBusError::OK;
}
