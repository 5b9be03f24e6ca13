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

#ifndef COMPACT_CACHE_H
#define COMPACT_CACHE_H

#include"errors.h"
#include"frame.h"
#include"threads.h"
#include"util.h"

#include<list>
#include<map>
#include<string>
#include<time.h>
#include<vector>

#define COMPACT_CACHE_MIN_CAPACITY 256
#define COMPACT_CACHE_MAX_CAPACITY 1024

// The record layout of a full frame, remembered so that later compact
// frames (ci 0x79) that only carry the values can be expanded.
struct CacheEntry
{
    uint16_t signature {};
    std::vector<uchar> format;
    uint16_t mfct {};
    uint32_t id {};
    uchar version {};
    uchar type {};
    time_t last_seen {};
    int access_count {};
};

struct CacheStats
{
    size_t insertions {};
    size_t lookups {};
    size_t hits {};
    size_t misses {};
    size_t evictions {};
};

// Shared between all readout tasks, every member function takes the cache lock.
struct CompactFrameCache
{
    // The capacity is clamped to 256..1024 entries.
    CompactFrameCache(size_t capacity = COMPACT_CACHE_MIN_CAPACITY);

    size_t capacity() { return capacity_; }
    size_t size();

    // A hit refreshes the recency and the last seen timestamp of the entry.
    bool lookup(uint16_t signature, CacheEntry *entry);
    // Check without touching the recency.
    bool contains(uint16_t signature);
    // Insert or replace, the least recently used entry is evicted when full.
    void insert(uint16_t signature, const CacheEntry &entry);
    bool remove(uint16_t signature);
    void clear();
    // Drop entries not seen for more than max_age seconds. Returns the number removed.
    int removeStale(time_t max_age, time_t now);

    CacheStats stats();
    // Signatures, most recently used first.
    std::vector<uint16_t> recency();

    // One line per entry, least recently used first.
    bool save(const std::string &file);
    bool load(const std::string &file);

private:

    void evictIfFull();

    RecursiveMutex cache_mutex_;
    size_t capacity_ {};
    std::list<uint16_t> lru_; // Front is the most recently used.
    std::map<uint16_t,std::pair<CacheEntry,std::list<uint16_t>::iterator>> entries_;
    CacheStats stats_;
};

// For a compact frame the signature is read from the frame, for a full
// unencrypted frame it is calculated from the record formats.
bool signatureFor(const Frame &frame, uint16_t *signature);

// Build the template of a full frame. The payload is the (decrypted) payload of the frame.
bool buildCacheEntry(const Frame &frame, const std::vector<uchar> &payload, CacheEntry *entry);

// Learn the format of a full frame, returns false if the records could not be scanned.
bool learnFormat(const Frame &frame, const std::vector<uchar> &payload, CompactFrameCache *cache);

// Transmit a full unencrypted frame as ci 0x79 sig sig crc crc values.
MBusError buildCompactFrame(const Frame &full, Frame *compact);

// On a hit the records are rebuilt from the cached format and the
// compact values. A miss is not an error, hit is then false and the
// caller should request the full frame.
MBusError expandCompactFrame(const Frame &compact,
                             CompactFrameCache *cache,
                             bool *hit,
                             std::vector<uchar> *records,
                             CacheEntry *entry);

#endif
