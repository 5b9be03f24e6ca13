/*
 Copyright (C) 2019-2024 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef CONFIG_H
#define CONFIG_H

#include"compact_cache.h"
#include"util.h"

#include<map>
#include<string>
#include<vector>

struct EngineConfig
{
    bool need_help {};
    bool silent {};
    bool verbose {};
    bool debug {};
    bool trace {};
    bool use_logfile {};
    std::string logfile; // The name syslog sends the log to syslog.
    bool use_stderr_for_log { true };

    std::string config_file;

    int cache_capacity { COMPACT_CACHE_MIN_CAPACITY };
    std::string cache_file; // Load at start, save at exit.

    int tag_length { 12 };  // Mode 9 tags are 12 or 16 bytes.
    bool insert_crc {};
    bool type_a_blocks {};

    int max_frames { 10 };  // Longest accepted multi frame telegram.
    int timeout_ms { 1000 }; // Per awaited frame.

    // Keys are provisioned per meter id, never derived from the frame.
    std::map<uint32_t,std::vector<uchar>> keys;

    std::string simulation_file;
    int poll_address { -1 };
    bool link_reset {};
    bool scan_secondary {};
    std::vector<std::string> telegrams; // Hex frames given on the command line.
};

std::pair<std::string,std::string> getNextKeyValue(std::vector<char> &buf, std::vector<char>::iterator &i);

void handleLoglevel(EngineConfig *c, std::string loglevel);
void handleLogfile(EngineConfig *c, std::string logfile);
bool handleCacheCapacity(EngineConfig *c, std::string s);
bool handleTagLength(EngineConfig *c, std::string s);
bool handleBool(const char *key, std::string s, bool *b);
bool handleMaxFrames(EngineConfig *c, std::string s);
bool handleTimeout(EngineConfig *c, std::string s);
// id:key where id is 8 hex digits and the key 32 hex digits.
bool handleKey(EngineConfig *c, std::string s);

// Parse key=value lines, lines starting with # are comments.
// Returns false if any line was bad, the good lines are still applied.
bool parseConfiguration(EngineConfig *c, std::vector<char> &buf);
bool loadConfiguration(EngineConfig *c, const std::string &file);

// Switch on the log levels and the log file.
void applyLogging(EngineConfig *c);

#endif
