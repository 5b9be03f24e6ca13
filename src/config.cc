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

#include"config.h"

#include<ctype.h>
#include<stdlib.h>
#include<string.h>

using namespace std;

pair<string,string> getNextKeyValue(vector<char> &buf, vector<char>::iterator &i)
{
    bool eof, err;
    string key, value;
    // Skip empty lines.
    while (i != buf.end() && isspace(*i)) i++;
    if (i == buf.end()) goto nomore;
    if (*i == '#')
    {
        string comment = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
        return { comment, "" };
    }
    key = eatToSkipWhitespace(buf, i, '=', 4096, &eof, &err);
    if (eof || err) goto nomore;
    value = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
    if (err) goto nomore;

    return { key, value };

    nomore:

    return { "", "" };
}

void handleLoglevel(EngineConfig *c, string loglevel)
{
    c->silent = false;
    c->verbose = false;
    c->debug = false;
    c->trace = false;

    if (loglevel == "verbose") c->verbose = true;
    else if (loglevel == "debug") c->debug = true;
    else if (loglevel == "trace") c->trace = true;
    else if (loglevel == "silent") c->silent = true;
    else if (loglevel != "normal")
    {
        warning("(config) no such log level: \"%s\"\n", loglevel.c_str());
    }
}

void handleLogfile(EngineConfig *c, string logfile)
{
    if (logfile.length() > 0)
    {
        c->use_logfile = true;
        c->logfile = logfile;
    }
}

static bool isNumber(const string &s)
{
    if (s.length() == 0) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
}

bool handleCacheCapacity(EngineConfig *c, string s)
{
    if (!isNumber(s))
    {
        warning("(config) cachecapacity must be a number, not \"%s\"\n", s.c_str());
        return false;
    }
    int n = atoi(s.c_str());
    if (n < COMPACT_CACHE_MIN_CAPACITY || n > COMPACT_CACHE_MAX_CAPACITY)
    {
        warning("(config) cachecapacity must be between %d and %d, not %d\n",
                COMPACT_CACHE_MIN_CAPACITY, COMPACT_CACHE_MAX_CAPACITY, n);
        return false;
    }
    c->cache_capacity = n;
    return true;
}

bool handleTagLength(EngineConfig *c, string s)
{
    if (s == "12" || s == "16")
    {
        c->tag_length = atoi(s.c_str());
        return true;
    }
    warning("(config) taglength must be 12 or 16, not \"%s\"\n", s.c_str());
    return false;
}

bool handleBool(const char *key, string s, bool *b)
{
    if (s == "true")
    {
        *b = true;
        return true;
    }
    if (s == "false")
    {
        *b = false;
        return true;
    }
    warning("(config) %s should be either true or false, not \"%s\"\n", key, s.c_str());
    return false;
}

bool handleMaxFrames(EngineConfig *c, string s)
{
    if (!isNumber(s) || atoi(s.c_str()) < 1)
    {
        warning("(config) maxframes must be a positive number, not \"%s\"\n", s.c_str());
        return false;
    }
    c->max_frames = atoi(s.c_str());
    return true;
}

bool handleTimeout(EngineConfig *c, string s)
{
    int secs = parseTime(s);
    if (secs <= 0)
    {
        warning("(config) not a valid timeout \"%s\"\n", s.c_str());
        return false;
    }
    c->timeout_ms = secs*1000;
    return true;
}

bool handleKey(EngineConfig *c, string s)
{
    vector<string> parts = splitString(s, ':');
    bool invalid = false;
    if (parts.size() != 2 ||
        parts[0].length() != 8 ||
        parts[1].length() != 32 ||
        !isHexStringStrict(parts[0], &invalid) || invalid ||
        !isHexStringStrict(parts[1], &invalid) || invalid)
    {
        warning("(config) key must be <8 hex digit id>:<32 hex digit key>\n");
        return false;
    }
    uint32_t id = strtoul(parts[0].c_str(), NULL, 16);
    vector<uchar> key;
    if (!hex2bin(parts[1], &key)) return false;
    c->keys[id] = key;
    debug("(config) key for %08x\n", id);
    return true;
}

bool parseConfiguration(EngineConfig *c, vector<char> &buf)
{
    bool ok = true;
    auto i = buf.begin();

    for (;;) {
        auto p = getNextKeyValue(buf, i);

        if (p.first == "") break;
        // If the key starts with # then the line is a comment. Ignore it.
        if (p.first[0] == '#') continue;
        // Keys are never logged.
        debug("(config) \"%s\"\n", p.first.c_str());

        if (p.first == "loglevel") handleLoglevel(c, p.second);
        else if (p.first == "logfile") handleLogfile(c, p.second);
        else if (p.first == "usestderr") ok &= handleBool("usestderr", p.second, &c->use_stderr_for_log);
        else if (p.first == "cachecapacity") ok &= handleCacheCapacity(c, p.second);
        else if (p.first == "cachefile") c->cache_file = p.second;
        else if (p.first == "taglength") ok &= handleTagLength(c, p.second);
        else if (p.first == "insertcrc") ok &= handleBool("insertcrc", p.second, &c->insert_crc);
        else if (p.first == "typeablocks") ok &= handleBool("typeablocks", p.second, &c->type_a_blocks);
        else if (p.first == "maxframes") ok &= handleMaxFrames(c, p.second);
        else if (p.first == "timeout") ok &= handleTimeout(c, p.second);
        else if (p.first == "key") ok &= handleKey(c, p.second);
        else
        {
            warning("(config) no such key: %s\n", p.first.c_str());
            ok = false;
        }
    }
    return ok;
}

bool loadConfiguration(EngineConfig *c, const string &file)
{
    vector<char> buf;
    debug("(config) loading %s\n", file.c_str());
    if (!loadFile(file, &buf)) return false;
    buf.push_back('\n');
    c->config_file = file;
    return parseConfiguration(c, buf);
}

void applyLogging(EngineConfig *c)
{
    if (c->use_logfile)
    {
        if (c->logfile == "syslog")
        {
            enableSyslog();
        }
        else if (!enableLogfile(c->logfile))
        {
            warning("(config) could not open log file %s\n", c->logfile.c_str());
        }
    }
    else
    {
        disableLogfile();
    }
    stderrEnabled(c->use_stderr_for_log);
    silentLogging(c->silent);
    verboseEnabled(c->verbose || c->debug || c->trace);
    debugEnabled(c->debug || c->trace);
    traceEnabled(c->trace);
}
