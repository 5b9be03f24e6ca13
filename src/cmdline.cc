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

#include"cmdline.h"
#include"util.h"

#include<stdlib.h>
#include<string.h>

using namespace std;

void enableEarlyLoggingFromCommandLine(int argc, char **argv)
{
    int i = 1;
    while (i < argc && argv[i][0] == '-')
    {
        if (!strcmp(argv[i], "--silent")) {
            silentLogging(true);
        }
        else if (!strcmp(argv[i], "--verbose")) {
            verboseEnabled(true);
        }
        else if (!strcmp(argv[i], "--debug")) {
            verboseEnabled(true);
            debugEnabled(true);
        }
        else if (!strcmp(argv[i], "--trace")) {
            verboseEnabled(true);
            debugEnabled(true);
            traceEnabled(true);
        }
        i++;
    }
}

static const char *valueOf(const char *arg, const char *flag)
{
    size_t len = strlen(flag);
    if (!strncmp(arg, flag, len) && arg[len] == '=') return arg+len+1;
    return NULL;
}

void parseCommandLine(EngineConfig *c, int argc, char **argv)
{
    if (argc < 2)
    {
        c->need_help = true;
        return;
    }

    for (int i = 1; i < argc && argv[i][0] == '-'; ++i)
    {
        const char *v = valueOf(argv[i], "--config");
        if (v)
        {
            if (!loadConfiguration(c, v))
            {
                error("Could not load configuration %s\n", v);
            }
        }
    }

    int i = 1;
    while (i < argc && argv[i][0] == '-')
    {
        const char *arg = argv[i];
        const char *v = NULL;
        i++;

        if (!strcmp(arg, "--help") || !strcmp(arg, "-h")) {
            c->need_help = true;
            return;
        }
        if (!strcmp(arg, "--silent")) {
            handleLoglevel(c, "silent");
            continue;
        }
        if (!strcmp(arg, "--verbose")) {
            handleLoglevel(c, "verbose");
            continue;
        }
        if (!strcmp(arg, "--normal")) {
            handleLoglevel(c, "normal");
            continue;
        }
        if (!strcmp(arg, "--debug")) {
            handleLoglevel(c, "debug");
            continue;
        }
        if (!strcmp(arg, "--trace")) {
            handleLoglevel(c, "trace");
            continue;
        }
        if (!strcmp(arg, "--syslog")) {
            handleLogfile(c, "syslog");
            continue;
        }
        if (!strcmp(arg, "--usestderr")) {
            c->use_stderr_for_log = true;
            continue;
        }
        if (!strcmp(arg, "--usestdoutforlogging")) {
            c->use_stderr_for_log = false;
            continue;
        }
        if (!strcmp(arg, "--insertcrc")) {
            c->insert_crc = true;
            continue;
        }
        if (!strcmp(arg, "--typeablocks")) {
            c->type_a_blocks = true;
            continue;
        }
        if (!strcmp(arg, "--linkreset")) {
            c->link_reset = true;
            continue;
        }
        if (!strcmp(arg, "--scan")) {
            c->scan_secondary = true;
            continue;
        }
        if (valueOf(arg, "--config")) {
            continue;
        }
        if ((v = valueOf(arg, "--logfile"))) {
            handleLogfile(c, v);
            continue;
        }
        if ((v = valueOf(arg, "--key"))) {
            if (!handleKey(c, v)) error("Bad key \"%s\"\n", v);
            continue;
        }
        if ((v = valueOf(arg, "--cachecapacity"))) {
            if (!handleCacheCapacity(c, v)) error("Bad cache capacity \"%s\"\n", v);
            continue;
        }
        if ((v = valueOf(arg, "--cachefile"))) {
            c->cache_file = v;
            continue;
        }
        if ((v = valueOf(arg, "--taglength"))) {
            if (!handleTagLength(c, v)) error("Bad tag length \"%s\"\n", v);
            continue;
        }
        if ((v = valueOf(arg, "--maxframes"))) {
            if (!handleMaxFrames(c, v)) error("Bad max frames \"%s\"\n", v);
            continue;
        }
        if ((v = valueOf(arg, "--timeout"))) {
            if (!handleTimeout(c, v)) error("Bad timeout \"%s\"\n", v);
            continue;
        }
        if ((v = valueOf(arg, "--simulate"))) {
            c->simulation_file = v;
            continue;
        }
        if ((v = valueOf(arg, "--poll"))) {
            char *end = NULL;
            long a = strtol(v, &end, 10);
            if (*v == 0 || *end != 0 || a < 0 || a > 250) error("Bad primary address \"%s\"\n", v);
            c->poll_address = a;
            continue;
        }
        error("Unknown option \"%s\"\n", arg);
    }

    while (i < argc)
    {
        c->telegrams.push_back(argv[i]);
        i++;
    }
}
