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
#include"compact_cache.h"
#include"config.h"
#include"crypto.h"
#include"readout.h"
#include"secondary.h"
#include"telegram.h"
#include"transport.h"
#include"util.h"
#include"vendor_quirks.h"
#include"wmbus_decoder.h"

#include<stdio.h>
#include<stdlib.h>
#include<string.h>

using namespace std;

int main(int argc, char **argv);
void printUsage();
bool decodeWired(EngineConfig *c, const vector<uchar> &bytes);
bool decodeWireless(WMBusDecoder *decoder, const vector<uchar> &bytes);
bool decodeHex(EngineConfig *c, WMBusDecoder *decoder, const string &hex);
bool poll(EngineConfig *c);
bool scan(EngineConfig *c);

void printUsage()
{
    printf("Usage: mbusengine {options} {hex}*\n"
           "\n"
           "Decodes wired and wireless mbus frames given as hex, or replays\n"
           "the telegram=|...| lines of a simulation file.\n"
           "\n"
           "    --cachecapacity=<n> compact frame formats to remember, 256 to 1024\n"
           "    --cachefile=<file> load and save the compact frame formats\n"
           "    --config=<file> read key=value settings from file\n"
           "    --debug for a lot of information\n"
           "    --insertcrc the plaintext starts with a crc\n"
           "    --key=<id>:<hex> 8 hex digit meter id and 32 hex digit aes key\n"
           "    --linkreset send SND_NKE before polling\n"
           "    --logfile=<file> log to file instead of stderr, syslog logs to syslog\n"
           "    --maxframes=<n> longest accepted multi frame telegram\n"
           "    --poll=<address> read a telegram from the primary address over the simulation\n"
           "    --scan scan the simulation for secondary addresses\n"
           "    --silent do not print warnings\n"
           "    --simulate=<file> replay the frames in file\n"
           "    --syslog log to syslog\n"
           "    --taglength=<12|16> mode 9 authentication tag length\n"
           "    --timeout=<time> wait this long for each frame, e.g. 2s\n"
           "    --trace for tons of information\n"
           "    --typeablocks the records are split into crc protected blocks\n"
           "    --usestderr log to stderr, the default\n"
           "    --usestdoutforlogging log to stdout\n"
           "    --verbose for more information\n"
           "\n");
}

bool decodeWired(EngineConfig *c, const vector<uchar> &bytes)
{
    size_t offset = 0;
    bool ok = true;
    while (offset < bytes.size())
    {
        vector<uchar> rest(bytes.begin()+offset, bytes.end());
        Frame frame;
        size_t len = 0;
        MBusError rc = parseMBusFrame(rest, &frame, &len);
        if (rc != MBusError::OK)
        {
            printf("error %s\n", toString(rc));
            return false;
        }
        offset += len;

        vector<uchar> payload = frame.payload;
        TPLHeader tpl;
        if (frame.encrypted && parseTPLHeader(frame.ci_field, frame.payload, &tpl) && tpl.found)
        {
            CryptoContext ctx;
            ctx.tag_length = c->tag_length;
            ctx.insert_crc = c->insert_crc;
            if (c->keys.count(tpl.id) > 0) ctx.key = c->keys[tpl.id];
            rc = decryptedPayload(frame, ctx, &payload);
            if (rc != MBusError::OK)
            {
                printf("%s\nerror %s\n", frame.str().c_str(), toString(rc));
                ok = false;
                continue;
            }
        }
        printf("%s\n", frame.str().c_str());
        if (payload.size() > 0) printf("payload %s\n", bin2hex(payload).c_str());
    }
    return ok;
}

bool decodeWireless(WMBusDecoder *decoder, const vector<uchar> &bytes)
{
    Telegram t;
    bool full_frame_request = false;
    Frame request;
    MBusError rc = decoder->decode(bytes, &t, &full_frame_request, &request);
    if (rc != MBusError::OK)
    {
        printf("error %s\n", toString(rc));
        return false;
    }
    if (full_frame_request)
    {
        vector<uchar> out;
        if (packFrame(request, &out) != MBusError::OK) return false;
        printf("request %s\n", bin2hex(out).c_str());
        return true;
    }
    printf("%s\n", t.str().c_str());
    printf("payload %s\n", bin2hex(t.payload).c_str());
    return true;
}

bool decodeHex(EngineConfig *c, WMBusDecoder *decoder, const string &hex)
{
    vector<uchar> bytes;
    if (!hex2bin(hex, &bytes) || bytes.size() == 0)
    {
        warning("Not a valid hex frame \"%s\"\n", hex.c_str());
        return false;
    }
    uchar first = bytes[0];
    if (first == MBUS_ACK || first == MBUS_SHORT_START || first == MBUS_LONG_START)
    {
        return decodeWired(c, bytes);
    }
    return decodeWireless(decoder, bytes);
}

bool poll(EngineConfig *c)
{
    SimulatorTransport transport(c->simulation_file);
    TelegramState state(c->poll_address);

    if (c->keys.size() > 0)
    {
        CryptoContext ctx;
        ctx.tag_length = c->tag_length;
        ctx.insert_crc = c->insert_crc;
        // A single key also serves frames without the meter id.
        if (c->keys.size() == 1) ctx.key = c->keys.begin()->second;
        state.setCryptoContext(ctx);
        for (auto &k : c->keys) state.addKey(k.first, k.second);
    }

    ReadoutSettings settings;
    settings.max_frames = c->max_frames;
    settings.timeout_ms = c->timeout_ms;
    settings.link_reset = c->link_reset;

    Telegram t;
    MBusError rc = readoutTelegram(&transport, &state, settings, &t);
    if (rc != MBusError::OK)
    {
        printf("error %s\n", toString(rc));
        return false;
    }
    printf("%s\n", t.str().c_str());
    printf("payload %s\n", bin2hex(t.payload).c_str());
    return true;
}

bool scan(EngineConfig *c)
{
    SimulatorTransport transport(c->simulation_file);
    vector<string> found;
    MBusError rc = scanSecondary(&transport, c->timeout_ms, &found);
    for (auto &a : found) printf("%s\n", a.c_str());
    if (rc != MBusError::OK)
    {
        printf("error %s\n", toString(rc));
        return false;
    }
    return true;
}

int main(int argc, char **argv)
{
    enableEarlyLoggingFromCommandLine(argc, argv);

    EngineConfig config;
    parseCommandLine(&config, argc, argv);

    if (config.need_help)
    {
        printUsage();
        exit(0);
    }

    applyLogging(&config);

    if (config.poll_address >= 0 || config.scan_secondary)
    {
        if (config.simulation_file == "")
        {
            error("Polling and scanning need a --simulate=<file>\n");
        }
        bool ok = config.scan_secondary ? scan(&config) : poll(&config);
        return ok ? 0 : 1;
    }

    CompactFrameCache cache(config.cache_capacity);
    if (config.cache_file != "" && checkFileExists(config.cache_file.c_str()))
    {
        cache.load(config.cache_file);
    }
    VendorQuirks quirks;
    registerBuiltinQuirks(&quirks);

    WMBusDecoder decoder(&cache, &quirks);
    for (auto &p : config.keys) decoder.addKey(p.first, p.second);
    decoder.setTagLength(config.tag_length);
    decoder.setInsertCrc(config.insert_crc);
    decoder.setTypeABlocks(config.type_a_blocks);

    vector<string> hexes = config.telegrams;
    if (config.simulation_file != "")
    {
        vector<string> lines;
        if (loadFile(config.simulation_file, &lines) != 0)
        {
            error("Could not read simulation file %s\n", config.simulation_file.c_str());
        }
        for (auto &l : lines)
        {
            if (!startsWith(l, "telegram=")) continue;
            string hex = l.substr(9);
            size_t plus = hex.find('+');
            if (plus != string::npos) hex = hex.substr(0, plus);
            hexes.push_back(hex);
        }
    }

    bool ok = true;
    for (auto &h : hexes)
    {
        if (!decodeHex(&config, &decoder, h)) ok = false;
    }

    if (config.cache_file != "")
    {
        if (!cache.save(config.cache_file))
        {
            warning("Could not save the compact frame formats to %s\n", config.cache_file.c_str());
        }
    }

    CacheStats s = cache.stats();
    verbose("(compact) lookups %zu hits %zu misses %zu insertions %zu evictions %zu\n",
            s.lookups, s.hits, s.misses, s.insertions, s.evictions);

    return ok ? 0 : 1;
}
