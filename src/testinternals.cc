/*
 Copyright (C) 2018-2024 Fredrik Öhrström (gpl-3.0-or-later)

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

#include"aes.h"
#include"aesgcm.h"
#include"blocks.h"
#include"cmdline.h"
#include"compact_cache.h"
#include"config.h"
#include"crypto.h"
#include"dvparser.h"
#include"errors.h"
#include"frame.h"
#include"readout.h"
#include"secondary.h"
#include"telegram.h"
#include"transport.h"
#include"util.h"
#include"vendor_quirks.h"
#include"wmbus_decoder.h"

#include<algorithm>
#include<stdio.h>
#include<string.h>

using namespace std;

void test_crc();
void test_hex();
void test_errors();
void test_frames();
void test_wmbus_frames();
void test_dvparser();
void test_blocks();
void test_quirks();
void test_aes();
void test_crypto();
void test_gcm_tamper();
void test_telegram();
void test_readout();
void test_cache();
void test_compact();
void test_decoder();
void test_secondary();
void test_config();
void test_cmdline();

int num_errors_ = 0;

// Test key 000102030405060708090a0b0c0d0e0f.
const char *key_hex = "000102030405060708090A0B0C0D0E0F";

// Single frame response from Kamstrup 12345678 with two records.
const char *single_rsp = "681a1a68280172785634122d2c0107100000000c137856341202fd1700006916";
// A two frame telegram, the first frame ends with dif 1f.
const char *multi_rsp_1 = "68161668280172785634122d2c0107100000000c13785634121f7216";
const char *multi_rsp_2 = "68141468080172785634122d2c01071100000002fd1700001716";
const char *mode5_rsp = "68151568280172785634122d2c010710001005de399ee82ca9a716";
const char *mode7_rsp = "681f1f68280172785634122d2c010710001007a2b3554f7da85ae2be9febaab025c5fc1916";
const char *mode9_wmbus = "25442d2c7856341201077a20002009c61cb730092f76016bf8fe5f940cce56d3b2db054afd80dddc";
const char *plain_wmbus = "15442d2c785634120107780c137856341202fd170000a7db";
const char *compact_wmbus = "14442d2c7856341201077943bb64a07856341200009bfb";
const char *type_a_wmbus = "17442d2c785634120107780c137856341202fd17000011f6973e";
const char *records_hex = "0c137856341202fd170000";

bool test(const char *test_name, const char *pattern)
{
    if (pattern == NULL) return true;
    bool ok = strstr(test_name, pattern) != NULL;
    return ok;
}

int main(int argc, char **argv)
{
    const char *pattern = NULL;

    int i = 1;
    while (i < argc) {
        if (!strcmp(argv[i], "--debug"))
        {
            debugEnabled(true);
        }
        else
        if (!strcmp(argv[i], "--trace"))
        {
            debugEnabled(true);
            traceEnabled(true);
        }
        else
        {
            pattern = argv[i];
        }
        i++;
    }
    onExit([](){});

    if (test("crc", pattern)) test_crc();
    if (test("hex", pattern)) test_hex();
    if (test("errors", pattern)) test_errors();
    if (test("frames", pattern)) test_frames();
    if (test("wmbus_frames", pattern)) test_wmbus_frames();
    if (test("dvparser", pattern)) test_dvparser();
    if (test("blocks", pattern)) test_blocks();
    if (test("quirks", pattern)) test_quirks();
    if (test("aes", pattern)) test_aes();
    if (test("crypto", pattern)) test_crypto();
    if (test("gcm_tamper", pattern)) test_gcm_tamper();
    if (test("telegram", pattern)) test_telegram();
    if (test("readout", pattern)) test_readout();
    if (test("cache", pattern)) test_cache();
    if (test("compact", pattern)) test_compact();
    if (test("decoder", pattern)) test_decoder();
    if (test("secondary", pattern)) test_secondary();
    if (test("config", pattern)) test_config();
    if (test("cmdline", pattern)) test_cmdline();

    if (num_errors_ > 0)
    {
        printf("%d tests failed\n", num_errors_);
        return 1;
    }
    printf("OK\n");
    return 0;
}

vector<uchar> fromHex(const char *h)
{
    vector<uchar> v;
    if (!hex2bin(h, &v))
    {
        printf("ERROR! bad hex in test \"%s\"\n", h);
        num_errors_++;
    }
    return v;
}

string packed(const Frame &f)
{
    vector<uchar> bytes;
    MBusError rc = packFrame(f, &bytes);
    if (rc != MBusError::OK) return string("<")+toString(rc)+">";
    return bin2hex(bytes);
}

void expectRC(const char *what, MBusError got, MBusError expected)
{
    if (got != expected)
    {
        printf("ERROR! %s returned %s but expected %s\n", what, toString(got), toString(expected));
        num_errors_++;
    }
}

void expectTrue(const char *what, bool b)
{
    if (!b)
    {
        printf("ERROR! %s\n", what);
        num_errors_++;
    }
}

void expectHex(const char *what, const vector<uchar> &got, const char *expected)
{
    vector<uchar> e = fromHex(expected);
    if (got != e)
    {
        printf("ERROR! %s\ngot      %s\nexpected %s\n", what, bin2hex(got).c_str(), bin2hex(e).c_str());
        num_errors_++;
    }
}

void expectHex(const char *what, const string &got, const char *expected)
{
    vector<uchar> g;
    hex2bin(got, &g);
    expectHex(what, g, expected);
}

Frame parseWired(const char *h)
{
    Frame f;
    size_t len = 0;
    MBusError rc = parseMBusFrame(fromHex(h), &f, &len);
    if (rc != MBusError::OK)
    {
        printf("ERROR! could not parse wired frame %s: %s\n", h, toString(rc));
        num_errors_++;
    }
    return f;
}

Frame parseWireless(const char *h)
{
    Frame f;
    size_t len = 0;
    MBusError rc = parseWMBusFrame(fromHex(h), &f, &len);
    if (rc != MBusError::OK)
    {
        printf("ERROR! could not parse wmbus frame %s: %s\n", h, toString(rc));
        num_errors_++;
    }
    return f;
}

// The long tpl header of meter 12345678 KAM version 01 type 07.
vector<uchar> longHeader(uchar acc, uint16_t cfg)
{
    vector<uchar> h = fromHex("785634122D2C0107");
    h.push_back(acc);
    h.push_back(0x00);
    h.push_back(cfg & 0xff);
    h.push_back(cfg >> 8);
    return h;
}

Frame rspFrame(bool fcb, uchar acc, int value, bool more)
{
    Frame f;
    f.kind = FrameKind::Long;
    f.c_field = C_RSP_UD | (fcb ? C_FCB : 0);
    f.a_field = 0x01;
    f.ci_field = CI_LONG_TPL;
    f.payload = longHeader(acc, 0);
    // 02 fd 17 error flags
    f.payload.push_back(0x02);
    f.payload.push_back(0xfd);
    f.payload.push_back(0x17);
    f.payload.push_back(value & 0xff);
    f.payload.push_back(0x00);
    if (more) f.payload.push_back(0x1f);
    sealFrame(&f);
    return f;
}

CryptoContext testContext()
{
    CryptoContext ctx;
    ctx.key = fromHex(key_hex);
    return ctx;
}

void test_crc()
{
    unsigned char data[4];
    data[0] = 0x01;
    data[1] = 0xfd;
    data[2] = 0x1f;
    data[3] = 0x01;

    uint16_t crc = crc16_EN13757(data, 4);
    if (crc != 0xcc22) {
        printf("ERROR! %4x should be cc22\n", crc);
        num_errors_++;
    }
    data[3] = 0x00;

    crc = crc16_EN13757(data, 4);
    if (crc != 0xf147) {
        printf("ERROR! %4x should be f147\n", crc);
        num_errors_++;
    }

    uchar block [10];
    block[0]=0xEE;
    block[1]=0x44;
    block[2]=0x9A;
    block[3]=0xCE;
    block[4]=0x01;
    block[5]=0x00;
    block[6]=0x00;
    block[7]=0x80;
    block[8]=0x23;
    block[9]=0x07;

    crc = crc16_EN13757(block, 10);

    if (crc != 0xaabc) {
        printf("ERROR! %4x should be aabc\n", crc);
        num_errors_++;
    }

    uchar check[] = { '1', '2', '3', '4', '5', '6', '7', '8', '9' };
    crc = crc16_EN13757(check, sizeof(check));
    if (crc != 0xc2b7) {
        printf("ERROR! %4x should be c2b7\n", crc);
        num_errors_++;
    }
    crc = crc16_EN13757_block(check, sizeof(check));
    if (crc != 0xbbb6) {
        printf("ERROR! %4x should be bbb6\n", crc);
        num_errors_++;
    }

    uchar seq[14];
    for (int i=0; i<14; ++i) seq[i] = i;
    crc = crc16_EN13757_block(seq, sizeof(seq));
    if (crc != 0x17b6) {
        printf("ERROR! %4x should be 17b6\n", crc);
        num_errors_++;
    }

    uchar cs[] = { 0x08, 0x01, 0x72 };
    uchar c = mbusChecksum(cs, sizeof(cs));
    if (c != 0x7b) {
        printf("ERROR! %02x should be 7b\n", c);
        num_errors_++;
    }
    uchar wrap[] = { 0xff, 0x02 };
    c = mbusChecksum(wrap, sizeof(wrap));
    if (c != 0x01) {
        printf("ERROR! %02x should be 01\n", c);
        num_errors_++;
    }
}

void test_hex()
{
    vector<uchar> v;
    bool ok = hex2bin("68 1a|1A_68", &v);
    expectTrue("hex with separators", ok);
    expectHex("hex with separators", v, "681A1A68");

    v.clear();
    ok = hex2bin("681", &v);
    expectTrue("dangling nibble is an error", !ok);

    v.clear();
    ok = hex2bin("68zz", &v);
    expectTrue("non hex is an error", !ok);

    v = { 0xde, 0xad, 0x01 };
    string s = bin2hex(v);
    if (s != "DEAD01")
    {
        printf("ERROR! bin2hex gave %s expected DEAD01\n", s.c_str());
        num_errors_++;
    }
}

void test_errors()
{
    if (string(toString(MBusError::FcbMismatch)) != "FcbMismatch")
    {
        printf("ERROR! toString of FcbMismatch gave %s\n", toString(MBusError::FcbMismatch));
        num_errors_++;
    }
    expectTrue("timeout is retryable", isRetryable(MBusError::Timeout));
    expectTrue("fcb mismatch is retryable", isRetryable(MBusError::FcbMismatch));
    expectTrue("decryption failure is not retryable", !isRetryable(MBusError::DecryptionFailed));
    expectTrue("ok is not retryable", !isRetryable(MBusError::OK));
}

void test_frames()
{
    Frame f;
    size_t len = 0;

    // Single character acknowledge, trailing bytes belong to the next frame.
    expectRC("parse ack", parseMBusFrame(fromHex("E5107B017C16"), &f, &len), MBusError::OK);
    expectTrue("ack kind", f.kind == FrameKind::Acknowledge);
    expectTrue("ack consumes one byte", len == 1);

    expectRC("parse empty", parseMBusFrame(vector<uchar>(), &f, &len), MBusError::FrameIncomplete);

    expectRC("parse short", parseMBusFrame(fromHex("107b017c16"), &f, &len), MBusError::OK);
    expectTrue("short kind", f.kind == FrameKind::Short);
    expectTrue("short fields", f.c_field == 0x7b && f.a_field == 0x01 && f.checksum == 0x7c && len == 5);
    expectTrue("short fcb", f.fcb());

    expectHex("snd_nke", packed(buildSndNke(1)), "1040014116");
    expectHex("req_ud2 fcb 1", packed(buildReqUd2(1, true)), "107b017c16");
    expectHex("req_ud2 fcb 0", packed(buildReqUd2(1, false)), "105b015c16");
    expectHex("application reset", packed(buildApplicationReset(1, false)), "68030368530150a416");
    expectHex("full frame request", packed(buildFullFrameRequest(1, 0xbb43, true)), "6805056873017643bbe816");

    expectRC("parse control", parseMBusFrame(fromHex("68030368530150a416"), &f, &len), MBusError::OK);
    expectTrue("control kind", f.kind == FrameKind::Control && f.ci_field == CI_APPLICATION_RESET);
    expectTrue("control length", len == 9 && f.payload.size() == 0);

    vector<uchar> single = fromHex(single_rsp);
    expectRC("parse long", parseMBusFrame(single, &f, &len), MBusError::OK);
    expectTrue("long kind", f.kind == FrameKind::Long);
    expectTrue("long fields", f.c_field == 0x28 && f.a_field == 0x01 && f.ci_field == CI_LONG_TPL);
    expectTrue("long length", len == single.size() && f.payload.size() == 0x1a-3);
    expectTrue("long flags", !f.more_records_follow && !f.encrypted && f.fcb());
    expectHex("long round trip", packed(f), single_rsp);

    // Builders and parsers agree.
    Frame built[] = { buildSndNke(7), buildReqUd2(0xfd, true), buildReqUd1(3, false),
                      buildApplicationReset(1, true), buildFullFrameRequest(250, 0x1234, false) };
    for (Frame &b : built)
    {
        vector<uchar> bytes;
        expectRC("pack built frame", packFrame(b, &bytes), MBusError::OK);
        Frame p;
        expectRC("parse built frame", parseMBusFrame(bytes, &p, &len), MBusError::OK);
        expectTrue("built frame round trip", p == b);
    }

    // Any changed byte between the start and the stop byte breaks the checksum.
    for (size_t i = 4; i < single.size()-1; ++i)
    {
        vector<uchar> bad = single;
        bad[i] ^= 0x04;
        MBusError rc = parseMBusFrame(bad, &f, &len);
        if (rc != MBusError::ChecksumMismatch)
        {
            printf("ERROR! flipped byte %zu gave %s\n", i, toString(rc));
            num_errors_++;
        }
    }

    // Every prefix is incomplete.
    for (size_t n = 1; n < single.size(); ++n)
    {
        vector<uchar> part(single.begin(), single.begin()+n);
        MBusError rc = parseMBusFrame(part, &f, &len);
        if (rc != MBusError::FrameIncomplete)
        {
            printf("ERROR! prefix of %zu bytes gave %s\n", n, toString(rc));
            num_errors_++;
        }
    }

    vector<uchar> bad = single;
    bad[2] = 0x1b;
    expectRC("length mismatch", parseMBusFrame(bad, &f, &len), MBusError::FrameMalformed);
    bad = single;
    bad[3] = 0x69;
    expectRC("second start", parseMBusFrame(bad, &f, &len), MBusError::FrameMalformed);
    bad = single;
    bad.back() = 0x17;
    expectRC("stop byte", parseMBusFrame(bad, &f, &len), MBusError::FrameMalformed);
    expectRC("unknown start", parseMBusFrame(fromHex("42"), &f, &len), MBusError::FrameMalformed);
    expectRC("short without stop", parseMBusFrame(fromHex("107b017c17"), &f, &len), MBusError::FrameMalformed);
    expectRC("short checksum", parseMBusFrame(fromHex("107b017d16"), &f, &len), MBusError::ChecksumMismatch);

    vector<uchar> out;
    Frame empty;
    empty.kind = FrameKind::Long;
    empty.ci_field = CI_NO_TPL;
    expectRC("long without payload", packFrame(empty, &out), MBusError::FrameMalformed);
    Frame ctrl = buildApplicationReset(1, false);
    ctrl.payload.push_back(0x00);
    expectRC("control with payload", packFrame(ctrl, &out), MBusError::FrameMalformed);
    Frame big;
    big.kind = FrameKind::Long;
    big.payload.resize(MBUS_MAX_LONG_PAYLOAD+1);
    expectRC("too large payload", packFrame(big, &out), MBusError::FrameMalformed);
    big.payload.resize(MBUS_MAX_LONG_PAYLOAD);
    expectRC("largest payload", packFrame(big, &out), MBusError::OK);

    expectTrue("ci 7a is encrypted", isEncryptedFrame(0x44, 0x7a));
    expectTrue("ci 8b is encrypted", isEncryptedFrame(0x08, 0x8b));
    expectTrue("ci 78 is not encrypted", !isEncryptedFrame(0x44, 0x78));
    expectTrue("ci 8c is not encrypted", !isEncryptedFrame(0x08, 0x8c));
    expectTrue("c bit 7 is encrypted", isEncryptedFrame(0xc4, 0x78));

    f = parseWired(multi_rsp_1);
    expectTrue("first of two frames has more records", f.more_records_follow);
    f = parseWired(multi_rsp_2);
    expectTrue("last frame has no more records", !f.more_records_follow && !f.fcb());

    f = parseWired(mode5_rsp);
    expectTrue("mode 5 frame is encrypted", f.encrypted);
}

void test_wmbus_frames()
{
    Frame f;
    size_t len = 0;
    vector<uchar> plain = fromHex(plain_wmbus);

    expectRC("parse wmbus", parseWMBusFrame(plain, &f, &len), MBusError::OK);
    expectTrue("wmbus kind", f.kind == FrameKind::Wireless);
    expectTrue("wmbus length", len == plain.size());
    expectTrue("wmbus dll", f.c_field == 0x44 && f.dll_mfct == MANUFACTURER_KAM &&
               f.dll_id == 0x12345678 && f.dll_version == 0x01 && f.dll_type == 0x07);
    expectTrue("wmbus ci", f.ci_field == CI_NO_TPL && !f.encrypted);
    expectHex("wmbus payload", f.payload, records_hex);
    expectTrue("wmbus crc", f.crc == 0xdba7);
    expectHex("wmbus round trip", packed(f), plain_wmbus);

    for (size_t i = 1; i < plain.size(); ++i)
    {
        vector<uchar> bad = plain;
        bad[i] ^= 0x10;
        MBusError rc = parseWMBusFrame(bad, &f, &len);
        if (rc != MBusError::ChecksumMismatch)
        {
            printf("ERROR! flipped wmbus byte %zu gave %s\n", i, toString(rc));
            num_errors_++;
        }
    }

    vector<uchar> part(plain.begin(), plain.begin()+10);
    expectRC("wmbus prefix", parseWMBusFrame(part, &f, &len), MBusError::FrameIncomplete);
    expectRC("wmbus too short l", parseWMBusFrame(fromHex("0944"), &f, &len), MBusError::FrameMalformed);

    // The crc of an encrypted frame is checked after decryption.
    vector<uchar> enc = fromHex(mode9_wmbus);
    f = parseWireless(mode9_wmbus);
    expectTrue("mode 9 is encrypted", f.encrypted);
    expectRC("deferred crc", verifyDeferredCrc(f), MBusError::OK);
    enc.back() ^= 0x01;
    expectRC("parse with bad deferred crc", parseWMBusFrame(enc, &f, &len), MBusError::OK);
    expectRC("bad deferred crc", verifyDeferredCrc(f), MBusError::ChecksumMismatch);

    Frame compact = parseWireless(compact_wmbus);
    Frame req = buildWMBusFullFrameRequest(compact, 0xbb43);
    expectHex("wmbus full frame request", packed(req), "0c532d2c7856341201077643bbebf5");
}

void test_dvparser()
{
    vector<uchar> data = fromHex("2F2F0B135634128B820093 3E674523 0DFD10 0A30313233343536373839 0F882F");
    DVScan scan;
    bool ok = scanDV(data, 0, &scan);
    expectTrue("scan dv", ok);
    expectHex("format bytes", scan.format_bytes, "0B138B8200933E0DFD100F");
    expectHex("value bytes", scan.value_bytes, "5634126745230A30313233343536373839882F");
    expectTrue("record count", scan.num_records == 3);
    expectTrue("manufacturer data", scan.has_mfct_data && scan.mfct_data_len == 2 && !scan.more_records_follow);

    vector<uchar> records;
    ok = mergeFormatAndValues(scan.format_bytes, scan.value_bytes, &records);
    expectTrue("merge", ok);
    expectHex("merged records", records, "0B135634128B8200933E6745230DFD100A303132333435363738390F882F");

    // Values must fill the format exactly.
    vector<uchar> short_values(scan.value_bytes.begin(), scan.value_bytes.begin()+4);
    expectTrue("merge with too few values", !mergeFormatAndValues(scan.format_bytes, short_values, &records));

    ok = scanDV(fromHex("0C13785634121F"), 0, &scan);
    expectTrue("scan with 1f", ok && scan.more_records_follow && scan.num_records == 1);

    ok = scanDV(fromHex("0C13785634"), 0, &scan);
    expectTrue("truncated record", !ok);

    uint16_t sig = formatSignature(fromHex("0C1302FD17"));
    if (sig != 0xbb43)
    {
        printf("ERROR! signature %04x should be bb43\n", sig);
        num_errors_++;
    }

    expectTrue("dif len 0c", difLenBytes(0x0c) == 4);
    expectTrue("dif len 04", difLenBytes(0x04) == 4);
    expectTrue("dif len 0d", difLenBytes(0x0d) == -1);
    expectTrue("lvar ascii", lvarLenBytes(0x0a) == 10);
    expectTrue("lvar bcd", lvarLenBytes(0xc3) == 3);
    expectTrue("lvar float", lvarLenBytes(0xf0) == -1);
}

void test_blocks()
{
    vector<uchar> data;
    for (int i=0; i<30; ++i) data.push_back(i);

    vector<uchar> payload;
    addBlockCrcs(data, &payload);
    expectTrue("three blocks", payload.size() == 36);
    expectTrue("first block crc", payload[14] == 0xb6 && payload[15] == 0x17);

    vector<Block> blocks;
    expectRC("verify blocks", verifyBlocks(payload, false, &blocks), MBusError::OK);
    expectTrue("block count", blocks.size() == 3);
    for (Block &b : blocks) expectTrue("block valid", b.checked && b.valid);

    vector<uchar> out;
    extractBlockData(blocks, &out);
    expectTrue("extracted data", out == data);

    // Splitting and extracting again gives the same blocks.
    vector<uchar> again;
    addBlockCrcs(out, &again);
    expectTrue("block crcs are idempotent", again == payload);

    vector<uchar> bad = payload;
    bad[20] ^= 0x01;
    expectRC("block crc mismatch", verifyBlocks(bad, false, &blocks), MBusError::BlockCrcMismatch);
    expectTrue("only block 1 invalid", blocks.size() == 3 && blocks[0].valid && !blocks[1].valid && blocks[2].valid);

    expectRC("encrypted blocks are deferred", verifyBlocks(bad, true, &blocks), MBusError::OK);
    expectTrue("deferred blocks unchecked", blocks.size() == 3 && !blocks[1].checked);

    vector<uchar> tiny = payload;
    tiny.resize(33);
    expectRC("last block too short", verifyBlocks(tiny, false, &blocks), MBusError::FrameMalformed);

    VendorQuirks quirks;
    registerBuiltinQuirks(&quirks);
    DeviceInfo qds;
    qds.mfct = MANUFACTURER_QDS;
    DeviceInfo kam;
    kam.mfct = MANUFACTURER_KAM;

    bad = payload;
    bad[33] ^= 0x80;
    expectRC("qds third block tolerated", verifyBlocks(bad, false, &blocks, &qds, &quirks), MBusError::OK);
    expectTrue("third block tolerated", blocks.size() == 3 && !blocks[2].valid && blocks[2].tolerated);
    expectRC("kam third block", verifyBlocks(bad, false, &blocks, &kam, &quirks), MBusError::BlockCrcMismatch);

    bad = payload;
    bad[3] ^= 0x80;
    expectRC("qds first block", verifyBlocks(bad, false, &blocks, &qds, &quirks), MBusError::BlockCrcMismatch);
}

void test_quirks()
{
    expectTrue("kam flag", manufacturerFlag(0x2c2d) == "KAM");
    expectTrue("qds code", manufacturerCode("QDS") == MANUFACTURER_QDS);

    VendorQuirks quirks;
    expectTrue("no policies", quirks.registeredManufacturers().size() == 0);
    registerBuiltinQuirks(&quirks);
    expectTrue("qds policy", quirks.hasCrcPolicy(MANUFACTURER_QDS));

    DeviceInfo di;
    di.mfct = MANUFACTURER_TCH;
    CrcErrorContext ctx;
    ctx.block_index = 2;
    Tolerance t = quirks.tolerateCrcFailure(MANUFACTURER_TCH, di, CrcErrorKind::Block, ctx);
    expectTrue("no opinion without policy", t == Tolerance::NoOpinion);

    quirks.registerCrcPolicy(MANUFACTURER_TCH,
                             [](uint16_t, const DeviceInfo &, CrcErrorKind, const CrcErrorContext &)
                             {
                                 return Tolerance::Reject;
                             });
    t = quirks.tolerateCrcFailure(MANUFACTURER_TCH, di, CrcErrorKind::Block, ctx);
    expectTrue("registered policy rejects", t == Tolerance::Reject);
    expectTrue("two policies", quirks.registeredManufacturers().size() == 2);

    expectTrue("unregister", quirks.unregisterCrcPolicy(MANUFACTURER_TCH));
    expectTrue("unregister twice", !quirks.unregisterCrcPolicy(MANUFACTURER_TCH));
    expectTrue("policy gone", !quirks.hasCrcPolicy(MANUFACTURER_TCH));

    di.mfct = MANUFACTURER_QDS;
    t = quirks.tolerateCrcFailure(MANUFACTURER_QDS, di, CrcErrorKind::Frame, ctx);
    expectTrue("qds frame crc not tolerated", t == Tolerance::NoOpinion);
}

void test_aes()
{
    vector<uchar> key = fromHex(key_hex);
    vector<uchar> in = fromHex("00112233445566778899aabbccddeeff");
    uchar out[16];

    AES_ECB_encrypt(&in[0], &key[0], out, 16);
    expectHex("aes ecb", vector<uchar>(out, out+16), "69c4e0d86a7b0430d8cdb78070b4c55a");

    uchar zero_key[16] = {};
    uchar zero_iv[12] = {};
    uchar zero[16] = {};
    uchar tag[16];

    AES_GCM_encrypt(zero_key, zero_iv, NULL, 0, zero, 0, out, tag, 16);
    expectHex("gcm empty tag", vector<uchar>(tag, tag+16), "58e2fccefa7e3061367f1d57a4e7455a");

    AES_GCM_encrypt(zero_key, zero_iv, NULL, 0, zero, 16, out, tag, 16);
    expectHex("gcm ciphertext", vector<uchar>(out, out+16), "0388dace60b6a392f328c2b971b2fe78");
    expectHex("gcm tag", vector<uchar>(tag, tag+16), "ab6e47d42cec13bdf53a67b21257bddf");

    uchar plain[16];
    bool ok = AES_GCM_decrypt(zero_key, zero_iv, NULL, 0, out, 16, plain, tag, 16);
    expectTrue("gcm decrypt", ok && !memcmp(plain, zero, 16));
    tag[15] ^= 1;
    ok = AES_GCM_decrypt(zero_key, zero_iv, NULL, 0, out, 16, plain, tag, 16);
    expectTrue("gcm bad tag", !ok);

    vector<uchar> k4 = fromHex("feffe9928665731c6d6a8f9467308308");
    vector<uchar> iv4 = fromHex("cafebabefacedbaddecaf888");
    vector<uchar> aad4 = fromHex("feedfacedeadbeeffeedfacedeadbeefabaddad2");
    vector<uchar> p4 = fromHex("d9313225f88406e5a55909c5aff5269a86a7a9531534f7da2e4c303d8a318a72"
                           "1c3c0c95956809532fcf0e2449a6b525b16aedf5aa0de657ba637b39");
    vector<uchar> c4(p4.size());
    uchar tag4[16];
    AES_GCM_encrypt(&k4[0], &iv4[0], &aad4[0], aad4.size(), &p4[0], p4.size(), &c4[0], tag4, 16);
    expectHex("gcm with aad", c4, "42831ec2217774244b7221b784d0d49ce3aa212f2c02a4e035c17e2329aca12e"
                                  "21d514b25466931c7d8f6a5aac84aa051ba30b396a0aac973d58e091");
    expectHex("gcm with aad tag", vector<uchar>(tag4, tag4+16), "5bc94fbc3221a5db94fae95ae7121a47");

    // A truncated tag is the prefix of the full tag.
    uchar tag12[12];
    AES_GCM_encrypt(&k4[0], &iv4[0], &aad4[0], aad4.size(), &p4[0], p4.size(), &c4[0], tag12, 12);
    expectTrue("gcm 12 byte tag", !memcmp(tag12, tag4, 12));
    vector<uchar> d4(p4.size());
    ok = AES_GCM_decrypt(&k4[0], &iv4[0], &aad4[0], aad4.size(), &c4[0], c4.size(), &d4[0], tag12, 12);
    expectTrue("gcm 12 byte tag decrypt", ok && d4 == p4);
    aad4[0] ^= 0x01;
    ok = AES_GCM_decrypt(&k4[0], &iv4[0], &aad4[0], aad4.size(), &c4[0], c4.size(), &d4[0], tag12, 12);
    expectTrue("gcm changed aad", !ok);
}

void test_crypto()
{
    CryptoContext ctx = testContext();
    vector<uchar> plaintext = fromHex("0C1378563412");

    Frame wired;
    wired.kind = FrameKind::Long;
    wired.c_field = 0x28;
    wired.a_field = 0x01;
    wired.ci_field = CI_LONG_TPL;
    wired.payload = longHeader(0x10, 0);
    sealFrame(&wired);

    Frame enc;
    expectRC("encrypt mode 5", encryptFrame(wired, plaintext, TPLSecurityMode::AES_CTR, ctx, &enc), MBusError::OK);
    expectHex("mode 5", packed(enc), mode5_rsp);
    expectRC("encrypt mode 7", encryptFrame(wired, plaintext, TPLSecurityMode::AES_CBC_IV, ctx, &enc), MBusError::OK);
    expectHex("mode 7", packed(enc), mode7_rsp);

    Frame wireless;
    wireless.kind = FrameKind::Wireless;
    wireless.c_field = 0x44;
    wireless.dll_mfct = MANUFACTURER_KAM;
    wireless.dll_id = 0x12345678;
    wireless.dll_version = 0x01;
    wireless.dll_type = 0x07;
    wireless.ci_field = CI_SHORT_TPL;
    wireless.payload = fromHex("20000000");
    sealFrame(&wireless);

    vector<uchar> records = fromHex(records_hex);
    expectRC("encrypt mode 9", encryptFrame(wireless, records, TPLSecurityMode::AES_GCM, ctx, &enc), MBusError::OK);
    expectHex("mode 9", packed(enc), mode9_wmbus);

    vector<uchar> out;
    expectRC("decrypt mode 5", decryptFrame(parseWired(mode5_rsp), ctx, &out), MBusError::OK);
    expectTrue("mode 5 plaintext", out == plaintext);
    expectRC("decrypt mode 7", decryptFrame(parseWired(mode7_rsp), ctx, &out), MBusError::OK);
    expectTrue("mode 7 plaintext", out == plaintext);
    expectRC("decrypt mode 9", decryptFrame(parseWireless(mode9_wmbus), ctx, &out), MBusError::OK);
    expectTrue("mode 9 plaintext", out == records);

    expectRC("decrypted payload", decryptedPayload(parseWired(mode5_rsp), ctx, &out), MBusError::OK);
    expectTrue("decrypted payload keeps the header", out.size() == 12+plaintext.size() &&
               equal(plaintext.begin(), plaintext.end(), out.begin()+12));

    // Encrypt then decrypt gives back the plaintext for all sizes and modes.
    TPLSecurityMode modes[] = { TPLSecurityMode::NoSecurity, TPLSecurityMode::AES_CTR,
                                TPLSecurityMode::AES_CBC_IV, TPLSecurityMode::AES_GCM };
    for (TPLSecurityMode m : modes)
    {
        for (int tl = 12; tl <= 16; tl += 4)
        {
            for (size_t n = 0; n < 48; ++n)
            {
                vector<uchar> p;
                for (size_t j = 0; j < n; ++j) p.push_back((j*37+n) & 0xff);
                CryptoContext c = testContext();
                c.tag_length = tl;
                c.insert_crc = (n % 2) == 1 && m != TPLSecurityMode::NoSecurity;
                Frame e;
                MBusError rc = encryptFrame(n < 24 ? wired : wireless, p, m, c, &e);
                vector<uchar> d;
                if (rc == MBusError::OK) rc = decryptFrame(e, c, &d);
                if (rc != MBusError::OK || d != p)
                {
                    printf("ERROR! round trip %s tag %d size %zu failed: %s\n", toString(m), tl, n, toString(rc));
                    num_errors_++;
                }
            }
        }
    }

    // The number of encrypted blocks is stored in the configuration word.
    expectRC("encrypt 40 bytes", encryptFrame(wired, vector<uchar>(40), TPLSecurityMode::AES_CBC_IV, ctx, &enc), MBusError::OK);
    TPLHeader tpl;
    parseTPLHeader(enc.ci_field, enc.payload, &tpl);
    expectTrue("mode 7 cfg", tpl.securityMode() == 7 && tpl.numEncryptedBlocks() == 3);

    // A wrong key shows up as bad padding, as a bad inserted crc or as a bad tag.
    CryptoContext wrong = testContext();
    wrong.key = fromHex("0F0E0D0C0B0A09080706050403020100");
    expectRC("mode 7 wrong key", decryptFrame(parseWired(mode7_rsp), wrong, &out), MBusError::DecryptionFailed);
    expectRC("mode 9 wrong key", decryptFrame(parseWireless(mode9_wmbus), wrong, &out), MBusError::DecryptionFailed);
    CryptoContext crc_ctx = testContext();
    crc_ctx.insert_crc = true;
    expectRC("encrypt with crc", encryptFrame(wired, plaintext, TPLSecurityMode::AES_CTR, crc_ctx, &enc), MBusError::OK);
    expectRC("decrypt with crc", decryptFrame(enc, crc_ctx, &out), MBusError::OK);
    expectTrue("crc stripped", out == plaintext);
    wrong.insert_crc = true;
    expectRC("mode 5 wrong key", decryptFrame(enc, wrong, &out), MBusError::DecryptionFailed);

    CryptoContext nokey;
    expectRC("no key", decryptFrame(parseWired(mode5_rsp), nokey, &out), MBusError::InvalidCryptoContext);
    CryptoContext short_key = testContext();
    short_key.key.resize(8);
    expectRC("short key", decryptFrame(parseWired(mode5_rsp), short_key, &out), MBusError::InvalidCryptoContext);
    CryptoContext bad_tag = testContext();
    bad_tag.tag_length = 8;
    expectRC("tag length 8", decryptFrame(parseWireless(mode9_wmbus), bad_tag, &out), MBusError::InvalidCryptoContext);

    Frame mode3 = wired;
    mode3.payload = longHeader(0x10, 0x0310);
    mode3.payload.insert(mode3.payload.end(), plaintext.begin(), plaintext.end());
    sealFrame(&mode3);
    expectRC("mode 3", decryptFrame(mode3, ctx, &out), MBusError::UnsupportedSecurityMode);

    // A wired frame has no link layer identity to fall back on.
    Frame short_wired = wired;
    short_wired.ci_field = CI_SHORT_TPL;
    short_wired.payload = fromHex("10001005");
    short_wired.payload.insert(short_wired.payload.end(), plaintext.begin(), plaintext.end());
    sealFrame(&short_wired);
    expectRC("short header on the wire", decryptFrame(short_wired, ctx, &out), MBusError::InvalidCryptoContext);

    // Nothing to decrypt.
    Frame plain = parseWireless(plain_wmbus);
    expectRC("no tpl", decryptFrame(plain, ctx, &out), MBusError::OK);
    expectHex("no tpl payload", out, records_hex);
    expectRC("mode 0", decryptFrame(wired, ctx, &out), MBusError::OK);
    expectTrue("mode 0 payload", out.size() == 0);

    TPLSecurityMode m;
    expectTrue("mode 9 from int", fromIntToTPLSecurityMode(9, &m) && m == TPLSecurityMode::AES_GCM);
    expectTrue("mode 3 from int", !fromIntToTPLSecurityMode(3, &m));
    expectTrue("mode 5 to int", toInt(TPLSecurityMode::AES_CTR) == 5);

    CryptoContext built;
    expectRC("build context", buildCryptoContext(parseWireless(mode9_wmbus), &built), MBusError::OK);
    expectTrue("context from frame", built.mfct == MANUFACTURER_KAM && built.id == 0x12345678 &&
               built.version == 0x01 && built.type == 0x07 && built.access_number == 0x20 &&
               built.has_access_number && built.length_field == 0x25 && built.c_field == 0x44);
}

void test_gcm_tamper()
{
    CryptoContext ctx = testContext();
    Frame good = parseWireless(mode9_wmbus);
    vector<uchar> out;
    expectRC("untouched", decryptFrame(good, ctx, &out), MBusError::OK);

    // Every byte of ciphertext and tag is authenticated.
    for (size_t i = 4; i < good.payload.size(); ++i)
    {
        Frame f = good;
        f.payload[i] ^= 0x01;
        MBusError rc = decryptFrame(f, ctx, &out);
        if (rc != MBusError::DecryptionFailed)
        {
            printf("ERROR! flipped gcm byte %zu gave %s\n", i, toString(rc));
            num_errors_++;
        }
    }

    // So is the link layer and the access number.
    Frame f = good;
    f.c_field ^= 0x01;
    expectRC("changed c field", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.dll_mfct ^= 0x0001;
    expectRC("changed manufacturer", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.dll_id ^= 0x00000100;
    expectRC("changed id", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.dll_version ^= 0x01;
    expectRC("changed version", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.dll_type ^= 0x01;
    expectRC("changed type", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.payload[0] ^= 0x01;
    expectRC("changed access number", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);
    f = good;
    f.payload.pop_back();
    expectRC("changed length", decryptFrame(f, ctx, &out), MBusError::DecryptionFailed);

    CryptoContext ctx16 = testContext();
    ctx16.tag_length = 16;
    expectRC("wrong tag length", decryptFrame(good, ctx16, &out), MBusError::DecryptionFailed);
}

void test_telegram()
{
    TelegramState ts(0x01);
    Frame req, next;

    expectTrue("idle", ts.status() == TelegramStatus::Idle);
    expectRC("frame while idle", ts.handleFrame(rspFrame(true, 0x10, 1, false), &next), MBusError::UnexpectedFrame);
    expectTrue("still idle", ts.status() == TelegramStatus::Idle);

    // Three frames, the fcb alternates between every request.
    expectTrue("begin", ts.beginRequest(&req));
    expectHex("first request", packed(req), "107b017c16");
    expectTrue("second begin refused", !ts.beginRequest(&req));
    expectRC("frame 1", ts.handleFrame(rspFrame(true, 0x10, 1, true), &next), MBusError::OK);
    expectTrue("accumulating", ts.status() == TelegramStatus::Accumulating && ts.frameCount() == 1);
    expectHex("second request", packed(next), "105b015c16");
    expectRC("frame 2", ts.handleFrame(rspFrame(false, 0x11, 2, true), &next), MBusError::OK);
    expectHex("third request", packed(next), "107b017c16");
    expectRC("frame 3", ts.handleFrame(rspFrame(true, 0x12, 3, false), &next), MBusError::OK);
    expectTrue("complete", ts.status() == TelegramStatus::Complete && ts.frameCount() == 3);

    vector<uchar> expected;
    for (int i = 0; i < 3; ++i)
    {
        Frame f = rspFrame((i % 2) == 0, 0x10+i, i+1, i < 2);
        expected.insert(expected.end(), f.payload.begin(), f.payload.end());
    }
    Telegram t;
    expectTrue("take telegram", ts.takeTelegram(&t));
    expectTrue("telegram payload is the concatenation", t.payload == expected);
    expectTrue("telegram meta", t.num_frames == 3 && t.id == 0x12345678 && t.mfct == MANUFACTURER_KAM &&
               t.access_number == 0x10 && t.has_access_number && !t.encrypted);
    expectTrue("idle after take", ts.status() == TelegramStatus::Idle);
    expectTrue("nothing more to take", !ts.takeTelegram(&t));

    // Bare chunks without a tpl header are joined as they are.
    TelegramState tb(0x01);
    expectTrue("begin chunks", tb.beginRequest(&req));
    vector<uchar> chunks = { 0x01, 0x02, 0x03 };
    bool follows[] = { true, true, false };
    for (int i = 0; i < 3; ++i)
    {
        Frame f;
        f.kind = FrameKind::Long;
        f.c_field = C_RSP_UD | (i % 2 == 0 ? C_FCB : 0);
        f.a_field = 0x01;
        f.ci_field = CI_NO_TPL;
        f.payload.push_back(chunks[i]);
        f.more_records_follow = follows[i];
        expectRC("chunk", tb.handleFrame(f, &next), MBusError::OK);
    }
    vector<uchar> joined;
    expectTrue("chunks complete", tb.takePayload(&joined));
    expectHex("joined chunks", joined, "010203");

    // After an odd number of frames the next telegram starts with the other fcb.
    expectTrue("begin again", ts.beginRequest(&req));
    expectHex("request after three frames", packed(req), "105b015c16");
    ts.reset();

    for (int n = 2; n <= 10; ++n)
    {
        TelegramState s(0x01);
        Frame r;
        s.beginRequest(&r);
        vector<uchar> all;
        bool fcb = true;
        for (int i = 0; i < n; ++i)
        {
            if (r.c_field != (C_REQ_UD2 | (fcb ? C_FCB : 0)))
            {
                printf("ERROR! telegram of %d frames, request %d has c field %02x\n", n, i, r.c_field);
                num_errors_++;
            }
            Frame f = rspFrame(fcb, i, i, i < n-1);
            all.insert(all.end(), f.payload.begin(), f.payload.end());
            MBusError rc = s.handleFrame(f, &r);
            if (rc != MBusError::OK)
            {
                printf("ERROR! telegram of %d frames, frame %d gave %s\n", n, i, toString(rc));
                num_errors_++;
            }
            fcb = !fcb;
        }
        vector<uchar> got;
        expectTrue("complete telegram", s.takePayload(&got));
        expectTrue("payload of n frames", got == all);
    }

    // A timeout retries with the same fcb.
    TelegramState tt(0x01);
    tt.beginRequest(&req);
    expectRC("timeout", tt.onTimeout(), MBusError::Timeout);
    expectTrue("discarded after timeout", tt.status() == TelegramStatus::Discarded &&
               tt.lastError() == MBusError::Timeout && tt.buffer().size() == 0);
    expectTrue("fcb unchanged by timeout", tt.expectedFcb());
    expectTrue("retry", tt.beginRequest(&req));
    expectHex("retry request", packed(req), "107b017c16");

    // A repeated frame has the wrong fcb.
    expectRC("first frame", tt.handleFrame(rspFrame(true, 0x10, 1, true), &next), MBusError::OK);
    expectRC("repeated frame", tt.handleFrame(rspFrame(true, 0x10, 1, true), &next), MBusError::FcbMismatch);
    expectTrue("discarded after fcb mismatch", tt.status() == TelegramStatus::Discarded &&
               tt.buffer().size() == 0 && tt.lastError() == MBusError::FcbMismatch);

    tt.linkReset();
    expectTrue("fcb after link reset", tt.expectedFcb());

    tt.beginRequest(&req);
    expectRC("ack instead of data", tt.handleFrame(parseWired("E5"), &next), MBusError::UnexpectedFrame);
    expectTrue("discarded after ack", tt.status() == TelegramStatus::Discarded);
    tt.reset();
    expectTrue("idle after reset", tt.status() == TelegramStatus::Idle && tt.lastError() == MBusError::UnexpectedFrame);

    // Encrypted frames need a key.
    TelegramState te(0x01);
    te.beginRequest(&req);
    expectRC("encrypted without key", te.handleFrame(parseWired(mode5_rsp), &next), MBusError::InvalidCryptoContext);
    te.setCryptoContext(testContext());
    expectTrue("has key", te.hasCryptoContext());
    te.beginRequest(&req);
    expectRC("encrypted with key", te.handleFrame(parseWired(mode5_rsp), &next), MBusError::OK);
    expectTrue("encrypted complete", te.takeTelegram(&t));
    vector<uchar> plaintext = fromHex("0C1378563412");
    expectTrue("decrypted telegram", t.encrypted && t.payload.size() == 12+plaintext.size() &&
               equal(plaintext.begin(), plaintext.end(), t.payload.begin()+12));
    te.clearCryptoContext();
    expectTrue("key cleared", !te.hasCryptoContext());

    // Keys are picked by the meter id of the long tpl header.
    TelegramState tk(0x01);
    tk.addKey(0x87654321, fromHex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"));
    tk.beginRequest(&req);
    expectRC("no key for this meter", tk.handleFrame(parseWired(mode5_rsp), &next), MBusError::InvalidCryptoContext);
    CryptoContext wrong;
    wrong.key = fromHex("FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF");
    tk.setCryptoContext(wrong);
    tk.addKey(0x12345678, fromHex(key_hex));
    tk.beginRequest(&req);
    expectRC("key by meter id", tk.handleFrame(parseWired(mode5_rsp), &next), MBusError::OK);
    expectTrue("meter key complete", tk.takeTelegram(&t));
    expectTrue("decrypted with meter key", t.payload.size() == 12+plaintext.size() &&
               equal(plaintext.begin(), plaintext.end(), t.payload.begin()+12));
    expectTrue("context of meter", tk.cryptoContext().id == 0x12345678 && tk.cryptoContext().key == fromHex(key_hex));
}

void test_readout()
{
    vector<string> lines = {
        "# two frame telegram",
        string("telegram=|")+multi_rsp_1+"|",
        string("telegram=|")+multi_rsp_2+"|+1",
    };
    SimulatorTransport sim(lines);
    TelegramState state(0x01);
    ReadoutSettings settings;
    Telegram t;

    expectRC("readout", readoutTelegram(&sim, &state, settings, &t), MBusError::OK);
    expectTrue("two frames", t.num_frames == 2);
    Frame f1 = parseWired(multi_rsp_1);
    Frame f2 = parseWired(multi_rsp_2);
    vector<uchar> expected = f1.payload;
    expected.insert(expected.end(), f2.payload.begin(), f2.payload.end());
    expectTrue("readout payload", t.payload == expected);
    expectTrue("two requests", sim.sent().size() == 2);
    if (sim.sent().size() == 2)
    {
        expectHex("first request", sim.sent()[0], "107b017c16");
        expectHex("second request", sim.sent()[1], "105b015c16");
    }
    expectTrue("simulation done", sim.exhausted());

    SimulatorTransport silent(vector<string>{ "timeout" });
    TelegramState s2(0x01);
    expectRC("readout timeout", readoutTelegram(&silent, &s2, settings, &t), MBusError::Timeout);
    expectTrue("timeout keeps fcb", s2.status() == TelegramStatus::Discarded && s2.expectedFcb());

    SimulatorTransport endless(vector<string>{ string("telegram=|")+multi_rsp_1+"|" });
    TelegramState s3(0x01);
    ReadoutSettings one;
    one.max_frames = 1;
    expectRC("too many frames", readoutTelegram(&endless, &s3, one, &t), MBusError::TelegramTooLong);
    expectTrue("too long discarded", s3.status() == TelegramStatus::Discarded);

    SimulatorTransport reset(vector<string>{ "telegram=|E5|", string("telegram=|")+single_rsp+"|" });
    TelegramState s4(0x01);
    ReadoutSettings with_reset;
    with_reset.link_reset = true;
    expectRC("readout with link reset", readoutTelegram(&reset, &s4, with_reset, &t), MBusError::OK);
    expectTrue("link reset sent", reset.sent().size() == 2);
    if (reset.sent().size() == 2)
    {
        expectHex("snd_nke", reset.sent()[0], "1040014116");
        expectHex("request after reset", reset.sent()[1], "107b017c16");
    }

    SimulatorTransport noack(vector<string>{ "timeout" });
    expectRC("no ack", sendLinkReset(&noack, 0x01, 100), MBusError::Timeout);
}

void test_cache()
{
    CompactFrameCache small(10);
    expectTrue("capacity raised", small.capacity() == COMPACT_CACHE_MIN_CAPACITY);
    CompactFrameCache huge(5000);
    expectTrue("capacity lowered", huge.capacity() == COMPACT_CACHE_MAX_CAPACITY);

    CompactFrameCache cache(256);
    CacheEntry e;
    e.format = fromHex("0C1302FD17");
    for (int i = 0; i <= 256; ++i) cache.insert(i, e);
    expectTrue("size capped", cache.size() == 256);
    expectTrue("least recently used evicted", !cache.contains(0) && cache.contains(1) && cache.contains(256));
    expectTrue("one eviction", cache.stats().evictions == 1);

    // A lookup protects the entry from eviction.
    CacheEntry got;
    expectTrue("lookup", cache.lookup(1, &got));
    expectTrue("lookup format", got.format == e.format && got.signature == 1 && got.access_count == 1);
    cache.insert(1000, e);
    expectTrue("refreshed entry kept", cache.contains(1) && !cache.contains(2));
    expectTrue("most recent first", cache.recency()[0] == 1000 && cache.recency()[1] == 1);

    expectTrue("miss", !cache.lookup(0, &got));
    CacheStats st = cache.stats();
    expectTrue("stats", st.lookups == 2 && st.hits == 1 && st.misses == 1 && st.evictions == 2);

    expectTrue("remove", cache.remove(1000) && !cache.contains(1000));
    expectTrue("remove missing", !cache.remove(1000));
    cache.clear();
    expectTrue("cleared", cache.size() == 0);

    CacheEntry old_entry = e;
    old_entry.last_seen = 1000;
    CacheEntry new_entry = e;
    new_entry.last_seen = 5000;
    cache.insert(0x1111, old_entry);
    cache.insert(0x2222, new_entry);
    expectTrue("remove stale", cache.removeStale(100, 5050) == 1);
    expectTrue("stale gone", !cache.contains(0x1111) && cache.contains(0x2222));

    CompactFrameCache saved(256);
    for (int i = 0; i < 5; ++i)
    {
        CacheEntry x;
        x.format = fromHex("0C13");
        x.format.push_back(i);
        x.mfct = MANUFACTURER_KAM;
        x.id = 0x12345678+i;
        x.version = 1;
        x.type = 7;
        x.last_seen = 1000+i;
        saved.insert(0xa000+i, x);
    }
    string file = "/tmp/testinternals_compact_cache.txt";
    expectTrue("save", saved.save(file));
    vector<string> saved_lines;
    expectTrue("read saved file", loadFile(file, &saved_lines) == 0);
    expectTrue("one line per saved entry", saved_lines.size() == 5);
    CompactFrameCache loaded(256);
    expectTrue("load", loaded.load(file));
    expectTrue("load restores every entry", loaded.size() == 5);
    expectTrue("load keeps recency", loaded.recency() == saved.recency());
    CacheEntry l;
    expectTrue("loaded entry", loaded.lookup(0xa003, &l));
    expectTrue("loaded fields", l.id == 0x12345679+2 && l.mfct == MANUFACTURER_KAM && l.version == 1 && l.type == 7);
    expectHex("loaded format", l.format, "0C1303");
    remove(file.c_str());

    CompactFrameCache missing(256);
    expectTrue("load missing file", !missing.load("/tmp/testinternals_no_such_cache.txt"));
}

void test_compact()
{
    Frame full = parseWireless(plain_wmbus);
    uint16_t sig = 0;
    expectTrue("signature of full frame", signatureFor(full, &sig) && sig == 0xbb43);

    Frame compact;
    expectRC("build compact", buildCompactFrame(full, &compact), MBusError::OK);
    expectHex("compact frame", packed(compact), compact_wmbus);
    expectTrue("signature of compact frame", signatureFor(compact, &sig) && sig == 0xbb43);

    CompactFrameCache cache;
    bool hit = true;
    vector<uchar> records;
    CacheEntry e;
    expectRC("expand unknown", expandCompactFrame(compact, &cache, &hit, &records, &e), MBusError::OK);
    expectTrue("unknown format misses", !hit);

    expectTrue("learn", learnFormat(full, full.payload, &cache));
    expectRC("expand known", expandCompactFrame(compact, &cache, &hit, &records, &e), MBusError::OK);
    expectTrue("known format hits", hit);
    expectHex("expanded records", records, records_hex);
    expectTrue("entry identity", e.id == 0x12345678 && e.mfct == MANUFACTURER_KAM);

    Frame bad = compact;
    bad.payload[5] ^= 0x01;
    expectRC("bad data crc", expandCompactFrame(bad, &cache, &hit, &records, &e), MBusError::ChecksumMismatch);

    Frame encrypted = parseWireless(mode9_wmbus);
    expectRC("cannot compact encrypted", buildCompactFrame(encrypted, &compact), MBusError::UnexpectedFrame);
    expectTrue("no signature for encrypted", !signatureFor(encrypted, &sig));

    // Wired frames with a long header carry records after the header.
    Frame wired = parseWired(single_rsp);
    expectTrue("wired signature", signatureFor(wired, &sig) && sig == 0xbb43);
}

void test_decoder()
{
    CompactFrameCache cache;
    VendorQuirks quirks;
    registerBuiltinQuirks(&quirks);
    WMBusDecoder dec(&cache, &quirks);
    Telegram t;
    bool ffr = false;
    Frame request;

    expectRC("decode unknown compact", dec.decode(fromHex(compact_wmbus), &t, &ffr, &request), MBusError::OK);
    expectTrue("full frame requested", ffr);
    expectHex("full frame request", packed(request), "0c532d2c7856341201077643bbebf5");

    expectRC("decode full", dec.decode(fromHex(plain_wmbus), &t, &ffr, &request), MBusError::OK);
    expectTrue("no request", !ffr);
    expectHex("full payload", t.payload, records_hex);
    expectTrue("full identity", t.id == 0x12345678 && t.mfct == MANUFACTURER_KAM && !t.compact && !t.encrypted);

    expectRC("decode known compact", dec.decode(fromHex(compact_wmbus), &t, &ffr, &request), MBusError::OK);
    expectTrue("compact decoded", !ffr && t.compact);
    expectHex("compact payload", t.payload, records_hex);

    expectRC("decode without key", dec.decode(fromHex(mode9_wmbus), &t, &ffr, &request), MBusError::InvalidCryptoContext);
    dec.addKey(0x12345678, fromHex(key_hex));
    expectTrue("has key", dec.hasKey(0x12345678) && !dec.hasKey(0x87654321));
    expectRC("decode mode 9", dec.decode(fromHex(mode9_wmbus), &t, &ffr, &request), MBusError::OK);
    vector<uchar> records = fromHex(records_hex);
    expectTrue("mode 9 payload", t.encrypted && t.payload.size() == 4+records.size() &&
               equal(records.begin(), records.end(), t.payload.begin()+4));
    expectTrue("mode 9 access number", t.has_access_number && t.access_number == 0x20);

    vector<uchar> bad = fromHex(mode9_wmbus);
    bad.back() ^= 0x01;
    expectRC("decode mode 9 bad crc", dec.decode(bad, &t, &ffr, &request), MBusError::ChecksumMismatch);

    dec.setTagLength(16);
    expectRC("decode mode 9 wrong tag length", dec.decode(fromHex(mode9_wmbus), &t, &ffr, &request), MBusError::DecryptionFailed);
    dec.setTagLength(12);

    WMBusDecoder blocks(NULL, &quirks);
    blocks.setTypeABlocks(true);
    expectRC("decode type a", blocks.decode(fromHex(type_a_wmbus), &t, &ffr, &request), MBusError::OK);
    expectHex("type a payload", t.payload, records_hex);
    Frame broken = parseWireless(type_a_wmbus);
    broken.payload[0] ^= 0x01;
    sealFrame(&broken);
    vector<uchar> broken_bytes;
    packFrame(broken, &broken_bytes);
    expectRC("decode type a bad block", blocks.decode(broken_bytes, &t, &ffr, &request), MBusError::BlockCrcMismatch);

    bad = fromHex(plain_wmbus);
    bad.back() ^= 0x01;
    expectRC("decode bad crc", dec.decode(bad, &t, &ffr, &request), MBusError::ChecksumMismatch);
    quirks.registerCrcPolicy(MANUFACTURER_KAM,
                             [](uint16_t, const DeviceInfo &, CrcErrorKind kind, const CrcErrorContext &)
                             {
                                 return kind == CrcErrorKind::Frame ? Tolerance::Tolerate : Tolerance::NoOpinion;
                             });
    expectRC("decode tolerated bad crc", dec.decode(bad, &t, &ffr, &request), MBusError::OK);
    expectHex("tolerated payload", t.payload, records_hex);
}

// A bus with a number of slaves that answer secondary address selection.
struct FakeBus : public FrameTransport
{
    FakeBus(const vector<string> &devices) : devices_(devices) {}
    string device() { return "fakebus"; }

    MBusError send(const vector<uchar> &bytes)
    {
        Frame f;
        size_t len = 0;
        MBusError rc = parseMBusFrame(bytes, &f, &len);
        if (rc != MBusError::OK) return rc;
        reply_.clear();

        if (f.kind == FrameKind::Long && f.ci_field == CI_SELECT_SLAVE && f.payload.size() == 8)
        {
            const vector<uchar> &p = f.payload;
            string mask = tostrprintf("%02X%02X%02X%02X%02X%02X%02X%02X",
                                      p[3], p[2], p[1], p[0], p[5], p[4], p[6], p[7]);
            selected_.clear();
            for (string &d : devices_)
            {
                if (matchesSecondaryMask(mask, d)) selected_.push_back(d);
            }
            probes_++;
            if (selected_.size() == 1) reply_.push_back(MBUS_ACK);
            // Colliding acks.
            if (selected_.size() > 1) { reply_.push_back(0xff); reply_.push_back(0xe5); }
            return MBusError::OK;
        }
        if (f.kind == FrameKind::Short && f.a_field == MBUS_NETWORK_LAYER_ADDRESS && selected_.size() == 1)
        {
            vector<uchar> id, rest;
            hex2bin(selected_[0].substr(0, 8), &id);
            hex2bin(selected_[0].substr(8), &rest);
            Frame r;
            r.kind = FrameKind::Long;
            r.c_field = C_RSP_UD;
            r.a_field = MBUS_NETWORK_LAYER_ADDRESS;
            r.ci_field = CI_LONG_TPL;
            r.payload = { id[3], id[2], id[1], id[0], rest[1], rest[0], rest[2], rest[3], 0x01, 0x00, 0x00, 0x00 };
            sealFrame(&r);
            return packFrame(r, &reply_);
        }
        return MBusError::OK;
    }

    MBusError receive(vector<uchar> *bytes, int timeout_ms)
    {
        if (reply_.size() == 0) return MBusError::Timeout;
        *bytes = reply_;
        reply_.clear();
        return MBusError::OK;
    }

    int probes_ {};

private:
    vector<string> devices_;
    vector<string> selected_;
    vector<uchar> reply_;
};

void test_secondary()
{
    expectTrue("wildcard mask", isValidSecondaryMask("FFFFFFFFFFFFFFFF"));
    expectTrue("lower case mask", isValidSecondaryMask("123456782c2d0107"));
    expectTrue("id is bcd", !isValidSecondaryMask("1234567A2C2D0107"));
    expectTrue("mask length", !isValidSecondaryMask("12345678"));
    expectTrue("high byte in id", !isValidSecondaryMask("\xe9" "2345678" "2C2D0107"));
    expectTrue("high byte in manufacturer", !isValidSecondaryMask("12345678" "\xc2" "C2D0107"));
    expectTrue("high byte in address", !matchesSecondaryMask("1234567F2C2D0107", "\xff" "23456782C2D0107"));

    expectTrue("id wildcard", matchesSecondaryMask("1234567F2C2D0107", "123456782C2D0107"));
    expectTrue("id mismatch", !matchesSecondaryMask("1234567F2C2D0107", "123456882C2D0107"));
    expectTrue("manufacturer wildcard", matchesSecondaryMask("12345678FFFF0107", "123456782C2D0107"));
    expectTrue("version wildcard", matchesSecondaryMask("123456782C2DFF07", "123456782C2D0107"));
    expectTrue("manufacturer mismatch", !matchesSecondaryMask("1234567800000107", "123456782C2D0107"));

    Frame select;
    expectTrue("select frame", buildSelectFrame("123456782C2D0107", &select));
    expectHex("select frame bytes", packed(select), "680b0b6873fd52785634122d2c01073716");
    expectTrue("bad select mask", !buildSelectFrame("12345678", &select));

    vector<string> devices = { "123456782C2D0107", "123456992C2D0107", "876543212C2D0107" };
    FakeBus bus(devices);
    expectTrue("probe collision", probeSecondary(&bus, "FFFFFFFFFFFFFFFF", 100) == ProbeResult::Collision);
    expectTrue("probe single", probeSecondary(&bus, "8FFFFFFFFFFFFFFF", 100) == ProbeResult::Single);
    string address;
    expectRC("read address", readSecondaryAddress(&bus, 100, &address), MBusError::OK);
    expectTrue("address", address == "876543212C2D0107");
    expectTrue("probe nothing", probeSecondary(&bus, "5FFFFFFFFFFFFFFF", 100) == ProbeResult::Nothing);

    vector<string> found;
    expectRC("scan", scanSecondary(&bus, 100, &found), MBusError::OK);
    expectTrue("scan found all", found == devices);
}

void test_config()
{
    string content =
        "# engine settings\n"
        "loglevel=debug\n"
        "\n"
        "cachecapacity=512\n"
        "cachefile=/tmp/cache.txt\n"
        "taglength=16\n"
        "insertcrc=true\n"
        "typeablocks=false\n"
        "maxframes=4\n"
        "timeout=2s\n"
        "key=12345678:000102030405060708090A0B0C0D0E0F\n";
    vector<char> buf(content.begin(), content.end());
    EngineConfig c;
    expectTrue("parse configuration", parseConfiguration(&c, buf));
    expectTrue("loglevel", c.debug && !c.verbose);
    expectTrue("cache settings", c.cache_capacity == 512 && c.cache_file == "/tmp/cache.txt");
    expectTrue("crypto settings", c.tag_length == 16 && c.insert_crc && !c.type_a_blocks);
    expectTrue("readout settings", c.max_frames == 4 && c.timeout_ms == 2000);
    expectTrue("key", c.keys.size() == 1 && c.keys[0x12345678] == fromHex(key_hex));

    string bad_content = "taglength=13\nunknown=1\n";
    vector<char> bad(bad_content.begin(), bad_content.end());
    EngineConfig b;
    expectTrue("bad configuration", !parseConfiguration(&b, bad));
    expectTrue("bad tag length ignored", b.tag_length == 12);
    expectTrue("log to stderr by default", b.use_stderr_for_log && !b.use_logfile);

    string log_content = "logfile=syslog\nusestderr=false\n";
    vector<char> log_buf(log_content.begin(), log_content.end());
    EngineConfig lg;
    expectTrue("parse log settings", parseConfiguration(&lg, log_buf));
    expectTrue("log to syslog", lg.use_logfile && lg.logfile == "syslog");
    expectTrue("log to stdout", !lg.use_stderr_for_log);

    EngineConfig k;
    expectTrue("short key", !handleKey(&k, "12345678:0001"));
    expectTrue("no id", !handleKey(&k, "000102030405060708090A0B0C0D0E0F"));
    expectTrue("capacity too small", !handleCacheCapacity(&k, "100"));
    expectTrue("capacity too large", !handleCacheCapacity(&k, "2048"));
    expectTrue("zero frames", !handleMaxFrames(&k, "0"));
    expectTrue("zero timeout", !handleTimeout(&k, "0"));
    expectTrue("one minute", handleTimeout(&k, "1m") && k.timeout_ms == 60000);
    bool flag = false;
    expectTrue("bool yes", !handleBool("insertcrc", "yes", &flag));

    string file = "/tmp/testinternals_engine.conf";
    saveFile(file, "maxframes=7\n");
    EngineConfig lc;
    expectTrue("load configuration", loadConfiguration(&lc, file) && lc.max_frames == 7);
    remove(file.c_str());
}

void test_cmdline()
{
    char arg0[] = "mbusengine";
    char arg1[] = "--verbose";
    char arg2[] = "--taglength=16";
    char arg3[] = "--key=12345678:000102030405060708090A0B0C0D0E0F";
    char arg4[] = "--maxframes=4";
    char arg5[] = "--poll=5";
    char arg6[] = "--linkreset";
    char arg7[] = "--simulate=simulation.txt";
    char arg8[] = "15442d2c785634120107780c137856341202fd170000a7db";
    char *argv[] = { arg0, arg1, arg2, arg3, arg4, arg5, arg6, arg7, arg8 };

    EngineConfig c;
    parseCommandLine(&c, 9, argv);
    expectTrue("cmdline loglevel", c.verbose && !c.need_help);
    expectTrue("cmdline tag length", c.tag_length == 16);
    expectTrue("cmdline key", c.keys.count(0x12345678) == 1);
    expectTrue("cmdline max frames", c.max_frames == 4);
    expectTrue("cmdline poll", c.poll_address == 5 && c.link_reset);
    expectTrue("cmdline simulation", c.simulation_file == "simulation.txt");
    expectTrue("cmdline telegram", c.telegrams.size() == 1 && c.telegrams[0] == arg8);

    char *help[] = { arg0 };
    EngineConfig h;
    parseCommandLine(&h, 1, help);
    expectTrue("no arguments needs help", h.need_help);

    char log1[] = "--syslog";
    char log2[] = "--usestdoutforlogging";
    char *logargs[] = { arg0, log1, log2, arg8 };
    EngineConfig l;
    parseCommandLine(&l, 4, logargs);
    expectTrue("cmdline syslog", l.use_logfile && l.logfile == "syslog");
    expectTrue("cmdline stdout logging", !l.use_stderr_for_log);
}
