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

#ifndef FRAME_H
#define FRAME_H

#include"errors.h"
#include"util.h"

#include<stdint.h>
#include<string>
#include<vector>

#define LIST_OF_FRAME_KINDS \
    X(Acknowledge) \
    X(Short) \
    X(Control) \
    X(Long) \
    X(Wireless)

enum class FrameKind {
#define X(name) name,
LIST_OF_FRAME_KINDS
#undef X
};

const char *toString(FrameKind k);

// Start and stop characters of the wired frames.
#define MBUS_ACK         0xe5
#define MBUS_SHORT_START 0x10
#define MBUS_LONG_START  0x68
#define MBUS_STOP        0x16

// C field values.
#define C_SND_NKE 0x40
#define C_SND_UD  0x53
#define C_REQ_UD1 0x5a
#define C_REQ_UD2 0x5b
#define C_RSP_UD  0x08
#define C_FCB     0x20
#define C_FCV     0x10

#define MBUS_NETWORK_LAYER_ADDRESS 0xfd

// CI field values.
#define CI_APPLICATION_RESET  0x50
#define CI_DATA_SEND          0x51
#define CI_SELECT_SLAVE       0x52
#define CI_LONG_TPL           0x72
#define CI_FIXED_RESPONSE     0x73
#define CI_FULL_FRAME_REQUEST 0x76
#define CI_NO_TPL             0x78
#define CI_COMPACT_FRAME      0x79
#define CI_SHORT_TPL          0x7a

// L is a single byte, 3 of them are taken by C A CI.
#define MBUS_MAX_LONG_PAYLOAD 252
// L is a single byte, 10 of them are taken by C M A V T CI.
#define WMBUS_MAX_PAYLOAD 245

struct Frame
{
    FrameKind kind {};
    uchar c_field {};
    uchar a_field {}; // Primary address, wired frames only.
    uchar ci_field {};
    std::vector<uchar> payload; // The bytes after the ci field, excluding checksum/crc.
    uchar checksum {};  // Wired frames.
    uint16_t crc {};    // Wireless frames.
    bool more_records_follow {};
    bool encrypted {};

    // Wireless data link layer, the address is M A V T.
    uint16_t dll_mfct {};
    uint32_t dll_id {};
    uchar dll_version {};
    uchar dll_type {};

    bool operator==(const Frame &f) const;
    bool operator!=(const Frame &f) const { return !(*this == f); }

    bool fcb() const { return (c_field & C_FCB) != 0; }
    std::string str() const;
};

// The transport layer header found after ci 0x7a (short) and ci 0x72 (long).
struct TPLHeader
{
    bool found {};
    bool long_header {};
    uint32_t id {};
    uint16_t mfct {};
    uchar version {};
    uchar type {};
    uchar acc {};
    uchar sts {};
    uint16_t cfg {};
    size_t header_len {};

    int securityMode() const { return (cfg >> 8) & 0x1f; }
    int numEncryptedBlocks() const { return (cfg >> 4) & 0x0f; }
};

// Returns false only when the ci announces a tpl header that is truncated.
// A ci without tpl header returns true with tpl->found false.
bool parseTPLHeader(uchar ci, const std::vector<uchar> &payload, TPLHeader *tpl);

// Must be consulted before any block crc check is attempted.
bool isEncryptedFrame(uchar c_field, uchar ci_field);

// Scan the records of an unencrypted payload for the 0x1f more records follow dif.
bool moreRecordsFollow(uchar ci_field, const std::vector<uchar> &payload);

// Parse exactly one frame from the start of data. The number of bytes
// consumed is stored in frame_length, the remainder belongs to the next frame.
MBusError parseMBusFrame(const std::vector<uchar> &data, Frame *frame, size_t *frame_length);
MBusError parseWMBusFrame(const std::vector<uchar> &data, Frame *frame, size_t *frame_length);

// The checksum and crc are always recomputed, the values in the frame are ignored.
MBusError packFrame(const Frame &frame, std::vector<uchar> *out);

// The crc check of an encrypted wireless frame is deferred until the
// payload has been successfully decrypted.
MBusError verifyDeferredCrc(const Frame &frame);

// Compute checksum, crc and the derived flags, the same way parsing does.
void sealFrame(Frame *frame);

Frame buildSndNke(uchar address);
Frame buildReqUd2(uchar address, bool fcb);
Frame buildReqUd1(uchar address, bool fcb);
Frame buildApplicationReset(uchar address, bool fcb);
Frame buildFullFrameRequest(uchar address, uint16_t signature, bool fcb);
Frame buildWMBusFullFrameRequest(const Frame &compact, uint16_t signature);

#endif
