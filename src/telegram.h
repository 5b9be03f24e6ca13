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

#ifndef TELEGRAM_H
#define TELEGRAM_H

#include"crypto.h"
#include"errors.h"
#include"frame.h"
#include"util.h"

#include<map>
#include<vector>

#define LIST_OF_TELEGRAM_STATUS \
    X(Idle) \
    X(AwaitingFrame) \
    X(Accumulating) \
    X(Complete) \
    X(Discarded)

enum class TelegramStatus {
#define X(name) name,
LIST_OF_TELEGRAM_STATUS
#undef X
};

const char *toString(TelegramStatus s);

// A reassembled telegram as handed to the record decoder.
struct Telegram
{
    FrameKind kind {};
    uchar c_field {};
    uchar a_field {};
    uchar ci_field {};
    uint16_t mfct {};
    uint32_t id {};
    uchar version {};
    uchar type {};
    uchar access_number {};
    bool has_access_number {};
    bool encrypted {};
    bool compact {};
    int num_frames {};
    // The concatenated (decrypted) payloads of all frames, in order.
    std::vector<uchar> payload;

    std::string str() const;
};

// Drives one request/response cycle against one device. Not thread safe,
// each polled device gets its own instance.
struct TelegramState
{
    TelegramState(uchar address);

    TelegramStatus status() const { return status_; }
    uchar address() const { return address_; }
    bool expectedFcb() const { return fcb_; }
    int frameCount() const { return frame_count_; }
    const std::vector<uchar> &buffer() const { return buffer_; }
    MBusError lastError() const { return last_error_; }

    // Encrypted frames are decrypted with this key and settings.
    void setCryptoContext(const CryptoContext &ctx);
    void clearCryptoContext();
    bool hasCryptoContext() const { return has_crypto_context_; }
    // A key for the meter with this id. Frames with a long tpl header pick
    // their key by id, other frames use the key of the crypto context.
    void addKey(uint32_t id, const std::vector<uchar> &key);
    // The context as it was built for the last decrypted frame.
    const CryptoContext &cryptoContext() const { return last_crypto_context_; }

    // A SND_NKE resets the link, the next request uses fcb set.
    void linkReset();

    // Start a new telegram. Returns false if a request is already in flight.
    bool beginRequest(Frame *request);

    // Feed the response to the last request. When more records follow the
    // next request (with the toggled fcb acknowledging this frame) is stored in next_request.
    MBusError handleFrame(const Frame &frame, Frame *next_request);

    // Nothing arrived in time. The fcb is not toggled so a retry reuses it.
    MBusError onTimeout();

    // Abort the telegram, the accumulated bytes are dropped.
    void discard(MBusError reason);

    // Hand out the completed telegram. The buffer is cleared.
    bool takeTelegram(Telegram *t);
    bool takePayload(std::vector<uchar> *payload);

    // Back to Idle, keeps the fcb and the crypto context.
    void reset();

private:

    uchar address_ {};
    TelegramStatus status_ {};
    bool fcb_ { true };
    int frame_count_ {};
    std::vector<uchar> buffer_;
    MBusError last_error_ {};

    bool has_crypto_context_ {};
    CryptoContext crypto_context_;
    CryptoContext last_crypto_context_;
    std::map<uint32_t,std::vector<uchar>> keys_;

    // Metadata of the first frame of the telegram.
    Telegram meta_;
};

#endif
