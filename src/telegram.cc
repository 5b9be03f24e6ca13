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

#include"telegram.h"
#include"vendor_quirks.h"

using namespace std;

const char *toString(TelegramStatus s)
{
    switch (s)
    {
#define X(name) case TelegramStatus::name: return #name;
LIST_OF_TELEGRAM_STATUS
#undef X
    }
    return "?";
}

string Telegram::str() const
{
    string s = tostrprintf("%s ci=%02x", toString(kind), ci_field);
    if (kind == FrameKind::Wireless || id != 0)
    {
        s += tostrprintf(" %s id=%08x v=%02x t=%02x", manufacturerFlag(mfct).c_str(), id, version, type);
    }
    else
    {
        s += tostrprintf(" a=%02x", a_field);
    }
    if (has_access_number) s += tostrprintf(" acc=%02x", access_number);
    s += tostrprintf(" frames=%d len=%zu", num_frames, payload.size());
    if (encrypted) s += " decrypted";
    if (compact) s += " compact";
    return s;
}

TelegramState::TelegramState(uchar address) : address_(address)
{
}

void TelegramState::setCryptoContext(const CryptoContext &ctx)
{
    crypto_context_ = ctx;
    has_crypto_context_ = true;
}

void TelegramState::clearCryptoContext()
{
    crypto_context_ = CryptoContext();
    has_crypto_context_ = false;
}

void TelegramState::addKey(uint32_t id, const vector<uchar> &key)
{
    keys_[id] = key;
}

void TelegramState::linkReset()
{
    fcb_ = true;
}

bool TelegramState::beginRequest(Frame *request)
{
    if (status_ == TelegramStatus::AwaitingFrame ||
        status_ == TelegramStatus::Accumulating)
    {
        warning("(telegram) request to %02x already in flight\n", address_);
        return false;
    }
    buffer_.clear();
    frame_count_ = 0;
    meta_ = Telegram();
    last_error_ = MBusError::OK;
    status_ = TelegramStatus::AwaitingFrame;
    *request = buildReqUd2(address_, fcb_);
    debug("(telegram) %02x request with fcb %d\n", address_, fcb_);
    return true;
}

static void recordMeta(const Frame &frame, const TPLHeader &tpl, Telegram *t)
{
    t->kind = frame.kind;
    t->c_field = frame.c_field;
    t->a_field = frame.a_field;
    t->ci_field = frame.ci_field;
    if (frame.kind == FrameKind::Wireless)
    {
        t->mfct = frame.dll_mfct;
        t->id = frame.dll_id;
        t->version = frame.dll_version;
        t->type = frame.dll_type;
    }
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
}

MBusError TelegramState::handleFrame(const Frame &frame, Frame *next_request)
{
    if (status_ != TelegramStatus::AwaitingFrame &&
        status_ != TelegramStatus::Accumulating)
    {
        verbose("(telegram) %02x not expecting a frame in state %s\n", address_, toString(status_));
        return MBusError::UnexpectedFrame;
    }

    if (frame.kind != FrameKind::Long)
    {
        verbose("(telegram) %02x expected a long frame but got %s\n", address_, frame.str().c_str());
        discard(MBusError::UnexpectedFrame);
        return MBusError::UnexpectedFrame;
    }

    if (frame.fcb() != fcb_)
    {
        verbose("(telegram) %02x fcb %d expected %d\n", address_, frame.fcb(), fcb_);
        discard(MBusError::FcbMismatch);
        return MBusError::FcbMismatch;
    }

    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl))
    {
        discard(MBusError::FrameMalformed);
        return MBusError::FrameMalformed;
    }

    vector<uchar> payload;
    bool more = frame.more_records_follow;
    bool needs_key = frame.encrypted && !(tpl.found && tpl.securityMode() == 0);
    if (needs_key)
    {
        CryptoContext ctx = crypto_context_;
        bool has_key = has_crypto_context_;
        if (tpl.long_header && keys_.count(tpl.id) > 0)
        {
            ctx.key = keys_[tpl.id];
            has_key = true;
        }
        if (!has_key)
        {
            verbose("(telegram) %02x frame is encrypted but there is no key\n", address_);
            discard(MBusError::InvalidCryptoContext);
            return MBusError::InvalidCryptoContext;
        }
        MBusError rc = decryptedPayload(frame, ctx, &payload);
        if (rc != MBusError::OK)
        {
            discard(rc);
            return rc;
        }
        // Remember the context of this frame, not of an earlier one.
        buildCryptoContext(frame, &ctx);
        last_crypto_context_ = ctx;
        more = moreRecordsFollow(frame.ci_field, payload);
    }
    else
    {
        payload = frame.payload;
    }

    if (frame_count_ == 0)
    {
        recordMeta(frame, tpl, &meta_);
        meta_.encrypted = needs_key;
    }

    buffer_.insert(buffer_.end(), payload.begin(), payload.end());
    frame_count_++;
    fcb_ = !fcb_;

    if (more)
    {
        status_ = TelegramStatus::Accumulating;
        *next_request = buildReqUd2(address_, fcb_);
        debug("(telegram) %02x frame %d accumulated %zu bytes, requesting next with fcb %d\n",
              address_, frame_count_, buffer_.size(), fcb_);
        return MBusError::OK;
    }

    status_ = TelegramStatus::Complete;
    debug("(telegram) %02x complete after %d frames, %zu bytes\n", address_, frame_count_, buffer_.size());
    return MBusError::OK;
}

MBusError TelegramState::onTimeout()
{
    if (status_ == TelegramStatus::AwaitingFrame ||
        status_ == TelegramStatus::Accumulating)
    {
        verbose("(telegram) %02x timeout after %d frames\n", address_, frame_count_);
        discard(MBusError::Timeout);
    }
    return MBusError::Timeout;
}

void TelegramState::discard(MBusError reason)
{
    if (buffer_.size() > 0)
    {
        debug("(telegram) %02x discarding %zu accumulated bytes (%s)\n", address_, buffer_.size(), toString(reason));
    }
    buffer_.clear();
    buffer_.shrink_to_fit();
    frame_count_ = 0;
    meta_ = Telegram();
    last_error_ = reason;
    status_ = TelegramStatus::Discarded;
}

bool TelegramState::takeTelegram(Telegram *t)
{
    if (status_ != TelegramStatus::Complete) return false;
    *t = meta_;
    t->num_frames = frame_count_;
    t->payload.swap(buffer_);
    reset();
    return true;
}

bool TelegramState::takePayload(vector<uchar> *payload)
{
    if (status_ != TelegramStatus::Complete) return false;
    payload->swap(buffer_);
    reset();
    return true;
}

void TelegramState::reset()
{
    buffer_.clear();
    frame_count_ = 0;
    meta_ = Telegram();
    status_ = TelegramStatus::Idle;
}
