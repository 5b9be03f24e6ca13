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

#include"readout.h"

using namespace std;

static MBusError sendFrame(FrameTransport *transport, const Frame &frame)
{
    vector<uchar> bytes;
    MBusError rc = packFrame(frame, &bytes);
    if (rc != MBusError::OK) return rc;
    debug("(readout) sending %s\n", frame.str().c_str());
    return transport->send(bytes);
}

static MBusError receiveFrame(FrameTransport *transport, int timeout_ms, Frame *frame)
{
    vector<uchar> bytes;
    MBusError rc = transport->receive(&bytes, timeout_ms);
    if (rc != MBusError::OK) return rc;

    size_t frame_length = 0;
    rc = parseMBusFrame(bytes, frame, &frame_length);
    if (rc != MBusError::OK) return rc;
    if (frame_length != bytes.size())
    {
        warning("(readout) ignoring %zu trailing bytes after frame\n", bytes.size()-frame_length);
    }
    return MBusError::OK;
}

MBusError sendLinkReset(FrameTransport *transport, uchar address, int timeout_ms)
{
    MBusError rc = sendFrame(transport, buildSndNke(address));
    if (rc != MBusError::OK) return rc;

    Frame reply;
    rc = receiveFrame(transport, timeout_ms, &reply);
    if (rc != MBusError::OK)
    {
        verbose("(readout) no ack on link reset of %02x: %s\n", address, toString(rc));
        return rc;
    }
    if (reply.kind != FrameKind::Acknowledge)
    {
        verbose("(readout) expected ack on link reset of %02x but got %s\n", address, reply.str().c_str());
        return MBusError::UnexpectedFrame;
    }
    return MBusError::OK;
}

MBusError readoutTelegram(FrameTransport *transport,
                          TelegramState *state,
                          const ReadoutSettings &settings,
                          Telegram *telegram)
{
    MBusError rc;
    if (settings.link_reset)
    {
        rc = sendLinkReset(transport, state->address(), settings.timeout_ms);
        if (rc != MBusError::OK) return rc;
        state->linkReset();
    }

    Frame request;
    if (!state->beginRequest(&request)) return MBusError::UnexpectedFrame;

    for (;;)
    {
        rc = sendFrame(transport, request);
        if (rc != MBusError::OK)
        {
            state->discard(rc);
            return rc;
        }

        Frame frame;
        rc = receiveFrame(transport, settings.timeout_ms, &frame);
        if (rc == MBusError::Timeout)
        {
            return state->onTimeout();
        }
        if (rc != MBusError::OK)
        {
            state->discard(rc);
            return rc;
        }

        Frame next;
        rc = state->handleFrame(frame, &next);
        if (rc != MBusError::OK) return rc;

        if (state->status() == TelegramStatus::Complete)
        {
            state->takeTelegram(telegram);
            verbose("(readout) %s\n", telegram->str().c_str());
            return MBusError::OK;
        }

        if (state->frameCount() >= settings.max_frames)
        {
            warning("(readout) %02x telegram exceeds %d frames\n", state->address(), settings.max_frames);
            state->discard(MBusError::TelegramTooLong);
            return MBusError::TelegramTooLong;
        }
        request = next;
    }
}
