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

#ifndef READOUT_H
#define READOUT_H

#include"telegram.h"
#include"transport.h"

struct ReadoutSettings
{
    // Telegrams longer than this are abandoned with TelegramTooLong.
    int max_frames { 10 };
    // Per awaited frame.
    int timeout_ms { 1000 };
    // Send SND_NKE before the first request.
    bool link_reset {};
};

// Send SND_NKE and wait for the single character ack.
MBusError sendLinkReset(FrameTransport *transport, uchar address, int timeout_ms);

// Poll one device with REQ_UD2 until the last frame of the telegram has
// arrived. Nothing is retried, a failed readout leaves the state Discarded
// and a new call reuses the fcb of the failed attempt.
MBusError readoutTelegram(FrameTransport *transport,
                          TelegramState *state,
                          const ReadoutSettings &settings,
                          Telegram *telegram);

#endif
