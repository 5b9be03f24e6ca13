/*
 Copyright (C) 2024 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef ERRORS_H
#define ERRORS_H

// Every decode, validate, decrypt and reassembly step reports
// one of these. Nothing in the engine throws or retries on its own.
#define LIST_OF_MBUS_ERRORS \
    X(OK, false) \
    X(FrameIncomplete, true) \
    X(FrameMalformed, false) \
    X(ChecksumMismatch, true) \
    X(BlockCrcMismatch, true) \
    X(FcbMismatch, true) \
    X(Timeout, true) \
    X(DecryptionFailed, false) \
    X(InvalidCryptoContext, false) \
    X(UnsupportedSecurityMode, false) \
    X(TelegramTooLong, false) \
    X(UnexpectedFrame, false)

enum class MBusError {
#define X(name,retry) name,
LIST_OF_MBUS_ERRORS
#undef X
};

const char *toString(MBusError e);

// Retrying is always the caller's decision, this only says
// whether a retry can be expected to succeed without operator action.
bool isRetryable(MBusError e);

#endif
