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

#ifndef CRYPTO_H
#define CRYPTO_H

#include"errors.h"
#include"frame.h"
#include"util.h"

#include<vector>

#define LIST_OF_TPL_SECURITY_MODES \
    X(NoSecurity, 0) \
    X(AES_CTR, 5) \
    X(AES_CBC_IV, 7) \
    X(AES_GCM, 9)

enum class TPLSecurityMode {
#define X(name,nr) name,
LIST_OF_TPL_SECURITY_MODES
#undef X
};

int toInt(TPLSecurityMode tsm);
const char *toString(TPLSecurityMode tsm);
// Returns false if the mode number is not one we can handle.
bool fromIntToTPLSecurityMode(int i, TPLSecurityMode *tsm);

struct CryptoContext
{
    // Identity of the meter, from the long tpl header or the wireless dll.
    uint16_t mfct {};
    uint32_t id {};
    uchar version {};
    uchar type {};

    // Always taken from the frame being decrypted, never from an earlier telegram.
    uchar access_number {};
    bool has_access_number {};

    // L and C of the frame, part of the gcm aad.
    uchar length_field {};
    uchar c_field {};

    // Mode 9 tags are truncated to 12 or 16 bytes.
    int tag_length { 12 };
    // Prepend a crc to the plaintext before encryption and verify it after decryption.
    bool insert_crc {};

    // Provisioned 128 bit key.
    std::vector<uchar> key;
};

// Fill in the frame dependent parts of the context: identity, access number, L and C.
// The key, tag length and crc policy are kept.
MBusError buildCryptoContext(const Frame &frame, CryptoContext *ctx);

// Decrypt the bytes after the tpl header. The frame is not modified.
// A frame with security mode 0 returns the bytes after the header as they are.
MBusError decryptFrame(const Frame &frame, const CryptoContext &ctx, std::vector<uchar> *plaintext);

// Build a new frame from the tpl header of frame followed by the encrypted plaintext.
// The security mode in the tpl configuration word is set to mode.
MBusError encryptFrame(const Frame &frame,
                       const std::vector<uchar> &plaintext,
                       TPLSecurityMode mode,
                       const CryptoContext &ctx,
                       Frame *encrypted);

// The frame payload with the encrypted part replaced by the plaintext.
MBusError decryptedPayload(const Frame &frame, const CryptoContext &ctx, std::vector<uchar> *payload);

#endif
