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
#include"crypto.h"
#include"threads.h"

#include<memory.h>

using namespace std;

// The aes implementation keeps its expanded key in static storage.
RecursiveMutex aes_mutex_("aes_mutex");

int toInt(TPLSecurityMode tsm)
{
    switch (tsm) {

#define X(name,nr) case TPLSecurityMode::name : return nr;
LIST_OF_TPL_SECURITY_MODES
#undef X
    }

    return -1;
}

const char *toString(TPLSecurityMode tsm)
{
    switch (tsm) {

#define X(name,nr) case TPLSecurityMode::name : return #name;
LIST_OF_TPL_SECURITY_MODES
#undef X
    }

    return "Reserved";
}

bool fromIntToTPLSecurityMode(int i, TPLSecurityMode *tsm)
{
    switch (i) {

#define X(name,nr) case nr: *tsm = TPLSecurityMode::name; return true;
LIST_OF_TPL_SECURITY_MODES
#undef X
    }

    return false;
}

// Number of bytes before the payload that are counted by the L field.
static size_t lengthOverhead(const Frame &frame)
{
    if (frame.kind == FrameKind::Wireless) return 10;
    return 3;
}

MBusError buildCryptoContext(const Frame &frame, CryptoContext *ctx)
{
    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl))
    {
        verbose("(crypto) truncated tpl header\n");
        return MBusError::FrameMalformed;
    }
    ctx->has_access_number = false;
    ctx->access_number = 0;
    if (!tpl.found)
    {
        verbose("(crypto) ci %02x has no tpl header and therefore no access number\n", frame.ci_field);
        return MBusError::InvalidCryptoContext;
    }

    if (tpl.long_header)
    {
        ctx->mfct = tpl.mfct;
        ctx->id = tpl.id;
        ctx->version = tpl.version;
        ctx->type = tpl.type;
    }
    else if (frame.kind == FrameKind::Wireless)
    {
        ctx->mfct = frame.dll_mfct;
        ctx->id = frame.dll_id;
        ctx->version = frame.dll_version;
        ctx->type = frame.dll_type;
    }
    else
    {
        verbose("(crypto) short tpl header in a wired frame does not identify the meter\n");
        return MBusError::InvalidCryptoContext;
    }

    ctx->access_number = tpl.acc;
    ctx->has_access_number = true;
    ctx->length_field = (uchar)(lengthOverhead(frame) + frame.payload.size());
    ctx->c_field = frame.c_field;
    return MBusError::OK;
}

static bool checkContext(const CryptoContext &ctx, int mode)
{
    if (!ctx.has_access_number)
    {
        verbose("(crypto) no access number\n");
        return false;
    }
    if (ctx.key.size() != 16)
    {
        verbose("(crypto) key must be 16 bytes but is %zu bytes\n", ctx.key.size());
        return false;
    }
    if (mode == 9 && ctx.tag_length != 12 && ctx.tag_length != 16)
    {
        verbose("(crypto) tag length must be 12 or 16 but is %d\n", ctx.tag_length);
        return false;
    }
    return true;
}

// M M A A A A
static void addIdentity(const CryptoContext &ctx, uchar *p)
{
    p[0] = ctx.mfct & 0xff;
    p[1] = ctx.mfct >> 8;
    p[2] = ctx.id & 0xff;
    p[3] = (ctx.id >> 8) & 0xff;
    p[4] = (ctx.id >> 16) & 0xff;
    p[5] = (ctx.id >> 24) & 0xff;
}

static void buildCounterBlock(const CryptoContext &ctx, uchar *iv)
{
    memset(iv, 0, 16);
    addIdentity(ctx, iv);
    iv[6] = ctx.version;
    iv[7] = ctx.type;
    iv[8] = ctx.access_number;
}

static void buildCbcIV(const CryptoContext &ctx, uchar *iv)
{
    addIdentity(ctx, iv);
    iv[6] = ctx.version;
    iv[7] = ctx.type;
    for (int j=0; j<8; ++j) { iv[8+j] = ctx.access_number; }
}

static void buildGcmNonce(const CryptoContext &ctx, uchar *nonce)
{
    memset(nonce, 0, 12);
    addIdentity(ctx, nonce);
    nonce[6] = ctx.access_number;
}

static void buildGcmAAD(const CryptoContext &ctx, uchar *aad)
{
    aad[0] = ctx.length_field;
    aad[1] = ctx.c_field;
    addIdentity(ctx, aad+2);
    aad[8] = ctx.version;
    aad[9] = ctx.type;
    aad[10] = ctx.access_number;
}

// The same function both encrypts and decrypts.
static void aesCtr(const CryptoContext &ctx, const vector<uchar> &in, vector<uchar> *out)
{
    uchar iv[16];
    buildCounterBlock(ctx, iv);
    debug("(crypto) ctr counter %s\n", bin2hex(iv, 16).c_str());

    out->resize(in.size());
    uchar key[16];
    memcpy(key, &ctx.key[0], 16);

    WITH(aes_mutex_, aesCtr);
    for (size_t offset = 0; offset < in.size(); offset += 16)
    {
        size_t block_size = 16;
        if (offset + block_size > in.size())
        {
            block_size = in.size() - offset;
        }
        uchar xordata[16];
        AES_ECB_encrypt(iv, key, xordata, 16);
        for (size_t j=0; j<block_size; ++j) (*out)[offset+j] = in[offset+j] ^ xordata[j];
        incrementIV(iv, sizeof(iv));
    }
}

static MBusError aesCbcEncrypt(const CryptoContext &ctx, const vector<uchar> &in, vector<uchar> *out)
{
    // Pkcs7, a full block of padding is added when the input is already aligned.
    vector<uchar> padded = in;
    size_t pad = 16 - in.size() % 16;
    padded.insert(padded.end(), pad, (uchar)pad);

    uchar iv[16];
    buildCbcIV(ctx, iv);
    debug("(crypto) cbc iv %s\n", bin2hex(iv, 16).c_str());

    out->resize(padded.size());
    uchar key[16];
    memcpy(key, &ctx.key[0], 16);

    WITH(aes_mutex_, aesCbcEncrypt);
    AES_CBC_encrypt_buffer(&(*out)[0], &padded[0], padded.size(), key, iv);
    return MBusError::OK;
}

static MBusError aesCbcDecrypt(const CryptoContext &ctx, const vector<uchar> &in, vector<uchar> *out)
{
    if (in.size() == 0 || in.size() % 16 != 0)
    {
        verbose("(crypto) cbc input of %zu bytes is not a multiple of 16\n", in.size());
        return MBusError::DecryptionFailed;
    }

    uchar iv[16];
    buildCbcIV(ctx, iv);
    debug("(crypto) cbc iv %s\n", bin2hex(iv, 16).c_str());

    vector<uchar> buffer = in;
    out->resize(in.size());
    uchar key[16];
    memcpy(key, &ctx.key[0], 16);
    {
        WITH(aes_mutex_, aesCbcDecrypt);
        AES_CBC_decrypt_buffer(&(*out)[0], &buffer[0], buffer.size(), key, iv);
    }

    // A wrong key shows up as broken padding.
    size_t pad = out->back();
    if (pad < 1 || pad > 16)
    {
        verbose("(crypto) bad cbc padding %zu\n", pad);
        out->clear();
        return MBusError::DecryptionFailed;
    }
    for (size_t i = out->size()-pad; i < out->size(); ++i)
    {
        if ((*out)[i] != pad)
        {
            verbose("(crypto) bad cbc padding\n");
            out->clear();
            return MBusError::DecryptionFailed;
        }
    }
    out->resize(out->size()-pad);
    return MBusError::OK;
}

static MBusError aesGcmEncrypt(const CryptoContext &ctx, const vector<uchar> &in, vector<uchar> *out)
{
    uchar nonce[12];
    uchar aad[11];
    uchar tag[16];
    uchar key[16];
    buildGcmNonce(ctx, nonce);
    buildGcmAAD(ctx, aad);
    memcpy(key, &ctx.key[0], 16);
    debug("(crypto) gcm nonce %s aad %s\n", bin2hex(nonce, 12).c_str(), bin2hex(aad, 11).c_str());

    vector<uchar> input = in;
    out->resize(in.size());
    {
        WITH(aes_mutex_, aesGcmEncrypt);
        AES_GCM_encrypt(key, nonce, aad, sizeof(aad),
                        safeButUnsafeVectorPtr(input), input.size(), safeButUnsafeVectorPtr(*out),
                        tag, ctx.tag_length);
    }
    out->insert(out->end(), tag, tag+ctx.tag_length);
    return MBusError::OK;
}

static MBusError aesGcmDecrypt(const CryptoContext &ctx, const vector<uchar> &in, vector<uchar> *out)
{
    if (in.size() < (size_t)ctx.tag_length)
    {
        verbose("(crypto) gcm input of %zu bytes is shorter than the tag\n", in.size());
        return MBusError::DecryptionFailed;
    }
    uchar nonce[12];
    uchar aad[11];
    uchar tag[16];
    uchar key[16];
    buildGcmNonce(ctx, nonce);
    buildGcmAAD(ctx, aad);
    memcpy(key, &ctx.key[0], 16);
    debug("(crypto) gcm nonce %s aad %s\n", bin2hex(nonce, 12).c_str(), bin2hex(aad, 11).c_str());

    size_t len = in.size()-ctx.tag_length;
    vector<uchar> input(in.begin(), in.begin()+len);
    memcpy(tag, &in[len], ctx.tag_length);
    out->resize(len);

    bool ok;
    {
        WITH(aes_mutex_, aesGcmDecrypt);
        ok = AES_GCM_decrypt(key, nonce, aad, sizeof(aad),
                             safeButUnsafeVectorPtr(input), len, safeButUnsafeVectorPtr(*out),
                             tag, ctx.tag_length);
    }
    if (!ok)
    {
        verbose("(crypto) gcm tag mismatch\n");
        out->clear();
        return MBusError::DecryptionFailed;
    }
    return MBusError::OK;
}

MBusError decryptFrame(const Frame &frame, const CryptoContext &ctx, vector<uchar> *plaintext)
{
    plaintext->clear();

    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl))
    {
        return MBusError::FrameMalformed;
    }
    if (!tpl.found && !frame.encrypted)
    {
        *plaintext = frame.payload;
        return MBusError::OK;
    }
    if (tpl.found && tpl.securityMode() == 0)
    {
        plaintext->insert(plaintext->end(), frame.payload.begin()+tpl.header_len, frame.payload.end());
        return MBusError::OK;
    }

    CryptoContext fc = ctx;
    MBusError rc = buildCryptoContext(frame, &fc);
    if (rc != MBusError::OK) return rc;

    TPLSecurityMode mode;
    if (!fromIntToTPLSecurityMode(tpl.securityMode(), &mode))
    {
        verbose("(crypto) security mode %d not supported\n", tpl.securityMode());
        return MBusError::UnsupportedSecurityMode;
    }
    if (!checkContext(fc, toInt(mode))) return MBusError::InvalidCryptoContext;

    vector<uchar> encrypted(frame.payload.begin()+tpl.header_len, frame.payload.end());
    debugPayload("(crypto) decrypting", encrypted);

    vector<uchar> decrypted;
    switch (mode)
    {
    case TPLSecurityMode::AES_CTR:
        aesCtr(fc, encrypted, &decrypted);
        break;
    case TPLSecurityMode::AES_CBC_IV:
        rc = aesCbcDecrypt(fc, encrypted, &decrypted);
        break;
    case TPLSecurityMode::AES_GCM:
        rc = aesGcmDecrypt(fc, encrypted, &decrypted);
        break;
    case TPLSecurityMode::NoSecurity:
        decrypted = encrypted;
        break;
    }
    if (rc != MBusError::OK) return rc;

    if (fc.insert_crc)
    {
        if (decrypted.size() < 2)
        {
            verbose("(crypto) no room for the inserted crc\n");
            return MBusError::DecryptionFailed;
        }
        uint16_t got = decrypted[1] << 8 | decrypted[0];
        uint16_t crc = crc16_EN13757_block(safeButUnsafeVectorPtr(decrypted)+2, decrypted.size()-2);
        if (got != crc)
        {
            // Without an authentication tag this is how a wrong key is detected.
            verbose("(crypto) inserted crc %04x expected %04x\n", got, crc);
            return MBusError::DecryptionFailed;
        }
        decrypted.erase(decrypted.begin(), decrypted.begin()+2);
    }

    debugPayload("(crypto) decrypted", decrypted);
    *plaintext = decrypted;
    return MBusError::OK;
}

MBusError encryptFrame(const Frame &frame,
                       const vector<uchar> &plaintext,
                       TPLSecurityMode mode,
                       const CryptoContext &ctx,
                       Frame *encrypted)
{
    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl))
    {
        return MBusError::FrameMalformed;
    }
    if (!tpl.found)
    {
        verbose("(crypto) cannot encrypt, ci %02x has no tpl header\n", frame.ci_field);
        return MBusError::InvalidCryptoContext;
    }

    Frame out = frame;
    out.payload.assign(frame.payload.begin(), frame.payload.begin()+tpl.header_len);

    vector<uchar> input;
    if (ctx.insert_crc && mode != TPLSecurityMode::NoSecurity)
    {
        uint16_t crc = crc16_EN13757_block(plaintext.size() ? &plaintext[0] : NULL, plaintext.size());
        input.push_back(crc & 0xff);
        input.push_back(crc >> 8);
    }
    input.insert(input.end(), plaintext.begin(), plaintext.end());

    // Predict the size of the encrypted part, the gcm aad includes the final L field.
    size_t enc_len = input.size();
    if (mode == TPLSecurityMode::AES_CBC_IV) enc_len = (input.size()/16+1)*16;
    if (mode == TPLSecurityMode::AES_GCM) enc_len = input.size()+ctx.tag_length;

    // Store mode and number of encrypted blocks in the configuration word.
    uint16_t cfg = tpl.cfg & ~0x1ff0;
    cfg |= (toInt(mode) & 0x1f) << 8;
    if (mode != TPLSecurityMode::NoSecurity)
    {
        size_t nb = (enc_len+15)/16;
        if (nb > 15) nb = 15;
        cfg |= nb << 4;
    }
    out.payload[tpl.header_len-2] = cfg & 0xff;
    out.payload[tpl.header_len-1] = cfg >> 8;

    CryptoContext fc = ctx;
    MBusError rc = MBusError::OK;
    if (mode != TPLSecurityMode::NoSecurity)
    {
        rc = buildCryptoContext(out, &fc);
        if (rc != MBusError::OK) return rc;
        fc.length_field = (uchar)(lengthOverhead(out) + out.payload.size() + enc_len);
        if (!checkContext(fc, toInt(mode))) return MBusError::InvalidCryptoContext;
    }

    vector<uchar> output;
    switch (mode)
    {
    case TPLSecurityMode::AES_CTR:
        aesCtr(fc, input, &output);
        break;
    case TPLSecurityMode::AES_CBC_IV:
        rc = aesCbcEncrypt(fc, input, &output);
        break;
    case TPLSecurityMode::AES_GCM:
        rc = aesGcmEncrypt(fc, input, &output);
        break;
    case TPLSecurityMode::NoSecurity:
        output = input;
        break;
    }
    if (rc != MBusError::OK) return rc;

    out.payload.insert(out.payload.end(), output.begin(), output.end());
    size_t max = out.kind == FrameKind::Wireless ? WMBUS_MAX_PAYLOAD : MBUS_MAX_LONG_PAYLOAD;
    if (out.payload.size() > max)
    {
        verbose("(crypto) encrypted payload of %zu bytes does not fit in a frame\n", out.payload.size());
        return MBusError::FrameMalformed;
    }

    sealFrame(&out);
    *encrypted = out;
    debug("(crypto) encrypted %s\n", out.str().c_str());
    return MBusError::OK;
}

MBusError decryptedPayload(const Frame &frame, const CryptoContext &ctx, vector<uchar> *payload)
{
    TPLHeader tpl;
    if (!parseTPLHeader(frame.ci_field, frame.payload, &tpl)) return MBusError::FrameMalformed;

    vector<uchar> plaintext;
    MBusError rc = decryptFrame(frame, ctx, &plaintext);
    if (rc != MBusError::OK) return rc;

    payload->assign(frame.payload.begin(), frame.payload.begin()+tpl.header_len);
    payload->insert(payload->end(), plaintext.begin(), plaintext.end());
    return MBusError::OK;
}
