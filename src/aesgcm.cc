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

#include<stdio.h>
#include<memory.h>
#include"aes.h"
#include"aesgcm.h"
#include"util.h"

void gf128Multiply(uchar *x, uchar *y, uchar *z)
{
    uchar Z[16];
    uchar V[16];

    memset(Z, 0, 16);
    memcpy(V, y, 16);

    for (int i = 0; i < 128; i++)
    {
        if (x[i/8] & (0x80 >> (i%8)))
        {
            xorit(Z, V, Z, 16);
        }
        bool lsb = V[15] & 1;
        // Shift V right one bit.
        for (int j = 15; j > 0; j--)
        {
            V[j] = (V[j] >> 1) | (V[j-1] << 7);
        }
        V[0] >>= 1;
        if (lsb)
        {
            // R = 11100001 || 0^120
            V[0] ^= 0xe1;
        }
    }
    memcpy(z, Z, 16);
}

static void ghashBlocks(uchar *H, uchar *X, uchar *data, int len)
{
    uchar block[16];
    uchar tmp[16];

    for (int offset = 0; offset < len; offset += 16)
    {
        int n = len-offset;
        if (n > 16) n = 16;
        memset(block, 0, 16);
        memcpy(block, data+offset, n);
        xorit(X, block, tmp, 16);
        gf128Multiply(tmp, H, X);
    }
}

static void ghash(uchar *H, uchar *aad, int aad_len, uchar *ciphertext, int len, uchar *S)
{
    uchar lengths[16];
    uchar tmp[16];

    memset(S, 0, 16);
    ghashBlocks(H, S, aad, aad_len);
    ghashBlocks(H, S, ciphertext, len);

    uint64_t aad_bits = (uint64_t)aad_len*8;
    uint64_t c_bits = (uint64_t)len*8;
    for (int i = 0; i < 8; i++)
    {
        lengths[7-i] = (aad_bits >> (8*i)) & 0xff;
        lengths[15-i] = (c_bits >> (8*i)) & 0xff;
    }
    xorit(S, lengths, tmp, 16);
    gf128Multiply(tmp, H, S);
}

// Counter mode from the block after J0, only the rightmost 32 bits are incremented.
static void gctr(uchar *key, uchar *J0, uchar *input, int len, uchar *output)
{
    uchar counter[16];
    uchar xordata[16];

    memcpy(counter, J0, 16);

    for (int offset = 0; offset < len; offset += 16)
    {
        incrementIV(counter+12, 4);
        AES_ECB_encrypt(counter, key, xordata, 16);
        int n = len-offset;
        if (n > 16) n = 16;
        xorit(input+offset, xordata, output+offset, n);
    }
}

static void computeTag(uchar *key, uchar *J0, uchar *aad, int aad_len, uchar *ciphertext, int len, uchar *full_tag)
{
    uchar H[16];
    uchar zero[16];
    uchar S[16];
    uchar EJ0[16];

    memset(zero, 0, 16);
    AES_ECB_encrypt(zero, key, H, 16);

    ghash(H, aad, aad_len, ciphertext, len, S);

    AES_ECB_encrypt(J0, key, EJ0, 16);
    xorit(EJ0, S, full_tag, 16);
}

void AES_GCM_encrypt(uchar *key, uchar *iv, uchar *aad, int aad_len,
                     uchar *input, int len, uchar *output,
                     uchar *tag, int tag_len)
{
    uchar J0[16];
    uchar full_tag[16];

    // J0 = IV || 0^31 || 1
    memcpy(J0, iv, 12);
    J0[12] = 0; J0[13] = 0; J0[14] = 0; J0[15] = 1;

    gctr(key, J0, input, len, output);
    computeTag(key, J0, aad, aad_len, output, len, full_tag);

    if (tag_len > 16) tag_len = 16;
    memcpy(tag, full_tag, tag_len);
}

bool AES_GCM_decrypt(uchar *key, uchar *iv, uchar *aad, int aad_len,
                     uchar *input, int len, uchar *output,
                     uchar *tag, int tag_len)
{
    uchar J0[16];
    uchar full_tag[16];

    if (tag_len < 1 || tag_len > 16) return false;

    memcpy(J0, iv, 12);
    J0[12] = 0; J0[13] = 0; J0[14] = 0; J0[15] = 1;

    // The tag is computed over the ciphertext, verify before decrypting.
    computeTag(key, J0, aad, aad_len, input, len, full_tag);

    uchar diff = 0;
    for (int i = 0; i < tag_len; i++)
    {
        diff |= full_tag[i] ^ tag[i];
    }
    if (diff != 0)
    {
        if (len > 0) memset(output, 0, len);
        return false;
    }

    gctr(key, J0, input, len, output);
    return true;
}
