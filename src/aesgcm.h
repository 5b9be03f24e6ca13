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

#ifndef AESGCM_H
#define AESGCM_H

#include"util.h"

// AES-128-GCM with a 96 bit iv, built on the aes block primitive.
// The tag length is 1 to 16 bytes, the tag is truncated from the left.
void AES_GCM_encrypt(uchar *key, uchar *iv, uchar *aad, int aad_len,
                     uchar *input, int len, uchar *output,
                     uchar *tag, int tag_len);

// Returns false if the tag does not match. The output is then zeroed.
bool AES_GCM_decrypt(uchar *key, uchar *iv, uchar *aad, int aad_len,
                     uchar *input, int len, uchar *output,
                     uchar *tag, int tag_len);

// Exposed for testing. Multiply x and y in GF(2^128) and store in z.
void gf128Multiply(uchar *x, uchar *y, uchar *z);

#endif
