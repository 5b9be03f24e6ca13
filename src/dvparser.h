/*
 Copyright (C) 2018-2022 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef DVPARSER_H
#define DVPARSER_H

#include"util.h"

#include<stdint.h>
#include<vector>

// Number of data bytes that follow the dif/vif header.
// -1 means variable length (lvar byte first), -2 means a special
// function that ends the record stream (0x0f, 0x1f and reserved difs).
int difLenBytes(int dif);

// Number of data bytes described by a lvar byte, -1 if unsupported.
int lvarLenBytes(uchar lvar);

struct DVScan
{
    // The dif,dife,vif,vife bytes of all records. A terminating 0x0f or 0x1f
    // dif is included as the last format byte.
    std::vector<uchar> format_bytes;
    // The data bytes of all records (lvar bytes included) followed by
    // any manufacturer specific data.
    std::vector<uchar> value_bytes;
    size_t num_records {};
    // The stream ended with dif 0x1f, the next frame carries more records.
    bool more_records_follow {};
    // The stream ended with dif 0x0f or 0x1f.
    bool has_mfct_data {};
    size_t mfct_data_len {};
};

// Walk the dif/vif records in data starting at offset. 0x2f idle fillers are skipped.
bool scanDV(const std::vector<uchar> &data, size_t offset, DVScan *scan);

// Rebuild the full record stream from remembered format bytes and the
// value bytes of a compact frame.
bool mergeFormatAndValues(const std::vector<uchar> &format_bytes,
                          const std::vector<uchar> &value_bytes,
                          std::vector<uchar> *records);

// The 2 byte format signature used by compact frames.
uint16_t formatSignature(const std::vector<uchar> &format_bytes);

#endif
