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

#include"dvparser.h"

using namespace std;

int difLenBytes(int dif)
{
    int t = dif & 0x0f;
    switch (t) {
    case 0x0: return 0; // No data
    case 0x1: return 1; // 8 Bit Integer/Binary
    case 0x2: return 2; // 16 Bit Integer/Binary
    case 0x3: return 3; // 24 Bit Integer/Binary
    case 0x4: return 4; // 32 Bit Integer/Binary
    case 0x5: return 4; // 32 Bit Real
    case 0x6: return 6; // 48 Bit Integer/Binary
    case 0x7: return 8; // 64 Bit Integer/Binary
    case 0x8: return 0; // Selection for Readout
    case 0x9: return 1; // 2 digit BCD
    case 0xA: return 2; // 4 digit BCD
    case 0xB: return 3; // 6 digit BCD
    case 0xC: return 4; // 8 digit BCD
    case 0xD: return -1; // variable length
    case 0xE: return 6; // 12 digit BCD
    case 0xF: // Special Functions
        if (dif == 0x2f) return 1; // The skip code 0x2f, used for padding.
        return -2;
    }
    // Bad!
    return -2;
}

int lvarLenBytes(uchar lvar)
{
    // 00-BF ascii string with lvar characters.
    if (lvar <= 0xbf) return lvar;
    // C0-C9 positive bcd, D0-D9 negative bcd, E0-EF binary number.
    if (lvar >= 0xc0 && lvar <= 0xc9) return lvar-0xc0;
    if (lvar >= 0xd0 && lvar <= 0xd9) return lvar-0xd0;
    if (lvar >= 0xe0 && lvar <= 0xef) return lvar-0xe0;
    // F0-FA floating point and the reserved values are not supported.
    return -1;
}

struct DVSink
{
    DVScan *scan {};
    vector<uchar> *records {};

    void format(uchar b)
    {
        if (scan) scan->format_bytes.push_back(b);
        if (records) records->push_back(b);
    }
    void values(const vector<uchar> &data, size_t from, size_t len)
    {
        if (scan) scan->value_bytes.insert(scan->value_bytes.end(), data.begin()+from, data.begin()+from+len);
        if (records) records->insert(records->end(), data.begin()+from, data.begin()+from+len);
    }
};

// When format is NULL, the difvifs are part of the data. This is the
// normal case. Otherwise the data holds only the values of a compact frame
// and the difvifs are read from the supplied format.
static bool walkDV(const vector<uchar> &data, size_t offset, const vector<uchar> *format, DVSink &sink)
{
    bool data_has_difvifs = (format == NULL);
    const vector<uchar> &fmt = data_has_difvifs ? data : *format;

    size_t d = offset;
    size_t separate_f = 0;
    // With inline difvifs there is only one cursor.
    size_t &f = data_has_difvifs ? d : separate_f;
    size_t num_records = 0;

    for (;;)
    {
        if (f >= fmt.size()) break;

        uchar dif = fmt[f];

        if (dif == 0x2f)
        {
            f++;
            continue;
        }

        int datalen = difLenBytes(dif);

        if (datalen == -2)
        {
            if (dif != 0x0f && dif != 0x1f)
            {
                debug("(dvparser) unknown dif %02x\n", dif);
                return false;
            }
            sink.format(dif);
            f++;
            if (!data_has_difvifs && f != fmt.size())
            {
                debug("(dvparser) format continues after manufacturer data marker %02x\n", dif);
                return false;
            }
            size_t mfct_len = data.size()-d;
            sink.values(data, d, mfct_len);
            d = data.size();
            if (sink.scan)
            {
                sink.scan->more_records_follow = (dif == 0x1f);
                sink.scan->has_mfct_data = true;
                sink.scan->mfct_data_len = mfct_len;
            }
            debug("(dvparser) reached dif %02x, %zu bytes of manufacturer data\n", dif, mfct_len);
            break;
        }

        sink.format(dif);
        f++;

        bool has_another_dife = (dif & 0x80) == 0x80;
        while (has_another_dife)
        {
            if (f >= fmt.size()) { debug("(dvparser) unexpected end of data (dife expected)\n"); return false; }
            uchar dife = fmt[f++];
            sink.format(dife);
            has_another_dife = (dife & 0x80) == 0x80;
        }

        if (f >= fmt.size()) { debug("(dvparser) unexpected end of data (vif expected)\n"); return false; }
        uchar vif = fmt[f++];
        sink.format(vif);

        if ((vif & 0x7f) == 0x7c)
        {
            // Plain text vif, the length and the text are part of the format.
            if (f >= fmt.size()) { debug("(dvparser) unexpected end of data (vif varlen expected)\n"); return false; }
            uchar viflen = fmt[f++];
            sink.format(viflen);
            for (uchar i = 0; i < viflen; ++i)
            {
                if (f >= fmt.size()) { debug("(dvparser) unexpected end of data (vif text expected)\n"); return false; }
                sink.format(fmt[f++]);
            }
        }

        bool has_another_vife = (vif & 0x80) == 0x80;
        while (has_another_vife)
        {
            if (f >= fmt.size()) { debug("(dvparser) unexpected end of data (vife expected)\n"); return false; }
            uchar vife = fmt[f++];
            sink.format(vife);
            has_another_vife = (vife & 0x80) == 0x80;
        }

        if (datalen == -1)
        {
            if (d >= data.size()) { debug("(dvparser) unexpected end of data (lvar expected)\n"); return false; }
            uchar lvar = data[d];
            datalen = lvarLenBytes(lvar);
            if (datalen < 0) { debug("(dvparser) unsupported lvar %02x\n", lvar); return false; }
            sink.values(data, d, 1);
            d++;
        }

        if (d+datalen > data.size())
        {
            debug("(dvparser) unexpected end of data, record needs %d bytes but only %zu remain\n",
                  datalen, data.size()-d);
            return false;
        }
        sink.values(data, d, datalen);
        d += datalen;
        num_records++;
    }

    if (!data_has_difvifs && d != data.size())
    {
        debug("(dvparser) %zu value bytes left when format was exhausted\n", data.size()-d);
        return false;
    }

    if (sink.scan) sink.scan->num_records = num_records;
    return true;
}

bool scanDV(const vector<uchar> &data, size_t offset, DVScan *scan)
{
    *scan = DVScan();
    if (offset > data.size()) return false;
    DVSink sink;
    sink.scan = scan;
    return walkDV(data, offset, NULL, sink);
}

bool mergeFormatAndValues(const vector<uchar> &format_bytes,
                          const vector<uchar> &value_bytes,
                          vector<uchar> *records)
{
    records->clear();
    DVSink sink;
    sink.records = records;
    bool ok = walkDV(value_bytes, 0, &format_bytes, sink);
    if (!ok) records->clear();
    return ok;
}

uint16_t formatSignature(const vector<uchar> &format_bytes)
{
    if (format_bytes.size() == 0) return crc16_EN13757(NULL, 0);
    return crc16_EN13757(&format_bytes[0], format_bytes.size());
}
