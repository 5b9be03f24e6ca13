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

#include"transport.h"

using namespace std;

FrameTransport::~FrameTransport()
{
}

SimulatorTransport::SimulatorTransport(string file) : file_(file)
{
    if (loadFile(file, &lines_) != 0)
    {
        warning("(simulator) could not load %s\n", file.c_str());
    }
}

SimulatorTransport::SimulatorTransport(const vector<string> &lines) : file_("simulation"), lines_(lines)
{
}

MBusError SimulatorTransport::send(const vector<uchar> &bytes)
{
    string hex = bin2hex(bytes);
    debug("(simulator) sent %s\n", hex.c_str());
    sent_.push_back(hex);
    return MBusError::OK;
}

MBusError SimulatorTransport::receive(vector<uchar> *bytes, int timeout_ms)
{
    bytes->clear();
    while (next_ < lines_.size())
    {
        string l = lines_[next_++];
        trimWhitespace(&l);
        if (l.length() == 0 || l[0] == '#') continue;

        if (l.find("timeout") != string::npos)
        {
            debug("(simulator) simulated timeout after %d ms\n", timeout_ms);
            return MBusError::Timeout;
        }
        if (!startsWith(l, "telegram="))
        {
            warning("(simulator) ignoring line \"%s\"\n", l.c_str());
            continue;
        }
        string hex;
        for (size_t i=9; i<l.length(); ++i)
        {
            if (l[i] == '|') continue;
            // A relative timestamp +secs may follow the hex.
            if (l[i] == '+') break;
            hex += l[i];
        }
        if (!hex2bin(hex, bytes))
        {
            warning("(simulator) bad hex \"%s\"\n", hex.c_str());
            bytes->clear();
            return MBusError::FrameMalformed;
        }
        debugPayload("(simulator) received", *bytes);
        return MBusError::OK;
    }
    debug("(simulator) no more frames\n");
    return MBusError::Timeout;
}
