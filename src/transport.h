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

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include"errors.h"
#include"util.h"

#include<string>
#include<vector>

// The byte level link to a bus or a radio receiver.
struct FrameTransport
{
    virtual std::string device() = 0;
    virtual MBusError send(const std::vector<uchar> &bytes) = 0;
    // Deliver exactly one frame, or Timeout if nothing arrived within timeout_ms.
    virtual MBusError receive(std::vector<uchar> *bytes, int timeout_ms) = 0;
    virtual ~FrameTransport() = 0;
};

// Replays frames from lines of the form telegram=|68...16| and answers
// Timeout on lines containing the word timeout.
struct SimulatorTransport : public FrameTransport
{
    SimulatorTransport(std::string file);
    SimulatorTransport(const std::vector<std::string> &lines);

    std::string device() { return file_; }
    MBusError send(const std::vector<uchar> &bytes);
    MBusError receive(std::vector<uchar> *bytes, int timeout_ms);

    // Everything sent, as hex strings.
    const std::vector<std::string> &sent() { return sent_; }
    bool exhausted() { return next_ >= lines_.size(); }

private:

    std::string file_;
    std::vector<std::string> lines_;
    size_t next_ {};
    std::vector<std::string> sent_;
};

#endif
