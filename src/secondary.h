/*
 Copyright (C) 2017-2024 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef SECONDARY_H
#define SECONDARY_H

#include"errors.h"
#include"frame.h"
#include"transport.h"

#include<string>
#include<vector>

// A secondary address mask is 16 hex digits: id (8 bcd digits), manufacturer (4),
// version (2) and type (2), e.g. 12345678FFFFFFFF. F is a wildcard.
bool isValidSecondaryMask(const std::string &mask);

// Does the full secondary address match the mask.
bool matchesSecondaryMask(const std::string &mask, const std::string &address);

// SND_UD to address 253 with ci 0x52 selects the matching slaves.
bool buildSelectFrame(const std::string &mask, Frame *frame);

#define LIST_OF_PROBE_RESULTS \
    X(Nothing) \
    X(Single) \
    X(Collision)

enum class ProbeResult {
#define X(name) name,
LIST_OF_PROBE_RESULTS
#undef X
};

const char *toString(ProbeResult r);

// Select with the mask and classify the answer: no answer, a clean ack or a garbled reply.
ProbeResult probeSecondary(FrameTransport *transport, const std::string &mask, int timeout_ms);

// Read the secondary address of the currently selected slave with REQ_UD2 to address 253.
MBusError readSecondaryAddress(FrameTransport *transport, int timeout_ms, std::string *address);

// Expand wildcards depth first until every slave answers alone.
MBusError scanSecondary(FrameTransport *transport, int timeout_ms, std::vector<std::string> *found);

#endif
