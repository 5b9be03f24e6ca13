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

#ifndef CMDLINE_H
#define CMDLINE_H

#include"config.h"

// Switch on logging as early as possible so that the parsing of the config file is logged.
void enableEarlyLoggingFromCommandLine(int argc, char **argv);

// A --config file is loaded first, the other flags override it.
void parseCommandLine(EngineConfig *c, int argc, char **argv);

#endif
