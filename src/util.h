/*
 Copyright (C) 2017-2022 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef UTIL_H
#define UTIL_H

#include<signal.h>
#include<stdint.h>
#include<string>
#include<functional>
#include<map>
#include<set>
#include<vector>

void onExit(std::function<void()> cb);

typedef unsigned char uchar;

bool isHexChar(uchar c);

// Strict strings contain only hexadecimal digits.
bool isHexStringStrict(const char* txt, bool *invalid);
bool isHexStringStrict(const std::string &txt, bool *invalid);
int char2int(char input);
// Hex strings may contain space # | and _ which are skipped.
bool hex2bin(const char* src, std::vector<uchar> *target);
bool hex2bin(const std::string &src, std::vector<uchar> *target);
std::string bin2hex(const std::vector<uchar> &target);
std::string bin2hex(std::vector<uchar>::iterator data, std::vector<uchar>::iterator end, int len);
std::string bin2hex(const uchar *data, size_t len);
void strprintf(std::string *s, const char* fmt, ...);
std::string tostrprintf(const char* fmt, ...);

void xorit(uchar *srca, uchar *srcb, uchar *dest, int len);

bool enableLogfile(const std::string& logfile);
void disableLogfile();
void enableSyslog();
void error(const char* fmt, ...);
void verbose(const char* fmt, ...);
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void warning(const char* fmt, ...);
void info(const char* fmt, ...);
void notice(const char* fmt, ...);

void silentLogging(bool b);
void verboseEnabled(bool b);
void debugEnabled(bool b);
void traceEnabled(bool b);
void stderrEnabled(bool b);

bool isVerboseEnabled();
bool isDebugEnabled();
bool isTraceEnabled();

void debugPayload(const std::string& intro, const std::vector<uchar> &payload);

// Split s into strings separated by c.
std::vector<std::string> splitString(const std::string &s, char c);

// Add one to the big endian number stored in iv, wrapping to zero.
void incrementIV(uchar *iv, size_t len);

bool checkFileExists(const char *file);
int loadFile(const std::string& file, std::vector<std::string> *lines);
bool loadFile(const std::string& file, std::vector<char> *buf);
bool saveFile(const std::string& file, const std::string &content);

// Parse text string into seconds, 5h = (3600*5) 2m = (60*2) 1s = 1
int parseTime(const std::string& time);

// The mbus checksum is the 8 bit truncated sum of the bytes.
uchar mbusChecksum(const uchar *data, size_t len);

// Standard EN13757 crc, init 0x0000 and the result is complemented.
// Used for the compact frame format signatures.
uint16_t crc16_EN13757(const uchar *data, size_t len);

// Same polynomial but init 0xffff and no final complement.
// Used for the wmbus envelope and the type A blocks.
uint16_t crc16_EN13757_block(const uchar *data, size_t len);

// Eat characters from the vector v, iterating using i, until the end char c is found.
// If end char == -1, then do not expect any end char, get all until eof.
// If the end char is not found, return error.
// If the maximum length is reached without finding the end char, return error.
std::string eatTo(std::vector<char> &v, std::vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err);
// Eat whitespace (space and tab, not end of lines).
void eatWhitespace(std::vector<char> &v, std::vector<char>::iterator &i, bool *eof);
// First eat whitespace, then start eating until c is found or eof. The found string is trimmed from beginning and ending whitespace.
std::string eatToSkipWhitespace(std::vector<char> &v, std::vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err);
// Remove leading and trailing white space
void trimWhitespace(std::string *s);

bool startsWith(const std::string &s, const char *prefix);

std::string currentSeconds();

// If a vector is empty, then there will be an assert (with some compiler flags) if we use &v[0]
// even if we do not intend to actually use the pointer to uchars!
// So provide safeVectorPtr which will return NULL instead of assert-crashing.
uchar *safeButUnsafeVectorPtr(std::vector<uchar> &v);

#endif
