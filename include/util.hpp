#pragma once
#include <string>
#include <cstring>
#include <cstdint>
#include <sys/stat.h>
#include <defs.h>

// INFO messages go through this so the library stays quiet unless someone asks
#define LOG_INFO(...) do { if (isVerbose()) { printf(INFO __VA_ARGS__); } } while (0)

void setVerbose(bool verbose);

bool isVerbose();

bool isWhitespace(char thing);

std::string trim(std::string thing); // strip whitespace from both ends

std::string fconcat(std::string one, std::string two); // sanely glue two path components together

std::string extensionOf(std::string path); // "dir/file.lua" -> "lua", "" if there isn't one

std::string stemOf(std::string filename); // "file.lua" -> "file"

std::string trim2dir(std::string file); // strip off a filename from a path
// if the path ends in /, it will not be changed

int64_t modificationTime(std::string path); // milliseconds since the epoch, -1 if it can't be stat'd

int64_t nowMillis();

void lineColumnAt(const std::string& text, size_t position, size_t& cursor, int& line, int& column);
// advance (line, column) from cursor to position, counting newlines on the way.
// cursor is updated, so repeated calls over increasing positions only scan each byte once.
