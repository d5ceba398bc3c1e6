// Parser for "ls -lan" output, the only directory listing SCP can offer.
// Unparseable lines are counted, never silently dropped.
#pragma once
#include "HostTypes.hpp"
#include <ctime>
#include <string>

namespace tscp {
namespace ls {

enum class LineResult { Entry, Ignored, Unparsed };

// Parses one line. "total N" and blank lines are Ignored. Understands
// epoch ("+%s"), "Mon DD HH:MM", "Mon DD YYYY" and ISO time styles; "now"
// resolves the year of the "HH:MM" form. Times are read as UTC.
LineResult parseLine(const std::string& line, const std::string& dir, std::time_t now, RemoteEntry& out);

// Parses a whole listing, dropping "." and "..". sawDot is set when the
// listing contained the "." entry (i.e. the path really is a directory).
ListResult parseListing(const std::string& output, const std::string& dir, std::time_t now, bool* sawDot = nullptr);

// rwx string (9 chars, with s/S/t/T) to mode bits.
bool parsePermissions(const std::string& rwx, std::uint32_t& mode);

} // namespace ls
} // namespace tscp
