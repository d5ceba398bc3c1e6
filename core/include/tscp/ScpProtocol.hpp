// Wire helpers for the legacy "scp -t/-f" exchange and the shell commands the
// SCP backend issues over exec channels.
#pragma once
#include "HostTypes.hpp"
#include <cstdint>
#include <string>

namespace tscp {
namespace scp {

// One control record of the SCP protocol.
struct ControlLine {
    enum class Type { File, Directory, EndDirectory, Times, Warning, Fatal } type = Type::File;
    std::uint32_t mode = 0;
    std::uint64_t size = 0;
    std::string name;
    std::int64_t mtime = 0;
    std::int64_t atime = 0;
    std::string message;  // Warning/Fatal text
};

// Parses "C0644 12 name", "D0755 0 dir", "E", "T<m> 0 <a> 0", "\x01msg",
// "\x02msg" (with or without the trailing newline).
bool parseControlLine(const std::string& line, ControlLine& out, std::string& err);

std::string fileHeader(std::uint32_t mode, std::uint64_t size, const std::string& name);
std::string timesHeader(std::int64_t mtime, std::int64_t atime);

// Status byte answered after each record: 0 ok, 1 warning, 2 fatal.
constexpr char kOk = '\0';
constexpr char kWarning = '\1';
constexpr char kFatal = '\2';

// Warning and fatal bytes are followed by a message line.
inline bool ackHasMessage(char status) { return status == kWarning || status == kFatal; }
// Error carried by a status byte and its message line; None for kOk.
ErrorKind ackError(char status, const std::string& message, std::string& text);

// POSIX shell single-quoting.
std::string shellQuote(const std::string& s);

// Classifies a remote error message ("scp: x: No such file or directory",
// "rm: cannot remove 'x': Permission denied") into the taxonomy.
ErrorKind classifyMessage(const std::string& message, ErrorKind fallback);

} // namespace scp
} // namespace tscp
