#include "tscp/ScpProtocol.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace tscp {
namespace scp {

static bool parseUnsigned(const std::string& s, std::uint64_t& out, int base = 10) {
    if (s.empty()) return false;
    for (char c : s) {
        if (base == 8 ? (c < '0' || c > '7') : !std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::strtoull(s.c_str(), nullptr, base);
    return true;
}

bool parseControlLine(const std::string& raw, ControlLine& out, std::string& err) {
    std::string line = raw;
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (line.empty()) {
        err = "empty control line";
        return false;
    }
    out = ControlLine{};
    const char tag = line[0];
    if (tag == kWarning || tag == kFatal) {
        out.type = tag == kWarning ? ControlLine::Type::Warning : ControlLine::Type::Fatal;
        out.message = line.substr(1);
        return true;
    }
    if (tag == 'E') {
        out.type = ControlLine::Type::EndDirectory;
        return true;
    }
    if (tag == 'T') {
        // T<mtime> 0 <atime> 0
        unsigned long long m = 0, mu = 0, a = 0, au = 0;
        char extra = 0;
        if (std::sscanf(line.c_str() + 1, "%llu %llu %llu %llu%c", &m, &mu, &a, &au, &extra) != 4) {
            err = "malformed times record: " + line;
            return false;
        }
        out.type = ControlLine::Type::Times;
        out.mtime = static_cast<std::int64_t>(m);
        out.atime = static_cast<std::int64_t>(a);
        return true;
    }
    if (tag != 'C' && tag != 'D') {
        err = "unexpected control record: " + line.substr(0, 32);
        return false;
    }
    // C<mode> <size> <name>
    const auto sp1 = line.find(' ');
    const auto sp2 = sp1 == std::string::npos ? std::string::npos : line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) {
        err = "malformed file record: " + line;
        return false;
    }
    std::uint64_t mode = 0, size = 0;
    if (!parseUnsigned(line.substr(1, sp1 - 1), mode, 8) || !parseUnsigned(line.substr(sp1 + 1, sp2 - sp1 - 1), size)) {
        err = "malformed file record: " + line;
        return false;
    }
    out.type = tag == 'C' ? ControlLine::Type::File : ControlLine::Type::Directory;
    out.mode = static_cast<std::uint32_t>(mode & 07777);
    out.size = size;
    out.name = line.substr(sp2 + 1);
    if (out.name.empty() || out.name.find('/') != std::string::npos) {
        err = "invalid name in file record: " + out.name;
        return false;
    }
    return true;
}

std::string fileHeader(std::uint32_t mode, std::uint64_t size, const std::string& name) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "C%04o %llu ", static_cast<unsigned>(mode & 07777),
                  static_cast<unsigned long long>(size));
    return std::string(buf) + name + "\n";
}

std::string timesHeader(std::int64_t mtime, std::int64_t atime) {
    return "T" + std::to_string(mtime) + " 0 " + std::to_string(atime) + " 0\n";
}

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

ErrorKind classifyMessage(const std::string& message, ErrorKind fallback) {
    // the remote shell lacks the tool ("sh: scp: command not found")
    if (message.find("command not found") != std::string::npos) return ErrorKind::Protocol;
    if (message.find("No such file") != std::string::npos ||
        message.find("not found") != std::string::npos ||
        message.find("Not a directory") != std::string::npos)
        return ErrorKind::NotFound;
    if (message.find("Permission denied") != std::string::npos ||
        message.find("Operation not permitted") != std::string::npos ||
        message.find("Read-only file system") != std::string::npos)
        return ErrorKind::Permission;
    if (message.find("File exists") != std::string::npos) return ErrorKind::AlreadyExists;
    return fallback;
}

ErrorKind ackError(char status, const std::string& message, std::string& text) {
    if (status == kOk) {
        text.clear();
        return ErrorKind::None;
    }
    if (!ackHasMessage(status)) {
        text = "unexpected scp status byte " + std::to_string(static_cast<int>(static_cast<unsigned char>(status)));
        return ErrorKind::Protocol;
    }
    std::size_t b = 0, e = message.size();
    while (b < e && (message[b] == ' ' || message[b] == '\r' || message[b] == '\n'))
        ++b;
    while (e > b && (message[e - 1] == ' ' || message[e - 1] == '\r' || message[e - 1] == '\n'))
        --e;
    text = message.substr(b, e - b);
    if (text.empty()) text = status == kFatal ? "remote scp failed" : "remote scp warning";
    return classifyMessage(text, ErrorKind::Io);
}

} // namespace scp
} // namespace tscp
