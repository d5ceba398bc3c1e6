#include "tscp/FtpReply.hpp"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace tscp {
namespace ftp {

namespace {

bool isCode(const std::string& line) {
    return line.size() >= 3 && line[0] >= '1' && line[0] <= '5' &&
           std::isdigit(static_cast<unsigned char>(line[1])) && std::isdigit(static_cast<unsigned char>(line[2]));
}

std::string lower(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool startsWithNoCase(const std::string& s, const char* prefix) {
    const std::size_t n = std::strlen(prefix);
    return s.size() >= n && lower(s.substr(0, n)) == lower(prefix);
}

} // namespace

void ReplyParser::reset() {
    reply_ = Reply{};
    multiline_ = false;
}

ReplyParser::Status ReplyParser::feed(const std::string& line) {
    if (!multiline_) {
        if (!isCode(line) || (line.size() > 3 && line[3] != ' ' && line[3] != '-')) return Status::Malformed;
        reply_.code = std::atoi(line.substr(0, 3).c_str());
        reply_.text = line.size() > 4 ? line.substr(4) : std::string();
        if (line.size() > 3 && line[3] == '-') {
            multiline_ = true;
            return Status::NeedMore;
        }
        return Status::Complete;
    }
    // Multi-line replies end with "<same code> "; lines in between are free text.
    if (isCode(line) && std::atoi(line.substr(0, 3).c_str()) == reply_.code && (line.size() == 3 || line[3] == ' ')) {
        reply_.text += "\n";
        if (line.size() > 4) reply_.text += line.substr(4);
        multiline_ = false;
        return Status::Complete;
    }
    reply_.text += "\n" + line;
    return Status::NeedMore;
}

bool parsePasv(const std::string& text, std::string& host, std::uint16_t& port) {
    const auto open = text.find('(');
    const char* p = text.c_str() + (open == std::string::npos ? 0 : open + 1);
    // some servers omit the parentheses: skip to the first digit
    while (*p && !std::isdigit(static_cast<unsigned char>(*p)))
        ++p;
    unsigned v[6];
    if (std::sscanf(p, "%u,%u,%u,%u,%u,%u", &v[0], &v[1], &v[2], &v[3], &v[4], &v[5]) != 6) return false;
    for (unsigned x : v)
        if (x > 255) return false;
    host = std::to_string(v[0]) + "." + std::to_string(v[1]) + "." + std::to_string(v[2]) + "." + std::to_string(v[3]);
    port = static_cast<std::uint16_t>(v[4] * 256 + v[5]);
    return port != 0;
}

bool isUnroutableAddress(const std::string& ip) {
    unsigned a = 0, b = 0, c = 0, d = 0;
    if (std::sscanf(ip.c_str(), "%u.%u.%u.%u", &a, &b, &c, &d) != 4) return false;
    return a == 0 || a == 10 || a == 127 || (a == 169 && b == 254) || (a == 172 && b >= 16 && b <= 31) ||
           (a == 192 && b == 168);
}

std::string choosePassiveHost(const std::string& advertised, const std::string& controlPeer) {
    if (controlPeer.empty()) return advertised;
    if (advertised == "0.0.0.0") return controlPeer;
    if (isUnroutableAddress(advertised) && !isUnroutableAddress(controlPeer)) return controlPeer;
    return advertised;
}

bool parsePwd(const std::string& text, std::string& path) {
    const auto first = text.find('"');
    if (first == std::string::npos) return false;
    path.clear();
    for (std::size_t i = first + 1; i < text.size(); ++i) {
        if (text[i] == '"') {
            if (i + 1 < text.size() && text[i + 1] == '"') {
                path.push_back('"');
                ++i;
                continue;
            }
            return !path.empty();
        }
        path.push_back(text[i]);
    }
    return false;
}

Features parseFeat(const std::string& text) {
    Features f;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const auto nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
            line.erase(0, 1);
        const std::string name = lower(line.substr(0, line.find(' ')));
        if (name == "mlst") f.mlst = true;
        else if (name == "mdtm") f.mdtm = true;
        else if (name == "mfmt") f.mfmt = true;
        else if (name == "size") f.size = true;
        else if (name == "utf8") f.utf8 = true;
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return f;
}

bool parseFactTime(const std::string& s, std::int64_t& out) {
    if (s.size() < 14) return false;
    for (std::size_t i = 0; i < 14; ++i)
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    if (s.size() > 14 && s[14] != '.') return false;
    struct tm t;
    std::memset(&t, 0, sizeof(t));
    t.tm_year = std::atoi(s.substr(0, 4).c_str()) - 1900;
    t.tm_mon = std::atoi(s.substr(4, 2).c_str()) - 1;
    t.tm_mday = std::atoi(s.substr(6, 2).c_str());
    t.tm_hour = std::atoi(s.substr(8, 2).c_str());
    t.tm_min = std::atoi(s.substr(10, 2).c_str());
    t.tm_sec = std::atoi(s.substr(12, 2).c_str());
    if (t.tm_mon < 0 || t.tm_mon > 11 || t.tm_mday < 1 || t.tm_mday > 31) return false;
    out = static_cast<std::int64_t>(::timegm(&t));
    return true;
}

std::string formatFactTime(std::int64_t epoch) {
    const std::time_t t = static_cast<std::time_t>(epoch);
    struct tm utc;
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &utc);
    return buf;
}

bool parseFactLine(const std::string& rawLine, const std::string& dir, RemoteEntry& out) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    // MLST fact lines start with a space; MLSD lines may too
    if (!line.empty() && line.front() == ' ') line.erase(0, 1);
    const auto blank = line.find(' ');
    if (blank == std::string::npos || blank + 1 >= line.size()) return false;

    RemoteEntry e;
    std::string name = line.substr(blank + 1);
    const std::string facts = line.substr(0, blank);
    std::string type;
    std::optional<std::uint64_t> size;

    std::size_t pos = 0;
    while (pos < facts.size()) {
        auto semi = facts.find(';', pos);
        if (semi == std::string::npos) semi = facts.size();
        const std::string fact = facts.substr(pos, semi - pos);
        pos = semi + 1;
        const auto eq = fact.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = lower(fact.substr(0, eq));
        const std::string value = fact.substr(eq + 1);
        if (key == "type") {
            type = value;
        } else if (key == "size" || key == "sizd") {
            char* end = nullptr;
            const unsigned long long v = std::strtoull(value.c_str(), &end, 10);
            if (!value.empty() && end && *end == '\0' && value[0] != '-') size = v;
        } else if (key == "modify") {
            std::int64_t t = 0;
            if (parseFactTime(value, t)) e.mtime = t;
        } else if (key == "unix.mode") {
            char* end = nullptr;
            const unsigned long m = std::strtoul(value.c_str(), &end, 8);
            if (!value.empty() && end && *end == '\0') e.permissions = static_cast<std::uint32_t>(m & 07777);
        } else if (key == "unix.uid" || key == "unix.owner") {
            char* end = nullptr;
            const unsigned long v = std::strtoul(value.c_str(), &end, 10);
            if (!value.empty() && end && *end == '\0') e.uid = static_cast<std::uint32_t>(v);
        } else if (key == "unix.gid" || key == "unix.group") {
            char* end = nullptr;
            const unsigned long v = std::strtoul(value.c_str(), &end, 10);
            if (!value.empty() && end && *end == '\0') e.gid = static_cast<std::uint32_t>(v);
        }
    }
    if (type.empty()) return false;

    const std::string ltype = lower(type);
    if (ltype == "cdir") {
        name = ".";
        e.is_directory = true;
    } else if (ltype == "pdir") {
        name = "..";
        e.is_directory = true;
    } else if (ltype == "dir") {
        e.is_directory = true;
    } else if (startsWithNoCase(ltype, "os.unix=slink") || startsWithNoCase(ltype, "os.unix=symlink")) {
        // "OS.unix=slink:/target"; the target part is optional
        e.is_symlink = true;
        const auto colon = type.find(':');
        if (colon != std::string::npos && colon + 1 < type.size()) e.symlink_target = type.substr(colon + 1);
    }
    if (!e.is_directory) e.size = size;

    e.name = name;
    // MLST answers with the full pathname
    e.path = (name == "." || name == "..") ? dir : (name.front() == '/' ? name : joinPath(dir, name));
    if (name.front() == '/') e.name = baseName(name);
    out = std::move(e);
    return true;
}

ErrorKind replyKind(const Reply& reply, bool duringLogin) {
    const std::string text = lower(reply.text);
    switch (reply.code) {
    case 421:
        return ErrorKind::Connection;
    case 530:
        return duringLogin ? ErrorKind::Auth : ErrorKind::Permission;
    case 331:
    case 332:
    case 532:
        return duringLogin ? ErrorKind::Auth : ErrorKind::Permission;
    case 553:
        return ErrorKind::Permission;
    case 550:
    case 450:
        if (text.find("permission") != std::string::npos || text.find("denied") != std::string::npos)
            return ErrorKind::Permission;
        if (text.find("exist") != std::string::npos && text.find("not exist") == std::string::npos &&
            text.find("n't exist") == std::string::npos)
            return ErrorKind::AlreadyExists;
        return reply.code == 550 ? ErrorKind::NotFound : ErrorKind::Io;
    case 425:
    case 426:
    case 451:
    case 452:
    case 552:
        return ErrorKind::Io;
    case 500:
    case 501:
    case 502:
    case 503:
    case 504:
        return ErrorKind::Protocol;
    default:
        break;
    }
    if (reply.category() == 4) return ErrorKind::Io;
    return ErrorKind::Protocol;
}

} // namespace ftp
} // namespace tscp
