#include "tscp/LsParser.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <vector>

namespace tscp {
namespace ls {

namespace {

struct Token {
    std::size_t start;
    std::string text;
};

std::vector<Token> tokenize(const std::string& line) {
    std::vector<Token> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        if (i >= line.size()) break;
        std::size_t j = i;
        while (j < line.size() && line[j] != ' ' && line[j] != '\t')
            ++j;
        out.push_back({i, line.substr(i, j - i)});
        i = j;
    }
    return out;
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

int monthIndex(const std::string& s) {
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    for (int i = 0; i < 12; ++i)
        if (s == kMonths[i]) return i;
    return -1;
}

// "HH:MM" or "HH:MM:SS[.frac]"
bool parseClock(const std::string& s, int& h, int& m, int& sec) {
    h = m = sec = 0;
    if (s.size() < 5 || s[2] != ':') return false;
    if (!std::isdigit(static_cast<unsigned char>(s[0])) || !std::isdigit(static_cast<unsigned char>(s[1])) ||
        !std::isdigit(static_cast<unsigned char>(s[3])) || !std::isdigit(static_cast<unsigned char>(s[4])))
        return false;
    h = std::atoi(s.substr(0, 2).c_str());
    m = std::atoi(s.substr(3, 2).c_str());
    if (s.size() >= 8 && s[5] == ':') sec = std::atoi(s.substr(6, 2).c_str());
    else if (s.size() != 5) return false;
    return h < 24 && m < 60 && sec < 61;
}

// "YYYY-MM-DD"
bool parseIsoDate(const std::string& s, int& y, int& mo, int& d) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    if (!allDigits(s.substr(0, 4)) || !allDigits(s.substr(5, 2)) || !allDigits(s.substr(8, 2))) return false;
    y = std::atoi(s.substr(0, 4).c_str());
    mo = std::atoi(s.substr(5, 2).c_str()) - 1;
    d = std::atoi(s.substr(8, 2).c_str());
    return mo >= 0 && mo < 12 && d >= 1 && d <= 31;
}

std::int64_t toEpoch(int year, int mon, int day, int h, int m, int s) {
    struct tm t;
    std::memset(&t, 0, sizeof(t));
    t.tm_year = year - 1900;
    t.tm_mon = mon;
    t.tm_mday = day;
    t.tm_hour = h;
    t.tm_min = m;
    t.tm_sec = s;
    return static_cast<std::int64_t>(::timegm(&t));
}

// Reads a time starting at token k; returns the index of the first name token.
std::size_t parseTime(const std::vector<Token>& t, std::size_t k, std::time_t now, std::int64_t& mtime) {
    const std::size_t n = t.size();
    if (k >= n) return 0;
    int mon = monthIndex(t[k].text);
    if (mon >= 0 && k + 3 < n && allDigits(t[k + 1].text)) {
        const int day = std::atoi(t[k + 1].text.c_str());
        int h, m, s;
        if (parseClock(t[k + 2].text, h, m, s)) {
            struct tm nowTm;
            gmtime_r(&now, &nowTm);
            int year = nowTm.tm_year + 1900;
            mtime = toEpoch(year, mon, day, h, m, s);
            // recent files omit the year; a date in the future belongs to last year
            if (mtime > static_cast<std::int64_t>(now) + 2 * 86400) mtime = toEpoch(year - 1, mon, day, h, m, s);
            return k + 3;
        }
        if (t[k + 2].text.size() == 4 && allDigits(t[k + 2].text)) {
            mtime = toEpoch(std::atoi(t[k + 2].text.c_str()), mon, day, 0, 0, 0);
            return k + 3;
        }
        return 0;
    }
    int y, mo, d;
    if (parseIsoDate(t[k].text, y, mo, d) && k + 2 < n) {
        int h, m, s;
        const std::string clock = t[k + 1].text.substr(0, std::min<std::size_t>(t[k + 1].text.size(), 8));
        if (!parseClock(clock, h, m, s)) return 0;
        mtime = toEpoch(y, mo, d, h, m, s);
        std::size_t next = k + 2;
        const std::string& tz = t[next].text;
        if (next + 1 < n && tz.size() == 5 && (tz[0] == '+' || tz[0] == '-') && allDigits(tz.substr(1))) {
            const int off = std::atoi(tz.substr(1, 2).c_str()) * 3600 + std::atoi(tz.substr(3, 2).c_str()) * 60;
            mtime += tz[0] == '+' ? -off : off;
            ++next;
        }
        return next;
    }
    if (allDigits(t[k].text) && k + 1 < n) {
        mtime = std::strtoll(t[k].text.c_str(), nullptr, 10);
        return k + 1;
    }
    return 0;
}

// Size and time columns starting at sizeIdx; nameIdx receives the first name token.
bool parseColumns(const std::vector<Token>& tokens, std::size_t sizeIdx, std::time_t now,
                  std::optional<std::uint64_t>& size, std::int64_t& mtime, std::size_t& nameIdx) {
    size.reset();
    std::size_t k = sizeIdx;
    const std::string& sizeTok = tokens[k].text;
    if (!sizeTok.empty() && sizeTok.back() == ',') {
        k += 2;  // "major," "minor": device node, no byte size
    } else if (sizeTok.find(',') != std::string::npos) {
        k += 1;
    } else if (allDigits(sizeTok)) {
        size = std::strtoull(sizeTok.c_str(), nullptr, 10);
        k += 1;
    } else {
        return false;
    }
    nameIdx = parseTime(tokens, k, now, mtime);
    return nameIdx != 0 && nameIdx < tokens.size();
}

} // namespace

bool parsePermissions(const std::string& rwx, std::uint32_t& mode) {
    if (rwx.size() != 9) return false;
    mode = 0;
    const std::uint32_t readBits[3] = {0400, 040, 04};
    const std::uint32_t writeBits[3] = {0200, 020, 02};
    const std::uint32_t execBits[3] = {0100, 010, 01};
    const std::uint32_t specialBits[3] = {04000, 02000, 01000};
    for (int g = 0; g < 3; ++g) {
        const char r = rwx[g * 3], w = rwx[g * 3 + 1], x = rwx[g * 3 + 2];
        if (r == 'r') mode |= readBits[g];
        else if (r != '-') return false;
        if (w == 'w') mode |= writeBits[g];
        else if (w != '-') return false;
        const char special = g == 2 ? 't' : 's';
        if (x == 'x') {
            mode |= execBits[g];
        } else if (x == special) {
            mode |= execBits[g] | specialBits[g];
        } else if (x == static_cast<char>(std::toupper(special))) {
            mode |= specialBits[g];
        } else if (x != '-') {
            return false;
        }
    }
    return true;
}

LineResult parseLine(const std::string& rawLine, const std::string& dir, std::time_t now, RemoteEntry& out) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    const auto tokens = tokenize(line);
    if (tokens.empty()) return LineResult::Ignored;
    if (tokens[0].text == "total" && tokens.size() == 2) return LineResult::Ignored;

    const std::string& perms = tokens[0].text;
    if (perms.size() < 10 || std::strchr("-dlcbps", perms[0]) == nullptr) return LineResult::Unparsed;
    std::uint32_t mode = 0;
    if (!parsePermissions(perms.substr(1, 9), mode)) return LineResult::Unparsed;
    if (tokens.size() < 6) return LineResult::Unparsed;

    // perms links owner group size|major,minor time... name; some FTP
    // servers leave out the group column.
    std::optional<std::uint64_t> size;
    std::int64_t mtime = 0;
    std::size_t nameIdx = 0;
    std::size_t sizeIdx = 4;
    for (; sizeIdx >= 3; --sizeIdx) {
        if (parseColumns(tokens, sizeIdx, now, size, mtime, nameIdx)) break;
    }
    if (sizeIdx < 3) return LineResult::Unparsed;

    std::string name = line.substr(tokens[nameIdx].start);
    RemoteEntry e;
    if (perms[0] == 'l') {
        e.is_symlink = true;
        const auto arrow = name.find(" -> ");
        if (arrow != std::string::npos) {
            e.symlink_target = name.substr(arrow + 4);
            name = name.substr(0, arrow);
        }
    }
    if (name.empty()) return LineResult::Unparsed;

    e.name = name;
    e.path = (name == "." || name == "..") ? dir : joinPath(dir, name);
    e.is_directory = perms[0] == 'd';
    e.permissions = mode;
    e.size = size;
    e.mtime = mtime;
    if (allDigits(tokens[2].text)) e.uid = static_cast<std::uint32_t>(std::strtoul(tokens[2].text.c_str(), nullptr, 10));
    if (sizeIdx == 4 && allDigits(tokens[3].text))
        e.gid = static_cast<std::uint32_t>(std::strtoul(tokens[3].text.c_str(), nullptr, 10));
    out = std::move(e);
    return LineResult::Entry;
}

ListResult parseListing(const std::string& output, const std::string& dir, std::time_t now, bool* sawDot) {
    ListResult result;
    if (sawDot) *sawDot = false;
    std::size_t pos = 0;
    while (pos <= output.size()) {
        const auto nl = output.find('\n', pos);
        const std::string line = output.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        RemoteEntry e;
        switch (parseLine(line, dir, now, e)) {
        case LineResult::Entry:
            if (e.name == ".") {
                if (sawDot) *sawDot = true;
            } else if (e.name != "..") {
                result.entries.push_back(std::move(e));
            }
            break;
        case LineResult::Unparsed:
            ++result.skipped_lines;
            break;
        case LineResult::Ignored:
            break;
        }
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    sortEntries(result.entries);
    return result;
}

} // namespace ls
} // namespace tscp
