#include "tscp/HostTypes.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tscp {

const char* protocolName(Protocol p) {
    switch (p) {
    case Protocol::Scp:
        return "scp";
    case Protocol::Sftp:
        return "sftp";
    case Protocol::Ftp:
        return "ftp";
    case Protocol::Ftps:
        return "ftps";
    case Protocol::Local:
        return "local";
    }
    return "unknown";
}

std::uint16_t defaultPort(Protocol p) {
    switch (p) {
    case Protocol::Scp:
    case Protocol::Sftp:
        return 22;
    case Protocol::Ftp:
    case Protocol::Ftps:
        return 21;
    case Protocol::Local:
        return 0;
    }
    return 22;
}

const char* toString(ErrorKind k) {
    switch (k) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Connection:
        return "connection error";
    case ErrorKind::Auth:
        return "authentication error";
    case ErrorKind::NotFound:
        return "not found";
    case ErrorKind::Permission:
        return "permission denied";
    case ErrorKind::Protocol:
        return "protocol error";
    case ErrorKind::Io:
        return "i/o error";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::AlreadyExists:
        return "already exists";
    }
    return "unknown";
}

std::string BridgeError::describe() const {
    std::string out = toString(kind);
    if (timed_out) out += " (timed out)";
    if (!path.empty()) out += ": " + path;
    if (!message.empty()) out += ": " + message;
    return out;
}

void sortEntries(std::vector<RemoteEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const RemoteEntry& a, const RemoteEntry& b) {
        if (a.is_directory != b.is_directory) return a.is_directory > b.is_directory;
        return a.name < b.name;
    });
}

bool parseHostUrl(const std::string& url, HostConfig& out, std::string& err) {
    const auto sep = url.find("://");
    if (sep == std::string::npos) {
        err = "missing scheme (expected scp://, sftp://, ftp:// or ftps://)";
        return false;
    }
    std::string scheme = url.substr(0, sep);
    for (char& c : scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    HostConfig cfg;
    if (scheme == "scp") {
        cfg.protocol = Protocol::Scp;
    } else if (scheme == "sftp") {
        cfg.protocol = Protocol::Sftp;
    } else if (scheme == "ftp") {
        cfg.protocol = Protocol::Ftp;
    } else if (scheme == "ftps") {
        cfg.protocol = Protocol::Ftps;
    } else {
        err = "unsupported scheme: " + scheme;
        return false;
    }

    std::string rest = url.substr(sep + 3);
    std::string path;
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        path = rest.substr(slash);
        rest = rest.substr(0, slash);
    }

    // user may contain '@' (e-mail style logins): split on the last one
    const auto at = rest.rfind('@');
    if (at != std::string::npos) {
        cfg.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    std::string host = rest;
    std::string portStr;
    bool hasPort = false;
    if (!rest.empty() && rest.front() == '[') {
        const auto close = rest.find(']');
        if (close == std::string::npos) {
            err = "unterminated IPv6 address";
            return false;
        }
        host = rest.substr(1, close - 1);
        const std::string tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                err = "unexpected text after IPv6 address";
                return false;
            }
            hasPort = true;
            portStr = tail.substr(1);
        }
    } else {
        const auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            host = rest.substr(0, colon);
            portStr = rest.substr(colon + 1);
            hasPort = true;
        }
    }
    if (hasPort) {
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            err = "invalid port: " + portStr;
            return false;
        }
        const long n = std::strtol(portStr.c_str(), nullptr, 10);
        if (n < 1 || n > 65535) {
            err = "invalid port: " + portStr;
            return false;
        }
        cfg.port = static_cast<std::uint16_t>(n);
    }
    if (host.empty()) {
        err = "host is required";
        return false;
    }
    cfg.host = host;
    if (!path.empty() && path != "/") cfg.remote_root = path;
    out = std::move(cfg);
    err.clear();
    return true;
}

std::string joinPath(const std::string& base, const std::string& name) {
    if (base.empty()) return std::string("/") + name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

std::string parentPath(const std::string& path) {
    if (path.empty() || path == "/") return "/";
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::string resolvePath(const std::string& cwd, const std::string& path) {
    std::string full;
    if (!path.empty() && path.front() == '/') {
        full = path;
    } else if (path.empty()) {
        full = cwd.empty() ? "/" : cwd;
    } else {
        full = joinPath(cwd.empty() ? "/" : cwd, path);
    }

    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= full.size()) {
        const auto next = full.find('/', i);
        const std::string seg = full.substr(i, next == std::string::npos ? std::string::npos : next - i);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        if (next == std::string::npos) break;
        i = next + 1;
    }
    if (parts.empty()) return "/";
    std::string out;
    for (const auto& s : parts) {
        out += '/';
        out += s;
    }
    return out;
}

} // namespace tscp
