// SCP backend over libssh2 exec channels. Each command gets its own channel;
// only one channel is open at a time so the session is never multiplexed.
#include "tscp/Libssh2ScpBridge.hpp"
#include "tscp/LsParser.hpp"
#include "tscp/ScpProtocol.hpp"
#include <libssh2.h>

#include <cstdio>
#include <ctime>
#include <map>
#include <string>

namespace tscp {

namespace {

std::string trimmed(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n'))
        ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n'))
        --e;
    return s.substr(b, e - b);
}

std::string octal(std::uint32_t mode) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%o", static_cast<unsigned>(mode & 07777));
    return buf;
}

// Non-zero exit of a remote command, classified from its stderr.
void commandError(const Libssh2ScpBridge::CommandResult& res, const std::string& path, ErrorKind fallback,
                  BridgeError& err) {
    const std::string msg = trimmed(res.err);
    if (res.exit_status == 127) {
        err.set(ErrorKind::Protocol, path, "remote command not available: " + msg);
        return;
    }
    err.set(scp::classifyMessage(msg, fallback), path,
            msg.empty() ? "remote command failed with status " + std::to_string(res.exit_status) : msg);
}

// One exec channel. Closing it mid-exchange is safe for the session: the
// remote side sees EOF and exits.
class ExecChannel {
public:
    ExecChannel(Libssh2ScpBridge* owner, LIBSSH2_CHANNEL* ch, std::string path)
        : owner_(owner), ch_(ch), path_(std::move(path)) {}
    ~ExecChannel() {
        if (ch_) {
            libssh2_channel_close(ch_);
            libssh2_channel_free(ch_);
        }
    }
    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    // got == 0 at EOF
    bool readSome(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) {
        got = 0;
        ssize_t n = libssh2_channel_read(ch_, buf, cap);
        if (n < 0) {
            owner_->fail(path_, "read", err);
            return false;
        }
        got = static_cast<std::size_t>(n);
        return true;
    }

    bool readByte(char& c, BridgeError& err) {
        std::size_t got = 0;
        if (!readSome(&c, 1, got, err)) return false;
        if (got == 0) {
            const std::string msg = trimmed(drainStderr());
            err.set(msg.empty() ? ErrorKind::Protocol : scp::classifyMessage(msg, ErrorKind::Protocol), path_,
                    msg.empty() ? "unexpected end of scp stream" : msg);
            return false;
        }
        return true;
    }

    bool readLine(std::string& line, BridgeError& err) {
        line.clear();
        char c = 0;
        while (true) {
            if (!readByte(c, err)) return false;
            if (c == '\n') return true;
            line.push_back(c);
            if (line.size() > 64 * 1024) {
                err.set(ErrorKind::Protocol, path_, "scp control line too long");
                return false;
            }
        }
    }

    bool writeAll(const char* data, std::size_t len, BridgeError& err) {
        while (len > 0) {
            ssize_t w = libssh2_channel_write(ch_, data, len);
            if (w < 0) {
                owner_->fail(path_, "write", err);
                return false;
            }
            data += w;
            len -= static_cast<std::size_t>(w);
        }
        return true;
    }
    bool writeAll(const std::string& s, BridgeError& err) { return writeAll(s.data(), s.size(), err); }

    // Status byte sent by the remote scp after each record and after the data.
    bool readAck(BridgeError& err) {
        char c = 0;
        if (!readByte(c, err)) return false;
        std::string msg;
        if (scp::ackHasMessage(c) && !readLine(msg, err)) return false;
        std::string text;
        const ErrorKind kind = scp::ackError(c, msg, text);
        if (kind == ErrorKind::None) return true;
        err.set(kind, path_, text);
        return false;
    }

    // Reads stdout and stderr together until EOF. Both share the channel
    // window, so leaving one unread can stall the remote command.
    bool readOutputs(std::string& out, std::string& errText, BridgeError& err) {
        SshSession& ssh = owner_->session();
        ssh.setBlocking(false);
        char buf[16 * 1024];
        bool ok = true;
        bool transport = false;
        while (true) {
            bool progressed = false;
            ssize_t n = libssh2_channel_read(ch_, buf, sizeof(buf));
            if (n > 0) {
                out.append(buf, static_cast<std::size_t>(n));
                progressed = true;
            } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                ok = false;
                transport = true;
                break;
            }
            n = libssh2_channel_read_stderr(ch_, buf, sizeof(buf));
            if (n > 0) {
                errText.append(buf, static_cast<std::size_t>(n));
                progressed = true;
            } else if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
                ok = false;
                transport = true;
                break;
            }
            if (progressed) continue;
            if (libssh2_channel_eof(ch_)) break;
            if (!ssh.waitSocket(owner_->ioTimeoutMs(), err)) {
                err.path = path_;
                ok = false;
                break;
            }
        }
        ssh.setBlocking(true);
        if (transport) owner_->fail(path_, "read", err);
        return ok;
    }

    std::string drainStderr() {
        std::string out;
        char buf[1024];
        while (true) {
            ssize_t n = libssh2_channel_read_stderr(ch_, buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }

    // Sends EOF, waits for the remote side to exit and reports its status.
    bool close(int& exitStatus, BridgeError& err) {
        exitStatus = -1;
        if (libssh2_channel_send_eof(ch_) != 0 || libssh2_channel_wait_eof(ch_) != 0 ||
            libssh2_channel_close(ch_) != 0 || libssh2_channel_wait_closed(ch_) != 0) {
            owner_->fail(path_, "close", err);
            return false;
        }
        exitStatus = libssh2_channel_get_exit_status(ch_);
        libssh2_channel_free(ch_);
        ch_ = nullptr;
        return true;
    }

private:
    Libssh2ScpBridge* owner_;
    LIBSSH2_CHANNEL* ch_;
    std::string path_;
};

// Source side of "scp -f": the data follows the C record; a status byte
// closes it.
class ScpReadStream : public ReadStream {
public:
    ScpReadStream(Libssh2ScpBridge* owner, std::unique_ptr<ExecChannel> ch, std::string path, std::uint64_t size)
        : owner_(owner), ch_(std::move(ch)), path_(std::move(path)), remaining_(size), size_(size) {}
    ~ScpReadStream() override {
        ch_.reset();
        owner_->streamClosed();
    }

    bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) override {
        got = 0;
        if (remaining_ == 0) return true;
        const std::size_t want = remaining_ < cap ? static_cast<std::size_t>(remaining_) : cap;
        if (!ch_->readSome(buf, want, got, err)) {
            if (err.kind != ErrorKind::Connection) err.kind = ErrorKind::Io;
            return false;
        }
        if (got == 0) {
            err.set(ErrorKind::Io, path_,
                    "stream ended after " + std::to_string(size_ - remaining_) + " of " + std::to_string(size_) +
                        " bytes");
            return false;
        }
        remaining_ -= got;
        return true;
    }

    bool finish(BridgeError& err) override {
        if (remaining_ != 0) {
            err.set(ErrorKind::Protocol, path_, "finish before end of data");
            return false;
        }
        if (!ch_->readAck(err)) return false;
        const char ok = scp::kOk;
        if (!ch_->writeAll(&ok, 1, err)) return false;
        const std::string stderrText = ch_->drainStderr();
        int status = -1;
        if (!ch_->close(status, err)) return false;
        if (status != 0) {
            Libssh2ScpBridge::CommandResult res;
            res.exit_status = status;
            res.err = stderrText;
            commandError(res, path_, ErrorKind::Io, err);
            return false;
        }
        return true;
    }

private:
    Libssh2ScpBridge* owner_;
    std::unique_ptr<ExecChannel> ch_;
    std::string path_;
    std::uint64_t remaining_;
    std::uint64_t size_;
};

// Sink side of "scp -t". The remote write result is only known from the
// status byte that answers our end-of-data marker.
class ScpWriteStream : public WriteStream {
public:
    ScpWriteStream(Libssh2ScpBridge* owner, std::unique_ptr<ExecChannel> ch, std::string path, std::uint64_t size)
        : owner_(owner), ch_(std::move(ch)), path_(std::move(path)), size_(size) {}
    ~ScpWriteStream() override { abort(); }

    bool write(const char* buf, std::size_t len, BridgeError& err) override {
        if (!ch_) {
            err.set(ErrorKind::Protocol, path_, "stream already closed");
            return false;
        }
        if (written_ + len > size_) {
            err.set(ErrorKind::Protocol, path_, "more data than announced in the scp header");
            return false;
        }
        if (!ch_->writeAll(buf, len, err)) {
            if (err.kind != ErrorKind::Connection) err.kind = ErrorKind::Io;
            return false;
        }
        written_ += len;
        return true;
    }

    bool finish(BridgeError& err) override {
        if (!ch_) {
            err.set(ErrorKind::Protocol, path_, "stream already closed");
            return false;
        }
        if (written_ != size_) {
            err.set(ErrorKind::Protocol, path_,
                    "short write: " + std::to_string(written_) + " of " + std::to_string(size_) + " bytes");
            return false;
        }
        const char ok = scp::kOk;
        if (!ch_->writeAll(&ok, 1, err) || !ch_->readAck(err)) return false;
        const std::string stderrText = ch_->drainStderr();
        int status = -1;
        const bool closed = ch_->close(status, err);
        ch_.reset();
        owner_->streamClosed();
        if (!closed) return false;
        if (status != 0) {
            Libssh2ScpBridge::CommandResult res;
            res.exit_status = status;
            res.err = stderrText;
            commandError(res, path_, ErrorKind::Io, err);
            return false;
        }
        return true;
    }

    void abort() override {
        if (ch_) {
            ch_.reset();
            owner_->streamClosed();
        }
    }

private:
    Libssh2ScpBridge* owner_;
    std::unique_ptr<ExecChannel> ch_;
    std::string path_;
    std::uint64_t size_;
    std::uint64_t written_ = 0;
};

} // namespace

Libssh2ScpBridge::Libssh2ScpBridge() = default;

Libssh2ScpBridge::~Libssh2ScpBridge() {
    disconnect();
}

void Libssh2ScpBridge::fail(const std::string& path, const char* op, BridgeError& err) {
    if (ssh_.transportBroken()) {
        ssh_.lastError(ErrorKind::Connection, path, err);
        state_ = SessionState::Failed;
    } else {
        ssh_.lastError(ErrorKind::Protocol, path, err);
    }
    err.message = std::string(op) + ": " + err.message;
}

bool Libssh2ScpBridge::requireIdle(const std::string& path, BridgeError& err) const {
    if (!requireConnected(path, err)) return false;
    if (streaming_) {
        err.set(ErrorKind::Protocol, path, "session busy: an scp transfer is in progress");
        return false;
    }
    return true;
}

LIBSSH2_CHANNEL* Libssh2ScpBridge::openChannel(const std::string& command, const std::string& path,
                                               BridgeError& err) {
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(ssh_.raw());
    if (!ch) {
        fail(path, "open channel", err);
        return nullptr;
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        fail(path, "exec", err);
        libssh2_channel_free(ch);
        return nullptr;
    }
    return ch;
}

bool Libssh2ScpBridge::exec(const std::string& command, const std::string& path, CommandResult& res,
                            BridgeError& err) {
    res = CommandResult{};
    LIBSSH2_CHANNEL* raw = openChannel(command, path, err);
    if (!raw) return false;
    ExecChannel ch(this, raw, path);
    if (!ch.readOutputs(res.out, res.err, err)) return false;
    return ch.close(res.exit_status, err);
}

bool Libssh2ScpBridge::connect(const HostConfig& cfg, BridgeError& err) {
    if (state_ == SessionState::Connected) {
        err.set(ErrorKind::Protocol, cfg.host, "already connected");
        return false;
    }
    state_ = SessionState::Connecting;
    if (!ssh_.open(cfg, err)) {
        state_ = SessionState::Failed;
        return false;
    }
    state_ = SessionState::Connected;
    lsPlain_ = false;
    ioTimeoutMs_ = cfg.io_timeout_ms;

    CommandResult res;
    if (!exec("pwd", {}, res, err)) {
        disconnect();
        state_ = SessionState::Failed;
        return false;
    }
    const std::string home = trimmed(res.out);
    cwd_ = (res.exit_status == 0 && !home.empty() && home.front() == '/') ? home : std::string("/");

    if (cfg.remote_root && !changeDirectory(*cfg.remote_root, err)) {
        disconnect();
        state_ = SessionState::Failed;
        return false;
    }
    return true;
}

void Libssh2ScpBridge::disconnect() {
    ssh_.close();
    cwd_ = "/";
    streaming_ = false;
    state_ = SessionState::Disconnected;
}

bool Libssh2ScpBridge::pwd(std::string& out, BridgeError& err) {
    if (!requireConnected({}, err)) return false;
    out = cwd_;
    return true;
}

bool Libssh2ScpBridge::changeDirectory(const std::string& path, BridgeError& err) {
    const std::string target = abs(path);
    bool isDir = false;
    if (!isDirectory(target, isDir, err)) return false;
    if (!isDir) {
        err.set(ErrorKind::NotFound, target, "not a directory");
        return false;
    }
    cwd_ = target;
    return true;
}

std::string Libssh2ScpBridge::lsCommand(const char* flags, const std::string& path) const {
    std::string cmd = "TZ=UTC LC_ALL=C ls ";
    cmd += flags;
    if (!lsPlain_) cmd += " --time-style=+%s";
    return cmd + " -- " + scp::shellQuote(path);
}

bool Libssh2ScpBridge::runLs(const char* flags, const std::string& path, CommandResult& res, BridgeError& err) {
    if (!exec(lsCommand(flags, path), path, res, err)) return false;
    if (res.exit_status != 0 && !lsPlain_ &&
        (res.err.find("unrecognized option") != std::string::npos ||
         res.err.find("illegal option") != std::string::npos ||
         res.err.find("invalid option") != std::string::npos ||
         res.err.find("unknown option") != std::string::npos)) {
        lsPlain_ = true;
        return exec(lsCommand(flags, path), path, res, err);
    }
    return true;
}

bool Libssh2ScpBridge::runSimple(const std::string& command, const std::string& path, BridgeError& err) {
    CommandResult res;
    if (!exec(command, path, res, err)) return false;
    if (res.exit_status != 0) {
        commandError(res, path, ErrorKind::Io, err);
        return false;
    }
    return true;
}

bool Libssh2ScpBridge::list(const std::string& path, ListResult& out, BridgeError& err) {
    const std::string dir = abs(path);
    if (!requireIdle(dir, err)) return false;
    // trailing slash: list the target of a symlinked directory, fail on files
    const std::string arg = dir == "/" ? dir : dir + "/";
    CommandResult res;
    if (!runLs("-lan", arg, res, err)) return false;
    if (res.exit_status != 0) {
        commandError(res, dir, ErrorKind::Io, err);
        return false;
    }
    const std::time_t now = std::time(nullptr);
    bool sawDot = false;
    out = ls::parseListing(res.out, dir, now, &sawDot);
    if (!sawDot) {
        err.set(ErrorKind::NotFound, dir, "not a directory");
        return false;
    }

    bool hasLinks = false;
    for (const auto& e : out.entries)
        hasLinks = hasLinks || e.is_symlink;
    if (hasLinks) {
        // Second pass with -L gives the link targets' type and size. Broken
        // links make ls exit non-zero; those keep their lstat view.
        CommandResult followedRes;
        if (!runLs("-lanL", arg, followedRes, err)) return false;
        std::map<std::string, RemoteEntry> followed;
        bool followedDot = false;
        for (auto& e : ls::parseListing(followedRes.out, dir, now, &followedDot).entries)
            followed.emplace(e.name, std::move(e));
        for (auto& e : out.entries) {
            if (!e.is_symlink) continue;
            auto it = followed.find(e.name);
            if (it == followed.end() || it->second.is_symlink) {
                e.symlink_dangling = followedDot;
                continue;
            }
            e.is_directory = it->second.is_directory;
            e.size = it->second.size;
            e.permissions = it->second.permissions;
            e.mtime = it->second.mtime;
        }
        sortEntries(out.entries);
    }
    return true;
}

bool Libssh2ScpBridge::stat(const std::string& path, RemoteEntry& out, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    CommandResult res;
    if (!runLs("-land", p, res, err)) return false;
    if (res.exit_status != 0) {
        commandError(res, p, ErrorKind::Io, err);
        return false;
    }
    const std::time_t now = std::time(nullptr);
    ListResult parsed = ls::parseListing(res.out, parentPath(p), now);
    if (parsed.entries.empty()) {
        err.set(ErrorKind::Protocol, p, "could not parse ls output: " + trimmed(res.out));
        return false;
    }
    RemoteEntry e = parsed.entries.front();
    e.name = baseName(p);
    e.path = p;
    if (e.is_symlink) {
        CommandResult followedRes;
        if (!runLs("-landL", p, followedRes, err)) return false;
        ListResult followed = ls::parseListing(followedRes.out, parentPath(p), now);
        if (followedRes.exit_status == 0 && !followed.entries.empty() && !followed.entries.front().is_symlink) {
            const RemoteEntry& t = followed.entries.front();
            e.is_directory = t.is_directory;
            e.size = t.size;
            e.permissions = t.permissions;
            e.mtime = t.mtime;
        } else {
            e.symlink_dangling = true;
        }
    }
    out = std::move(e);
    return true;
}

bool Libssh2ScpBridge::createDirectory(const std::string& path, BridgeError& err, unsigned int mode) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return runSimple("mkdir -m " + octal(mode) + " -- " + scp::shellQuote(p), p, err);
}

bool Libssh2ScpBridge::removeFile(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return runSimple("rm -- " + scp::shellQuote(p), p, err);
}

bool Libssh2ScpBridge::removeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return runSimple("rmdir -- " + scp::shellQuote(p), p, err);
}

bool Libssh2ScpBridge::rename(const std::string& from, const std::string& to, BridgeError& err) {
    const std::string src = abs(from);
    const std::string dst = abs(to);
    if (!requireIdle(src, err)) return false;
    return runSimple("mv -f -- " + scp::shellQuote(src) + " " + scp::shellQuote(dst), src, err);
}

std::unique_ptr<ReadStream> Libssh2ScpBridge::openRead(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return nullptr;
    LIBSSH2_CHANNEL* raw = openChannel("scp -f -- " + scp::shellQuote(p), p, err);
    if (!raw) return nullptr;
    auto ch = std::make_unique<ExecChannel>(this, raw, p);

    const char ok = scp::kOk;
    if (!ch->writeAll(&ok, 1, err)) return nullptr;
    scp::ControlLine record;
    while (true) {
        char tag = 0;
        if (!ch->readByte(tag, err)) return nullptr;
        std::string rest;
        if (!ch->readLine(rest, err)) return nullptr;
        std::string perr;
        if (!scp::parseControlLine(std::string(1, tag) + rest, record, perr)) {
            err.set(ErrorKind::Protocol, p, perr);
            return nullptr;
        }
        if (record.type == scp::ControlLine::Type::Warning || record.type == scp::ControlLine::Type::Fatal) {
            const std::string msg = trimmed(record.message);
            err.set(scp::classifyMessage(msg, ErrorKind::Io), p, msg);
            return nullptr;
        }
        if (record.type == scp::ControlLine::Type::Times) {
            if (!ch->writeAll(&ok, 1, err)) return nullptr;
            continue;
        }
        break;
    }
    if (record.type != scp::ControlLine::Type::File) {
        err.set(ErrorKind::Protocol, p, "expected a file record from scp");
        return nullptr;
    }
    if (!ch->writeAll(&ok, 1, err)) return nullptr;
    streaming_ = true;
    return std::make_unique<ScpReadStream>(this, std::move(ch), p, record.size);
}

std::unique_ptr<WriteStream> Libssh2ScpBridge::openWrite(const std::string& path, bool append, BridgeError& err,
                                                         std::optional<std::uint64_t> expected_size,
                                                         std::optional<std::int64_t> mtime) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return nullptr;
    if (append) {
        err.set(ErrorKind::Protocol, p, "append is not supported over SCP");
        return nullptr;
    }
    if (!expected_size) {
        err.set(ErrorKind::Protocol, p, "SCP needs the file size before the data");
        return nullptr;
    }
    // The sink gets the parent directory and the C record names the file.
    LIBSSH2_CHANNEL* raw = openChannel("scp -t -- " + scp::shellQuote(parentPath(p)), p, err);
    if (!raw) return nullptr;
    auto ch = std::make_unique<ExecChannel>(this, raw, p);

    if (!ch->readAck(err)) return nullptr;
    if (mtime && (!ch->writeAll(scp::timesHeader(*mtime, *mtime), err) || !ch->readAck(err))) return nullptr;
    if (!ch->writeAll(scp::fileHeader(0644, *expected_size, baseName(p)), err) || !ch->readAck(err))
        return nullptr;
    streaming_ = true;
    return std::make_unique<ScpWriteStream>(this, std::move(ch), p, *expected_size);
}

bool Libssh2ScpBridge::symlinkResolve(const std::string& path, std::string& target, BridgeError& err) {
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    if (!e.is_symlink) {
        target = e.path;
        return true;
    }
    std::string link = e.symlink_target.value_or(std::string());
    if (link.empty()) {
        CommandResult res;
        if (!exec("readlink -- " + scp::shellQuote(e.path), e.path, res, err)) return false;
        if (res.exit_status != 0) {
            commandError(res, e.path, ErrorKind::Io, err);
            return false;
        }
        link = trimmed(res.out);
    }
    target = resolvePath(parentPath(e.path), link);
    return true;
}

bool Libssh2ScpBridge::setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return runSimple("chmod " + octal(mode) + " -- " + scp::shellQuote(p), p, err);
}

bool Libssh2ScpBridge::setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    const std::time_t t = static_cast<std::time_t>(mtime);
    struct tm utc;
    gmtime_r(&t, &utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M.%S", &utc);
    return runSimple(std::string("TZ=UTC touch -c -m -t ") + stamp + " -- " + scp::shellQuote(p), p, err);
}

} // namespace tscp
