// FTP/FTPS backend. Every path goes to the server in absolute form, so the
// server-side working directory is never relied upon.
#include "tscp/FtpBridge.hpp"
#include "tscp/LsParser.hpp"

#include <cstdio>
#include <ctime>

namespace tscp {

namespace {

std::string firstLine(const std::string& text) {
    return text.substr(0, text.find('\n'));
}

// Data connection failures are Io; stalls stay Connection timeouts.
void dataError(BridgeError& err, const std::string& path) {
    if (!err.timed_out) err.kind = ErrorKind::Io;
    err.path = path;
}

class FtpReadStream : public ReadStream {
public:
    FtpReadStream(FtpBridge* owner, std::unique_ptr<ftp::Channel> data, std::string path)
        : owner_(owner), data_(std::move(data)), path_(std::move(path)) {}
    ~FtpReadStream() override {
        if (!done_) owner_->abortTransfer(*data_);
    }

    bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) override {
        got = 0;
        if (eof_) return true;
        if (!data_->recv(buf, cap, got, owner_->timeoutMs(), err)) {
            // the data connection failed; the control connection is still fine
            dataError(err, path_);
            return false;
        }
        eof_ = got == 0;
        return true;
    }

    bool finish(BridgeError& err) override {
        done_ = true;
        return owner_->finishTransfer(*data_, eof_, path_, err);
    }

private:
    FtpBridge* owner_;
    std::unique_ptr<ftp::Channel> data_;
    std::string path_;
    bool eof_ = false;
    bool done_ = false;
};

class FtpWriteStream : public WriteStream {
public:
    FtpWriteStream(FtpBridge* owner, std::unique_ptr<ftp::Channel> data, std::string path)
        : owner_(owner), data_(std::move(data)), path_(std::move(path)) {}
    ~FtpWriteStream() override { abort(); }

    bool write(const char* buf, std::size_t len, BridgeError& err) override {
        if (done_) {
            err.set(ErrorKind::Protocol, path_, "stream already closed");
            return false;
        }
        if (!data_->send(buf, len, owner_->timeoutMs(), err)) {
            failed_ = true;
            dataError(err, path_);
            return false;
        }
        return true;
    }

    // Closing the data connection marks the end of the file for the server.
    bool finish(BridgeError& err) override {
        if (done_) {
            err.set(ErrorKind::Protocol, path_, "stream already closed");
            return false;
        }
        done_ = true;
        return owner_->finishTransfer(*data_, !failed_, path_, err);
    }

    void abort() override {
        if (done_) return;
        done_ = true;
        owner_->abortTransfer(*data_);
    }

private:
    FtpBridge* owner_;
    std::unique_ptr<ftp::Channel> data_;
    std::string path_;
    bool failed_ = false;
    bool done_ = false;
};

} // namespace

FtpBridge::FtpBridge(bool tls) : tls_(tls) {}

FtpBridge::~FtpBridge() {
    disconnect();
}

void FtpBridge::teardown() {
    ctrl_.close();
    cstate_ = ControlState::Idle;
    state_ = SessionState::Failed;
}

bool FtpBridge::requireIdle(const std::string& path, BridgeError& err) const {
    if (!requireConnected(path, err)) return false;
    if (cstate_ != ControlState::Idle) {
        err.set(ErrorKind::Protocol, path, "session busy: a data transfer is in progress");
        return false;
    }
    return true;
}

bool FtpBridge::readReply(ftp::Reply& reply, BridgeError& err) {
    ftp::ReplyParser parser;
    std::string line;
    while (true) {
        if (!ctrl_.readLine(line, timeoutMs(), err)) {
            teardown();
            if (err.kind != ErrorKind::Protocol) err.kind = ErrorKind::Connection;
            return false;
        }
        switch (parser.feed(line)) {
        case ftp::ReplyParser::Status::NeedMore:
            continue;
        case ftp::ReplyParser::Status::Malformed:
            teardown();
            err.set(ErrorKind::Protocol, cfg_.host, "malformed reply: " + line.substr(0, 80));
            return false;
        case ftp::ReplyParser::Status::Complete:
            reply = parser.reply();
            if (reply.code == 421) {
                teardown();
                err.set(ErrorKind::Connection, cfg_.host, "server closing connection: " + firstLine(reply.text));
                return false;
            }
            return true;
        }
    }
}

bool FtpBridge::command(const std::string& cmd, ftp::Reply& reply, BridgeError& err) {
    if (cstate_ != ControlState::Idle) {
        err.set(ErrorKind::Protocol, cfg_.host, "session busy: a data transfer is in progress");
        return false;
    }
    if (cmd.find_first_of("\r\n") != std::string::npos) {
        err.set(ErrorKind::Protocol, cmd.substr(cmd.find(' ') + 1), "line breaks are not allowed in FTP paths");
        return false;
    }
    cstate_ = ControlState::AwaitingResponse;
    const std::string line = cmd + "\r\n";
    if (!ctrl_.send(line.data(), line.size(), timeoutMs(), err)) {
        teardown();
        err.kind = ErrorKind::Connection;
        return false;
    }
    if (!readReply(reply, err)) return false;
    cstate_ = ControlState::Idle;
    return true;
}

void FtpBridge::replyError(const ftp::Reply& reply, const std::string& path, const std::string& what,
                           BridgeError& err) {
    err.set(ftp::replyKind(reply, loggingIn_), path,
            what + ": " + std::to_string(reply.code) + " " + firstLine(reply.text));
    if (err.kind == ErrorKind::Connection) teardown();
}

bool FtpBridge::expect(const std::string& cmd, int code, const std::string& path, BridgeError& err,
                       ftp::Reply* out) {
    ftp::Reply reply;
    if (!command(cmd, reply, err)) return false;
    if (out) *out = reply;
    if (code == 0 ? reply.positive() : reply.code == code) return true;
    replyError(reply, path, cmd.substr(0, cmd.find(' ')), err);
    return false;
}

bool FtpBridge::login(BridgeError& err) {
    ftp::Reply reply;
    do {
        if (!readReply(reply, err)) return false;
    } while (reply.code == 120);  // "service ready in nnn minutes"
    if (reply.code != 220) {
        replyError(reply, cfg_.host, "greeting", err);
        return false;
    }

    if (tls_) {
        if (!tlsCtx_.init(cfg_, err) || !expect("AUTH TLS", 234, cfg_.host, err)) return false;
        if (!ctrl_.startTls(tlsCtx_, cfg_.host, nullptr, timeoutMs(), err)) return false;
    }

    const std::string user = cfg_.username.empty() ? std::string("anonymous") : cfg_.username;
    if (!command("USER " + user, reply, err)) return false;
    if (reply.code == 331) {
        const std::string pass = cfg_.password.value_or(cfg_.username.empty() ? std::string("anonymous@") : std::string());
        if (!command("PASS " + pass, reply, err)) return false;
    }
    if (reply.code == 332) {
        err.set(ErrorKind::Auth, user, "server requires an account (ACCT), which is not supported");
        return false;
    }
    if (reply.code != 230 && reply.code != 202) {
        replyError(reply, user, "login", err);
        if (err.kind != ErrorKind::Connection) err.kind = ErrorKind::Auth;
        return false;
    }

    if (tls_ && (!expect("PBSZ 0", 200, cfg_.host, err) || !expect("PROT P", 200, cfg_.host, err))) return false;

    // FEAT is optional: servers without it just get the conservative paths
    if (!command("FEAT", reply, err)) return false;
    feat_ = reply.code == 211 ? ftp::parseFeat(reply.text) : ftp::Features{};
    if (feat_.utf8 && !command("OPTS UTF8 ON", reply, err)) return false;

    if (!expect("TYPE I", 200, cfg_.host, err)) return false;

    if (!command("PWD", reply, err)) return false;
    std::string home;
    cwd_ = (reply.code == 257 && ftp::parsePwd(reply.text, home) && home.front() == '/') ? home : std::string("/");
    return true;
}

bool FtpBridge::connect(const HostConfig& cfg, BridgeError& err) {
    if (state_ == SessionState::Connected) {
        err.set(ErrorKind::Protocol, cfg.host, "already connected");
        return false;
    }
    cfg_ = cfg;
    state_ = SessionState::Connecting;
    cstate_ = ControlState::Idle;
    loggingIn_ = true;
    if (!ctrl_.connect(cfg_.host, cfg_.effectivePort(), cfg_.connect_timeout_ms, err)) {
        loggingIn_ = false;
        state_ = SessionState::Failed;
        return false;
    }
    peer_ = ctrl_.peerAddress();
    const bool ok = login(err);
    loggingIn_ = false;
    if (!ok) {
        ctrl_.close();
        state_ = SessionState::Failed;
        return false;
    }
    state_ = SessionState::Connected;

    if (cfg_.remote_root && !changeDirectory(*cfg_.remote_root, err)) {
        disconnect();
        state_ = SessionState::Failed;
        return false;
    }
    return true;
}

void FtpBridge::disconnect() {
    if (ctrl_.isOpen() && state_ == SessionState::Connected && cstate_ == ControlState::Idle) {
        // polite goodbye; the answer does not matter
        const std::string quit = "QUIT\r\n";
        BridgeError ignored;
        if (ctrl_.send(quit.data(), quit.size(), 2000, ignored)) {
            std::string line;
            ctrl_.readLine(line, 2000, ignored);
        }
    }
    ctrl_.close();
    cstate_ = ControlState::Idle;
    cwd_ = "/";
    state_ = SessionState::Disconnected;
}

bool FtpBridge::pwd(std::string& out, BridgeError& err) {
    if (!requireConnected({}, err)) return false;
    out = cwd_;
    return true;
}

bool FtpBridge::changeDirectory(const std::string& path, BridgeError& err) {
    const std::string target = abs(path);
    if (!requireIdle(target, err)) return false;
    if (!expect("CWD " + target, 0, target, err)) return false;
    cwd_ = target;
    return true;
}

bool FtpBridge::openData(const std::string& cmd, const std::string& path, std::unique_ptr<ftp::Channel>& data,
                         BridgeError& err) {
    ftp::Reply reply;
    if (!command("PASV", reply, err)) return false;
    if (reply.code != 227) {
        replyError(reply, path, "PASV", err);
        return false;
    }
    std::string host;
    std::uint16_t port = 0;
    if (!ftp::parsePasv(reply.text, host, port)) {
        teardown();
        err.set(ErrorKind::Protocol, path, "unparseable PASV reply: " + firstLine(reply.text));
        return false;
    }
    host = ftp::choosePassiveHost(host, peer_);

    data = std::make_unique<ftp::Channel>();
    if (!data->connect(host, port, cfg_.connect_timeout_ms, err)) {
        // the control connection is unaffected
        dataError(err, path);
        err.message = "data connection failed: " + err.message;
        return false;
    }

    if (!command(cmd, reply, err)) return false;
    earlyCompletion_.reset();
    if (reply.positive()) {
        // no 1xx: the server answered with the completion reply right away
        earlyCompletion_ = reply;
    } else if (!reply.preliminary()) {
        data->close();
        replyError(reply, path, cmd.substr(0, cmd.find(' ')), err);
        return false;
    }
    cstate_ = ControlState::DataTransferInProgress;

    if (tls_ && !data->startTls(tlsCtx_, cfg_.host, ctrl_.tlsSession(), timeoutMs(), err)) {
        const BridgeError tlsErr = err;
        abortTransfer(*data);
        err = tlsErr;
        dataError(err, path);
        return false;
    }
    return true;
}

bool FtpBridge::finishTransfer(ftp::Channel& data, bool dataComplete, const std::string& path, BridgeError& err) {
    data.close();
    if (cstate_ != ControlState::DataTransferInProgress) {
        err.set(ErrorKind::Protocol, path, "no transfer in progress");
        return false;
    }
    ftp::Reply reply;
    if (earlyCompletion_) {
        reply = *earlyCompletion_;
        earlyCompletion_.reset();
    } else if (!readReply(reply, err)) {
        return false;
    }
    cstate_ = ControlState::Idle;
    if (!reply.positive()) {
        replyError(reply, path, "transfer", err);
        return false;
    }
    if (!dataComplete) {
        err.set(ErrorKind::Protocol, path, "server reported completion but the data connection did not end cleanly");
        return false;
    }
    return true;
}

void FtpBridge::abortTransfer(ftp::Channel& data) {
    data.close();
    if (cstate_ != ControlState::DataTransferInProgress) return;
    if (earlyCompletion_) {
        earlyCompletion_.reset();
        cstate_ = ControlState::Idle;
        return;
    }
    // one completion reply follows: 226 when the server had finished, 426/451 otherwise
    ftp::Reply reply;
    BridgeError ignored;
    if (readReply(reply, ignored)) cstate_ = ControlState::Idle;
}

bool FtpBridge::fetch(const std::string& cmd, const std::string& path, std::string& out, BridgeError& err) {
    std::unique_ptr<ftp::Channel> data;
    if (!openData(cmd, path, data, err)) return false;
    out.clear();
    char buf[16 * 1024];
    bool complete = false;
    BridgeError readErr;
    while (true) {
        std::size_t got = 0;
        if (!data->recv(buf, sizeof(buf), got, timeoutMs(), readErr)) break;
        if (got == 0) {
            complete = true;
            break;
        }
        out.append(buf, got);
    }
    if (!complete && readErr.timed_out) {
        abortTransfer(*data);
        err = readErr;
        err.path = path;
        return false;
    }
    return finishTransfer(*data, complete, path, err);
}

bool FtpBridge::list(const std::string& path, ListResult& out, BridgeError& err) {
    const std::string dir = abs(path);
    if (!requireIdle(dir, err)) return false;
    std::string raw;
    out = ListResult{};

    if (feat_.mlst) {
        if (!fetch("MLSD " + dir, dir, raw, err)) return false;
    } else {
        // LIST of a file prints the file: enter the directory and list it
        if (!expect("CWD " + dir, 0, dir, err)) return false;
        if (!fetch("LIST", dir, raw, err)) return false;
    }

    const std::time_t now = std::time(nullptr);
    std::size_t pos = 0;
    while (pos < raw.size()) {
        auto nl = raw.find('\n', pos);
        if (nl == std::string::npos) nl = raw.size();
        std::string line = raw.substr(pos, nl - pos);
        pos = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        RemoteEntry e;
        if (feat_.mlst) {
            if (!ftp::parseFactLine(line, dir, e)) {
                ++out.skipped_lines;
                continue;
            }
        } else {
            const ls::LineResult r = ls::parseLine(line, dir, now, e);
            if (r == ls::LineResult::Unparsed) ++out.skipped_lines;
            if (r != ls::LineResult::Entry) continue;
        }
        if (e.name == "." || e.name == "..") continue;
        out.entries.push_back(std::move(e));
    }
    sortEntries(out.entries);
    return true;
}

bool FtpBridge::stat(const std::string& path, RemoteEntry& out, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;

    if (feat_.mlst) {
        ftp::Reply reply;
        if (!expect("MLST " + p, 250, p, err, &reply)) return false;
        std::size_t pos = 0;
        while (pos < reply.text.size()) {
            auto nl = reply.text.find('\n', pos);
            if (nl == std::string::npos) nl = reply.text.size();
            const std::string line = reply.text.substr(pos, nl - pos);
            pos = nl + 1;
            RemoteEntry e;
            if (!line.empty() && line.front() == ' ' && ftp::parseFactLine(line, parentPath(p), e)) {
                e.name = p == "/" ? std::string("/") : baseName(p);
                e.path = p;
                out = std::move(e);
                return true;
            }
        }
        teardown();
        err.set(ErrorKind::Protocol, p, "MLST reply without facts");
        return false;
    }

    if (p == "/") {
        out = RemoteEntry{};
        out.name = "/";
        out.path = "/";
        out.is_directory = true;
        return true;
    }
    ListResult siblings;
    if (!list(parentPath(p), siblings, err)) return false;
    const std::string name = baseName(p);
    for (auto& e : siblings.entries) {
        if (e.name == name) {
            out = std::move(e);
            return true;
        }
    }
    err.set(ErrorKind::NotFound, p, "no such file or directory");
    return false;
}

bool FtpBridge::createDirectory(const std::string& path, BridgeError& err, unsigned int) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    if (expect("MKD " + p, 257, p, err)) return true;
    if (err.kind == ErrorKind::NotFound || err.kind == ErrorKind::Io) {
        // most servers answer a plain 550 for an existing directory
        RemoteEntry existing;
        BridgeError statErr;
        if (stat(p, existing, statErr)) err.set(ErrorKind::AlreadyExists, p, "MKD: path exists");
    }
    return false;
}

bool FtpBridge::removeFile(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return expect("DELE " + p, 0, p, err);
}

bool FtpBridge::removeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    return expect("RMD " + p, 0, p, err);
}

bool FtpBridge::rename(const std::string& from, const std::string& to, BridgeError& err) {
    const std::string src = abs(from);
    const std::string dst = abs(to);
    if (!requireIdle(src, err)) return false;
    return expect("RNFR " + src, 350, src, err) && expect("RNTO " + dst, 0, dst, err);
}

std::unique_ptr<ReadStream> FtpBridge::openRead(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return nullptr;
    std::unique_ptr<ftp::Channel> data;
    if (!openData("RETR " + p, p, data, err)) return nullptr;
    return std::make_unique<FtpReadStream>(this, std::move(data), p);
}

std::unique_ptr<WriteStream> FtpBridge::openWrite(const std::string& path, bool append, BridgeError& err,
                                                  std::optional<std::uint64_t>, std::optional<std::int64_t>) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return nullptr;
    std::unique_ptr<ftp::Channel> data;
    if (!openData((append ? "APPE " : "STOR ") + p, p, data, err)) return nullptr;
    return std::make_unique<FtpWriteStream>(this, std::move(data), p);
}

bool FtpBridge::symlinkResolve(const std::string& path, std::string& target, BridgeError& err) {
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    if (!e.is_symlink) {
        target = e.path;
        return true;
    }
    if (!e.symlink_target) {
        err.set(ErrorKind::Protocol, e.path, "server does not report symlink targets");
        return false;
    }
    target = resolvePath(parentPath(e.path), *e.symlink_target);
    return true;
}

bool FtpBridge::setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    char octal[8];
    std::snprintf(octal, sizeof(octal), "%o", static_cast<unsigned>(mode & 07777));
    return expect(std::string("SITE CHMOD ") + octal + " " + p, 0, p, err);
}

bool FtpBridge::setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireIdle(p, err)) return false;
    if (!feat_.mfmt) {
        err.set(ErrorKind::Protocol, p, "server does not support MFMT");
        return false;
    }
    return expect("MFMT " + ftp::formatFactTime(mtime) + " " + p, 213, p, err);
}

} // namespace tscp
