// SFTP backend: typed requests over the SSH subsystem. Every failing request
// is translated from its SSH_FX_* status into the bridge error taxonomy.
#include "tscp/Libssh2SftpBridge.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>

namespace tscp {

ErrorKind sftpStatusKind(unsigned long status) {
    switch (status) {
    case LIBSSH2_FX_OK:
        return ErrorKind::None;
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
    case LIBSSH2_FX_NOT_A_DIRECTORY:
    case LIBSSH2_FX_INVALID_FILENAME:
        return ErrorKind::NotFound;
    case LIBSSH2_FX_PERMISSION_DENIED:
    case LIBSSH2_FX_WRITE_PROTECT:
        return ErrorKind::Permission;
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return ErrorKind::AlreadyExists;
    case LIBSSH2_FX_NO_CONNECTION:
    case LIBSSH2_FX_CONNECTION_LOST:
        return ErrorKind::Connection;
    case LIBSSH2_FX_BAD_MESSAGE:
    case LIBSSH2_FX_OP_UNSUPPORTED:
    case LIBSSH2_FX_INVALID_HANDLE:
        return ErrorKind::Protocol;
    case LIBSSH2_FX_EOF:
    case LIBSSH2_FX_FAILURE:
    case LIBSSH2_FX_NO_MEDIA:
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
    case LIBSSH2_FX_DIR_NOT_EMPTY:
    default:
        return ErrorKind::Io;
    }
}

static const char* sftpStatusText(unsigned long status) {
    switch (status) {
    case LIBSSH2_FX_NO_SUCH_FILE:
        return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FAILURE:
        return "failure";
    case LIBSSH2_FX_BAD_MESSAGE:
        return "bad message";
    case LIBSSH2_FX_OP_UNSUPPORTED:
        return "operation unsupported";
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such path";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        return "no space left";
    default:
        return "status";
    }
}

namespace {

class SftpReadStream : public ReadStream {
public:
    SftpReadStream(Libssh2SftpBridge* owner, LIBSSH2_SFTP_HANDLE* h, std::string path)
        : owner_(owner), h_(h), path_(std::move(path)) {}
    ~SftpReadStream() override {
        if (h_) libssh2_sftp_close(h_);
    }

    bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) override {
        got = 0;
        ssize_t n = libssh2_sftp_read(h_, buf, cap);
        if (n < 0) {
            owner_->fail(path_, "read", err);
            if (err.kind != ErrorKind::Connection) err.kind = ErrorKind::Io;
            return false;
        }
        got = static_cast<std::size_t>(n);
        return true;
    }

    bool finish(BridgeError& err) override {
        LIBSSH2_SFTP_HANDLE* h = h_;
        h_ = nullptr;
        if (h && libssh2_sftp_close(h) != 0) {
            owner_->fail(path_, "close", err);
            return false;
        }
        return true;
    }

private:
    Libssh2SftpBridge* owner_;
    LIBSSH2_SFTP_HANDLE* h_;
    std::string path_;
};

class SftpWriteStream : public WriteStream {
public:
    SftpWriteStream(Libssh2SftpBridge* owner, LIBSSH2_SFTP_HANDLE* h, std::string path)
        : owner_(owner), h_(h), path_(std::move(path)) {}
    ~SftpWriteStream() override { abort(); }

    bool write(const char* buf, std::size_t len, BridgeError& err) override {
        while (len > 0) {
            ssize_t w = libssh2_sftp_write(h_, buf, len);
            if (w < 0) {
                owner_->fail(path_, "write", err);
                if (err.kind != ErrorKind::Connection && err.kind != ErrorKind::Permission)
                    err.kind = ErrorKind::Io;
                return false;
            }
            buf += w;
            len -= static_cast<std::size_t>(w);
        }
        return true;
    }

    // The server reports deferred write errors on close.
    bool finish(BridgeError& err) override {
        LIBSSH2_SFTP_HANDLE* h = h_;
        h_ = nullptr;
        if (h && libssh2_sftp_close(h) != 0) {
            owner_->fail(path_, "close", err);
            if (err.kind != ErrorKind::Connection) err.kind = ErrorKind::Io;
            return false;
        }
        return true;
    }

    void abort() override {
        if (h_) {
            libssh2_sftp_close(h_);
            h_ = nullptr;
        }
    }

private:
    Libssh2SftpBridge* owner_;
    LIBSSH2_SFTP_HANDLE* h_;
    std::string path_;
};

} // namespace

Libssh2SftpBridge::Libssh2SftpBridge() = default;

Libssh2SftpBridge::~Libssh2SftpBridge() {
    disconnect();
}

void Libssh2SftpBridge::fail(const std::string& path, const char* op, BridgeError& err) {
    if (ssh_.transportBroken()) {
        ssh_.lastError(ErrorKind::Connection, path, err);
        state_ = SessionState::Failed;
        return;
    }
    if (sftp_ && libssh2_session_last_errno(ssh_.raw()) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        const unsigned long status = libssh2_sftp_last_error(sftp_);
        err.set(sftpStatusKind(status), path,
                std::string(op) + ": " + sftpStatusText(status) + " (" + std::to_string(status) + ")");
        if (err.kind == ErrorKind::Connection) state_ = SessionState::Failed;
        return;
    }
    ssh_.lastError(ErrorKind::Protocol, path, err);
    err.message = std::string(op) + ": " + err.message;
}

bool Libssh2SftpBridge::connect(const HostConfig& cfg, BridgeError& err) {
    if (state_ == SessionState::Connected) {
        err.set(ErrorKind::Protocol, cfg.host, "already connected");
        return false;
    }
    state_ = SessionState::Connecting;
    if (!ssh_.open(cfg, err)) {
        state_ = SessionState::Failed;
        return false;
    }
    sftp_ = libssh2_sftp_init(ssh_.raw());
    if (!sftp_) {
        ssh_.lastError(ErrorKind::Protocol, cfg.host, err);
        err.message = "could not start the SFTP subsystem: " + err.message;
        ssh_.close();
        state_ = SessionState::Failed;
        return false;
    }
    state_ = SessionState::Connected;

    char buf[4096];
    int n = libssh2_sftp_realpath(sftp_, ".", buf, sizeof(buf));
    cwd_ = (n > 0) ? std::string(buf, static_cast<std::size_t>(n)) : std::string("/");

    if (cfg.remote_root && !changeDirectory(*cfg.remote_root, err)) {
        disconnect();
        state_ = SessionState::Failed;
        return false;
    }
    return true;
}

void Libssh2SftpBridge::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    ssh_.close();
    cwd_ = "/";
    state_ = SessionState::Disconnected;
}

bool Libssh2SftpBridge::pwd(std::string& out, BridgeError& err) {
    if (!requireConnected({}, err)) return false;
    out = cwd_;
    return true;
}

bool Libssh2SftpBridge::changeDirectory(const std::string& path, BridgeError& err) {
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

bool Libssh2SftpBridge::describe(const std::string& path, const std::string& name,
                                 const LIBSSH2_SFTP_ATTRIBUTES& lattrs, RemoteEntry& out) {
    out = RemoteEntry{};
    out.name = name;
    out.path = path;

    LIBSSH2_SFTP_ATTRIBUTES attrs = lattrs;
    if ((lattrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISLNK(lattrs.permissions)) {
        out.is_symlink = true;
        char target[4096];
        int n = libssh2_sftp_readlink(sftp_, path.c_str(), target, sizeof(target));
        if (n > 0) out.symlink_target = std::string(target, static_cast<std::size_t>(n));
        LIBSSH2_SFTP_ATTRIBUTES followed{};
        if (libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                 LIBSSH2_SFTP_STAT, &followed) == 0) {
            attrs = followed;
        } else {
            out.symlink_dangling = true;
        }
    }

    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
        out.permissions = static_cast<std::uint32_t>(attrs.permissions & 07777);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) out.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) out.mtime = static_cast<std::int64_t>(attrs.mtime);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        out.uid = static_cast<std::uint32_t>(attrs.uid);
        out.gid = static_cast<std::uint32_t>(attrs.gid);
    }
    return true;
}

// libssh2 requests further READDIR pages until the server answers with an
// SSH_FX_EOF status, which readdir reports as 0.
bool Libssh2SftpBridge::list(const std::string& path, ListResult& out, BridgeError& err) {
    const std::string dirPath = abs(path);
    if (!requireConnected(dirPath, err)) return false;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, dirPath.c_str());
    if (!dir) {
        fail(dirPath, "opendir", err);
        return false;
    }

    out.entries.clear();
    out.skipped_lines = 0;
    std::vector<char> filename(4096);
    std::vector<char> longentry(4096);
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename.data(), filename.size(),
                                         longentry.data(), longentry.size(), &attrs);
        if (rc > 0) {
            const std::string name(filename.data(), static_cast<std::size_t>(rc));
            if (name == "." || name == "..") continue;
            RemoteEntry e;
            describe(joinPath(dirPath, name), name, attrs, e);
            out.entries.push_back(std::move(e));
        } else if (rc == 0) {
            break;
        } else if (rc == LIBSSH2_ERROR_BUFFER_TOO_SMALL) {
            // name longer than the buffer: counted, not silently dropped
            ++out.skipped_lines;
            filename.resize(filename.size() * 2);
            longentry.resize(longentry.size() * 2);
        } else {
            fail(dirPath, "readdir", err);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    sortEntries(out.entries);
    return true;
}

bool Libssh2SftpBridge::stat(const std::string& path, RemoteEntry& out, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()), LIBSSH2_SFTP_LSTAT, &st) != 0) {
        fail(p, "stat", err);
        return false;
    }
    return describe(p, baseName(p), st, out);
}

bool Libssh2SftpBridge::createDirectory(const std::string& path, BridgeError& err, unsigned int mode) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (libssh2_sftp_mkdir(sftp_, p.c_str(), static_cast<long>(mode)) == 0) return true;
    fail(p, "mkdir", err);
    if (err.kind == ErrorKind::Io) {
        // SFTPv3 servers answer a plain FAILURE for an existing directory
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()), LIBSSH2_SFTP_STAT, &st) == 0)
            err.set(ErrorKind::AlreadyExists, p, "mkdir: path exists");
    }
    return false;
}

bool Libssh2SftpBridge::removeFile(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (libssh2_sftp_unlink(sftp_, p.c_str()) != 0) {
        fail(p, "unlink", err);
        return false;
    }
    return true;
}

bool Libssh2SftpBridge::removeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (libssh2_sftp_rmdir(sftp_, p.c_str()) != 0) {
        fail(p, "rmdir", err);
        return false;
    }
    return true;
}

bool Libssh2SftpBridge::rename(const std::string& from, const std::string& to, BridgeError& err) {
    const std::string src = abs(from);
    const std::string dst = abs(to);
    if (!requireConnected(src, err)) return false;
    const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (libssh2_sftp_rename_ex(sftp_, src.c_str(), static_cast<unsigned>(src.size()),
                               dst.c_str(), static_cast<unsigned>(dst.size()), flags) != 0) {
        fail(src, "rename", err);
        return false;
    }
    return true;
}

std::unique_ptr<ReadStream> Libssh2SftpBridge::openRead(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return nullptr;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()),
                                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(p, "open", err);
        return nullptr;
    }
    return std::make_unique<SftpReadStream>(this, h, p);
}

std::unique_ptr<WriteStream> Libssh2SftpBridge::openWrite(const std::string& path, bool append, BridgeError& err,
                                                          std::optional<std::uint64_t>,
                                                          std::optional<std::int64_t>) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return nullptr;

    // Servers differ on FXF_APPEND; seek to the current size as well.
    std::uint64_t startOffset = 0;
    if (append) {
        LIBSSH2_SFTP_ATTRIBUTES st{};
        if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()), LIBSSH2_SFTP_STAT, &st) == 0 &&
            (st.flags & LIBSSH2_SFTP_ATTR_SIZE))
            startOffset = st.filesize;
    }
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                                (append ? LIBSSH2_FXF_APPEND : LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()),
                                                  flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        fail(p, "open", err);
        return nullptr;
    }
    if (startOffset > 0) libssh2_sftp_seek64(h, startOffset);
    return std::make_unique<SftpWriteStream>(this, h, p);
}

bool Libssh2SftpBridge::symlinkResolve(const std::string& path, std::string& target, BridgeError& err) {
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    if (!e.is_symlink) {
        target = e.path;
        return true;
    }
    if (!e.symlink_target) {
        err.set(ErrorKind::Protocol, e.path, "readlink returned no target");
        return false;
    }
    target = resolvePath(parentPath(e.path), *e.symlink_target);
    return true;
}

bool Libssh2SftpBridge::setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    a.permissions = mode & 07777;
    if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()), LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        fail(p, "chmod", err);
        return false;
    }
    return true;
}

bool Libssh2SftpBridge::setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    LIBSSH2_SFTP_ATTRIBUTES a{};
    a.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    a.atime = static_cast<unsigned long>(mtime);
    a.mtime = static_cast<unsigned long>(mtime);
    if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()), LIBSSH2_SFTP_SETSTAT, &a) != 0) {
        fail(p, "setstat", err);
        return false;
    }
    return true;
}

} // namespace tscp
