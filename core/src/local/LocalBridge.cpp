#include "tscp/LocalBridge.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace tscp {

ErrorKind errnoKind(int e) {
    switch (e) {
    case ENOENT:
    case ENOTDIR:
    case ENAMETOOLONG:
        return ErrorKind::NotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return ErrorKind::Permission;
    case EEXIST:
        return ErrorKind::AlreadyExists;
    default:
        return ErrorKind::Io;
    }
}

static void setErrno(BridgeError& err, const std::string& path, const char* op) {
    const int e = errno;
    err.set(errnoKind(e), path, std::string(op) + ": " + std::strerror(e));
}

namespace {

class LocalReadStream : public ReadStream {
public:
    LocalReadStream(std::FILE* f, std::string path) : f_(f), path_(std::move(path)) {}
    ~LocalReadStream() override {
        if (f_) std::fclose(f_);
    }

    bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) override {
        got = std::fread(buf, 1, cap, f_);
        if (got == 0 && std::ferror(f_)) {
            setErrno(err, path_, "read");
            err.kind = ErrorKind::Io;
            return false;
        }
        return true;
    }

    bool finish(BridgeError&) override {
        std::fclose(f_);
        f_ = nullptr;
        return true;
    }

private:
    std::FILE* f_;
    std::string path_;
};

class LocalWriteStream : public WriteStream {
public:
    LocalWriteStream(std::FILE* f, std::string path) : f_(f), path_(std::move(path)) {}
    ~LocalWriteStream() override { abort(); }

    bool write(const char* buf, std::size_t len, BridgeError& err) override {
        if (std::fwrite(buf, 1, len, f_) != len) {
            setErrno(err, path_, "write");
            if (err.kind != ErrorKind::Permission) err.kind = ErrorKind::Io;
            return false;
        }
        return true;
    }

    // Buffered data reaches the file (and its errors surface) on close.
    bool finish(BridgeError& err) override {
        std::FILE* f = f_;
        f_ = nullptr;
        if (std::fflush(f) != 0) {
            setErrno(err, path_, "flush");
            err.kind = ErrorKind::Io;
            std::fclose(f);
            return false;
        }
        if (std::fclose(f) != 0) {
            setErrno(err, path_, "close");
            err.kind = ErrorKind::Io;
            return false;
        }
        return true;
    }

    void abort() override {
        if (f_) {
            std::fclose(f_);
            f_ = nullptr;
        }
    }

private:
    std::FILE* f_;
    std::string path_;
};

} // namespace

bool LocalBridge::connect(const HostConfig& cfg, BridgeError& err) {
    char buf[4096];
    cwd_ = ::getcwd(buf, sizeof(buf)) ? std::string(buf) : std::string("/");
    state_ = SessionState::Connected;
    if (cfg.remote_root && !changeDirectory(*cfg.remote_root, err)) {
        state_ = SessionState::Failed;
        return false;
    }
    return true;
}

void LocalBridge::disconnect() {
    state_ = SessionState::Disconnected;
}

bool LocalBridge::pwd(std::string& out, BridgeError& err) {
    if (!requireConnected({}, err)) return false;
    out = cwd_;
    return true;
}

bool LocalBridge::changeDirectory(const std::string& path, BridgeError& err) {
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

bool LocalBridge::describe(const std::string& path, RemoteEntry& out, BridgeError& err) const {
    struct stat lst;
    if (::lstat(path.c_str(), &lst) != 0) {
        setErrno(err, path, "lstat");
        return false;
    }
    out = RemoteEntry{};
    out.name = path == "/" ? std::string("/") : baseName(path);
    out.path = path;
    struct stat st = lst;
    if (S_ISLNK(lst.st_mode)) {
        out.is_symlink = true;
        std::vector<char> target(4096);
        const ssize_t n = ::readlink(path.c_str(), target.data(), target.size());
        if (n > 0) out.symlink_target = std::string(target.data(), static_cast<std::size_t>(n));
        // dangling links keep their own metadata
        struct stat followed;
        if (::stat(path.c_str(), &followed) == 0)
            st = followed;
        else
            out.symlink_dangling = true;
    }
    out.is_directory = S_ISDIR(st.st_mode);
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.permissions = static_cast<std::uint32_t>(st.st_mode & 07777);
    out.mtime = static_cast<std::int64_t>(st.st_mtime);
    out.uid = static_cast<std::uint32_t>(st.st_uid);
    out.gid = static_cast<std::uint32_t>(st.st_gid);
    return true;
}

bool LocalBridge::list(const std::string& path, ListResult& out, BridgeError& err) {
    const std::string dir = abs(path);
    if (!requireConnected(dir, err)) return false;
    DIR* d = ::opendir(dir.c_str());
    if (!d) {
        setErrno(err, dir, "opendir");
        return false;
    }
    out = ListResult{};
    errno = 0;
    while (struct dirent* ent = ::readdir(d)) {
        const std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        RemoteEntry e;
        BridgeError entryErr;
        // entries removed while listing are not part of the snapshot
        if (describe(joinPath(dir, name), e, entryErr)) out.entries.push_back(std::move(e));
        errno = 0;
    }
    const int readErr = errno;
    ::closedir(d);
    if (readErr != 0) {
        errno = readErr;
        setErrno(err, dir, "readdir");
        return false;
    }
    sortEntries(out.entries);
    return true;
}

bool LocalBridge::stat(const std::string& path, RemoteEntry& out, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    return describe(p, out, err);
}

bool LocalBridge::createDirectory(const std::string& path, BridgeError& err, unsigned int mode) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (::mkdir(p.c_str(), static_cast<mode_t>(mode)) != 0) {
        setErrno(err, p, "mkdir");
        return false;
    }
    return true;
}

bool LocalBridge::removeFile(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (::unlink(p.c_str()) != 0) {
        setErrno(err, p, "unlink");
        return false;
    }
    return true;
}

bool LocalBridge::removeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (::rmdir(p.c_str()) != 0) {
        setErrno(err, p, "rmdir");
        return false;
    }
    return true;
}

bool LocalBridge::rename(const std::string& from, const std::string& to, BridgeError& err) {
    const std::string src = abs(from);
    const std::string dst = abs(to);
    if (!requireConnected(src, err)) return false;
    if (::rename(src.c_str(), dst.c_str()) != 0) {
        setErrno(err, src, "rename");
        return false;
    }
    return true;
}

std::unique_ptr<ReadStream> LocalBridge::openRead(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return nullptr;
    struct stat st;
    if (::stat(p.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        err.set(ErrorKind::Io, p, "is a directory");
        return nullptr;
    }
    std::FILE* f = std::fopen(p.c_str(), "rb");
    if (!f) {
        setErrno(err, p, "open");
        return nullptr;
    }
    return std::make_unique<LocalReadStream>(f, p);
}

std::unique_ptr<WriteStream> LocalBridge::openWrite(const std::string& path, bool append, BridgeError& err,
                                                    std::optional<std::uint64_t>, std::optional<std::int64_t>) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return nullptr;
    std::FILE* f = std::fopen(p.c_str(), append ? "ab" : "wb");
    if (!f) {
        setErrno(err, p, "open");
        return nullptr;
    }
    return std::make_unique<LocalWriteStream>(f, p);
}

bool LocalBridge::symlinkResolve(const std::string& path, std::string& target, BridgeError& err) {
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    if (!e.is_symlink) {
        target = e.path;
        return true;
    }
    if (!e.symlink_target) {
        err.set(ErrorKind::Io, e.path, "readlink failed");
        return false;
    }
    target = resolvePath(parentPath(e.path), *e.symlink_target);
    return true;
}

bool LocalBridge::setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    if (::chmod(p.c_str(), static_cast<mode_t>(mode & 07777)) != 0) {
        setErrno(err, p, "chmod");
        return false;
    }
    return true;
}

bool LocalBridge::setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(mtime);
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, p.c_str(), times, 0) != 0) {
        setErrno(err, p, "utimensat");
        return false;
    }
    return true;
}

} // namespace tscp
