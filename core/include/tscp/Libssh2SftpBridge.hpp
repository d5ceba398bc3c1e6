#pragma once
#include "HostBridge.hpp"
#include "SshSession.hpp"
#include <string>

// Forward declarations of libssh2's internal types (with underscore)
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_ATTRIBUTES;

namespace tscp {

// Maps an SFTP status code (SSH_FX_*) to the error taxonomy.
ErrorKind sftpStatusKind(unsigned long status);

class Libssh2SftpBridge : public HostBridge {
public:
    Libssh2SftpBridge();
    ~Libssh2SftpBridge() override;

    Protocol protocol() const override { return Protocol::Sftp; }

    bool connect(const HostConfig& cfg, BridgeError& err) override;
    void disconnect() override;
    SessionState state() const override { return state_; }

    bool pwd(std::string& out, BridgeError& err) override;
    bool changeDirectory(const std::string& path, BridgeError& err) override;
    bool list(const std::string& path, ListResult& out, BridgeError& err) override;
    bool stat(const std::string& path, RemoteEntry& out, BridgeError& err) override;
    bool createDirectory(const std::string& path, BridgeError& err, unsigned int mode = 0755) override;
    bool removeFile(const std::string& path, BridgeError& err) override;
    bool removeDirectory(const std::string& path, BridgeError& err) override;
    bool rename(const std::string& from, const std::string& to, BridgeError& err) override;
    std::unique_ptr<ReadStream> openRead(const std::string& path, BridgeError& err) override;
    std::unique_ptr<WriteStream> openWrite(const std::string& path, bool append, BridgeError& err,
                                           std::optional<std::uint64_t> expected_size = std::nullopt,
                                           std::optional<std::int64_t> mtime = std::nullopt) override;
    bool symlinkResolve(const std::string& path, std::string& target, BridgeError& err) override;
    bool setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) override;
    bool setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) override;

    // Fills err from the last SFTP status (or transport error); moves the
    // session to Failed on Connection errors.
    void fail(const std::string& path, const char* op, BridgeError& err);

private:
    SessionState state_ = SessionState::Disconnected;
    SshSession ssh_;
    _LIBSSH2_SFTP* sftp_ = nullptr;
    std::string cwd_ = "/";

    std::string abs(const std::string& path) const { return resolvePath(cwd_, path); }
    // lstat, then follow symlinks for type/size so list() and stat() agree
    bool describe(const std::string& path, const std::string& name,
                  const _LIBSSH2_SFTP_ATTRIBUTES& lattrs, RemoteEntry& out);
};

} // namespace tscp
