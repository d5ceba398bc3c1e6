// SCP backend: file data over the legacy "scp -f/-t" exchange, everything
// else (listing, mkdir, rm, mv, chmod) synthesized from shell commands run on
// SSH exec channels.
#pragma once
#include "HostBridge.hpp"
#include "SshSession.hpp"
#include <string>

// Forward declarations of libssh2's internal types (with underscore)
struct _LIBSSH2_CHANNEL;

namespace tscp {

class Libssh2ScpBridge : public HostBridge {
public:
    Libssh2ScpBridge();
    ~Libssh2ScpBridge() override;

    Protocol protocol() const override { return Protocol::Scp; }

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
    // No directory data: reading a directory is NotFound-like ("not a regular file").
    std::unique_ptr<ReadStream> openRead(const std::string& path, BridgeError& err) override;
    // expected_size is mandatory (the C record announces it); append is not
    // supported by the protocol.
    std::unique_ptr<WriteStream> openWrite(const std::string& path, bool append, BridgeError& err,
                                           std::optional<std::uint64_t> expected_size = std::nullopt,
                                           std::optional<std::int64_t> mtime = std::nullopt) override;
    bool symlinkResolve(const std::string& path, std::string& target, BridgeError& err) override;
    bool setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) override;
    bool setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) override;

    // Output of one remote command.
    struct CommandResult {
        int exit_status = -1;
        std::string out;
        std::string err;
    };

    // Runs "command" on a fresh exec channel and collects stdout, stderr and
    // the exit status. false only when the channel itself failed.
    bool exec(const std::string& command, const std::string& path, CommandResult& res, BridgeError& err);

    // Fills err from the session's last error; Connection errors move the
    // session to Failed.
    void fail(const std::string& path, const char* op, BridgeError& err);

    void streamClosed() { streaming_ = false; }
    SshSession& session() { return ssh_; }
    int ioTimeoutMs() const { return ioTimeoutMs_; }

private:
    SessionState state_ = SessionState::Disconnected;
    SshSession ssh_;
    std::string cwd_ = "/";
    bool streaming_ = false;  // an scp exchange owns the session
    bool lsPlain_ = false;    // remote ls lacks --time-style
    int ioTimeoutMs_ = 30000;

    std::string abs(const std::string& path) const { return resolvePath(cwd_, path); }
    _LIBSSH2_CHANNEL* openChannel(const std::string& command, const std::string& path, BridgeError& err);
    bool requireIdle(const std::string& path, BridgeError& err) const;
    std::string lsCommand(const char* flags, const std::string& path) const;
    // Runs ls, retrying once without --time-style on ls implementations that
    // reject it.
    bool runLs(const char* flags, const std::string& path, CommandResult& res, BridgeError& err);
    // Runs a command that prints nothing on success; a non-zero exit becomes
    // an error classified from stderr.
    bool runSimple(const std::string& command, const std::string& path, BridgeError& err);
};

} // namespace tscp
