// FTP and explicit FTPS backend: one control connection driven as a
// command/response state machine, one passive data connection per transfer.
#pragma once
#include "FtpChannel.hpp"
#include "FtpReply.hpp"
#include "HostBridge.hpp"
#include <memory>
#include <optional>
#include <string>

namespace tscp {

class FtpBridge : public HostBridge {
public:
    enum class ControlState { Idle, AwaitingResponse, DataTransferInProgress };

    // tls: explicit FTPS (AUTH TLS before login, protected data connections).
    explicit FtpBridge(bool tls);
    ~FtpBridge() override;

    Protocol protocol() const override { return tls_ ? Protocol::Ftps : Protocol::Ftp; }

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
    // SITE CHMOD; servers without it answer Protocol.
    bool setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) override;
    // MFMT; Protocol when the server did not announce it.
    bool setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) override;

    ControlState controlState() const { return cstate_; }
    const ftp::Features& features() const { return feat_; }

    // Closes the data connection and reads the completion reply. Succeeds
    // only when the reply is positive and the data ended cleanly.
    bool finishTransfer(ftp::Channel& data, bool dataComplete, const std::string& path, BridgeError& err);
    // Closes the data connection early and consumes the completion reply so
    // the control connection is back to Idle.
    void abortTransfer(ftp::Channel& data);
    int timeoutMs() const { return loggingIn_ ? cfg_.connect_timeout_ms : cfg_.io_timeout_ms; }

private:
    bool tls_;
    SessionState state_ = SessionState::Disconnected;
    ControlState cstate_ = ControlState::Idle;
    bool loggingIn_ = false;
    HostConfig cfg_;
    ftp::Channel ctrl_;
    ftp::TlsContext tlsCtx_;
    ftp::Features feat_;
    std::string peer_;
    std::string cwd_ = "/";
    // completion reply that arrived in place of the preliminary one
    std::optional<ftp::Reply> earlyCompletion_;

    std::string abs(const std::string& path) const { return resolvePath(cwd_, path); }
    bool requireIdle(const std::string& path, BridgeError& err) const;
    bool login(BridgeError& err);

    bool readReply(ftp::Reply& reply, BridgeError& err);
    // Idle -> AwaitingResponse -> Idle
    bool command(const std::string& cmd, ftp::Reply& reply, BridgeError& err);
    // command() that must answer with "code" (or any positive reply when 0).
    bool expect(const std::string& cmd, int code, const std::string& path, BridgeError& err,
                ftp::Reply* out = nullptr);
    void replyError(const ftp::Reply& reply, const std::string& path, const std::string& what, BridgeError& err);
    // Drops the control connection; the session is unusable afterwards.
    void teardown();

    // PASV, data connect, command, preliminary reply (and TLS on the data
    // connection). On success the control state is DataTransferInProgress.
    bool openData(const std::string& cmd, const std::string& path, std::unique_ptr<ftp::Channel>& data,
                  BridgeError& err);
    bool fetch(const std::string& cmd, const std::string& path, std::string& out, BridgeError& err);
};

} // namespace tscp
