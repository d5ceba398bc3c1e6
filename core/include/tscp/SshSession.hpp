// SSH transport shared by the SCP and SFTP backends: TCP socket, libssh2
// session, host key verification and user authentication.
#pragma once
#include "HostTypes.hpp"
#include <string>

// Forward declarations of libssh2's internal types (with underscore)
struct _LIBSSH2_SESSION;

namespace tscp {

class SshSession {
public:
    SshSession();
    ~SshSession();
    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // TCP connect -> key exchange -> host key check -> authentication.
    // Credential rejection is Auth, unreachable/timeouts are Connection.
    bool open(const HostConfig& opt, BridgeError& err);
    void close();
    bool isOpen() const { return session_ != nullptr; }

    _LIBSSH2_SESSION* raw() const { return session_; }
    int socket() const { return sock_; }

    // Blocking call timeout in milliseconds (0 disables).
    void setTimeout(int ms);
    void setBlocking(bool on);
    // After LIBSSH2_ERROR_EAGAIN: waits until the socket is ready in the
    // direction libssh2 is blocked on.
    bool waitSocket(int timeout_ms, BridgeError& err) const;

    // Converts the session's last libssh2 error into the taxonomy. Transport
    // failures become Connection; everything else uses "fallback".
    void lastError(ErrorKind fallback, const std::string& path, BridgeError& err) const;
    // True when the last libssh2 error means the transport is gone.
    bool transportBroken() const;

private:
    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;

    bool verifyHostKey(const HostConfig& opt, BridgeError& err);
    bool authenticate(const HostConfig& opt, BridgeError& err);
    bool authWithAgent(const std::string& user);
    std::string authMethods(const std::string& user);
};

} // namespace tscp
