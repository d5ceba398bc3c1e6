// One FTP connection (control or data): a TCP socket that can be upgraded to
// TLS in place for FTPS.
#pragma once
#include "HostTypes.hpp"
#include <string>

// OpenSSL forward declarations
struct ssl_ctx_st;
struct ssl_st;
struct ssl_session_st;

namespace tscp {
namespace ftp {

// Client TLS settings shared by the control and data connections of one session.
class TlsContext {
public:
    TlsContext() = default;
    ~TlsContext();
    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    bool init(const HostConfig& cfg, BridgeError& err);
    ssl_ctx_st* raw() const { return ctx_; }
    bool verifyPeer() const { return verify_; }

private:
    ssl_ctx_st* ctx_ = nullptr;
    bool verify_ = true;
};

class Channel {
public:
    Channel() = default;
    ~Channel();
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool connect(const std::string& host, std::uint16_t port, int timeout_ms, BridgeError& err);
    // TLS client handshake on the connected socket. "reuse" resumes the
    // control connection's session on data connections.
    bool startTls(const TlsContext& ctx, const std::string& host, ssl_session_st* reuse, int timeout_ms,
                  BridgeError& err);
    bool isOpen() const { return fd_ >= 0; }
    bool isTls() const { return ssl_ != nullptr; }
    // Session of the established TLS connection (owned by the channel).
    ssl_session_st* tlsSession() const;

    // got == 0 at EOF; waits at most timeout_ms for data.
    bool recv(char* buf, std::size_t cap, std::size_t& got, int timeout_ms, BridgeError& err);
    bool send(const char* data, std::size_t len, int timeout_ms, BridgeError& err);

    // Reads one line (CRLF or LF terminated, terminator removed).
    bool readLine(std::string& line, int timeout_ms, BridgeError& err);

    std::string peerAddress() const;
    // Sends the TLS close_notify when applicable and closes the socket.
    void close();

private:
    int fd_ = -1;
    ssl_st* ssl_ = nullptr;
    std::string where_;
    std::string pending_;  // bytes read past the last line

    bool recvRaw(char* buf, std::size_t cap, std::size_t& got, int timeout_ms, BridgeError& err);
};

} // namespace ftp
} // namespace tscp
