#include "tscp/FtpChannel.hpp"
#include "tscp/TcpSocket.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>

namespace tscp {
namespace ftp {

static std::string opensslError() {
    const unsigned long e = ERR_get_error();
    if (e == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(e, buf, sizeof(buf));
    return buf;
}

// Bounds blocking OpenSSL calls, which cannot be driven by poll alone.
static void setSocketTimeouts(int fd, int timeout_ms) {
    struct timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

TlsContext::~TlsContext() {
    if (ctx_) SSL_CTX_free(ctx_);
}

bool TlsContext::init(const HostConfig& cfg, BridgeError& err) {
    if (ctx_) return true;
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
        err.set(ErrorKind::Protocol, cfg.host, "SSL_CTX_new: " + opensslError());
        return false;
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // many servers close data connections without close_notify
    SSL_CTX_set_options(ctx_, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    // data connections resume the control session
    SSL_CTX_set_session_cache_mode(ctx_, SSL_SESS_CACHE_CLIENT);
    verify_ = cfg.tls_verify_peer;
    if (verify_) {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        const bool loaded = cfg.tls_ca_file ? SSL_CTX_load_verify_locations(ctx_, cfg.tls_ca_file->c_str(), nullptr) == 1
                                            : SSL_CTX_set_default_verify_paths(ctx_) == 1;
        if (!loaded) {
            err.set(ErrorKind::Auth, cfg.tls_ca_file.value_or(std::string()),
                    "could not load trusted certificates: " + opensslError());
            return false;
        }
    } else {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    }
    return true;
}

Channel::~Channel() {
    close();
}

bool Channel::connect(const std::string& host, std::uint16_t port, int timeout_ms, BridgeError& err) {
    close();
    where_ = host + ":" + std::to_string(port);
    fd_ = net::tcpConnect(host, port, timeout_ms, err);
    return fd_ >= 0;
}

bool Channel::startTls(const TlsContext& ctx, const std::string& host, ssl_session_st* reuse, int timeout_ms,
                       BridgeError& err) {
    ssl_ = SSL_new(ctx.raw());
    if (!ssl_) {
        err.set(ErrorKind::Protocol, where_, "SSL_new: " + opensslError());
        return false;
    }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, host.c_str());
    if (ctx.verifyPeer()) SSL_set1_host(ssl_, host.c_str());
    if (reuse) SSL_set_session(ssl_, reuse);

    setSocketTimeouts(fd_, timeout_ms);
    ERR_clear_error();
    errno = 0;
    const int rc = SSL_connect(ssl_);
    if (rc != 1) {
        const long verify = SSL_get_verify_result(ssl_);
        if (ctx.verifyPeer() && verify != X509_V_OK) {
            err.set(ErrorKind::Auth, where_,
                    std::string("server certificate rejected: ") + X509_verify_cert_error_string(verify));
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            err.set(ErrorKind::Connection, where_, "TLS handshake timed out");
            err.timed_out = true;
        } else {
            err.set(ErrorKind::Connection, where_, "TLS handshake failed: " + opensslError());
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
        return false;
    }
    return true;
}

ssl_session_st* Channel::tlsSession() const {
    return ssl_ ? SSL_get_session(ssl_) : nullptr;
}

bool Channel::recv(char* buf, std::size_t cap, std::size_t& got, int timeout_ms, BridgeError& err) {
    got = 0;
    if (fd_ < 0) {
        err.set(ErrorKind::Connection, where_, "connection closed");
        return false;
    }
    if (!pending_.empty()) {
        got = pending_.size() < cap ? pending_.size() : cap;
        std::memcpy(buf, pending_.data(), got);
        pending_.erase(0, got);
        return true;
    }
    return recvRaw(buf, cap, got, timeout_ms, err);
}

bool Channel::recvRaw(char* buf, std::size_t cap, std::size_t& got, int timeout_ms, BridgeError& err) {
    got = 0;
    while (true) {
        if (!(ssl_ && SSL_pending(ssl_) > 0) && !net::waitReadable(fd_, timeout_ms, err)) {
            err.path = where_;
            return false;
        }
        if (!ssl_) {
            const ssize_t n = ::recv(fd_, buf, cap, 0);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                err.set(ErrorKind::Connection, where_, std::string("recv: ") + std::strerror(errno));
                return false;
            }
            got = static_cast<std::size_t>(n);
            return true;
        }
        ERR_clear_error();
        const int n = SSL_read(ssl_, buf, static_cast<int>(cap));
        if (n > 0) {
            got = static_cast<std::size_t>(n);
            return true;
        }
        switch (SSL_get_error(ssl_, n)) {
        case SSL_ERROR_ZERO_RETURN:
            return true;
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            continue;
        case SSL_ERROR_SYSCALL:
            if (n == 0) return true;  // EOF without close_notify
            err.set(ErrorKind::Connection, where_, std::string("TLS read: ") + std::strerror(errno));
            return false;
        default:
            err.set(ErrorKind::Connection, where_, "TLS read: " + opensslError());
            return false;
        }
    }
}

bool Channel::send(const char* data, std::size_t len, int timeout_ms, BridgeError& err) {
    if (fd_ < 0) {
        err.set(ErrorKind::Connection, where_, "connection closed");
        return false;
    }
    if (!ssl_) {
        if (net::sendAll(fd_, data, len, timeout_ms, err)) return true;
        err.path = where_;
        return false;
    }
    setSocketTimeouts(fd_, timeout_ms);
    while (len > 0) {
        ERR_clear_error();
        const int n = SSL_write(ssl_, data, static_cast<int>(len));
        if (n <= 0) {
            const int e = SSL_get_error(ssl_, n);
            if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) continue;
            const bool stalled = (e == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK));
            err.set(ErrorKind::Connection, where_, stalled ? std::string("operation stalled") : "TLS write: " + opensslError());
            err.timed_out = stalled;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool Channel::readLine(std::string& line, int timeout_ms, BridgeError& err) {
    line.clear();
    while (true) {
        const auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (pending_.size() > 64 * 1024) {
            err.set(ErrorKind::Protocol, where_, "control line too long");
            return false;
        }
        char buf[4096];
        std::size_t got = 0;
        if (fd_ < 0) {
            err.set(ErrorKind::Connection, where_, "connection closed");
            return false;
        }
        if (!recvRaw(buf, sizeof(buf), got, timeout_ms, err)) return false;
        if (got == 0) {
            err.set(ErrorKind::Connection, where_, "server closed the connection");
            return false;
        }
        pending_.append(buf, got);
    }
}

std::string Channel::peerAddress() const {
    return fd_ >= 0 ? net::peerAddress(fd_) : std::string();
}

void Channel::close() {
    if (ssl_) {
        SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    net::closeSocket(fd_);
    pending_.clear();
}

} // namespace ftp
} // namespace tscp
