#include "tscp/TcpSocket.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>

// POSIX sockets
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace tscp {
namespace net {

static void enableKeepalive(int s) {
    int opt = 1;
    ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
    int idle = 60;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
}

static bool setNonBlocking(int s, bool on) {
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) return false;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
}

int tcpConnect(const std::string& host, std::uint16_t port, int timeout_ms, BridgeError& err) {
    const std::string where = host + ":" + std::to_string(port);
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = ::getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connection, where, std::string("getaddrinfo: ") + gai_strerror(gai));
        return -1;
    }

    bool timedOut = false;
    std::string lastError = "could not connect to host/port";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        enableKeepalive(s);
        if (!setNonBlocking(s, true)) {
            ::close(s);
            continue;
        }
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int pr;
            do {
                pr = ::poll(&pfd, 1, timeout_ms);
            } while (pr < 0 && errno == EINTR);
            if (pr == 0) {
                timedOut = true;
                lastError = "connect timed out";
                ::close(s);
                continue;
            }
            int soErr = 0;
            socklen_t len = sizeof(soErr);
            if (pr < 0 || ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) != 0 || soErr != 0) {
                lastError = std::strerror(pr < 0 ? errno : soErr);
                ::close(s);
                continue;
            }
            rc = 0;
        } else if (rc != 0) {
            lastError = std::strerror(errno);
        }
        if (rc == 0 && setNonBlocking(s, false)) {
            ::freeaddrinfo(res);
            return s;
        }
        ::close(s);
    }
    ::freeaddrinfo(res);
    err.set(ErrorKind::Connection, where, lastError);
    err.timed_out = timedOut;
    return -1;
}

static bool waitFor(int fd, short events, int timeout_ms, BridgeError& err) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int pr;
    do {
        pr = ::poll(&pfd, 1, timeout_ms);
    } while (pr < 0 && errno == EINTR);
    if (pr == 0) {
        err.set(ErrorKind::Connection, {}, "operation stalled");
        err.timed_out = true;
        return false;
    }
    if (pr < 0) {
        err.set(ErrorKind::Connection, {}, std::string("poll: ") + std::strerror(errno));
        return false;
    }
    return true;
}

bool waitReadable(int fd, int timeout_ms, BridgeError& err) {
    return waitFor(fd, POLLIN, timeout_ms, err);
}

bool waitWritable(int fd, int timeout_ms, BridgeError& err) {
    return waitFor(fd, POLLOUT, timeout_ms, err);
}

bool waitReady(int fd, bool readable, bool writable, int timeout_ms, BridgeError& err) {
    short events = 0;
    if (readable) events |= POLLIN;
    if (writable) events |= POLLOUT;
    return waitFor(fd, events, timeout_ms, err);
}

bool sendAll(int fd, const char* data, std::size_t len, int timeout_ms, BridgeError& err) {
    while (len > 0) {
        if (!waitWritable(fd, timeout_ms, err)) return false;
        ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            err.set(ErrorKind::Connection, {}, std::string("send: ") + std::strerror(errno));
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string peerAddress(int fd) {
    struct sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) != 0) return {};
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        auto* a = reinterpret_cast<struct sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        auto* a = reinterpret_cast<struct sockaddr_in6*>(&ss);
        ::inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    }
    return buf;
}

void closeSocket(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace net
} // namespace tscp
