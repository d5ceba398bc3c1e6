// Connect against a local listener that never speaks: every protocol must give
// up within its connect timeout and report a timed-out Connection error.
#include "tscp/HostBridge.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

// Bound to 127.0.0.1 on an ephemeral port. With listen() the kernel completes
// the TCP handshake, but nothing is ever accepted or sent.
int openSilentListener(std::uint16_t &port, bool listening) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0 ||
        (listening && ::listen(fd, 8) != 0)) {
        ::close(fd);
        return -1;
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr *>(&addr), &len) != 0) {
        ::close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

tscp::HostConfig configFor(tscp::Protocol p, std::uint16_t port) {
    tscp::HostConfig cfg;
    cfg.protocol = p;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    cfg.username = "nobody";
    cfg.password = std::string("nothing");
    cfg.known_hosts_policy = tscp::KnownHostsPolicy::Off;
    cfg.connect_timeout_ms = 700;
    cfg.io_timeout_ms = 700;
    return cfg;
}

void test_silent_server(TestContext &t, tscp::Protocol p, std::uint16_t port) {
    const std::string name = tscp::protocolName(p);
    auto bridge = tscp::makeBridge(p);
    tscp::BridgeError err;
    const auto started = std::chrono::steady_clock::now();
    const bool ok = bridge->connect(configFor(p, port), err);
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    t.check(!ok, name + ": connect to a silent server must fail");
    t.check(err.kind == tscp::ErrorKind::Connection, name + ": Connection error, got " + err.describe());
    t.check(err.timed_out, name + ": error flagged as timed out");
    t.check(elapsed.count() < 5000, name + ": gave up within the bound (" + std::to_string(elapsed.count()) + " ms)");
    t.check(bridge->state() != tscp::SessionState::Connected, name + ": session not connected");
}

void test_refused(TestContext &t, tscp::Protocol p, std::uint16_t port) {
    const std::string name = tscp::protocolName(p);
    auto bridge = tscp::makeBridge(p);
    tscp::BridgeError err;
    t.check(!bridge->connect(configFor(p, port), err), name + ": refused connect fails");
    t.check(err.kind == tscp::ErrorKind::Connection, name + ": refused is a Connection error");
    t.check(!err.timed_out, name + ": refused is not a timeout");
}

} // namespace

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    TestContext t;

    std::uint16_t silentPort = 0;
    const int silent = openSilentListener(silentPort, true);
    // bound but not listening: connections are refused
    std::uint16_t closedPort = 0;
    const int closed = openSilentListener(closedPort, false);
    if (silent < 0 || closed < 0) {
        std::cerr << "[SKIP] cannot open loopback sockets\n";
        return 77;
    }

    for (auto p : {tscp::Protocol::Scp, tscp::Protocol::Sftp, tscp::Protocol::Ftp, tscp::Protocol::Ftps}) {
        test_silent_server(t, p, silentPort);
        test_refused(t, p, closedPort);
    }

    ::close(silent);
    ::close(closed);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] tscp_connect_timeout_tests\n";
    return EXIT_SUCCESS;
}
