// FTP control/data sequencing against a scripted server on 127.0.0.1. Each
// test installs a handler for the commands it cares about; login, FEAT, PASV
// and the other housekeeping commands get canned answers.
#include "tscp/FtpBridge.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

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

const char *const kListing =
    "type=cdir;modify=20240101000000;UNIX.mode=0755; .\r\n"
    "type=file;size=5;modify=20240102030405;UNIX.mode=0644; hello.txt\r\n"
    "type=dir;modify=20240101000000;UNIX.mode=0755; sub\r\n";

int openListener(std::uint16_t &port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    if (::bind(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0 || ::listen(fd, 4) != 0 ||
        ::getsockname(fd, reinterpret_cast<struct sockaddr *>(&addr), &len) != 0) {
        ::close(fd);
        return -1;
    }
    port = ntohs(addr.sin_port);
    return fd;
}

// A stuck test must not hang the suite: server sockets give up after 5 s.
void limitWait(int fd) {
    struct timeval tv{};
    tv.tv_sec = 5;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void closeFd(int &fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

class ScriptedFtpServer {
public:
    // Returns true when it answered the command itself.
    using Handler = std::function<bool(ScriptedFtpServer &, const std::string &verb, const std::string &arg)>;

    explicit ScriptedFtpServer(Handler handler) : handler_(std::move(handler)) {
        listen_ = openListener(port_);
        if (listen_ >= 0) thread_ = std::thread([this] { run(); });
    }
    ~ScriptedFtpServer() {
        join();
        closeFd(listen_);
        closeFd(dataListen_);
        closeFd(data_);
    }
    ScriptedFtpServer(const ScriptedFtpServer &) = delete;
    ScriptedFtpServer &operator=(const ScriptedFtpServer &) = delete;

    bool ok() const { return listen_ >= 0; }
    std::uint16_t port() const { return port_; }
    void join() {
        if (thread_.joinable()) thread_.join();
    }
    // Commands received so far; read only after join().
    const std::vector<std::string> &commands() const { return commands_; }

    void reply(const std::string &text) { sendRaw(ctrl_, text + "\r\n"); }

    bool acceptData() {
        data_ = ::accept(dataListen_, nullptr, nullptr);
        closeFd(dataListen_);
        if (data_ < 0) return false;
        limitWait(data_);
        return true;
    }
    void sendData(const std::string &bytes) { sendRaw(data_, bytes); }
    // reset: abortive close (RST) instead of a clean FIN
    void closeData(bool reset) {
        if (reset && data_ >= 0) {
            struct linger lg{};
            lg.l_onoff = 1;
            lg.l_linger = 0;
            ::setsockopt(data_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
        }
        closeFd(data_);
    }
    // Everything the client sends until it closes the data connection.
    std::string drainData() {
        std::string out;
        char buf[4096];
        while (data_ >= 0) {
            const ssize_t n = ::recv(data_, buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        closeFd(data_);
        return out;
    }

private:
    Handler handler_;
    std::thread thread_;
    int listen_ = -1;
    int ctrl_ = -1;
    int dataListen_ = -1;
    int data_ = -1;
    std::uint16_t port_ = 0;
    std::vector<std::string> commands_;

    static void sendRaw(int fd, const std::string &bytes) {
        std::size_t off = 0;
        while (fd >= 0 && off < bytes.size()) {
            const ssize_t n = ::send(fd, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return;
            off += static_cast<std::size_t>(n);
        }
    }

    bool readLine(std::string &line) {
        line.clear();
        char c = 0;
        while (true) {
            const ssize_t n = ::recv(ctrl_, &c, 1, 0);
            if (n <= 0) return false;
            if (c == '\n') break;
            if (c != '\r') line.push_back(c);
        }
        return true;
    }

    void passive() {
        closeFd(dataListen_);
        closeFd(data_);
        std::uint16_t p = 0;
        dataListen_ = openListener(p);
        if (dataListen_ < 0) {
            reply("425 cannot open data listener");
            return;
        }
        reply("227 Entering Passive Mode (127,0,0,1," + std::to_string(p >> 8) + "," + std::to_string(p & 0xff) +
              ")");
    }

    bool standardReply(const std::string &verb, const std::string &arg) {
        if (verb == "USER") reply("331 password please");
        else if (verb == "PASS") reply("230 logged in");
        else if (verb == "FEAT")
            reply("211-Features:\r\n MLST type*;size*;modify*;UNIX.mode*;\r\n UTF8\r\n MFMT\r\n211 End");
        else if (verb == "OPTS" || verb == "TYPE") reply("200 ok");
        else if (verb == "PWD") reply("257 \"/\" is the current directory");
        else if (verb == "CWD") reply("250 directory changed");
        else if (verb == "MKD") reply("257 \"" + arg + "\" created");
        else if (verb == "DELE") reply("250 deleted");
        else if (verb == "PASV") passive();
        else if (verb == "QUIT") reply("221 bye");
        else return false;
        return true;
    }

    void run() {
        ctrl_ = ::accept(listen_, nullptr, nullptr);
        if (ctrl_ < 0) return;
        limitWait(ctrl_);
        reply("220 scripted server ready");
        std::string line;
        while (readLine(line)) {
            commands_.push_back(line);
            const auto space = line.find(' ');
            std::string verb = line.substr(0, space);
            for (auto &ch : verb) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            const std::string arg = space == std::string::npos ? std::string() : line.substr(space + 1);
            if (handler_ && handler_(*this, verb, arg)) continue;
            if (!standardReply(verb, arg)) reply("502 command not implemented");
            if (verb == "QUIT") break;
        }
        closeFd(ctrl_);
    }
};

tscp::HostConfig configFor(const ScriptedFtpServer &server, int ioTimeoutMs = 3000) {
    tscp::HostConfig cfg;
    cfg.protocol = tscp::Protocol::Ftp;
    cfg.host = "127.0.0.1";
    cfg.port = server.port();
    cfg.username = "alice";
    cfg.password = std::string("secret");
    cfg.connect_timeout_ms = 3000;
    cfg.io_timeout_ms = ioTimeoutMs;
    return cfg;
}

bool hasCommand(const ScriptedFtpServer &server, const std::string &prefix) {
    for (const auto &c : server.commands()) {
        if (c.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

void test_login_and_listing(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "MLSD") return false;
        if (!s.acceptData()) return true;
        s.reply("150 opening data connection");
        s.sendData(kListing);
        s.closeData(false);
        s.reply("226 transfer complete");
        return true;
    });
    if (!server.ok()) {
        t.check(false, "listener for the login test");
        return;
    }
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    t.check(bridge.features().mlst && bridge.features().utf8 && bridge.features().mfmt, "FEAT parsed");

    tscp::ListResult res;
    t.check(bridge.list("/", res, err), "MLSD listing: " + err.describe());
    t.check(res.entries.size() == 2 && res.skipped_lines == 0, "cdir entry dropped, two entries kept");
    if (res.entries.size() == 2) {
        t.check(res.entries[0].name == "sub" && res.entries[0].is_directory, "directory first");
        t.check(res.entries[1].name == "hello.txt" && res.entries[1].size && *res.entries[1].size == 5,
                "file size from facts");
        t.check(res.entries[1].permissions && *res.entries[1].permissions == 0644, "UNIX.mode fact");
    }
    t.check(bridge.controlState() == tscp::FtpBridge::ControlState::Idle, "control idle after the listing");
    bridge.disconnect();
    server.join();
    t.check(hasCommand(server, "OPTS UTF8 ON") && hasCommand(server, "TYPE I"), "session setup commands sent");
    t.check(hasCommand(server, "MLSD /"), "listing uses MLSD with an absolute path");
    t.check(hasCommand(server, "QUIT"), "polite disconnect");
}

void test_completion_without_preliminary(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "MLSD") return false;
        if (!s.acceptData()) return true;
        // no 1xx at all: the completion reply comes first
        s.reply("226 transfer complete");
        s.sendData(kListing);
        s.closeData(false);
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    tscp::ListResult res;
    t.check(bridge.list("/", res, err), "direct 2xx accepted as completion: " + err.describe());
    t.check(res.entries.size() == 2, "listing still read from the data connection");
    t.check(bridge.controlState() == tscp::FtpBridge::ControlState::Idle, "control idle");
    t.check(bridge.createDirectory("/after", err), "session usable afterwards: " + err.describe());
    bridge.disconnect();
    server.join();
}

void test_completion_before_data_end(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "MLSD") return false;
        if (!s.acceptData()) return true;
        s.reply("150 opening data connection");
        s.sendData("type=file;size=5;modify=20240102030405; hel");
        s.reply("226 transfer complete");
        s.closeData(true);
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    tscp::ListResult res;
    t.check(!bridge.list("/", res, err), "listing with a broken data connection fails");
    t.check(err.kind == tscp::ErrorKind::Protocol, "completion without clean data end is Protocol, got " +
                                                        err.describe());
    t.check(bridge.isConnected() && bridge.controlState() == tscp::FtpBridge::ControlState::Idle,
            "control connection survives");
    t.check(bridge.createDirectory("/next", err), "next command works: " + err.describe());
    bridge.disconnect();
    server.join();
}

void test_negative_preliminary(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "RETR") return false;
        s.reply("550 /missing.txt: No such file or directory");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    auto stream = bridge.openRead("/missing.txt", err);
    t.check(!stream, "RETR refused");
    t.check(err.kind == tscp::ErrorKind::NotFound, "550 maps to NotFound, got " + err.describe());
    t.check(bridge.isConnected() && bridge.controlState() == tscp::FtpBridge::ControlState::Idle,
            "refused transfer leaves the session idle");
    bridge.disconnect();
    server.join();
}

void test_upload(TestContext &t) {
    std::string received;
    ScriptedFtpServer server([&received](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "STOR") return false;
        if (!s.acceptData()) return true;
        s.reply("150 ok to send data");
        received = s.drainData();
        s.reply("226 transfer complete");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    const std::string payload(70000, 'x');
    auto w = bridge.openWrite("/up.bin", false, err, payload.size());
    t.check(w != nullptr, "STOR accepted: " + err.describe());
    if (w) {
        t.check(bridge.controlState() == tscp::FtpBridge::ControlState::DataTransferInProgress,
                "data transfer in progress while writing");
        t.check(w->write(payload.data(), payload.size(), err), "write: " + err.describe());
        t.check(w->finish(err), "finish reads the completion reply: " + err.describe());
    }
    t.check(bridge.controlState() == tscp::FtpBridge::ControlState::Idle, "control idle after upload");
    bridge.disconnect();
    server.join();
    t.check(received == payload, "server received every byte");
    t.check(hasCommand(server, "STOR /up.bin"), "STOR with an absolute path");
}

void test_data_stall_times_out(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "MLSD") return false;
        if (!s.acceptData()) return true;
        s.reply("150 opening data connection");
        // nothing is sent until the client gives up
        s.drainData();
        s.reply("426 transfer aborted");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server, 700), err), "login: " + err.describe());
    tscp::ListResult res;
    t.check(!bridge.list("/", res, err), "stalled listing fails");
    t.check(err.kind == tscp::ErrorKind::Connection && err.timed_out,
            "stalled data connection is a timed-out Connection error, got " + err.describe());
    t.check(bridge.controlState() == tscp::FtpBridge::ControlState::Idle, "abort reply consumed");
    bridge.disconnect();
    server.join();
}

void test_malformed_reply_closes_session(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "MKD") return false;
        s.reply("this is not an ftp reply");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    t.check(!bridge.createDirectory("/x", err), "MKD with a garbage reply fails");
    t.check(err.kind == tscp::ErrorKind::Protocol, "garbage reply is Protocol, got " + err.describe());
    t.check(!bridge.isConnected(), "control connection dropped after a malformed reply");
    t.check(!bridge.createDirectory("/y", err) && err.kind == tscp::ErrorKind::Connection,
            "later calls report the lost session");
    bridge.disconnect();
    server.join();
}

void test_service_closing(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "DELE") return false;
        s.reply("421 Timeout, closing control connection");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(bridge.connect(configFor(server), err), "login: " + err.describe());
    t.check(!bridge.removeFile("/a.txt", err), "DELE answered with 421 fails");
    t.check(err.kind == tscp::ErrorKind::Connection, "421 is a Connection error, got " + err.describe());
    t.check(!bridge.isConnected(), "421 drops the session");
    bridge.disconnect();
    server.join();
}

void test_login_rejected(TestContext &t) {
    ScriptedFtpServer server([](ScriptedFtpServer &s, const std::string &verb, const std::string &) {
        if (verb != "PASS") return false;
        s.reply("530 Login incorrect");
        return true;
    });
    if (!server.ok()) return;
    tscp::FtpBridge bridge(false);
    tscp::BridgeError err;
    t.check(!bridge.connect(configFor(server), err), "bad password rejected");
    t.check(err.kind == tscp::ErrorKind::Auth, "530 during login is Auth, got " + err.describe());
    t.check(!bridge.isConnected(), "not connected after a rejected login");
    bridge.disconnect();
    server.join();
}

} // namespace

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    std::uint16_t loopbackPort = 0;
    const int loopback = openListener(loopbackPort);
    if (loopback < 0) {
        std::cerr << "[SKIP] cannot open loopback sockets\n";
        return 77;
    }
    ::close(loopback);

    TestContext t;
    test_login_and_listing(t);
    test_completion_without_preliminary(t);
    test_completion_before_data_end(t);
    test_negative_preliminary(t);
    test_upload(t);
    test_data_stall_times_out(t);
    test_malformed_reply_closes_session(t);
    test_service_closing(t);
    test_login_rejected(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] tscp_ftp_session_tests\n";
    return EXIT_SUCCESS;
}
