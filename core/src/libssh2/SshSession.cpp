// libssh2 transport: TCP socket, SSH session, known_hosts validation and
// authentication (public key, password, keyboard-interactive, ssh-agent).
#include "tscp/SshSession.hpp"
#include "tscp/TcpSocket.hpp"
#include <libssh2.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace tscp {

// Global libssh2 initialization (once per process)
static void ensureLibssh2() {
    static const int rc = libssh2_init(0);
    (void)rc;
}

// Context for keyboard-interactive: user/password and optional UI callback
struct KbdIntCtx {
    const std::string* user;
    const std::string* pass;
    const KbdIntPromptsCB* cb;
};

static char* dupResponse(const std::string& s, unsigned int& len) {
    len = 0;
    if (s.empty()) return nullptr;
    char* buf = static_cast<char*>(std::malloc(s.size() + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = static_cast<unsigned int>(s.size());
    return buf;
}

static bool promptAsksForUser(const std::string& prompt) {
    std::string lower;
    lower.reserve(prompt.size());
    for (char c : prompt)
        lower.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    return lower.find("user") != std::string::npos || lower.find("name") != std::string::npos;
}

static void kbint_callback(const char* name, int name_len,
                           const char* instruction, int instruction_len,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                           void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    std::vector<std::string> texts;
    texts.reserve(static_cast<std::size_t>(num_prompts > 0 ? num_prompts : 0));
    for (int i = 0; i < num_prompts; ++i) {
        const char* pt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        texts.emplace_back(pt, prompts ? prompts[i].length : 0);
    }

    // The UI callback gets the first chance (OTP/2FA prompts).
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> answers;
        const std::string nm = (name && name_len > 0) ? std::string(name, static_cast<std::size_t>(name_len)) : std::string();
        const std::string ins = (instruction && instruction_len > 0)
                                    ? std::string(instruction, static_cast<std::size_t>(instruction_len))
                                    : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) && static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i)
                responses[i].text = dupResponse(answers[static_cast<std::size_t>(i)], responses[i].length);
            return;
        }
    }
    // Fallback heuristic: "user"/"name" prompts get the user, anything else the password.
    for (int i = 0; i < num_prompts; ++i) {
        const std::string* ans = promptAsksForUser(texts[static_cast<std::size_t>(i)]) ? ctx->user : ctx->pass;
        if (!ans) {
            responses[i].text = nullptr;
            responses[i].length = 0;
            continue;
        }
        responses[i].text = dupResponse(*ans, responses[i].length);
    }
}

SshSession::SshSession() {
    ensureLibssh2();
}

SshSession::~SshSession() {
    close();
}

void SshSession::close() {
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    net::closeSocket(sock_);
}

void SshSession::setTimeout(int ms) {
    if (session_) libssh2_session_set_timeout(session_, ms > 0 ? ms : 0);
}

void SshSession::setBlocking(bool on) {
    if (session_) libssh2_session_set_blocking(session_, on ? 1 : 0);
}

bool SshSession::waitSocket(int timeout_ms, BridgeError& err) const {
    const int dir = session_ ? libssh2_session_block_directions(session_) : 0;
    const bool out = (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) != 0;
    const bool in = (dir & LIBSSH2_SESSION_BLOCK_INBOUND) != 0 || !out;
    return net::waitReady(sock_, in, out, timeout_ms, err);
}

bool SshSession::transportBroken() const {
    if (!session_) return true;
    switch (libssh2_session_last_errno(session_)) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
    case LIBSSH2_ERROR_KEX_FAILURE:
    case LIBSSH2_ERROR_DECRYPT:
        return true;
    default:
        return false;
    }
}

void SshSession::lastError(ErrorKind fallback, const std::string& path, BridgeError& err) const {
    if (!session_) {
        err.set(ErrorKind::Connection, path, "no SSH session");
        return;
    }
    char* msg = nullptr;
    int msgLen = 0;
    const int code = libssh2_session_last_error(session_, &msg, &msgLen, 0);
    std::string text = (msg && msgLen > 0) ? std::string(msg, static_cast<std::size_t>(msgLen)) : std::string();
    text += " [libssh2 " + std::to_string(code) + "]";
    err.set(transportBroken() ? ErrorKind::Connection : fallback, path, text);
    err.timed_out = (code == LIBSSH2_ERROR_TIMEOUT || code == LIBSSH2_ERROR_SOCKET_TIMEOUT);
}

bool SshSession::open(const HostConfig& opt, BridgeError& err) {
    close();
    sock_ = net::tcpConnect(opt.host, opt.effectivePort(), opt.connect_timeout_ms, err);
    if (sock_ == -1) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err.set(ErrorKind::Connection, opt.host, "libssh2_session_init failed");
        close();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    // The handshake and authentication are bounded by the connect timeout.
    setTimeout(opt.connect_timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        lastError(ErrorKind::Connection, opt.host, err);
        err.kind = ErrorKind::Connection;
        err.message = "SSH handshake failed: " + err.message;
        close();
        return false;
    }

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        close();
        return false;
    }
    setTimeout(opt.io_timeout_ms);
    return true;
}

bool SshSession::verifyHostKey(const HostConfig& opt, BridgeError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err.set(ErrorKind::Connection, opt.host, "could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Auth, khPath, "host key verification failed: known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Protocol, opt.host, "could not obtain host key");
        return false;
    }

    int alg = 0;
    std::string algName;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        algName = "RSA";
        break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        algName = "DSA";
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        algName = "ECDSA-256";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        algName = "ECDSA-384";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        algName = "ECDSA-521";
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        algName = "ED25519";
        break;
#endif
    default:
        algName = "UNKNOWN";
        break;
    }

    const int typemaskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemaskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.effectivePort(),
                                         hostkey, keylen, typemaskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.effectivePort(),
                                         hostkey, keylen, typemaskHash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        std::string fpStr;
        const unsigned char* h = reinterpret_cast<const unsigned char*>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed = opt.hostkey_confirm_cb &&
                               opt.hostkey_confirm_cb(opt.host, opt.effectivePort(), algName, fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Auth, opt.host, "host key verification failed: unknown host, fingerprint not confirmed");
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Io, {}, "known_hosts path is not defined");
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr, hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Io, khPath, "could not add host to known_hosts");
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    // Only Strict fails on mismatch/notfound; AcceptNew still rejects changed keys.
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict || check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err.set(ErrorKind::Auth, opt.host,
                check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                    ? "host key verification failed: key does not match known_hosts"
                    : "host key verification failed: host not in known_hosts");
        return false;
    }
    return true;
}

std::string SshSession::authMethods(const std::string& user) {
    char* methods = libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.size()));
    return methods ? std::string(methods) : std::string();
}

bool SshSession::authWithAgent(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3;
        while (tries < kMaxAgentTries && libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc;
            while ((arc = libssh2_agent_userauth(agent, user.c_str(), identity)) == LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (arc == 0) {
                authed = true;
                break;
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Order: explicit private key, then password (with keyboard-interactive as
// a follow-up), then ssh-agent when the server offers publickey.
bool SshSession::authenticate(const HostConfig& opt, BridgeError& err) {
    if (opt.private_key_path.has_value()) {
        std::optional<std::string> passphrase = opt.private_key_passphrase;
        int rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                     opt.private_key_path->c_str(),
                                                     passphrase ? passphrase->c_str() : nullptr);
        // LIBSSH2_ERROR_FILE: key unreadable or encrypted with another passphrase
        if (rc == LIBSSH2_ERROR_FILE && !passphrase && opt.passphrase_prompt) {
            passphrase = opt.passphrase_prompt(*opt.private_key_path);
            if (passphrase) {
                rc = libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                         opt.private_key_path->c_str(), passphrase->c_str());
            }
        }
        if (rc == 0) return true;
        if (transportBroken()) {
            lastError(ErrorKind::Connection, opt.host, err);
            return false;
        }
        if (!opt.password.has_value()) {
            lastError(ErrorKind::Auth, *opt.private_key_path, err);
            err.kind = ErrorKind::Auth;
            err.message = "public key authentication failed: " + err.message;
            return false;
        }
    }

    std::string authlist;
    if (opt.password.has_value()) {
        int rcPw;
        while ((rcPw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str())) ==
               LIBSSH2_ERROR_EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (rcPw == 0) return true;

        // The server hung up after the password attempt: everything else would cascade.
        if (transportBroken()) {
            lastError(ErrorKind::Connection, opt.host, err);
            err.message = "server closed the connection after the password attempt: " + err.message;
            return false;
        }
        authlist = authMethods(opt.username);
        if (authlist.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{&opt.username, &*opt.password, &opt.keyboard_interactive_cb};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            int rcKbd;
            while ((rcKbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_callback)) ==
                   LIBSSH2_ERROR_EAGAIN)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            if (abs) *abs = nullptr;
            if (rcKbd == 0) return true;
        }
    } else {
        authlist = authMethods(opt.username);
        if (libssh2_userauth_authenticated(session_)) return true;  // "none" accepted
    }

    if (authlist.find("publickey") != std::string::npos && authWithAgent(opt.username)) return true;

    if (transportBroken()) {
        lastError(ErrorKind::Connection, opt.host, err);
        return false;
    }
    err.set(ErrorKind::Auth, opt.username,
            opt.password.has_value()
                ? "password/keyboard-interactive authentication failed" +
                      (authlist.empty() ? std::string() : " (methods: " + authlist + ")")
                : "no usable credentials: key, agent and password unavailable");
    return false;
}

} // namespace tscp
