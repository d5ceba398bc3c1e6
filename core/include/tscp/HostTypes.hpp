// Shared types between the front end and core: session options, remote entry
// metadata and the error taxonomy every bridge reports through.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tscp {

// Local is the operator's own filesystem (no session to configure).
enum class Protocol { Scp, Sftp, Ftp, Ftps, Local };

const char* protocolName(Protocol p);
std::uint16_t defaultPort(Protocol p);

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: accepts and stores new hosts; rejects changed keys.
    Off         // No verification (not recommended).
};

enum class SessionState { Disconnected, Connecting, Connected, Failed };

enum class ErrorKind {
    None,
    Connection,
    Auth,
    NotFound,
    Permission,
    Protocol,
    Io,
    Cancelled,
    AlreadyExists
};

const char* toString(ErrorKind k);

struct BridgeError {
    ErrorKind kind = ErrorKind::None;
    std::string path;
    std::string message;
    bool timed_out = false;

    explicit operator bool() const { return kind != ErrorKind::None; }
    void clear() { *this = BridgeError{}; }
    void set(ErrorKind k, std::string p, std::string msg) {
        kind = k;
        path = std::move(p);
        message = std::move(msg);
        timed_out = false;
    }
    // "kind: path: message" (path omitted when empty)
    std::string describe() const;
};

// Snapshot of one filesystem object. Fields the protocol cannot supply stay
// empty; absence means "unknown", never zero.
struct RemoteEntry {
    std::string name;
    std::string path;  // absolute
    bool is_directory = false;
    bool is_symlink = false;
    std::optional<std::string> symlink_target;
    bool symlink_dangling = false;  // link target could not be followed
    std::optional<std::uint64_t> size;
    std::optional<std::uint32_t> permissions;  // POSIX mode bits (07777)
    std::optional<std::int64_t> mtime;         // epoch seconds
    std::optional<std::uint32_t> uid;
    std::optional<std::uint32_t> gid;

    bool operator==(const RemoteEntry& o) const { return path == o.path; }
    bool operator!=(const RemoteEntry& o) const { return path != o.path; }
    bool operator<(const RemoteEntry& o) const { return path < o.path; }
};

// Directory listing plus the number of lines the backend could not parse.
struct ListResult {
    std::vector<RemoteEntry> entries;
    std::size_t skipped_lines = 0;
};

// Directories first, then by name.
void sortEntries(std::vector<RemoteEntry>& entries);

// Callback for keyboard-interactive prompts. Returns true and fills
// "responses" with one element per prompt if the user answered.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct HostConfig {
    Protocol protocol = Protocol::Sftp;
    std::string host;
    std::uint16_t port = 0;  // 0: protocol default
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;
    // Asked once when the private key needs a passphrase that was not given.
    std::function<std::optional<std::string>(const std::string& key_path)> passphrase_prompt;

    std::optional<std::string> remote_root;

    // SSH security
    std::optional<std::string> known_hosts_path;  // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
    KbdIntPromptsCB keyboard_interactive_cb;

    // FTPS
    bool tls_verify_peer = true;
    std::optional<std::string> tls_ca_file;

    int connect_timeout_ms = 20000;
    int io_timeout_ms = 30000;

    std::uint16_t effectivePort() const { return port ? port : defaultPort(protocol); }
};

// Parses "scheme://[user@]host[:port][/path]" with scheme scp, sftp, ftp or
// ftps. The path becomes remote_root.
bool parseHostUrl(const std::string& url, HostConfig& out, std::string& err);

// Path helpers shared by all bridges (always '/' separated).
std::string joinPath(const std::string& base, const std::string& name);
std::string parentPath(const std::string& path);
std::string baseName(const std::string& path);
// Makes "path" absolute against "cwd" and removes "." and ".." segments.
std::string resolvePath(const std::string& cwd, const std::string& path);

} // namespace tscp
