// In-memory bridge used by tests: a small filesystem tree plus fault
// injection (fail an operation on a path, fail a stream after N bytes, drop
// the connection).
#pragma once
#include "HostBridge.hpp"
#include <map>
#include <string>
#include <vector>

namespace tscp {

class MockHostBridge : public HostBridge {
public:
    enum class Op {
        Connect,
        List,
        Stat,
        CreateDirectory,
        RemoveFile,
        RemoveDirectory,
        Rename,
        OpenRead,
        OpenWrite,
        FinishWrite,
        SymlinkResolve,
        SetPermissions,
        SetTimes
    };

    explicit MockHostBridge(Protocol p = Protocol::Sftp, bool local = false);

    Protocol protocol() const override { return protocol_; }
    bool isLocal() const override { return local_; }

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
    bool setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) override;
    bool setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) override;

    // Tree setup (parents are created as needed).
    void addDirectory(const std::string& path, std::int64_t mtime = 0);
    void addFile(const std::string& path, const std::string& content, std::int64_t mtime = 0,
                 std::uint32_t mode = 0644);
    void addSymlink(const std::string& path, const std::string& target);
    bool exists(const std::string& path) const;
    std::optional<std::string> fileContent(const std::string& path) const;
    std::optional<std::uint32_t> modeOf(const std::string& path) const;
    std::optional<std::int64_t> mtimeOf(const std::string& path) const;

    // Fault injection
    void failOn(Op op, const std::string& path, ErrorKind kind, const std::string& message = "injected fault");
    // The stream fails once "after" bytes went through it. A Connection
    // kind also drops the session.
    void failReadAfter(const std::string& path, std::uint64_t after, ErrorKind kind);
    void failWriteAfter(const std::string& path, std::uint64_t after, ErrorKind kind);
    // Marks the session Failed (as a reset transport would).
    void dropConnection() { state_ = SessionState::Failed; }
    void clearFaults();

    // Clock used for files written through openWrite.
    void setNow(std::int64_t now) { now_ = now; }
    // "op path" lines for every mutating call, in order.
    const std::vector<std::string>& journal() const { return journal_; }

    // Used by the stream classes.
    bool injected(Op op, const std::string& path, BridgeError& err);
    bool streamFault(bool reading, const std::string& path, std::uint64_t offset, std::size_t len,
                     std::size_t& allowed, BridgeError& err);
    std::string* data(const std::string& path);
    void note(const std::string& line) { journal_.push_back(line); }

private:
    struct Node {
        bool is_dir = false;
        bool is_symlink = false;
        std::string target;
        std::string data;
        std::uint32_t mode = 0644;
        std::int64_t mtime = 0;
    };
    struct Fault {
        Op op;
        std::string path;
        ErrorKind kind;
        std::string message;
    };
    struct StreamFault {
        bool reading;
        std::string path;
        std::uint64_t after;
        ErrorKind kind;
    };

    Protocol protocol_;
    bool local_;
    SessionState state_ = SessionState::Disconnected;
    std::string cwd_ = "/";
    std::int64_t now_ = 1000;
    std::map<std::string, Node> nodes_;
    std::vector<Fault> faults_;
    std::vector<StreamFault> streamFaults_;
    std::vector<std::string> journal_;

    std::string abs(const std::string& path) const { return resolvePath(cwd_, path); }
    // Follows symlinks (bounded) to the node they name.
    const Node* follow(const std::string& path, std::string* resolved = nullptr) const;
    bool hasChildren(const std::string& dir) const;
    bool checkParent(const std::string& path, BridgeError& err) const;
    RemoteEntry describe(const std::string& path, const Node& n) const;
};

} // namespace tscp
