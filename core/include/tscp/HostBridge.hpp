// Abstract filesystem bridge. Protocol backends (SCP, SFTP, FTP/FTPS) and the
// local filesystem implement this API so the transfer engine and the front end
// stay decoupled from the wire protocol.
#pragma once
#include "HostTypes.hpp"
#include <atomic>
#include <memory>

namespace tscp {

// Streaming read handle. read() reports got == 0 at end of file. A stream
// that fails mid-way leaves the transfer failed, never truncated-successful.
class ReadStream {
public:
    virtual ~ReadStream() = default;
    virtual bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) = 0;
    // Completes the protocol exchange once EOF was reached.
    virtual bool finish(BridgeError& err) = 0;
};

// Streaming write handle. Data is committed only by finish(); destroying an
// unfinished stream aborts it.
class WriteStream {
public:
    virtual ~WriteStream() = default;
    virtual bool write(const char* buf, std::size_t len, BridgeError& err) = 0;
    virtual bool finish(BridgeError& err) = 0;
    // Stops the exchange without committing. Leaves the session usable.
    virtual void abort() = 0;
};

class HostBridge {
public:
    virtual ~HostBridge() = default;

    virtual Protocol protocol() const = 0;
    virtual bool isLocal() const { return false; }

    // Connect and disconnect
    virtual bool connect(const HostConfig& cfg, BridgeError& err) = 0;
    virtual void disconnect() = 0;
    virtual SessionState state() const = 0;
    bool isConnected() const { return state() == SessionState::Connected; }

    // Working directory cursor
    virtual bool pwd(std::string& out, BridgeError& err) = 0;
    virtual bool changeDirectory(const std::string& path, BridgeError& err) = 0;

    // Directory listing (without "." and ".."), directories first.
    virtual bool list(const std::string& path, ListResult& out, BridgeError& err) = 0;

    // Metadata for a single path (symlinks report their target's type/size).
    virtual bool stat(const std::string& path, RemoteEntry& out, BridgeError& err) = 0;

    // Convenience over stat(); false with NotFound when the path is absent.
    virtual bool isDirectory(const std::string& path, bool& out, BridgeError& err);

    // AlreadyExists when the path is already there.
    virtual bool createDirectory(const std::string& path, BridgeError& err,
                                 unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& path, BridgeError& err) = 0;
    virtual bool removeDirectory(const std::string& path, BridgeError& err) = 0;

    // Removes a file, or a directory (with its contents when recursive).
    bool remove(const std::string& path, bool recursive, BridgeError& err);

    virtual bool rename(const std::string& from, const std::string& to, BridgeError& err) = 0;

    virtual std::unique_ptr<ReadStream> openRead(const std::string& path, BridgeError& err) = 0;
    // expected_size is mandatory for protocols that announce the size before
    // the data (SCP).
    virtual std::unique_ptr<WriteStream> openWrite(const std::string& path,
                                                   bool append,
                                                   BridgeError& err,
                                                   std::optional<std::uint64_t> expected_size = std::nullopt,
                                                   std::optional<std::int64_t> mtime = std::nullopt) = 0;

    virtual bool symlinkResolve(const std::string& path, std::string& target, BridgeError& err) = 0;

    // Attribute changes (best effort on servers that do not support them).
    virtual bool setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) = 0;
    virtual bool setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) = 0;

    // Exclusive use of the session by one batch at a time.
    bool tryLease() {
        bool expected = false;
        return leased_.compare_exchange_strong(expected, true);
    }
    void releaseLease() { leased_.store(false); }
    bool leased() const { return leased_.load(); }

protected:
    // Fails with Connection when the session is not Connected.
    bool requireConnected(const std::string& path, BridgeError& err) const;

private:
    std::atomic<bool> leased_{false};
};

// RAII lease over a bridge.
class BridgeLease {
public:
    explicit BridgeLease(HostBridge& b) : bridge_(&b), owned_(b.tryLease()) {}
    ~BridgeLease() {
        if (owned_) bridge_->releaseLease();
    }
    BridgeLease(const BridgeLease&) = delete;
    BridgeLease& operator=(const BridgeLease&) = delete;
    bool owned() const { return owned_; }

private:
    HostBridge* bridge_;
    bool owned_;
};

// Creates an unconnected bridge for the protocol.
std::unique_ptr<HostBridge> makeBridge(Protocol p);

} // namespace tscp
