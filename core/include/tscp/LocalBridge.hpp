// The local filesystem behind the same contract as the remote backends, so a
// transfer is always "bridge to bridge".
#pragma once
#include "HostBridge.hpp"
#include <string>

namespace tscp {

// Maps an errno value to the error taxonomy.
ErrorKind errnoKind(int e);

class LocalBridge : public HostBridge {
public:
    LocalBridge() = default;
    ~LocalBridge() override = default;

    Protocol protocol() const override { return Protocol::Local; }
    bool isLocal() const override { return true; }

    // Only remote_root (the starting directory) is used.
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

private:
    SessionState state_ = SessionState::Disconnected;
    std::string cwd_ = "/";

    std::string abs(const std::string& path) const { return resolvePath(cwd_, path); }
    bool describe(const std::string& path, RemoteEntry& out, BridgeError& err) const;
};

} // namespace tscp
