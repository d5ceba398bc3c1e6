#include "tscp/HostBridge.hpp"

namespace tscp {

bool HostBridge::requireConnected(const std::string& path, BridgeError& err) const {
    if (state() == SessionState::Connected) return true;
    err.set(ErrorKind::Connection, path, "not connected");
    return false;
}

bool HostBridge::isDirectory(const std::string& path, bool& out, BridgeError& err) {
    out = false;
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    out = e.is_directory;
    return true;
}

// Depth-first: children before their directory.
bool HostBridge::remove(const std::string& path, bool recursive, BridgeError& err) {
    RemoteEntry e;
    if (!stat(path, e, err)) return false;
    // a symlink to a directory is unlinked, never descended into
    if (!e.is_directory || e.is_symlink) return removeFile(path, err);
    if (recursive) {
        ListResult children;
        if (!list(path, children, err)) return false;
        for (const auto& child : children.entries) {
            if (!remove(child.path, true, err)) return false;
        }
    }
    return removeDirectory(path, err);
}

} // namespace tscp
