// Tree comparison: decides per source path whether it must be copied,
// overwritten, skipped or handed back to the caller as a conflict.
#pragma once
#include "HostBridge.hpp"
#include "TransferTypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace tscp {

// Decision for one source entry against its destination counterpart (null
// when absent). Identical entries are always Skip; conflicts are never
// resolved here.
SyncAction decide(const RemoteEntry& source, const RemoteEntry* destination, OverwritePolicy policy,
                  std::int64_t mtime_tolerance_secs = 0);

struct TreeSnapshot {
    std::string root;
    // relative path ("a/b.txt") -> entry
    std::map<std::string, RemoteEntry> entries;
    // relative paths in depth-first pre-order
    std::vector<std::string> order;
    std::size_t unparsed_lines = 0;
};

// Lists "root" (recursively when asked). Symlinked directories are recorded
// but not descended into.
bool snapshotTree(HostBridge& bridge, const std::string& root, bool recursive, TreeSnapshot& out,
                  BridgeError& err);

struct SyncOptions {
    OverwritePolicy policy = OverwritePolicy::NewerWins;
    std::int64_t mtime_tolerance_secs = 0;
    Direction direction = Direction::Upload;
};

struct SyncPlan {
    std::vector<SyncDecision> decisions;  // source order
    std::size_t source_unparsed = 0;
    std::size_t destination_unparsed = 0;

    bool complete() const { return source_unparsed == 0 && destination_unparsed == 0; }
    std::size_t count(SyncAction a) const;
};

SyncPlan planSync(const TreeSnapshot& source, const TreeSnapshot& destination, const SyncOptions& options);

} // namespace tscp
