#include "tscp/SyncPlanner.hpp"
#include <algorithm>

namespace tscp {

SyncAction decide(const RemoteEntry& source, const RemoteEntry* destination, OverwritePolicy policy,
                  std::int64_t tolerance) {
    if (!destination) return SyncAction::Copy;
    if (source.is_directory != destination->is_directory) return SyncAction::Conflict;
    // directories are merged, their contents decide
    if (source.is_directory) return SyncAction::Skip;

    const bool timesKnown = source.mtime && destination->mtime;
    const bool sizesKnown = source.size && destination->size;
    const std::int64_t delta = timesKnown ? *source.mtime - *destination->mtime : 0;
    const bool sameTime = timesKnown && delta <= tolerance && -delta <= tolerance;
    const bool sameSize = !sizesKnown || *source.size == *destination->size;
    if (sameTime && sameSize) return SyncAction::Skip;

    switch (policy) {
    case OverwritePolicy::Never:
        return SyncAction::Skip;
    case OverwritePolicy::Always:
        return SyncAction::Overwrite;
    case OverwritePolicy::PromptOnConflict:
        return SyncAction::Conflict;
    case OverwritePolicy::NewerWins:
        // without both times nobody can tell which side is newer
        if (!timesKnown) return SyncAction::Conflict;
        if (-delta > tolerance) return SyncAction::Conflict;
        return SyncAction::Overwrite;
    }
    return SyncAction::Conflict;
}

static bool walk(HostBridge& bridge, const std::string& dir, const std::string& rel, bool recursive,
                 TreeSnapshot& out, BridgeError& err) {
    ListResult listing;
    if (!bridge.list(dir, listing, err)) return false;
    out.unparsed_lines += listing.skipped_lines;
    for (auto& e : listing.entries) {
        const std::string childRel = rel.empty() ? e.name : rel + "/" + e.name;
        const bool descend = recursive && e.is_directory && !e.is_symlink;
        const std::string childPath = e.path;
        out.order.push_back(childRel);
        out.entries[childRel] = std::move(e);
        if (descend && !walk(bridge, childPath, childRel, true, out, err)) return false;
    }
    return true;
}

bool snapshotTree(HostBridge& bridge, const std::string& root, bool recursive, TreeSnapshot& out,
                  BridgeError& err) {
    out = TreeSnapshot{};
    out.root = root;
    return walk(bridge, root, std::string(), recursive, out, err);
}

std::size_t SyncPlan::count(SyncAction a) const {
    return static_cast<std::size_t>(std::count_if(decisions.begin(), decisions.end(),
                                                  [a](const SyncDecision& d) { return d.action == a; }));
}

SyncPlan planSync(const TreeSnapshot& source, const TreeSnapshot& destination, const SyncOptions& options) {
    SyncPlan plan;
    plan.source_unparsed = source.unparsed_lines;
    plan.destination_unparsed = destination.unparsed_lines;
    for (const auto& rel : source.order) {
        const RemoteEntry& src = source.entries.at(rel);
        auto it = destination.entries.find(rel);
        const RemoteEntry* dst = it == destination.entries.end() ? nullptr : &it->second;

        SyncDecision d;
        d.task.source_path = src.path;
        d.task.destination_path = joinPath(destination.root, rel);
        d.task.direction = options.direction;
        d.task.kind = src.is_directory ? TaskKind::Directory : src.is_symlink ? TaskKind::Symlink : TaskKind::File;
        d.task.size_bytes = src.is_directory ? 0 : src.size.value_or(0);
        d.action = decide(src, dst, options.policy, options.mtime_tolerance_secs);
        plan.decisions.push_back(std::move(d));
    }
    return plan;
}

} // namespace tscp
