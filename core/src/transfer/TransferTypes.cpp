#include "tscp/TransferTypes.hpp"
#include <cstdio>

namespace tscp {

const char* toString(Direction d) {
    switch (d) {
    case Direction::Upload: return "upload";
    case Direction::Download: return "download";
    case Direction::LocalCopy: return "local copy";
    }
    return "?";
}

const char* toString(TaskKind k) {
    switch (k) {
    case TaskKind::File: return "file";
    case TaskKind::Directory: return "directory";
    case TaskKind::Symlink: return "symlink";
    }
    return "?";
}

const char* toString(OverwritePolicy p) {
    switch (p) {
    case OverwritePolicy::NewerWins: return "newer";
    case OverwritePolicy::Always: return "always";
    case OverwritePolicy::Never: return "never";
    case OverwritePolicy::PromptOnConflict: return "prompt";
    }
    return "?";
}

const char* toString(SyncAction a) {
    switch (a) {
    case SyncAction::Copy: return "copy";
    case SyncAction::Overwrite: return "overwrite";
    case SyncAction::Skip: return "skip";
    case SyncAction::Conflict: return "conflict";
    }
    return "?";
}

bool parseOverwritePolicy(const std::string& s, OverwritePolicy& out) {
    for (auto p : {OverwritePolicy::NewerWins, OverwritePolicy::Always, OverwritePolicy::Never,
                   OverwritePolicy::PromptOnConflict}) {
        if (s == toString(p)) {
            out = p;
            return true;
        }
    }
    return false;
}

const char* toString(TransferOutcome::Status s) {
    switch (s) {
    case TransferOutcome::Status::Success: return "success";
    case TransferOutcome::Status::Skipped: return "skipped";
    case TransferOutcome::Status::Failed: return "failed";
    }
    return "?";
}

TransferOutcome TransferOutcome::success(const TransferTask& t, std::uint64_t bytes) {
    TransferOutcome o;
    o.task = t;
    o.status = Status::Success;
    o.bytes_written = bytes;
    return o;
}

TransferOutcome TransferOutcome::skipped(const TransferTask& t, std::string reason) {
    TransferOutcome o;
    o.task = t;
    o.status = Status::Skipped;
    o.reason = std::move(reason);
    return o;
}

TransferOutcome TransferOutcome::failed(const TransferTask& t, BridgeError err) {
    TransferOutcome o;
    o.task = t;
    o.status = Status::Failed;
    o.error = std::move(err);
    return o;
}

void TransferReport::add(TransferOutcome outcome) {
    const bool dir = outcome.task.kind == TaskKind::Directory;
    switch (outcome.status) {
    case TransferOutcome::Status::Success:
        ++(dir ? directories_succeeded : files_succeeded);
        break;
    case TransferOutcome::Status::Skipped:
        ++(dir ? directories_skipped : files_skipped);
        break;
    case TransferOutcome::Status::Failed:
        ++(dir ? directories_failed : files_failed);
        break;
    }
    // partial writes count too: the bytes did reach the destination
    bytes_written += outcome.bytes_written;
    outcomes.push_back(std::move(outcome));
}

double TransferReport::throughput() const {
    if (elapsed.count() <= 0) return 0.0;
    return static_cast<double>(bytes_written) * 1000.0 / static_cast<double>(elapsed.count());
}

static std::string humanBytes(double v) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, units[u]);
    return buf;
}

std::string TransferReport::summary() const {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "%zu files copied, %zu failed, %zu skipped; %zu directories created, %zu failed, %zu skipped; ",
                  files_succeeded, files_failed, files_skipped, directories_succeeded, directories_failed,
                  directories_skipped);
    std::string s = buf;
    std::snprintf(buf, sizeof(buf), " in %.1f s (%s/s)", static_cast<double>(elapsed.count()) / 1000.0,
                  humanBytes(throughput()).c_str());
    s += humanBytes(static_cast<double>(bytes_written)) + buf;
    if (cancelled) s += "; cancelled";
    if (aborted) s += "; aborted";
    if (fatal_error) s += "; " + fatal_error->describe();
    if (unparsed_lines) s += "; " + std::to_string(unparsed_lines) + " unparsed listing lines";
    return s;
}

} // namespace tscp
