// Value types shared by the transfer engine, the sync planner and the front
// end: tasks, per-task outcomes, the batch report and the transfer options.
#pragma once
#include "HostTypes.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tscp {

enum class Direction { Upload, Download, LocalCopy };
enum class TaskKind { File, Directory, Symlink };

const char* toString(Direction d);
const char* toString(TaskKind k);

// One unit of work, fixed once enumerated.
struct TransferTask {
    std::string source_path;
    std::string destination_path;
    Direction direction = Direction::Upload;
    std::uint64_t size_bytes = 0;
    TaskKind kind = TaskKind::File;
};

enum class OverwritePolicy { NewerWins, Always, Never, PromptOnConflict };
enum class SyncAction { Copy, Overwrite, Skip, Conflict };

const char* toString(OverwritePolicy p);
const char* toString(SyncAction a);
// "newer", "always", "never", "prompt"
bool parseOverwritePolicy(const std::string& s, OverwritePolicy& out);

struct SyncDecision {
    TransferTask task;
    SyncAction action = SyncAction::Copy;
};

struct TransferOutcome {
    enum class Status { Success, Skipped, Failed };

    TransferTask task;
    Status status = Status::Success;
    std::uint64_t bytes_written = 0;
    std::string reason;  // Skipped
    BridgeError error;   // Failed
    // A partially written destination file could not be removed.
    bool partial_destination = false;
    std::vector<std::string> warnings;

    static TransferOutcome success(const TransferTask& t, std::uint64_t bytes);
    static TransferOutcome skipped(const TransferTask& t, std::string reason);
    static TransferOutcome failed(const TransferTask& t, BridgeError err);
};

const char* toString(TransferOutcome::Status s);

// Ordered record of a batch: one outcome per enumerated task.
struct TransferReport {
    std::vector<TransferOutcome> outcomes;

    std::size_t files_succeeded = 0;
    std::size_t files_failed = 0;
    std::size_t files_skipped = 0;
    std::size_t directories_succeeded = 0;
    std::size_t directories_failed = 0;
    std::size_t directories_skipped = 0;
    std::uint64_t bytes_written = 0;
    std::uint64_t bytes_total = 0;
    // Listing lines the backends could not parse during enumeration.
    std::size_t unparsed_lines = 0;

    bool cancelled = false;
    bool aborted = false;  // a Connection error stopped the batch
    std::optional<BridgeError> fatal_error;
    std::chrono::milliseconds elapsed{0};

    void add(TransferOutcome outcome);
    std::size_t failures() const { return files_failed + directories_failed; }
    bool ok() const { return failures() == 0 && !fatal_error; }
    // bytes per second over the whole batch
    double throughput() const;
    std::string summary() const;
};

struct TransferProgress {
    std::string path;  // source path of the current file
    std::uint64_t file_done = 0;
    std::uint64_t file_total = 0;
    std::uint64_t batch_done = 0;
    std::uint64_t batch_total = 0;
    std::size_t task_index = 0;
    std::size_t task_count = 0;
};

struct TransferOptions {
    bool recursive = true;
    OverwritePolicy overwrite_policy = OverwritePolicy::NewerWins;
    std::function<void(const TransferProgress&)> progress_callback;

    std::size_t buffer_size = 64 * 1024;
    std::uint64_t progress_interval_bytes = 256 * 1024;
    // Cooperative cancellation, polled between tasks and between chunks.
    std::function<bool()> should_cancel;
    // Called once per recorded outcome, in report order.
    std::function<void(const TransferOutcome&)> on_outcome;
    // Decides a Conflict: Overwrite proceeds, anything else skips. Without
    // it conflicts are Skipped("conflict").
    std::function<SyncAction(const SyncDecision&)> resolve_conflict;
    // Modification times closer than this are considered equal.
    std::int64_t mtime_tolerance_secs = 0;
    // Actions decided ahead of the run (a sync plan), keyed by destination
    // path. Files listed here follow the planned action instead of being
    // compared with the destination again.
    std::map<std::string, SyncAction> planned_actions;

    bool preserve_permissions = true;
    bool preserve_times = true;
};

} // namespace tscp
