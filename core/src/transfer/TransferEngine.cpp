#include "tscp/TransferEngine.hpp"
#include "tscp/SyncPlanner.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

namespace tscp {

namespace {

struct Planned {
    TransferTask task;
    RemoteEntry entry;        // source metadata at enumeration time
    std::string skip_reason;  // recorded as Skipped without running
    BridgeError error;        // enumeration failure, recorded as Failed
};

class Batch {
public:
    Batch(HostBridge& src, HostBridge& dst, const TransferOptions& opt, Direction dir, TransferReport& report)
        : src_(src), dst_(dst), opt_(opt), dir_(dir), report_(report) {}

    void enumerate(const RemoteEntry& e, const std::string& dstPath, bool root);
    void run();

private:
    HostBridge& src_;
    HostBridge& dst_;
    const TransferOptions& opt_;
    Direction dir_;
    TransferReport& report_;

    std::vector<Planned> plan_;
    std::vector<std::string> failedDirs_;
    std::uint64_t batchDone_ = 0;
    bool listingLost_ = false;

    bool cancelRequested();
    void record(TransferOutcome o);
    bool underFailedDirectory(const std::string& path) const;
    bool sessionLost(const BridgeError& err) const;
    void emitProgress(const Planned& p, std::size_t index, std::uint64_t done);

    TransferOutcome runDirectory(const Planned& p);
    TransferOutcome runFile(const Planned& p, std::size_t index);
    TransferOutcome abandon(const Planned& p, std::unique_ptr<ReadStream>& in, std::unique_ptr<WriteStream>& out,
                            TransferOutcome o, std::uint64_t done);
    void discardPartial(const std::string& path, TransferOutcome& o, std::uint64_t done);
    void preserveAttributes(const Planned& p, TransferOutcome& o);
};

bool Batch::cancelRequested() {
    if (!report_.cancelled && opt_.should_cancel && opt_.should_cancel()) report_.cancelled = true;
    return report_.cancelled;
}

void Batch::record(TransferOutcome o) {
    if (opt_.on_outcome) opt_.on_outcome(o);
    report_.add(std::move(o));
}

bool Batch::underFailedDirectory(const std::string& path) const {
    for (const auto& d : failedDirs_) {
        if (path.size() > d.size() && path.compare(0, d.size(), d) == 0 && path[d.size()] == '/') return true;
    }
    return false;
}

bool Batch::sessionLost(const BridgeError& err) const {
    return err.kind == ErrorKind::Connection || !src_.isConnected() || !dst_.isConnected();
}

void Batch::emitProgress(const Planned& p, std::size_t index, std::uint64_t done) {
    if (!opt_.progress_callback) return;
    TransferProgress pr;
    pr.path = p.task.source_path;
    pr.file_done = done;
    pr.file_total = p.task.size_bytes;
    pr.batch_done = batchDone_;
    pr.batch_total = report_.bytes_total;
    pr.task_index = index;
    pr.task_count = plan_.size();
    opt_.progress_callback(pr);
}

void Batch::enumerate(const RemoteEntry& e, const std::string& dstPath, bool root) {
    Planned p;
    p.entry = e;
    p.task.source_path = e.path;
    p.task.destination_path = dstPath;
    p.task.direction = dir_;

    if (!e.is_directory) {
        p.task.kind = e.is_symlink ? TaskKind::Symlink : TaskKind::File;
        p.task.size_bytes = e.size.value_or(0);
        if (e.is_symlink && e.symlink_dangling) {
            p.skip_reason = "dangling symlink";
        } else {
            report_.bytes_total += p.task.size_bytes;
        }
        plan_.push_back(std::move(p));
        return;
    }

    p.task.kind = TaskKind::Directory;
    if (e.is_symlink && !root) {
        p.skip_reason = "symlink to directory not followed";
        plan_.push_back(std::move(p));
        return;
    }
    if (!root && !opt_.recursive) {
        p.skip_reason = "not recursive";
        plan_.push_back(std::move(p));
        return;
    }
    if (listingLost_ || cancelRequested()) {
        // recorded at run time as connection lost / cancelled
        plan_.push_back(std::move(p));
        return;
    }

    ListResult listing;
    if (!src_.list(e.path, listing, p.error)) {
        if (sessionLost(p.error)) listingLost_ = true;
        plan_.push_back(std::move(p));
        return;
    }
    report_.unparsed_lines += listing.skipped_lines;
    plan_.push_back(std::move(p));
    for (const auto& child : listing.entries) enumerate(child, joinPath(dstPath, child.name), false);
}

void Batch::run() {
    if (listingLost_) report_.aborted = true;
    for (std::size_t i = 0; i < plan_.size(); ++i) {
        const Planned& p = plan_[i];
        if (p.error) {
            if (sessionLost(p.error) && !report_.fatal_error) report_.fatal_error = p.error;
            if (p.task.kind == TaskKind::Directory) failedDirs_.push_back(p.task.destination_path);
            record(TransferOutcome::failed(p.task, p.error));
            continue;
        }
        if (report_.aborted) {
            record(TransferOutcome::skipped(p.task, "connection lost"));
            continue;
        }
        if (cancelRequested()) {
            record(TransferOutcome::skipped(p.task, "cancelled"));
            continue;
        }
        if (!p.skip_reason.empty()) {
            record(TransferOutcome::skipped(p.task, p.skip_reason));
            continue;
        }
        if (underFailedDirectory(p.task.destination_path)) {
            record(TransferOutcome::skipped(p.task, "parent directory not created"));
            continue;
        }

        TransferOutcome o = p.task.kind == TaskKind::Directory ? runDirectory(p) : runFile(p, i);
        if (o.status == TransferOutcome::Status::Failed && sessionLost(o.error)) {
            report_.aborted = true;
            BridgeError fatal = o.error;
            if (fatal.kind != ErrorKind::Connection) {
                fatal.kind = ErrorKind::Connection;
                fatal.message = "session lost: " + fatal.message;
            }
            report_.fatal_error = fatal;
        }
        record(std::move(o));
    }
}

TransferOutcome Batch::runDirectory(const Planned& p) {
    const std::string& dest = p.task.destination_path;
    // the owner must be able to fill the directory
    const unsigned int mode =
        opt_.preserve_permissions && p.entry.permissions ? ((*p.entry.permissions & 07777) | 0700) : 0755;
    BridgeError err;
    if (dst_.createDirectory(dest, err, mode)) return TransferOutcome::success(p.task, 0);
    if (err.kind == ErrorKind::AlreadyExists) {
        bool isDir = false;
        BridgeError serr;
        if (dst_.isDirectory(dest, isDir, serr) && isDir) return TransferOutcome::skipped(p.task, "directory exists");
        if (serr) err = serr;
        else err.message = "exists and is not a directory";
    }
    failedDirs_.push_back(dest);
    return TransferOutcome::failed(p.task, err);
}

TransferOutcome Batch::runFile(const Planned& p, std::size_t index) {
    const TransferTask& t = p.task;
    BridgeError err;

    RemoteEntry existing;
    if (dst_.stat(t.destination_path, existing, err)) {
        if (existing.is_directory) {
            err.set(ErrorKind::AlreadyExists, t.destination_path, "destination is a directory");
            return TransferOutcome::failed(t, err);
        }
        const auto planned = opt_.planned_actions.find(t.destination_path);
        const SyncAction action = planned != opt_.planned_actions.end()
                                      ? planned->second
                                      : decide(p.entry, &existing, opt_.overwrite_policy, opt_.mtime_tolerance_secs);
        if (action == SyncAction::Skip) {
            const bool identical =
                decide(p.entry, &existing, OverwritePolicy::Always, opt_.mtime_tolerance_secs) == SyncAction::Skip;
            return TransferOutcome::skipped(t, identical ? "up to date" : "exists");
        }
        if (action == SyncAction::Conflict) {
            SyncDecision d;
            d.task = t;
            d.action = action;
            if (!opt_.resolve_conflict || opt_.resolve_conflict(d) != SyncAction::Overwrite)
                return TransferOutcome::skipped(t, "conflict");
        }
    } else if (err.kind != ErrorKind::NotFound) {
        return TransferOutcome::failed(t, err);
    }
    err.clear();

    std::unique_ptr<ReadStream> in = src_.openRead(t.source_path, err);
    if (!in) return TransferOutcome::failed(t, err);
    const std::optional<std::int64_t> mtime = opt_.preserve_times ? p.entry.mtime : std::nullopt;
    std::unique_ptr<WriteStream> out = dst_.openWrite(t.destination_path, false, err, p.entry.size, mtime);
    if (!out) {
        in.reset();
        return TransferOutcome::failed(t, err);
    }

    std::vector<char> buf(std::max<std::size_t>(opt_.buffer_size, 1));
    std::uint64_t done = 0;
    std::uint64_t lastTick = 0;
    emitProgress(p, index, 0);
    for (;;) {
        if (cancelRequested()) return abandon(p, in, out, TransferOutcome::skipped(t, "cancelled"), done);
        std::size_t got = 0;
        if (!in->read(buf.data(), buf.size(), got, err))
            return abandon(p, in, out, TransferOutcome::failed(t, err), done);
        if (got == 0) break;
        if (!out->write(buf.data(), got, err)) return abandon(p, in, out, TransferOutcome::failed(t, err), done);
        done += got;
        batchDone_ += got;
        if (done - lastTick >= opt_.progress_interval_bytes) {
            emitProgress(p, index, done);
            lastTick = done;
        }
    }
    if (!in->finish(err)) return abandon(p, in, out, TransferOutcome::failed(t, err), done);
    in.reset();
    if (!out->finish(err)) {
        out.reset();
        TransferOutcome o = TransferOutcome::failed(t, err);
        discardPartial(t.destination_path, o, done);
        return o;
    }
    out.reset();
    if (done != lastTick) emitProgress(p, index, done);

    TransferOutcome o = TransferOutcome::success(t, done);
    preserveAttributes(p, o);
    return o;
}

TransferOutcome Batch::abandon(const Planned& p, std::unique_ptr<ReadStream>& in, std::unique_ptr<WriteStream>& out,
                               TransferOutcome o, std::uint64_t done) {
    // both exchanges end before the destination is touched again
    out->abort();
    out.reset();
    in.reset();
    discardPartial(p.task.destination_path, o, done);
    return o;
}

void Batch::discardPartial(const std::string& path, TransferOutcome& o, std::uint64_t done) {
    BridgeError err;
    if (!dst_.isConnected()) {
        err.set(ErrorKind::Connection, path, "not connected");
    } else if (dst_.removeFile(path, err) || err.kind == ErrorKind::NotFound) {
        return;
    }
    o.partial_destination = true;
    o.bytes_written = done;
    o.warnings.push_back("partial file left behind: " + err.describe());
}

void Batch::preserveAttributes(const Planned& p, TransferOutcome& o) {
    const std::string& dest = p.task.destination_path;
    BridgeError err;
    if (opt_.preserve_permissions && p.entry.permissions &&
        !dst_.setPermissions(dest, *p.entry.permissions & 07777, err)) {
        o.warnings.push_back("permissions not applied: " + err.describe());
    }
    err.clear();
    if (opt_.preserve_times && p.entry.mtime && !dst_.setTimes(dest, *p.entry.mtime, err)) {
        o.warnings.push_back("modification time not applied: " + err.describe());
    }
}

} // namespace

TransferReport transfer(HostBridge& source,
                        const std::string& source_root,
                        HostBridge& destination,
                        const std::string& destination_root,
                        const TransferOptions& options) {
    TransferReport report;
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&]() {
        report.elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        return report;
    };
    auto fatal = [&](ErrorKind kind, const std::string& path, const std::string& msg) {
        BridgeError e;
        e.set(kind, path, msg);
        report.fatal_error = e;
        return finish();
    };

    if (!source.isLocal() && !destination.isLocal())
        return fatal(ErrorKind::Protocol, source_root, "remote-to-remote transfers are not supported");
    const Direction dir =
        source.isLocal() ? (destination.isLocal() ? Direction::LocalCopy : Direction::Upload) : Direction::Download;

    BridgeLease sourceLease(source);
    std::unique_ptr<BridgeLease> destinationLease;
    if (&destination != &source) destinationLease = std::make_unique<BridgeLease>(destination);
    if (!sourceLease.owned() || (destinationLease && !destinationLease->owned()))
        return fatal(ErrorKind::Protocol, source_root, "session busy");
    if (!source.isConnected()) return fatal(ErrorKind::Connection, source_root, "source not connected");
    if (!destination.isConnected())
        return fatal(ErrorKind::Connection, destination_root, "destination not connected");

    RemoteEntry root;
    BridgeError err;
    if (!source.stat(source_root, root, err)) {
        report.aborted = err.kind == ErrorKind::Connection;
        report.fatal_error = err;
        return finish();
    }

    Batch batch(source, destination, options, dir, report);
    batch.enumerate(root, destination_root, true);
    batch.run();
    return finish();
}

} // namespace tscp
