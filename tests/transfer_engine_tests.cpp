// Transfer engine tests over in-memory bridges (run via CTest).
#include "tscp/MockHostBridge.hpp"
#include "tscp/SyncPlanner.hpp"
#include "tscp/TransferEngine.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

using Status = tscp::TransferOutcome::Status;
using Op = tscp::MockHostBridge::Op;

struct Fixture {
    tscp::MockHostBridge local{tscp::Protocol::Local, true};
    tscp::MockHostBridge remote{tscp::Protocol::Sftp, false};

    Fixture() {
        tscp::BridgeError err;
        tscp::HostConfig cfg;
        local.connect(cfg, err);
        cfg.host = "example.test";
        cfg.username = "alice";
        remote.connect(cfg, err);
    }
};

std::size_t countFiles(const tscp::TransferReport &r, Status s) {
    std::size_t n = 0;
    for (const auto &o : r.outcomes) {
        if (o.task.kind != tscp::TaskKind::Directory && o.status == s) ++n;
    }
    return n;
}

std::size_t fileOutcomes(const tscp::TransferReport &r) {
    std::size_t n = 0;
    for (const auto &o : r.outcomes) {
        if (o.task.kind != tscp::TaskKind::Directory) ++n;
    }
    return n;
}

const tscp::TransferOutcome *outcomeFor(const tscp::TransferReport &r, const std::string &dst) {
    for (const auto &o : r.outcomes) {
        if (o.task.destination_path == dst) return &o;
    }
    return nullptr;
}

std::string pseudoRandom(std::size_t n, unsigned seed) {
    std::string s(n, '\0');
    unsigned x = seed;
    for (std::size_t i = 0; i < n; ++i) {
        x = x * 1103515245u + 12345u;
        s[i] = static_cast<char>((x >> 16) & 0xff);
    }
    return s;
}

void test_upload_tree(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "hello", 10, 0600);
    f.local.addFile("/src/sub/b.bin", pseudoRandom(5000, 1), 20);
    f.local.addFile("/src/sub/deeper/c.txt", "c", 30);

    std::vector<std::string> order;
    tscp::TransferOptions opt;
    opt.on_outcome = [&order](const tscp::TransferOutcome &o) { order.push_back(o.task.destination_path); };
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);

    t.check(r.ok(), "upload should succeed: " + r.summary());
    t.check(r.outcomes.size() == 6, "six tasks (3 dirs, 3 files)");
    t.check(order.size() == r.outcomes.size(), "on_outcome called once per outcome");
    t.check(r.files_succeeded == 3 && r.directories_succeeded == 3, "counters");
    t.check(r.bytes_written == 5 + 5000 + 1, "bytes written");
    t.check(r.bytes_total == 5 + 5000 + 1, "bytes total");
    t.check(!r.outcomes.empty() && r.outcomes.front().task.destination_path == "/dst",
            "root directory comes first");
    t.check(!r.outcomes.empty() && r.outcomes.front().task.direction == tscp::Direction::Upload,
            "local to remote is an upload");
    // every directory precedes its children
    for (std::size_t i = 0; i < r.outcomes.size(); ++i) {
        const std::string parent = tscp::parentPath(r.outcomes[i].task.destination_path);
        for (std::size_t j = i + 1; j < r.outcomes.size(); ++j) {
            t.check(r.outcomes[j].task.destination_path != parent,
                    "parent " + parent + " created after its child");
        }
    }
    t.check(f.remote.fileContent("/dst/sub/b.bin") == f.local.fileContent("/src/sub/b.bin"),
            "binary content copied");
    t.check(f.remote.modeOf("/dst/a.txt") == std::optional<std::uint32_t>(0600), "permissions preserved");
    t.check(f.remote.mtimeOf("/dst/sub/deeper/c.txt") == std::optional<std::int64_t>(30), "mtime preserved");
}

void test_never_policy_is_idempotent(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "hello", 10);
    f.local.addFile("/src/sub/b.txt", "world", 20);
    tscp::TransferOptions opt;
    const auto first = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(first.ok(), "first run succeeds");

    opt.overwrite_policy = tscp::OverwritePolicy::Never;
    const auto second = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(second.outcomes.size() == first.outcomes.size(), "same task count on second run");
    bool allSkipped = true;
    for (const auto &o : second.outcomes) allSkipped = allSkipped && o.status == Status::Skipped;
    t.check(allSkipped, "every task skipped on an already synced destination");
    t.check(second.bytes_written == 0, "nothing written on second run");
    const auto *dir = outcomeFor(second, "/dst");
    t.check(dir && dir->reason == "directory exists", "existing directory reported as present");
}

void test_partial_failure_continues(TestContext &t) {
    Fixture f;
    for (int i = 1; i <= 5; ++i) f.local.addFile("/src/f" + std::to_string(i) + ".bin", pseudoRandom(4096, i), i);
    f.local.failReadAfter("/src/f3.bin", 1000, tscp::ErrorKind::Io);

    tscp::TransferOptions opt;
    opt.buffer_size = 512;
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(fileOutcomes(r) == 5, "exactly N file outcomes");
    t.check(countFiles(r, Status::Failed) == 1, "exactly one failure");
    t.check(countFiles(r, Status::Success) == 4, "others copied");
    t.check(!r.aborted && !r.fatal_error, "batch not aborted for an Io failure");
    const auto *failed = outcomeFor(r, "/dst/f3.bin");
    t.check(failed && failed->status == Status::Failed && failed->error.kind == tscp::ErrorKind::Io,
            "failed outcome carries the Io error");
    t.check(failed && !failed->partial_destination, "partial file was removed");
    t.check(!f.remote.exists("/dst/f3.bin"), "no truncated file left behind");
    t.check(f.remote.fileContent("/dst/f5.bin") == f.local.fileContent("/src/f5.bin"), "later file copied");
}

void test_connection_failure_aborts(TestContext &t) {
    Fixture f;
    for (int i = 1; i <= 4; ++i) f.local.addFile("/src/f" + std::to_string(i) + ".txt", "data", i);
    f.remote.failWriteAfter("/dst/f2.txt", 2, tscp::ErrorKind::Connection);

    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    t.check(fileOutcomes(r) == 4, "every file accounted for");
    t.check(countFiles(r, Status::Success) == 1, "file before the drop copied");
    t.check(countFiles(r, Status::Failed) == 1, "one failure");
    t.check(countFiles(r, Status::Skipped) == 2, "remainder skipped");
    t.check(r.aborted, "batch aborted");
    t.check(r.fatal_error && r.fatal_error->kind == tscp::ErrorKind::Connection, "fatal connection error");
    const auto *failed = outcomeFor(r, "/dst/f2.txt");
    t.check(failed && failed->partial_destination, "unreachable partial file is flagged");
    const auto *rest = outcomeFor(r, "/dst/f4.txt");
    t.check(rest && rest->reason == "connection lost", "skipped reason names the cause");
}

void test_cancel_between_files(TestContext &t) {
    Fixture f;
    for (int i = 1; i <= 5; ++i) f.local.addFile("/src/f" + std::to_string(i) + ".txt", "x", i);
    std::size_t done = 0;
    tscp::TransferOptions opt;
    opt.on_outcome = [&done](const tscp::TransferOutcome &o) {
        if (o.task.kind == tscp::TaskKind::File && o.status == Status::Success) ++done;
    };
    opt.should_cancel = [&done] { return done >= 2; };
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(r.cancelled, "report marked cancelled");
    t.check(countFiles(r, Status::Success) == 2, "exactly K successes");
    t.check(countFiles(r, Status::Skipped) == 3, "N-K skipped, none omitted");
    for (const auto &o : r.outcomes) {
        if (o.status == Status::Skipped) t.check(o.reason == "cancelled", "skip reason is cancelled");
    }
}

void test_cancel_mid_file_removes_partial(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/big.bin", pseudoRandom(64 * 1024, 7), 1);
    bool stop = false;
    tscp::TransferOptions opt;
    opt.buffer_size = 1024;
    opt.progress_interval_bytes = 1024;
    opt.progress_callback = [&stop](const tscp::TransferProgress &p) {
        if (p.file_done >= 8 * 1024) stop = true;
    };
    opt.should_cancel = [&stop] { return stop; };
    const auto r = tscp::transfer(f.local, "/src/big.bin", f.remote, "/big.bin", opt);
    t.check(r.outcomes.size() == 1, "single task");
    t.check(!r.outcomes.empty() && r.outcomes[0].status == Status::Skipped &&
                r.outcomes[0].reason == "cancelled",
            "cancelled file is Skipped(cancelled)");
    t.check(!f.remote.exists("/big.bin"), "partial destination removed");
    t.check(r.bytes_written == 0, "removed partial does not count as written");
}

void test_partial_left_is_flagged(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/x.bin", pseudoRandom(100, 3), 1);
    f.local.failReadAfter("/src/x.bin", 30, tscp::ErrorKind::Io);
    f.remote.failOn(Op::RemoveFile, "/x.bin", tscp::ErrorKind::Permission);
    tscp::TransferOptions opt;
    opt.buffer_size = 10;
    const auto r = tscp::transfer(f.local, "/src/x.bin", f.remote, "/x.bin", opt);
    t.check(r.outcomes.size() == 1 && r.outcomes[0].partial_destination, "partial destination flagged");
    t.check(!r.outcomes.empty() && !r.outcomes[0].warnings.empty(), "warning explains the leftover");
    t.check(f.remote.fileContent("/x.bin") && f.remote.fileContent("/x.bin")->size() == 30,
            "partial file is discoverable");
}

void test_session_busy(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "a", 1);
    tscp::BridgeLease held(f.remote);
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    t.check(r.outcomes.empty(), "busy session yields an empty report");
    t.check(r.fatal_error && r.fatal_error->kind == tscp::ErrorKind::Protocol, "busy is a Protocol error");
    t.checkContains(r.fatal_error ? r.fatal_error->message : "", "busy", "message says busy");
    t.check(!f.remote.exists("/dst"), "nothing touched");
}

void test_remote_to_remote_rejected(TestContext &t) {
    Fixture f;
    tscp::MockHostBridge other;
    const auto r = tscp::transfer(f.remote, "/", other, "/", tscp::TransferOptions{});
    t.check(r.fatal_error && r.fatal_error->kind == tscp::ErrorKind::Protocol, "remote to remote rejected");
    t.check(r.outcomes.empty(), "no tasks");
}

void test_download_direction_and_single_file(TestContext &t) {
    Fixture f;
    f.remote.addFile("/srv/report.pdf", pseudoRandom(777, 9), 55);
    f.local.addDirectory("/home");
    const auto r = tscp::transfer(f.remote, "/srv/report.pdf", f.local, "/home/report.pdf", tscp::TransferOptions{});
    t.check(r.ok() && r.outcomes.size() == 1, "single file download");
    t.check(!r.outcomes.empty() && r.outcomes[0].task.direction == tscp::Direction::Download, "download direction");
    t.check(f.local.fileContent("/home/report.pdf") == f.remote.fileContent("/srv/report.pdf"), "content");
}

void test_symlinks(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/real.txt", "payload", 5);
    f.local.addSymlink("/src/link.txt", "real.txt");
    f.local.addFile("/src/sub/inner.txt", "inner", 5);
    f.local.addSymlink("/src/dirlink", "sub");
    f.local.addSymlink("/src/broken", "/nowhere");
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    const auto *link = outcomeFor(r, "/dst/link.txt");
    t.check(link && link->status == Status::Success && link->task.kind == tscp::TaskKind::Symlink,
            "symlink to file copied");
    t.check(f.remote.fileContent("/dst/link.txt") == std::optional<std::string>("payload"),
            "symlink copied as target content");
    const auto *dirlink = outcomeFor(r, "/dst/dirlink");
    t.check(dirlink && dirlink->status == Status::Skipped, "symlink to directory skipped");
    t.check(!f.remote.exists("/dst/dirlink"), "symlinked directory not followed");
    const auto *broken = outcomeFor(r, "/dst/broken");
    t.check(broken && broken->status == Status::Skipped && broken->reason == "dangling symlink",
            "dangling symlink skipped");
    t.check(f.remote.exists("/dst/sub/inner.txt"), "real directory still copied");
}

void test_non_recursive(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "a", 1);
    f.local.addFile("/src/sub/b.txt", "b", 1);
    tscp::TransferOptions opt;
    opt.recursive = false;
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(f.remote.exists("/dst/a.txt"), "direct file copied");
    const auto *sub = outcomeFor(r, "/dst/sub");
    t.check(sub && sub->status == Status::Skipped && sub->reason == "not recursive", "sub-directory skipped");
    t.check(!f.remote.exists("/dst/sub"), "sub-directory not created");
}

void test_conflicts(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "local", 10);
    f.remote.addFile("/dst/a.txt", "newer", 12);

    auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    const auto *a = outcomeFor(r, "/dst/a.txt");
    t.check(a && a->status == Status::Skipped && a->reason == "conflict", "unresolved conflict is skipped");
    t.check(f.remote.fileContent("/dst/a.txt") == std::optional<std::string>("newer"), "destination untouched");

    int asked = 0;
    tscp::TransferOptions opt;
    opt.resolve_conflict = [&asked](const tscp::SyncDecision &d) {
        ++asked;
        return d.task.destination_path == "/dst/a.txt" ? tscp::SyncAction::Overwrite : tscp::SyncAction::Skip;
    };
    r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(asked == 1, "resolver consulted once");
    a = outcomeFor(r, "/dst/a.txt");
    t.check(a && a->status == Status::Success, "resolved conflict overwrites");
    t.check(f.remote.fileContent("/dst/a.txt") == std::optional<std::string>("local"), "overwritten");

    // destination older: NewerWins overwrites without asking
    f.remote.addFile("/dst/a.txt", "older", 8);
    asked = 0;
    r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(asked == 0, "no conflict when source is newer");
    t.check(f.remote.fileContent("/dst/a.txt") == std::optional<std::string>("local"), "newer source wins");
}

void test_follows_sync_plan(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/new.txt", "new", 10);
    f.local.addFile("/src/stale.txt", "fresh", 20);
    f.local.addFile("/src/same.txt", "same", 5);
    f.remote.addFile("/dst/stale.txt", "stale", 10);
    f.remote.addFile("/dst/same.txt", "same", 5);

    tscp::TreeSnapshot source, destination;
    tscp::BridgeError err;
    t.check(tscp::snapshotTree(f.local, "/src", true, source, err), "source snapshot");
    t.check(tscp::snapshotTree(f.remote, "/dst", true, destination, err), "destination snapshot");
    const tscp::SyncPlan plan = tscp::planSync(source, destination, tscp::SyncOptions{});
    t.check(plan.count(tscp::SyncAction::Copy) == 1 && plan.count(tscp::SyncAction::Overwrite) == 1 &&
                plan.count(tscp::SyncAction::Skip) == 1,
            "plan: one copy, one overwrite, one skip");

    tscp::TransferOptions opt;
    for (const auto &d : plan.decisions) {
        if (d.task.kind != tscp::TaskKind::Directory) opt.planned_actions[d.task.destination_path] = d.action;
    }
    // the destination changes after planning: the plan still decides
    f.remote.addFile("/dst/stale.txt", "touched", 30);
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", opt);
    t.check(r.files_succeeded == plan.count(tscp::SyncAction::Copy) + plan.count(tscp::SyncAction::Overwrite),
            "engine counts match the plan: " + r.summary());
    t.check(r.files_skipped == plan.count(tscp::SyncAction::Skip), "skips match the plan");
    t.check(f.remote.fileContent("/dst/stale.txt") == std::optional<std::string>("fresh"),
            "planned overwrite carried out");
    t.check(f.remote.fileContent("/dst/new.txt") == std::optional<std::string>("new"), "planned copy carried out");
    const auto *same = outcomeFor(r, "/dst/same.txt");
    t.check(same && same->status == Status::Skipped && same->reason == "up to date", "planned skip");
}

void test_directory_creation_failure(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/sub/a.txt", "a", 1);
    f.local.addFile("/src/ok.txt", "ok", 1);
    f.remote.failOn(Op::CreateDirectory, "/dst/sub", tscp::ErrorKind::Permission);
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    const auto *sub = outcomeFor(r, "/dst/sub");
    t.check(sub && sub->status == Status::Failed && sub->error.kind == tscp::ErrorKind::Permission,
            "directory failure recorded");
    const auto *child = outcomeFor(r, "/dst/sub/a.txt");
    t.check(child && child->status == Status::Skipped && child->reason == "parent directory not created",
            "children of a failed directory are skipped");
    t.check(f.remote.exists("/dst/ok.txt"), "siblings still copied");
    t.check(r.directories_failed == 1 && !r.ok(), "report not ok");

    Fixture g;
    g.local.addFile("/src/a.txt", "a", 1);
    g.remote.addFile("/dst", "i am a file", 1);
    const auto r2 = tscp::transfer(g.local, "/src", g.remote, "/dst", tscp::TransferOptions{});
    const auto *root = outcomeFor(r2, "/dst");
    t.check(root && root->status == Status::Failed && root->error.kind == tscp::ErrorKind::AlreadyExists,
            "file in place of the destination directory fails");
}

void test_listing_failure_is_local(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/locked/secret.txt", "s", 1);
    f.local.addFile("/src/open.txt", "o", 1);
    f.local.failOn(Op::List, "/src/locked", tscp::ErrorKind::Permission);
    const auto r = tscp::transfer(f.local, "/src", f.remote, "/dst", tscp::TransferOptions{});
    const auto *locked = outcomeFor(r, "/dst/locked");
    t.check(locked && locked->status == Status::Failed, "unlistable directory fails");
    t.check(f.remote.exists("/dst/open.txt"), "rest of the batch continues");
    t.check(!r.aborted, "permission failure does not abort");
}

void test_attribute_warnings(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.txt", "a", 42);
    f.remote.failOn(Op::SetTimes, "/a.txt", tscp::ErrorKind::Protocol, "MFMT not supported");
    const auto r = tscp::transfer(f.local, "/src/a.txt", f.remote, "/a.txt", tscp::TransferOptions{});
    t.check(r.ok(), "attribute failure does not fail the copy");
    t.check(!r.outcomes.empty() && r.outcomes[0].warnings.size() == 1, "one warning");
    t.checkContains(r.outcomes.empty() || r.outcomes[0].warnings.empty() ? "" : r.outcomes[0].warnings[0],
                    "modification time", "warning names the attribute");
}

void test_progress_cadence(TestContext &t) {
    Fixture f;
    f.local.addFile("/src/a.bin", pseudoRandom(16 * 1024, 5), 1);
    std::vector<tscp::TransferProgress> events;
    tscp::TransferOptions opt;
    opt.buffer_size = 1024;
    opt.progress_interval_bytes = 4 * 1024;
    opt.progress_callback = [&events](const tscp::TransferProgress &p) { events.push_back(p); };
    tscp::transfer(f.local, "/src/a.bin", f.remote, "/a.bin", opt);
    t.check(events.size() == 5, "start event plus one per interval");
    for (std::size_t i = 1; i < events.size(); ++i)
        t.check(events[i].file_done > events[i - 1].file_done, "progress is monotonic");
    t.check(!events.empty() && events.back().file_done == 16 * 1024, "last event at end of file");
    t.check(!events.empty() && events.back().batch_total == 16 * 1024, "batch total known up front");
}

void test_round_trip_binary(TestContext &t) {
    Fixture f;
    const std::string big = pseudoRandom(3 * 1024 * 1024, 11);
    std::string zeros(1000, '\0');
    f.local.addFile("/up/big.bin", big, 1);
    f.local.addFile("/up/empty.bin", "", 1);
    f.local.addFile("/up/zeros.bin", zeros, 1);
    const auto up = tscp::transfer(f.local, "/up", f.remote, "/remote", tscp::TransferOptions{});
    t.check(up.ok(), "upload ok");
    const auto down = tscp::transfer(f.remote, "/remote", f.local, "/down", tscp::TransferOptions{});
    t.check(down.ok(), "download ok");
    t.check(f.local.fileContent("/down/big.bin") == std::optional<std::string>(big), "multi-megabyte file intact");
    t.check(f.local.fileContent("/down/empty.bin") == std::optional<std::string>(""), "zero-byte file intact");
    t.check(f.local.fileContent("/down/zeros.bin") == std::optional<std::string>(zeros), "NUL bytes intact");
}

void test_missing_source_root(TestContext &t) {
    Fixture f;
    const auto r = tscp::transfer(f.local, "/nope", f.remote, "/dst", tscp::TransferOptions{});
    t.check(r.outcomes.empty(), "nothing enumerated");
    t.check(r.fatal_error && r.fatal_error->kind == tscp::ErrorKind::NotFound, "missing root is NotFound");
}

void test_report_summary(TestContext &t) {
    tscp::TransferReport r;
    tscp::TransferTask file;
    file.destination_path = "/a";
    r.add(tscp::TransferOutcome::success(file, 2048));
    tscp::BridgeError e;
    e.set(tscp::ErrorKind::Io, "/b", "boom");
    r.add(tscp::TransferOutcome::failed(file, e));
    tscp::TransferTask dir;
    dir.kind = tscp::TaskKind::Directory;
    r.add(tscp::TransferOutcome::skipped(dir, "directory exists"));
    t.check(r.files_succeeded == 1 && r.files_failed == 1 && r.directories_skipped == 1, "counters by kind");
    t.check(r.failures() == 1 && !r.ok(), "failures make the report not ok");
    t.checkContains(r.summary(), "1 files copied, 1 failed", "summary lists file counters");
    t.checkContains(r.summary(), "2.0 KiB", "summary shows human bytes");
}

} // namespace

int main() {
    TestContext t;
    test_upload_tree(t);
    test_never_policy_is_idempotent(t);
    test_partial_failure_continues(t);
    test_connection_failure_aborts(t);
    test_cancel_between_files(t);
    test_cancel_mid_file_removes_partial(t);
    test_partial_left_is_flagged(t);
    test_session_busy(t);
    test_remote_to_remote_rejected(t);
    test_download_direction_and_single_file(t);
    test_symlinks(t);
    test_non_recursive(t);
    test_conflicts(t);
    test_follows_sync_plan(t);
    test_directory_creation_failure(t);
    test_listing_failure_is_local(t);
    test_attribute_warnings(t);
    test_progress_cadence(t);
    test_round_trip_binary(t);
    test_missing_source_root(t);
    test_report_summary(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] tscp_transfer_engine_tests\n";
    return EXIT_SUCCESS;
}
