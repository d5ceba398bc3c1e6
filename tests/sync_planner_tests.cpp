// Sync planner tests: per-entry decisions and tree comparison over mocks.
#include "tscp/MockHostBridge.hpp"
#include "tscp/SyncPlanner.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

using tscp::OverwritePolicy;
using tscp::SyncAction;

tscp::RemoteEntry file(const std::string &name, std::optional<std::int64_t> mtime,
                       std::optional<std::uint64_t> size) {
    tscp::RemoteEntry e;
    e.name = name;
    e.path = "/" + name;
    e.mtime = mtime;
    e.size = size;
    return e;
}

tscp::RemoteEntry dir(const std::string &name) {
    tscp::RemoteEntry e;
    e.name = name;
    e.path = "/" + name;
    e.is_directory = true;
    e.mtime = 1;
    return e;
}

void test_newer_wins_scenario(TestContext &t) {
    const auto src = file("a.txt", 10, 5);
    const auto older = file("a.txt", 8, 5);
    const auto newer = file("a.txt", 12, 5);
    t.check(tscp::decide(src, &older, OverwritePolicy::NewerWins) == SyncAction::Overwrite,
            "newer source overwrites");
    t.check(tscp::decide(src, &newer, OverwritePolicy::NewerWins) == SyncAction::Conflict,
            "newer destination is a conflict");
    t.check(tscp::decide(src, nullptr, OverwritePolicy::NewerWins) == SyncAction::Copy, "absent destination");

    const auto sameTimeOtherSize = file("a.txt", 10, 7);
    t.check(tscp::decide(src, &sameTimeOtherSize, OverwritePolicy::NewerWins) == SyncAction::Overwrite,
            "size difference alone overwrites");
}

void test_policies(TestContext &t) {
    const auto src = file("a.txt", 10, 5);
    const auto older = file("a.txt", 8, 5);
    const auto newer = file("a.txt", 12, 5);
    const auto same = file("a.txt", 10, 5);

    t.check(tscp::decide(src, &newer, OverwritePolicy::Always) == SyncAction::Overwrite, "always overwrites");
    t.check(tscp::decide(src, &older, OverwritePolicy::Never) == SyncAction::Skip, "never skips");
    t.check(tscp::decide(src, nullptr, OverwritePolicy::Never) == SyncAction::Copy, "never still copies new files");
    t.check(tscp::decide(src, &older, OverwritePolicy::PromptOnConflict) == SyncAction::Conflict,
            "prompt hands every difference back");

    for (auto p : {OverwritePolicy::NewerWins, OverwritePolicy::Always, OverwritePolicy::Never,
                   OverwritePolicy::PromptOnConflict}) {
        t.check(tscp::decide(src, &same, p) == SyncAction::Skip,
                std::string("identical entries skip under ") + tscp::toString(p));
    }
}

void test_unknown_metadata(TestContext &t) {
    const auto src = file("a.txt", 10, 5);
    const auto noTime = file("a.txt", std::nullopt, 5);
    const auto noSize = file("a.txt", 10, std::nullopt);
    t.check(tscp::decide(src, &noTime, OverwritePolicy::NewerWins) == SyncAction::Conflict,
            "unknown time cannot be ordered");
    t.check(tscp::decide(src, &noTime, OverwritePolicy::Always) == SyncAction::Overwrite,
            "always ignores unknown time");
    t.check(tscp::decide(src, &noSize, OverwritePolicy::NewerWins) == SyncAction::Skip,
            "same time with unknown size counts as identical");
}

void test_tolerance(TestContext &t) {
    const auto src = file("a.txt", 10, 5);
    const auto slightlyNewer = file("a.txt", 12, 5);
    const auto slightlyOlder = file("a.txt", 8, 5);
    const auto newerOtherSize = file("a.txt", 12, 9);
    t.check(tscp::decide(src, &slightlyNewer, OverwritePolicy::NewerWins, 2) == SyncAction::Skip,
            "within tolerance is identical");
    t.check(tscp::decide(src, &slightlyOlder, OverwritePolicy::NewerWins, 2) == SyncAction::Skip,
            "tolerance applies in both directions");
    t.check(tscp::decide(src, &newerOtherSize, OverwritePolicy::NewerWins, 2) == SyncAction::Overwrite,
            "within tolerance the destination is not newer");
    t.check(tscp::decide(src, &slightlyNewer, OverwritePolicy::NewerWins, 1) == SyncAction::Conflict,
            "outside tolerance the destination is newer");
}

void test_type_mismatch(TestContext &t) {
    const auto f = file("x", 10, 5);
    const auto d = dir("x");
    t.check(tscp::decide(f, &d, OverwritePolicy::Always) == SyncAction::Conflict, "file over directory");
    t.check(tscp::decide(d, &f, OverwritePolicy::Always) == SyncAction::Conflict, "directory over file");
    t.check(tscp::decide(d, &d, OverwritePolicy::Always) == SyncAction::Skip, "directories merge");
    t.check(tscp::decide(d, nullptr, OverwritePolicy::Never) == SyncAction::Copy, "missing directory is created");
}

void connect(tscp::MockHostBridge &b) {
    tscp::HostConfig cfg;
    cfg.host = "example.test";
    cfg.username = "alice";
    tscp::BridgeError err;
    b.connect(cfg, err);
}

void test_snapshot(TestContext &t) {
    tscp::MockHostBridge b;
    b.addFile("/site/index.html", "<html>", 10);
    b.addFile("/site/css/main.css", "body{}", 20);
    b.addDirectory("/site/empty", 5);
    b.addDirectory("/elsewhere/deep", 5);
    b.addFile("/elsewhere/deep/hidden.txt", "x", 5);
    b.addSymlink("/site/link", "/elsewhere");
    connect(b);

    tscp::TreeSnapshot snap;
    tscp::BridgeError err;
    t.check(tscp::snapshotTree(b, "/site", true, snap, err), "recursive snapshot");
    t.check(snap.root == "/site", "snapshot root");
    t.check(snap.entries.count("css/main.css") == 1, "nested file keyed by relative path");
    t.check(snap.entries.count("empty") == 1 && snap.entries.at("empty").is_directory, "empty directory recorded");
    t.check(snap.entries.count("link") == 1, "symlink recorded");
    t.check(snap.entries.count("link/deep") == 0, "symlinked directory not descended into");
    t.check(snap.order.size() == snap.entries.size(), "order lists every entry once");
    if (!snap.order.empty()) t.check(snap.order.front() == "css", "directories come first");
    bool parentFirst = false;
    for (std::size_t i = 0; i + 1 < snap.order.size(); ++i) {
        if (snap.order[i] == "css" && snap.order[i + 1] == "css/main.css") parentFirst = true;
    }
    t.check(parentFirst, "pre-order: a directory precedes its contents");

    tscp::TreeSnapshot flat;
    t.check(tscp::snapshotTree(b, "/site", false, flat, err), "flat snapshot");
    t.check(flat.entries.count("css") == 1 && flat.entries.count("css/main.css") == 0,
            "non-recursive snapshot stays at the top level");

    tscp::TreeSnapshot missing;
    t.check(!tscp::snapshotTree(b, "/nope", true, missing, err), "missing root fails");
    t.check(err.kind == tscp::ErrorKind::NotFound, "missing root reports NotFound");

    b.failOn(tscp::MockHostBridge::Op::List, "/site/css", tscp::ErrorKind::Permission);
    tscp::TreeSnapshot denied;
    t.check(!tscp::snapshotTree(b, "/site", true, denied, err), "listing failure aborts the snapshot");
    t.check(err.kind == tscp::ErrorKind::Permission && err.path == "/site/css", "failure names the directory");
}

void test_plan(TestContext &t) {
    tscp::MockHostBridge local(tscp::Protocol::Local, true);
    tscp::MockHostBridge remote;
    local.addFile("/src/a.txt", "aaaaa", 10);
    local.addFile("/src/b.txt", "bbbbb", 10);
    local.addFile("/src/c.txt", "ccccc", 10);
    local.addFile("/src/sub/d.txt", "dd", 10);
    remote.addFile("/dst/a.txt", "aaaaa", 8);
    remote.addFile("/dst/b.txt", "bbbbb", 12);
    remote.addFile("/dst/c.txt", "ccccc", 10);
    remote.addFile("/dst/only-remote.txt", "z", 1);
    connect(local);
    connect(remote);

    tscp::TreeSnapshot src, dst;
    tscp::BridgeError err;
    t.check(tscp::snapshotTree(local, "/src", true, src, err), "source snapshot");
    t.check(tscp::snapshotTree(remote, "/dst", true, dst, err), "destination snapshot");
    src.unparsed_lines = 0;
    dst.unparsed_lines = 2;

    tscp::SyncOptions opt;
    opt.direction = tscp::Direction::Upload;
    auto plan = tscp::planSync(src, dst, opt);
    t.check(plan.decisions.size() == src.order.size(), "one decision per source entry");
    t.check(plan.count(SyncAction::Copy) == 2, "sub and sub/d.txt are copied");
    t.check(plan.count(SyncAction::Overwrite) == 1, "a.txt is overwritten");
    t.check(plan.count(SyncAction::Conflict) == 1, "b.txt is a conflict");
    t.check(plan.count(SyncAction::Skip) == 1, "c.txt is up to date");
    t.check(!plan.complete() && plan.destination_unparsed == 2, "unparsed lines make the plan incomplete");

    for (const auto &d : plan.decisions) {
        if (d.task.source_path == "/src/sub/d.txt") {
            t.check(d.task.destination_path == "/dst/sub/d.txt", "destination mirrors the relative path");
            t.check(d.task.kind == tscp::TaskKind::File && d.task.size_bytes == 2, "task kind and size");
            t.check(d.task.direction == tscp::Direction::Upload, "task direction");
        }
        if (d.task.source_path == "/src/sub") {
            t.check(d.task.kind == tscp::TaskKind::Directory && d.action == SyncAction::Copy, "directory task");
        }
        t.check(d.task.source_path.find("only-remote") == std::string::npos,
                "destination-only entries are not planned");
    }

    opt.policy = OverwritePolicy::Never;
    auto never = tscp::planSync(src, dst, opt);
    t.check(never.count(SyncAction::Overwrite) == 0 && never.count(SyncAction::Conflict) == 0,
            "never policy leaves existing files alone");
}

} // namespace

int main() {
    TestContext t;
    test_newer_wins_scenario(t);
    test_policies(t);
    test_unknown_metadata(t);
    test_tolerance(t);
    test_type_mismatch(t);
    test_snapshot(t);
    test_plan(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] tscp_sync_planner_tests\n";
    return EXIT_SUCCESS;
}
