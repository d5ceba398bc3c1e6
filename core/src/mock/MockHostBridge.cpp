#include "tscp/MockHostBridge.hpp"
#include <algorithm>
#include <cstring>

namespace tscp {

namespace {

const char* opName(MockHostBridge::Op op) {
    using Op = MockHostBridge::Op;
    switch (op) {
    case Op::Connect: return "connect";
    case Op::List: return "list";
    case Op::Stat: return "stat";
    case Op::CreateDirectory: return "mkdir";
    case Op::RemoveFile: return "rm";
    case Op::RemoveDirectory: return "rmdir";
    case Op::Rename: return "mv";
    case Op::OpenRead: return "read";
    case Op::OpenWrite: return "write";
    case Op::FinishWrite: return "commit";
    case Op::SymlinkResolve: return "readlink";
    case Op::SetPermissions: return "chmod";
    case Op::SetTimes: return "touch";
    }
    return "?";
}

class MockReadStream : public ReadStream {
public:
    MockReadStream(MockHostBridge& owner, std::string path, std::string content)
        : owner_(owner), path_(std::move(path)), content_(std::move(content)) {}

    bool read(char* buf, std::size_t cap, std::size_t& got, BridgeError& err) override {
        got = 0;
        if (pending_) {
            err = pending_;
            return false;
        }
        const std::size_t n = std::min(cap, content_.size() - static_cast<std::size_t>(offset_));
        std::size_t allowed = n;
        if (!owner_.streamFault(true, path_, offset_, n, allowed, err)) {
            if (allowed == 0) return false;
            // bytes before the fault point are delivered, the error comes next
            pending_ = err;
            err.clear();
        }
        if (allowed > 0) std::memcpy(buf, content_.data() + offset_, allowed);
        offset_ += allowed;
        got = allowed;
        return true;
    }

    bool finish(BridgeError& err) override {
        if (offset_ != content_.size()) {
            err.set(ErrorKind::Protocol, path_, "stream finished before end of file");
            return false;
        }
        return true;
    }

private:
    MockHostBridge& owner_;
    std::string path_;
    std::string content_;
    std::uint64_t offset_ = 0;
    BridgeError pending_;
};

class MockWriteStream : public WriteStream {
public:
    MockWriteStream(MockHostBridge& owner, std::string path) : owner_(owner), path_(std::move(path)) {}

    bool write(const char* buf, std::size_t len, BridgeError& err) override {
        std::size_t allowed = len;
        const bool ok = owner_.streamFault(false, path_, written_, len, allowed, err);
        if (std::string* d = owner_.data(path_)) d->append(buf, ok ? len : allowed);
        written_ += ok ? len : allowed;
        return ok;
    }

    bool finish(BridgeError& err) override {
        done_ = true;
        return !owner_.injected(MockHostBridge::Op::FinishWrite, path_, err);
    }

    void abort() override {
        if (!done_) owner_.note("abort " + path_);
        done_ = true;
    }

private:
    MockHostBridge& owner_;
    std::string path_;
    std::uint64_t written_ = 0;
    bool done_ = false;
};

} // namespace

MockHostBridge::MockHostBridge(Protocol p, bool local) : protocol_(p), local_(local) {
    Node root;
    root.is_dir = true;
    root.mode = 0755;
    nodes_["/"] = root;
}

bool MockHostBridge::connect(const HostConfig& cfg, BridgeError& err) {
    if (!local_ && cfg.host.empty()) {
        err.set(ErrorKind::Connection, {}, "host is required");
        return false;
    }
    if (!local_ && cfg.username.empty()) {
        err.set(ErrorKind::Auth, {}, "username is required");
        return false;
    }
    state_ = SessionState::Connecting;
    for (const auto& f : faults_) {
        if (f.op == Op::Connect) {
            err.set(f.kind, {}, f.message);
            state_ = f.kind == ErrorKind::Connection ? SessionState::Failed : SessionState::Disconnected;
            return false;
        }
    }
    state_ = SessionState::Connected;
    cwd_ = "/";
    if (cfg.remote_root && !changeDirectory(*cfg.remote_root, err)) {
        state_ = SessionState::Failed;
        return false;
    }
    return true;
}

void MockHostBridge::disconnect() {
    state_ = SessionState::Disconnected;
}

bool MockHostBridge::injected(Op op, const std::string& path, BridgeError& err) {
    if (!requireConnected(path, err)) return true;
    for (const auto& f : faults_) {
        if (f.op == op && f.path == path) {
            err.set(f.kind, path, std::string(opName(op)) + ": " + f.message);
            if (f.kind == ErrorKind::Connection) state_ = SessionState::Failed;
            return true;
        }
    }
    return false;
}

bool MockHostBridge::streamFault(bool reading, const std::string& path, std::uint64_t offset, std::size_t len,
                                 std::size_t& allowed, BridgeError& err) {
    allowed = len;
    if (!requireConnected(path, err)) {
        allowed = 0;
        return false;
    }
    for (const auto& f : streamFaults_) {
        if (f.reading != reading || f.path != path) continue;
        if (offset + len <= f.after) continue;
        allowed = offset < f.after ? static_cast<std::size_t>(f.after - offset) : 0;
        err.set(f.kind, path, reading ? "injected read failure" : "injected write failure");
        if (f.kind == ErrorKind::Connection) state_ = SessionState::Failed;
        return false;
    }
    return true;
}

std::string* MockHostBridge::data(const std::string& path) {
    auto it = nodes_.find(path);
    return it == nodes_.end() ? nullptr : &it->second.data;
}

const MockHostBridge::Node* MockHostBridge::follow(const std::string& path, std::string* resolved) const {
    std::string p = path;
    for (int hops = 0; hops < 8; ++hops) {
        auto it = nodes_.find(p);
        if (it == nodes_.end()) return nullptr;
        if (!it->second.is_symlink) {
            if (resolved) *resolved = p;
            return &it->second;
        }
        p = resolvePath(parentPath(p), it->second.target);
    }
    return nullptr;
}

bool MockHostBridge::hasChildren(const std::string& dir) const {
    for (const auto& kv : nodes_) {
        if (kv.first != "/" && kv.first != dir && parentPath(kv.first) == dir) return true;
    }
    return false;
}

bool MockHostBridge::checkParent(const std::string& path, BridgeError& err) const {
    const Node* parent = follow(parentPath(path));
    if (!parent || !parent->is_dir) {
        err.set(ErrorKind::NotFound, path, "no such parent directory");
        return false;
    }
    return true;
}

RemoteEntry MockHostBridge::describe(const std::string& path, const Node& n) const {
    RemoteEntry e;
    e.name = path == "/" ? std::string("/") : baseName(path);
    e.path = path;
    e.uid = 1000;
    e.gid = 1000;
    const Node* target = &n;
    if (n.is_symlink) {
        e.is_symlink = true;
        e.symlink_target = n.target;
        target = follow(path);
        if (!target) {
            e.symlink_dangling = true;
            return e;
        }
    }
    e.is_directory = target->is_dir;
    e.size = target->is_dir ? 0 : target->data.size();
    e.permissions = target->mode;
    e.mtime = target->mtime;
    return e;
}

bool MockHostBridge::pwd(std::string& out, BridgeError& err) {
    if (!requireConnected({}, err)) return false;
    out = cwd_;
    return true;
}

bool MockHostBridge::changeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (!requireConnected(p, err)) return false;
    std::string real;
    const Node* n = follow(p, &real);
    if (!n || !n->is_dir) {
        err.set(ErrorKind::NotFound, p, "no such directory");
        return false;
    }
    cwd_ = p;
    return true;
}

bool MockHostBridge::list(const std::string& path, ListResult& out, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::List, p, err)) return false;
    std::string dir;
    const Node* n = follow(p, &dir);
    if (!n) {
        err.set(ErrorKind::NotFound, p, "no such directory");
        return false;
    }
    if (!n->is_dir) {
        err.set(ErrorKind::NotFound, p, "not a directory");
        return false;
    }
    out = ListResult{};
    for (const auto& kv : nodes_) {
        if (kv.first == "/" || parentPath(kv.first) != dir) continue;
        RemoteEntry e = describe(kv.first, kv.second);
        // listed under the name the caller used
        e.path = joinPath(p, e.name);
        out.entries.push_back(std::move(e));
    }
    sortEntries(out.entries);
    return true;
}

bool MockHostBridge::stat(const std::string& path, RemoteEntry& out, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::Stat, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, p, "no such file or directory");
        return false;
    }
    out = describe(p, it->second);
    return true;
}

bool MockHostBridge::createDirectory(const std::string& path, BridgeError& err, unsigned int mode) {
    const std::string p = abs(path);
    if (injected(Op::CreateDirectory, p, err)) return false;
    if (nodes_.count(p)) {
        err.set(ErrorKind::AlreadyExists, p, "file exists");
        return false;
    }
    if (!checkParent(p, err)) return false;
    Node n;
    n.is_dir = true;
    n.mode = mode & 07777;
    n.mtime = now_;
    nodes_[p] = n;
    note("mkdir " + p);
    return true;
}

bool MockHostBridge::removeFile(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::RemoveFile, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, p, "no such file");
        return false;
    }
    if (it->second.is_dir) {
        err.set(ErrorKind::Io, p, "is a directory");
        return false;
    }
    nodes_.erase(it);
    note("rm " + p);
    return true;
}

bool MockHostBridge::removeDirectory(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::RemoveDirectory, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end() || !it->second.is_dir) {
        err.set(ErrorKind::NotFound, p, "no such directory");
        return false;
    }
    if (p == "/" || hasChildren(p)) {
        err.set(ErrorKind::Io, p, "directory not empty");
        return false;
    }
    nodes_.erase(it);
    note("rmdir " + p);
    return true;
}

bool MockHostBridge::rename(const std::string& from, const std::string& to, BridgeError& err) {
    const std::string src = abs(from);
    const std::string dst = abs(to);
    if (injected(Op::Rename, src, err)) return false;
    if (!nodes_.count(src)) {
        err.set(ErrorKind::NotFound, src, "no such file or directory");
        return false;
    }
    if (!checkParent(dst, err)) return false;
    std::map<std::string, Node> moved;
    const std::string prefix = src + "/";
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (it->first == src || it->first.compare(0, prefix.size(), prefix) == 0) {
            moved[dst + it->first.substr(src.size())] = it->second;
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& kv : moved) nodes_[kv.first] = kv.second;
    note("mv " + src + " " + dst);
    return true;
}

std::unique_ptr<ReadStream> MockHostBridge::openRead(const std::string& path, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::OpenRead, p, err)) return nullptr;
    const Node* n = follow(p);
    if (!n) {
        err.set(ErrorKind::NotFound, p, "no such file");
        return nullptr;
    }
    if (n->is_dir) {
        err.set(ErrorKind::Io, p, "is a directory");
        return nullptr;
    }
    return std::make_unique<MockReadStream>(*this, p, n->data);
}

std::unique_ptr<WriteStream> MockHostBridge::openWrite(const std::string& path, bool append, BridgeError& err,
                                                       std::optional<std::uint64_t>,
                                                       std::optional<std::int64_t> mtime) {
    const std::string p = abs(path);
    if (injected(Op::OpenWrite, p, err)) return nullptr;
    if (!checkParent(p, err)) return nullptr;
    auto it = nodes_.find(p);
    if (it != nodes_.end() && it->second.is_dir) {
        err.set(ErrorKind::Io, p, "is a directory");
        return nullptr;
    }
    Node& n = nodes_[p];
    if (!append) n.data.clear();
    n.mtime = mtime ? *mtime : now_;
    note("write " + p);
    return std::make_unique<MockWriteStream>(*this, p);
}

bool MockHostBridge::symlinkResolve(const std::string& path, std::string& target, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::SymlinkResolve, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, p, "no such file or directory");
        return false;
    }
    target = it->second.is_symlink ? resolvePath(parentPath(p), it->second.target) : p;
    return true;
}

bool MockHostBridge::setPermissions(const std::string& path, std::uint32_t mode, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::SetPermissions, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, p, "no such file or directory");
        return false;
    }
    it->second.mode = mode & 07777;
    return true;
}

bool MockHostBridge::setTimes(const std::string& path, std::int64_t mtime, BridgeError& err) {
    const std::string p = abs(path);
    if (injected(Op::SetTimes, p, err)) return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorKind::NotFound, p, "no such file or directory");
        return false;
    }
    it->second.mtime = mtime;
    return true;
}

void MockHostBridge::addDirectory(const std::string& path, std::int64_t mtime) {
    const std::string p = resolvePath("/", path);
    if (p != "/") addDirectory(parentPath(p), mtime);
    Node& n = nodes_[p];
    if (!n.is_dir) {
        n.is_dir = true;
        n.mode = 0755;
        n.mtime = mtime;
    }
}

void MockHostBridge::addFile(const std::string& path, const std::string& content, std::int64_t mtime,
                             std::uint32_t mode) {
    const std::string p = resolvePath("/", path);
    addDirectory(parentPath(p), 0);
    Node n;
    n.data = content;
    n.mtime = mtime;
    n.mode = mode;
    nodes_[p] = n;
}

void MockHostBridge::addSymlink(const std::string& path, const std::string& target) {
    const std::string p = resolvePath("/", path);
    addDirectory(parentPath(p), 0);
    Node n;
    n.is_symlink = true;
    n.target = target;
    n.mode = 0777;
    nodes_[p] = n;
}

bool MockHostBridge::exists(const std::string& path) const {
    return nodes_.count(resolvePath("/", path)) != 0;
}

std::optional<std::string> MockHostBridge::fileContent(const std::string& path) const {
    auto it = nodes_.find(resolvePath("/", path));
    if (it == nodes_.end() || it->second.is_dir) return std::nullopt;
    return it->second.data;
}

std::optional<std::uint32_t> MockHostBridge::modeOf(const std::string& path) const {
    auto it = nodes_.find(resolvePath("/", path));
    if (it == nodes_.end()) return std::nullopt;
    return it->second.mode;
}

std::optional<std::int64_t> MockHostBridge::mtimeOf(const std::string& path) const {
    auto it = nodes_.find(resolvePath("/", path));
    if (it == nodes_.end()) return std::nullopt;
    return it->second.mtime;
}

void MockHostBridge::failOn(Op op, const std::string& path, ErrorKind kind, const std::string& message) {
    faults_.push_back(Fault{op, op == Op::Connect ? path : resolvePath("/", path), kind, message});
}

void MockHostBridge::failReadAfter(const std::string& path, std::uint64_t after, ErrorKind kind) {
    streamFaults_.push_back(StreamFault{true, resolvePath("/", path), after, kind});
}

void MockHostBridge::failWriteAfter(const std::string& path, std::uint64_t after, ErrorKind kind) {
    streamFaults_.push_back(StreamFault{false, resolvePath("/", path), after, kind});
}

void MockHostBridge::clearFaults() {
    faults_.clear();
    streamFaults_.clear();
}

} // namespace tscp
