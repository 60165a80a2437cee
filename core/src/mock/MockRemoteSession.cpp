#include "pibridge/MockRemoteSession.hpp"
#include <algorithm>
#include <cstring>
#include <vector>

namespace pibridge {

namespace {

std::string normalize(const std::string& p) {
    if (p.empty()) return "/";
    std::string out = p;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string parentOf(const std::string& p) {
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return p.substr(0, pos);
}

} // namespace

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockRemoteFs> fs, std::string path)
        : fs_(std::move(fs)), path_(std::move(path)) {}

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (fs_->takeFault(MockOp::Read, path_)) {
            err = "mock read failure";
            return -1;
        }
        auto it = fs_->nodes_.find(path_);
        if (it == fs_->nodes_.end()) {
            err = "no such file";
            return -1;
        }
        const std::string& data = it->second.data;
        if (offset_ >= data.size()) return 0;
        const std::size_t n = std::min(len, data.size() - offset_);
        std::memcpy(buf, data.data() + offset_, n);
        offset_ += n;
        ++fs_->dataReads_;
        return (std::int64_t)n;
    }

    bool write(const char* buf, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(fs_->mtx_);
        if (fs_->takeFault(MockOp::Write, path_)) {
            err = "mock write failure";
            return false;
        }
        auto it = fs_->nodes_.find(path_);
        if (it == fs_->nodes_.end()) {
            err = "no such file";
            return false;
        }
        it->second.data.append(buf, len);
        ++fs_->writeCalls_;
        return true;
    }

    bool close(std::string&) override { return true; }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    std::string path_;
    std::size_t offset_ = 0;
};

MockRemoteFs::MockRemoteFs(std::string home) : home_(normalize(home)) {
    nodes_["/"] = Node{true, {}, 0};
    addDir(home_);
}

void MockRemoteFs::addParents(const std::string& path) {
    std::string parent = parentOf(path);
    std::vector<std::string> missing;
    while (nodes_.find(parent) == nodes_.end()) {
        missing.push_back(parent);
        parent = parentOf(parent);
    }
    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        nodes_[*it] = Node{true, {}, 0};
    }
}

void MockRemoteFs::addDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    addParents(p);
    nodes_[p] = Node{true, {}, 0};
}

void MockRemoteFs::addFile(const std::string& path, std::string data, std::uint64_t mtime) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    addParents(p);
    nodes_[p] = Node{false, std::move(data), mtime};
}

void MockRemoteFs::addSymlink(const std::string& path, const std::string& target) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = normalize(path);
    addParents(p);
    Node n;
    n.link_target = normalize(target);
    nodes_[p] = std::move(n);
}

bool MockRemoteFs::exists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return nodes_.count(normalize(path)) != 0;
}

bool MockRemoteFs::isDir(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    return it != nodes_.end() && it->second.is_dir;
}

std::optional<std::string> MockRemoteFs::contents(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(normalize(path));
    if (it == nodes_.end() || it->second.is_dir) return std::nullopt;
    return it->second.data;
}

void MockRemoteFs::failOn(MockOp op, const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    faults_.insert({op, normalize(path)});
}

void MockRemoteFs::setExecExitStatus(int status) {
    std::lock_guard<std::mutex> lk(mtx_);
    execStatus_ = status;
}

void MockRemoteFs::setOmitAttributes(bool omit) {
    std::lock_guard<std::mutex> lk(mtx_);
    omitAttributes_ = omit;
}

std::size_t MockRemoteFs::dataReads() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dataReads_;
}

std::size_t MockRemoteFs::writeCalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return writeCalls_;
}

void MockRemoteFs::resetCounters() {
    std::lock_guard<std::mutex> lk(mtx_);
    dataReads_ = 0;
    writeCalls_ = 0;
}

// Caller holds mtx_.
bool MockRemoteFs::takeFault(MockOp op, const std::string& path) {
    auto it = faults_.find({op, path});
    if (it == faults_.end()) return false;
    faults_.erase(it);
    return true;
}

// Caller holds mtx_. Follows links a bounded number of times.
std::map<std::string, MockRemoteFs::Node>::iterator MockRemoteFs::resolve(const std::string& path) {
    auto it = nodes_.find(path);
    for (int hops = 0; it != nodes_.end() && !it->second.link_target.empty(); ++hops) {
        if (hops == 8) return nodes_.end();
        it = nodes_.find(it->second.link_target);
    }
    return it;
}

// Caller holds mtx_.
RemoteAttributes MockRemoteFs::attributesOf(const Node& n) const {
    RemoteAttributes a;
    a.is_link = !n.link_target.empty();
    a.is_dir = n.is_dir;
    a.mode = a.is_link ? 0120777 : n.is_dir ? 0040755 : 0100644;
    if (!omitAttributes_) {
        a.has_size = true;
        a.size = a.is_link ? n.link_target.size() : n.is_dir ? 4096 : n.data.size();
        a.has_mtime = true;
        a.mtime = n.mtime;
    }
    return a;
}

MockRemoteSession::MockRemoteSession(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

bool MockRemoteSession::connect(const SessionOptions& opt, std::string& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    connected_ = true;
    return true;
}

void MockRemoteSession::disconnect() {
    connected_ = false;
}

bool MockRemoteSession::exec(const std::string& command,
                             std::string& output,
                             int& exitStatus,
                             std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Exec, command)) {
        err = "mock channel failure";
        return false;
    }
    output = command == "echo $HOME" ? fs_->home_ + "\n" : std::string();
    exitStatus = fs_->execStatus_;
    return true;
}

bool MockRemoteSession::statNode(const std::string& remote_path,
                                 bool follow,
                                 RemoteAttributes& attrs,
                                 std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Stat, p)) {
        err = "mock stat failure";
        return false;
    }
    auto it = follow ? fs_->resolve(p) : fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err.clear();
        return false;
    }
    attrs = fs_->attributesOf(it->second);
    return true;
}

bool MockRemoteSession::stat(const std::string& remote_path,
                             RemoteAttributes& attrs,
                             std::string& err) {
    return statNode(remote_path, true, attrs, err);
}

bool MockRemoteSession::lstat(const std::string& remote_path,
                              RemoteAttributes& attrs,
                              std::string& err) {
    return statNode(remote_path, false, attrs, err);
}

bool MockRemoteSession::list(const std::string& remote_path,
                             std::vector<RemoteEntry>& out,
                             std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::List, p)) {
        err = "mock readdir failure";
        return false;
    }
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end()) {
        err = "no such file";
        return false;
    }
    if (!it->second.is_dir) {
        err = "not a directory";
        return false;
    }
    out.clear();
    const std::string prefix = p == "/" ? "/" : p + "/";
    for (auto c = fs_->nodes_.upper_bound(p); c != fs_->nodes_.end(); ++c) {
        if (c->first.compare(0, prefix.size(), prefix) != 0) continue;
        const std::string rest = c->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos) continue;
        RemoteEntry e;
        e.name = rest;
        e.attrs = fs_->attributesOf(c->second);
        out.push_back(std::move(e));
    }
    return true;
}

bool MockRemoteSession::mkdir(const std::string& remote_dir, std::string& err, unsigned int) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Mkdir, p)) {
        err = "mock mkdir failure";
        return false;
    }
    if (fs_->nodes_.count(p)) {
        err = "file already exists";
        return false;
    }
    auto parent = fs_->nodes_.find(parentOf(p));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "no such file";
        return false;
    }
    fs_->nodes_[p] = MockRemoteFs::Node{true, {}, 0};
    return true;
}

bool MockRemoteSession::removeFile(const std::string& remote_path, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Unlink, p)) {
        err = "mock unlink failure";
        return false;
    }
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end() || it->second.is_dir) {
        err = it == fs_->nodes_.end() ? "no such file" : "failure";
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockRemoteSession::removeDir(const std::string& remote_dir, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string p = normalize(remote_dir);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Rmdir, p)) {
        err = "mock rmdir failure";
        return false;
    }
    auto it = fs_->nodes_.find(p);
    if (it == fs_->nodes_.end() || !it->second.is_dir) {
        err = it == fs_->nodes_.end() ? "no such file" : "not a directory";
        return false;
    }
    const std::string prefix = p == "/" ? "/" : p + "/";
    auto child = fs_->nodes_.lower_bound(prefix);
    if (child != fs_->nodes_.end() && child->first != p &&
        child->first.compare(0, prefix.size(), prefix) == 0) {
        err = "directory not empty";
        return false;
    }
    fs_->nodes_.erase(it);
    return true;
}

bool MockRemoteSession::rename(const std::string& from, const std::string& to, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    const std::string src = normalize(from);
    const std::string dst = normalize(to);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::Rename, src)) {
        err = "mock rename failure";
        return false;
    }
    if (!fs_->nodes_.count(src)) {
        err = "no such file";
        return false;
    }
    if (fs_->nodes_.count(dst)) {
        err = "file already exists";
        return false;
    }
    // Move the node and everything below it.
    std::vector<std::pair<std::string, MockRemoteFs::Node>> moved;
    for (auto it = fs_->nodes_.begin(); it != fs_->nodes_.end();) {
        if (it->first == src || it->first.compare(0, src.size() + 1, src + "/") == 0) {
            moved.emplace_back(dst + it->first.substr(src.size()), std::move(it->second));
            it = fs_->nodes_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& m : moved) fs_->nodes_[m.first] = std::move(m.second);
    return true;
}

std::unique_ptr<RemoteFile> MockRemoteSession::openRead(const std::string& remote_path,
                                                        std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return nullptr;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::OpenRead, p)) {
        err = "mock open failure";
        return nullptr;
    }
    auto it = fs_->resolve(p);
    if (it == fs_->nodes_.end() || it->second.is_dir) {
        err = it == fs_->nodes_.end() ? "no such file" : "failure";
        return nullptr;
    }
    return std::make_unique<MockRemoteFile>(fs_, it->first);
}

std::unique_ptr<RemoteFile> MockRemoteSession::openWrite(const std::string& remote_path,
                                                         std::string& err,
                                                         unsigned int) {
    if (!connected_) {
        err = "Not connected";
        return nullptr;
    }
    const std::string p = normalize(remote_path);
    std::lock_guard<std::mutex> lk(fs_->mtx_);
    if (fs_->takeFault(MockOp::OpenWrite, p)) {
        err = "mock open failure";
        return nullptr;
    }
    auto parent = fs_->nodes_.find(parentOf(p));
    if (parent == fs_->nodes_.end() || !parent->second.is_dir) {
        err = "no such file";
        return nullptr;
    }
    auto it = fs_->nodes_.find(p);
    if (it != fs_->nodes_.end() && it->second.is_dir) {
        err = "failure";
        return nullptr;
    }
    fs_->nodes_[p] = MockRemoteFs::Node{false, {}, 0};
    return std::make_unique<MockRemoteFile>(fs_, p);
}

MockSessionFactory::MockSessionFactory(std::shared_ptr<MockRemoteFs> fs) : fs_(std::move(fs)) {}

std::unique_ptr<RemoteSession> MockSessionFactory::open(const SessionOptions& opt, Error& err) {
    auto session = std::make_unique<MockRemoteSession>(fs_);
    std::string msg;
    if (!session->connect(opt, msg)) {
        err.set(ErrorKind::Connection, "Failed to connect to " + opt.host + ":" +
                                           std::to_string(opt.port) + ": " + msg);
        return nullptr;
    }
    if (expectedPassword_ && *expectedPassword_ != opt.password) {
        err.set(ErrorKind::Connection, "SSH authentication failed: wrong password");
        return nullptr;
    }
    ++opened_;
    return session;
}

} // namespace pibridge
