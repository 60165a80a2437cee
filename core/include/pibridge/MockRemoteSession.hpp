// In-memory remote filesystem used by the tests. Several sessions may share
// one MockRemoteFs, the way several commands share the real remote host.
#pragma once
#include "RemoteSession.hpp"
#include "SessionFactory.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace pibridge {

enum class MockOp { Stat, List, Mkdir, Unlink, Rmdir, Rename, OpenRead, OpenWrite, Read, Write, Exec };

class MockRemoteFs {
public:
    explicit MockRemoteFs(std::string home = "/home/pi");

    const std::string& home() const { return home_; }

    // Both create missing parent directories.
    void addDir(const std::string& path);
    void addFile(const std::string& path, std::string data, std::uint64_t mtime = 0);
    // Symbolic link at `path`; stat and openRead follow it, lstat and
    // readdir report the link itself.
    void addSymlink(const std::string& path, const std::string& target);

    bool exists(const std::string& path) const;
    bool isDir(const std::string& path) const;
    std::optional<std::string> contents(const std::string& path) const;

    // The next `op` touching `path` fails once.
    void failOn(MockOp op, const std::string& path);
    void setExecExitStatus(int status);
    // readdir/stat stop reporting size and mtime.
    void setOmitAttributes(bool omit);

    // Number of read() calls that returned data.
    std::size_t dataReads() const;
    std::size_t writeCalls() const;
    void resetCounters();

private:
    friend class MockRemoteSession;
    friend class MockRemoteFile;

    struct Node {
        bool          is_dir = false;
        std::string   data;
        std::uint64_t mtime = 0;
        std::string   link_target; // non-empty for a symbolic link
    };

    bool takeFault(MockOp op, const std::string& path);
    std::map<std::string, Node>::iterator resolve(const std::string& path);
    RemoteAttributes attributesOf(const Node& n) const;
    void addParents(const std::string& path);

    mutable std::mutex mtx_;
    std::string home_;
    std::map<std::string, Node> nodes_;
    std::set<std::pair<MockOp, std::string>> faults_;
    int execStatus_ = 0;
    bool omitAttributes_ = false;
    std::size_t dataReads_ = 0;
    std::size_t writeCalls_ = 0;
};

class MockRemoteSession : public RemoteSession {
public:
    explicit MockRemoteSession(std::shared_ptr<MockRemoteFs> fs);

    bool connect(const SessionOptions& opt, std::string& err);
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool exec(const std::string& command,
              std::string& output,
              int& exitStatus,
              std::string& err) override;

    bool stat(const std::string& remote_path,
              RemoteAttributes& attrs,
              std::string& err) override;

    bool lstat(const std::string& remote_path,
               RemoteAttributes& attrs,
               std::string& err) override;

    bool list(const std::string& remote_path,
              std::vector<RemoteEntry>& out,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path, std::string& err) override;
    bool removeDir(const std::string& remote_dir, std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err) override;

    std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                         std::string& err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                          std::string& err,
                                          unsigned int mode = 0644) override;

private:
    bool statNode(const std::string& remote_path, bool follow, RemoteAttributes& attrs, std::string& err);

    std::shared_ptr<MockRemoteFs> fs_;
    bool connected_ = false;
};

class MockSessionFactory : public SessionFactory {
public:
    explicit MockSessionFactory(std::shared_ptr<MockRemoteFs> fs);

    // When set, open() rejects any other password.
    void setExpectedPassword(std::string password) { expectedPassword_ = std::move(password); }

    std::unique_ptr<RemoteSession> open(const SessionOptions& opt,
                                        Error& err) override;

    std::size_t opened() const { return opened_.load(); }

private:
    std::shared_ptr<MockRemoteFs> fs_;
    std::optional<std::string> expectedPassword_;
    std::atomic<std::size_t> opened_{0};
};

} // namespace pibridge
