// Core unit tests without external framework (run via CTest).
#include "pibridge/DirectoryLister.hpp"
#include "pibridge/FileOpsService.hpp"
#include "pibridge/LogRedaction.hpp"
#include "pibridge/MockRemoteSession.hpp"
#include "pibridge/RemotePath.hpp"
#include "pibridge/RemoteWalk.hpp"
#include "pibridge/WorkspaceResolver.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
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

const char *kRoot = "/home/pi/pi-interface/alice";

pibridge::SessionOptions validOptions() {
    pibridge::SessionOptions opt;
    opt.host = "pi.test";
    opt.username = "pi";
    opt.password = "raspberry";
    return opt;
}

std::unique_ptr<pibridge::MockRemoteSession>
connected(const std::shared_ptr<pibridge::MockRemoteFs> &fs) {
    auto s = std::make_unique<pibridge::MockRemoteSession>(fs);
    std::string err;
    s->connect(validOptions(), err);
    return s;
}

const pibridge::FileDescriptor *
findEntry(const std::vector<pibridge::FileDescriptor> &entries,
          const std::string &name) {
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&name](const pibridge::FileDescriptor &d) {
                               return d.name == name;
                           });
    return it == entries.end() ? nullptr : &*it;
}

void test_session_defaults(TestContext &t) {
    pibridge::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.known_hosts_policy == pibridge::KnownHostsPolicy::Off,
            "default known_hosts_policy should be Off");
    t.check(!o.known_hosts_path.has_value(),
            "known_hosts_path should be empty by default");
}

void test_path_policy(TestContext &t) {
    pibridge::Error err;
    t.check(pibridge::validateSegment("notes.txt", err), "plain name is valid");
    t.check(pibridge::validateSegment("..hidden", err),
            "name starting with dots is valid");

    const std::vector<std::string> bad = {"", ".", "..", "a/b",
                                          std::string("a\0b", 3)};
    for (const auto &seg : bad) {
        err.clear();
        t.check(!pibridge::validateSegment(seg, err),
                "segment should be rejected: '" + seg + "'");
        t.check(err.kind == pibridge::ErrorKind::Path,
                "rejected segment should be a Path error");
    }

    std::string out;
    err.clear();
    t.check(pibridge::joinSegments("/root", {"a", "b"}, out, err) &&
                out == "/root/a/b",
            "joinSegments should join with single slashes");
    err.clear();
    t.check(!pibridge::joinSegments("/root", {"a", ".."}, out, err),
            "joinSegments should reject traversal");

    std::vector<std::string> segs;
    err.clear();
    t.check(pibridge::splitPath("/docs/2024/", segs, err) && segs.size() == 2 &&
                segs[0] == "docs" && segs[1] == "2024",
            "splitPath should ignore leading and trailing slashes");
    err.clear();
    t.check(pibridge::splitPath("", segs, err) && segs.empty(),
            "empty path yields no segments");
    err.clear();
    t.check(!pibridge::splitPath("docs/../etc", segs, err) &&
                err.kind == pibridge::ErrorKind::Path,
            "splitPath should reject '..'");

    t.check(pibridge::joinRemote("/a/", "b") == "/a/b",
            "joinRemote should not double the slash");
    t.check(pibridge::joinRemote("", "b") == "/b",
            "joinRemote on empty base should give an absolute path");

    std::string name;
    err.clear();
    t.check(pibridge::baseName("/tmp/upload/photo.JPG", name, err) &&
                name == "photo.JPG",
            "baseName should return the last component");
    err.clear();
    t.check(!pibridge::baseName("/", name, err) &&
                err.kind == pibridge::ErrorKind::Path,
            "baseName of '/' should be a Path error");
}

void test_classification(TestContext &t) {
    t.check(pibridge::classify("docs", true).isDirectory(),
            "directories classify as Directory");
    t.check(pibridge::classify("photo.JPG", false) ==
                pibridge::FileKind::fromExtension("jpg"),
            "extension should be lowercased");
    t.check(pibridge::classify("archive.tar.gz", false) ==
                pibridge::FileKind::fromExtension("gz"),
            "only the last extension counts");
    t.check(pibridge::classify("Makefile", false) ==
                pibridge::FileKind::unknown(),
            "name without extension is Unknown");
    t.check(pibridge::classify(".bashrc", false) == pibridge::FileKind::unknown(),
            "dot file is Unknown");
    t.check(pibridge::classify("name.", false) == pibridge::FileKind::unknown(),
            "trailing dot is Unknown");
    t.check(pibridge::classify("v1.0", true).isDirectory(),
            "directory with a dot is still a Directory");
    t.check(pibridge::FileKind::directory().label() == "Directory" &&
                pibridge::FileKind::unknown().label() == "Unknown" &&
                pibridge::FileKind::fromExtension("txt").label() == "txt",
            "labels");
}

void test_error_kind_names(TestContext &t) {
    t.check(std::string(pibridge::errorKindName(pibridge::ErrorKind::Config)) ==
                "config",
            "config tag");
    t.check(std::string(pibridge::errorKindName(
                pibridge::ErrorKind::RemoteProtocol)) == "remote",
            "remote tag");
    t.check(std::string(pibridge::errorKindName(pibridge::ErrorKind::LocalIO)) ==
                "local-io",
            "local-io tag");
    pibridge::Error err;
    t.check(err.ok(), "default error is ok");
    t.check(!err.set(pibridge::ErrorKind::Archive, "boom"), "set returns false");
    t.checkContains(err.describe(), "boom", "describe should carry the message");
    err.clear();
    t.check(err.ok() && err.message.empty(), "clear resets the error");
}

void test_log_redaction(TestContext &t) {
    ::unsetenv("PIBRIDGE_ENV");
    ::unsetenv("PIBRIDGE_LOG_SENSITIVE");
    t.check(pibridge::loggable("alice") == "<redacted>", "redacted by default");

    ::setenv("PIBRIDGE_LOG_SENSITIVE", "1", 1);
    t.check(pibridge::loggable("alice") == "<redacted>",
            "the opt-in alone does not reveal values");

    ::setenv("PIBRIDGE_ENV", " Development ", 1);
    ::setenv("PIBRIDGE_LOG_SENSITIVE", "Yes", 1);
    t.check(pibridge::logExposure() == pibridge::LogExposure::Verbatim &&
                pibridge::loggable("alice") == "alice",
            "dev environment with the opt-in logs values verbatim");

    ::setenv("PIBRIDGE_ENV", "production", 1);
    t.check(pibridge::loggable("alice") == "<redacted>",
            "production stays redacted");
    ::unsetenv("PIBRIDGE_ENV");
    ::unsetenv("PIBRIDGE_LOG_SENSITIVE");
}

void test_workspace_idempotent(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    auto s = connected(fs);
    pibridge::WorkspaceResolver resolver;
    std::string first, second;
    pibridge::Error err;
    t.check(resolver.resolve(*s, "alice", first, err),
            "first resolve should succeed: " + err.message);
    t.check(resolver.resolve(*s, "alice", second, err),
            "second resolve should succeed: " + err.message);
    t.check(first == kRoot, "root should be <home>/pi-interface/<user>");
    t.check(first == second, "resolve should be stable");
    t.check(fs->isDir(kRoot), "user directory should exist");
}

void test_workspace_custom_base(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>("/home/bob/");
    auto s = connected(fs);
    pibridge::WorkspaceResolver resolver("bridge");
    std::string root;
    pibridge::Error err;
    t.check(resolver.resolve(*s, "carol", root, err) &&
                root == "/home/bob/bridge/carol",
            "custom base directory name should be honored");
}

void test_workspace_failures(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    auto s = connected(fs);
    pibridge::WorkspaceResolver resolver;
    std::string root;
    pibridge::Error err;

    t.check(!resolver.resolve(*s, "..", root, err) &&
                err.kind == pibridge::ErrorKind::Path,
            "user name '..' should be a Path error");

    err.clear();
    fs->setExecExitStatus(1);
    t.check(!resolver.resolve(*s, "alice", root, err),
            "non-zero exit status should fail");
    t.check(err.kind == pibridge::ErrorKind::RemoteProtocol,
            "exit status failure is a remote error");
    t.checkContains(err.message, "exit status", "message names the exit status");
    fs->setExecExitStatus(0);

    err.clear();
    fs->failOn(pibridge::MockOp::Exec, "echo $HOME");
    t.check(!resolver.resolve(*s, "alice", root, err) &&
                err.kind == pibridge::ErrorKind::RemoteProtocol,
            "channel failure should be a remote error");

    err.clear();
    fs->addFile("/home/pi/pi-interface", "not a dir");
    t.check(!resolver.resolve(*s, "alice", root, err),
            "a file in place of the base directory should fail");
    t.checkContains(err.message, "/home/pi/pi-interface",
                    "message should name the base path");
}

void test_listing(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    fs->addFile(std::string(kRoot) + "/notes.TXT", "hello", 1700000000);
    fs->addDir(std::string(kRoot) + "/docs");
    fs->addFile(std::string(kRoot) + "/docs/inner.md", "nested");
    auto s = connected(fs);

    std::vector<pibridge::FileDescriptor> out;
    pibridge::Error err;
    t.check(pibridge::DirectoryLister().list(*s, kRoot, out, err),
            "list should succeed: " + err.message);
    t.check(out.size() == 2, "list returns direct children only");
    const auto *notes = findEntry(out, "notes.TXT");
    t.check(notes && notes->kind == pibridge::FileKind::fromExtension("txt") &&
                notes->size == 5 && notes->last_modified == "1700000000",
            "file descriptor carries kind, size and mtime");
    const auto *docs = findEntry(out, "docs");
    t.check(docs && docs->kind.isDirectory(), "docs is a directory");

    fs->setOmitAttributes(true);
    t.check(pibridge::DirectoryLister().list(*s, kRoot, out, err),
            "list without attributes should succeed");
    notes = findEntry(out, "notes.TXT");
    t.check(notes && notes->size == 0 && notes->last_modified == "0",
            "missing attributes become 0");
    fs->setOmitAttributes(false);

    err.clear();
    t.check(!pibridge::DirectoryLister().list(
                *s, std::string(kRoot) + "/missing", out, err),
            "listing a missing directory should fail");
    t.check(err.kind == pibridge::ErrorKind::RemoteProtocol,
            "missing directory is a remote error");
    t.checkContains(err.message, "/missing", "message names the path");
}

void test_walk_order(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    const std::string root = std::string(kRoot) + "/tree";
    fs->addFile(root + "/a/x.txt", "x");
    fs->addFile(root + "/a/b/y.txt", "yy");
    fs->addFile(root + "/z.txt", "zzz");
    auto s = connected(fs);

    std::vector<std::string> seen;
    pibridge::Error err;
    auto visit = [&seen](const pibridge::WalkItem &w, pibridge::Error &) {
        seen.push_back(w.relative);
        return true;
    };
    t.check(pibridge::walkRemoteTree(*s, root, visit, err),
            "walk should succeed: " + err.message);
    t.check(seen.size() == 5, "walk visits every descendant");
    auto pos = [&seen](const std::string &r) {
        return std::find(seen.begin(), seen.end(), r) - seen.begin();
    };
    t.check(pos("a") < pos("a/b") && pos("a/b") < pos("a/b/y.txt"),
            "directories come before their contents");
}

void test_fileops_round_trip(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    fs->addDir(kRoot);
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    t.check(ops.saveFile(*s, kRoot, "hello.txt", "hello", err),
            "save should succeed: " + err.message);
    std::string content;
    t.check(ops.readFile(*s, kRoot, "hello.txt", content, err) &&
                content == "hello",
            "read after save returns the same content");

    t.check(ops.saveFile(*s, kRoot, "hello.txt", "hi", err),
            "second save should succeed");
    t.check(ops.readFile(*s, kRoot, "hello.txt", content, err) && content == "hi",
            "save truncates existing content");

    t.check(ops.saveFile(*s, kRoot, "empty.txt", "", err) &&
                ops.readFile(*s, kRoot, "empty.txt", content, err) &&
                content.empty(),
            "empty file round trip");

    err.clear();
    t.check(!ops.readFile(*s, kRoot, "missing.txt", content, err) &&
                err.kind == pibridge::ErrorKind::RemoteProtocol,
            "reading a missing file is a remote error");
    t.checkContains(err.message, "missing.txt", "message names the file");
}

void test_fileops_create_folder(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    fs->addDir(kRoot);
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    t.check(ops.createFolder(*s, kRoot, "docs", err),
            "createFolder should succeed: " + err.message);
    std::vector<pibridge::FileDescriptor> out;
    t.check(pibridge::DirectoryLister().list(*s, kRoot, out, err), "list");
    const auto *docs = findEntry(out, "docs");
    t.check(docs && docs->kind.isDirectory(),
            "listing after createFolder shows a directory");

    err.clear();
    t.check(!ops.createFolder(*s, kRoot, "docs", err) &&
                err.kind == pibridge::ErrorKind::RemoteProtocol,
            "creating an existing folder fails");

    err.clear();
    t.check(!ops.createFolder(*s, kRoot, "../escape", err) &&
                err.kind == pibridge::ErrorKind::Path,
            "folder name with traversal is a Path error");
    t.check(!fs->exists("/home/pi/pi-interface/escape"),
            "nothing is created outside the workspace");
}

void test_fileops_rename(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    fs->addFile(std::string(kRoot) + "/old.txt", "12345");
    fs->addFile(std::string(kRoot) + "/dir/inner.txt", "x");
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    t.check(ops.rename(*s, kRoot, "old.txt", "new.txt", err),
            "rename should succeed: " + err.message);
    std::vector<pibridge::FileDescriptor> out;
    t.check(pibridge::DirectoryLister().list(*s, kRoot, out, err), "list");
    t.check(!findEntry(out, "old.txt"), "old name is gone");
    const auto *renamed = findEntry(out, "new.txt");
    t.check(renamed && renamed->size == 5 &&
                renamed->kind == pibridge::FileKind::fromExtension("txt"),
            "new name keeps size and kind");

    t.check(ops.rename(*s, kRoot, "dir", "moved", err),
            "renaming a directory should succeed");
    t.check(fs->contents(std::string(kRoot) + "/moved/inner.txt").value_or("") == "x",
            "directory contents move along");

    err.clear();
    t.check(!ops.rename(*s, kRoot, "nope", "other", err) &&
                err.kind == pibridge::ErrorKind::RemoteProtocol,
            "renaming a missing entry fails");
    err.clear();
    t.check(!ops.rename(*s, kRoot, "new.txt", "a/b", err) &&
                err.kind == pibridge::ErrorKind::Path,
            "new name with '/' is a Path error");
}

void test_fileops_recursive_delete(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    const std::string root = kRoot;
    fs->addFile(root + "/keep.txt", "keep");
    fs->addFile(root + "/gone.txt", "gone");
    fs->addFile(root + "/tree/a.txt", "a");
    fs->addFile(root + "/tree/sub/b.txt", "b");
    fs->addDir(root + "/tree/sub/empty");
    fs->addFile(root + "/tree/sub/deeper/c.txt", "c");
    // Sibling sharing the prefix must survive.
    fs->addFile(root + "/tree-2/d.txt", "d");
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    t.check(ops.deleteMany(*s, root, {"tree", "gone.txt"}, err),
            "deleteMany should succeed: " + err.message);
    t.check(!fs->exists(root + "/tree"), "directory itself is removed");
    t.check(!fs->exists(root + "/tree/sub/deeper/c.txt"),
            "nested descendants are removed");
    t.check(!fs->exists(root + "/gone.txt"), "file is removed");
    t.check(fs->exists(root + "/keep.txt"), "unrelated file survives");
    t.check(fs->exists(root + "/tree-2/d.txt"), "sibling with same prefix survives");

    std::vector<pibridge::FileDescriptor> out;
    t.check(pibridge::DirectoryLister().list(*s, root, out, err), "list");
    t.check(!findEntry(out, "tree") && !findEntry(out, "gone.txt"),
            "deleted entries are absent from the listing");
}

void test_fileops_delete_symlink_to_directory(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    const std::string root = kRoot;
    fs->addFile("/home/pi/outside/precious.txt", "keep me");
    fs->addSymlink(root + "/shortcut", "/home/pi/outside");
    fs->addFile(root + "/tree/a.txt", "a");
    fs->addSymlink(root + "/tree/link", "/home/pi/outside");
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    pibridge::RemoteAttributes followed;
    std::string msg;
    t.check(s->stat(root + "/shortcut", followed, msg) && followed.is_dir,
            "stat follows the link to the directory");

    t.check(ops.deleteMany(*s, root, {"shortcut"}, err),
            "deleting a link should succeed: " + err.message);
    t.check(!fs->exists(root + "/shortcut"), "the link itself is removed");
    t.check(fs->contents("/home/pi/outside/precious.txt").value_or("") == "keep me",
            "the link target's contents survive");

    t.check(ops.deleteMany(*s, root, {"tree"}, err),
            "deleting a tree holding a link should succeed: " + err.message);
    t.check(!fs->exists(root + "/tree"), "the tree is removed");
    t.check(fs->exists("/home/pi/outside/precious.txt"),
            "a nested link is unlinked, not followed");
}

void test_fileops_delete_stops_at_failure(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    const std::string root = kRoot;
    fs->addFile(root + "/one.txt", "1");
    fs->addFile(root + "/two.txt", "2");
    fs->addFile(root + "/three.txt", "3");
    fs->failOn(pibridge::MockOp::Unlink, root + "/two.txt");
    auto s = connected(fs);
    pibridge::FileOpsService ops;
    pibridge::Error err;

    t.check(!ops.deleteMany(*s, root, {"one.txt", "two.txt", "three.txt"}, err),
            "deleteMany should report the failure");
    t.check(err.kind == pibridge::ErrorKind::RemoteProtocol, "remote error kind");
    t.checkContains(err.message, "two.txt", "message names the failing file");
    t.check(!fs->exists(root + "/one.txt"), "earlier deletions are kept");
    t.check(fs->exists(root + "/three.txt"), "later items are not attempted");

    err.clear();
    t.check(!ops.deleteMany(*s, root, {"three.txt", ".."}, err) &&
                err.kind == pibridge::ErrorKind::Path,
            "an invalid name rejects the whole batch");
    t.check(fs->exists(root + "/three.txt"), "nothing deleted on a Path error");
}

void test_storage_used(TestContext &t) {
    auto fs = std::make_shared<pibridge::MockRemoteFs>();
    const std::string root = kRoot;
    fs->addFile(root + "/a.bin", std::string(100, 'a'));
    fs->addFile(root + "/d/b.bin", std::string(20, 'b'));
    fs->addFile(root + "/d/e/c.bin", std::string(3, 'c'));
    auto s = connected(fs);
    std::uint64_t total = 0;
    pibridge::Error err;
    t.check(pibridge::FileOpsService().storageUsed(*s, root, total, err),
            "storageUsed should succeed: " + err.message);
    t.check(total == 123, "storageUsed sums file sizes recursively");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_path_policy(t);
    test_classification(t);
    test_error_kind_names(t);
    test_log_redaction(t);
    test_workspace_idempotent(t);
    test_workspace_custom_base(t);
    test_workspace_failures(t);
    test_listing(t);
    test_walk_order(t);
    test_fileops_round_trip(t);
    test_fileops_create_folder(t);
    test_fileops_rename(t);
    test_fileops_recursive_delete(t);
    test_fileops_delete_symlink_to_directory(t);
    test_fileops_delete_stops_at_failure(t);
    test_storage_used(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] pibridge_core_tests\n";
    return EXIT_SUCCESS;
}
