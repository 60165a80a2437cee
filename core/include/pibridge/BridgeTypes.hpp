// Basic types shared between the Qt host and the core for sessions,
// listings and progress. Kept as plain structs so the host can copy them.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pibridge {

// Host key validation policy against known_hosts.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: appends unknown hosts, rejects changed keys.
    Off         // No verification.
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Off;
};

// Raw remote metadata as reported by the SFTP stat/readdir calls.
struct RemoteAttributes {
    bool          is_dir    = false;
    bool          is_link   = false; // only from lstat and readdir
    bool          has_size  = false;
    bool          has_mtime = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits
};

struct RemoteEntry {
    std::string      name;  // base name
    RemoteAttributes attrs;
};

// Classification shown to the user: a directory, a lowercase extension, or
// nothing recognisable.
struct FileKind {
    enum class Tag { Directory, Extension, Unknown };

    Tag         tag = Tag::Unknown;
    std::string extension; // only meaningful for Tag::Extension

    static FileKind directory() { return {Tag::Directory, {}}; }
    static FileKind unknown() { return {Tag::Unknown, {}}; }
    static FileKind fromExtension(std::string ext) {
        return {Tag::Extension, std::move(ext)};
    }

    bool isDirectory() const { return tag == Tag::Directory; }

    // "Directory", the extension itself, or "Unknown".
    std::string label() const;

    bool operator==(const FileKind& o) const {
        return tag == o.tag && extension == o.extension;
    }
    bool operator!=(const FileKind& o) const { return !(*this == o); }
};

struct FileDescriptor {
    std::string   name;
    FileKind      kind;
    std::uint64_t size = 0;
    std::string   last_modified; // epoch seconds as decimal text
};

enum class ProgressTopic {
    TotalSize,
    DownloadProgress,
    UploadProgress,
    ZipProgress
};

// Wire names of the topics: "total-size", "download-progress", ...
const char* topicName(ProgressTopic topic);

} // namespace pibridge
