// Abstract remote session. The libssh2 backend and the in-memory mock both
// implement it, so services never depend on a concrete transport.
#pragma once
#include "BridgeTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pibridge {

// Open remote file handle; closed when destroyed.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Fills up to `len` bytes and only returns short at end of file.
    // Returns the byte count, 0 at EOF, or -1 with `err` set.
    virtual std::int64_t read(char* buf, std::size_t len, std::string& err) = 0;

    // Writes all `len` bytes or fails.
    virtual bool write(const char* buf, std::size_t len, std::string& err) = 0;

    // Explicit close so write errors reported on close are not lost.
    virtual bool close(std::string& err) = 0;
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual bool isConnected() const = 0;
    virtual void disconnect() = 0;

    // Runs `command` on a fresh channel and captures stdout.
    virtual bool exec(const std::string& command,
                      std::string& output,
                      int& exitStatus,
                      std::string& err) = 0;

    // Returns true if the path exists. A missing path returns false with
    // `err` left empty; any other failure fills `err`.
    virtual bool stat(const std::string& remote_path,
                      RemoteAttributes& attrs,
                      std::string& err) = 0;

    // Same as stat, but a symbolic link is described rather than followed.
    virtual bool lstat(const std::string& remote_path,
                       RemoteAttributes& attrs,
                       std::string& err) = 0;

    // Direct children only, without "." and "..".
    virtual bool list(const std::string& remote_path,
                      std::vector<RemoteEntry>& out,
                      std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err) = 0;

    virtual std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                                 std::string& err) = 0;

    // Creates or truncates.
    virtual std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                                  std::string& err,
                                                  unsigned int mode = 0644) = 0;
};

} // namespace pibridge
