#include "pibridge/TransferEngine.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/RemotePath.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

namespace pibridge {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

std::string lastErrno() {
    return std::strerror(errno);
}

} // namespace

std::unique_ptr<RemoteFile> TransferEngine::openRemote(RemoteSession& s,
                                                       const std::string& remotePath,
                                                       Error& err) {
    std::string msg;
    auto file = s.openRead(remotePath, msg);
    if (!file)
        err.set(ErrorKind::RemoteProtocol, "Failed to open remote file '" + remotePath + "': " + msg);
    return file;
}

std::int64_t TransferEngine::readChunk(RemoteFile& file,
                                       const std::string& remotePath,
                                       char* buf,
                                       std::size_t len,
                                       ProgressTopic topic,
                                       std::uint64_t& done,
                                       Error& err) {
    std::string msg;
    const std::int64_t n = file.read(buf, len, msg);
    if (n < 0) {
        err.set(ErrorKind::RemoteProtocol, "Failed to read remote file '" + remotePath + "': " + msg);
        return -1;
    }
    if (n > 0) {
        done += (std::uint64_t)n;
        progress_.report(topic, done);
    }
    return n;
}

bool TransferEngine::closeRemote(RemoteFile& file, const std::string& remotePath, Error& err) {
    std::string msg;
    if (!file.close(msg))
        return err.set(ErrorKind::RemoteProtocol,
                       "Failed to close remote file '" + remotePath + "': " + msg);
    return true;
}

bool TransferEngine::pump(RemoteFile& file,
                          const std::string& remotePath,
                          ProgressTopic topic,
                          std::uint64_t& done,
                          const ChunkConsumer& consume,
                          Error& err) {
    std::vector<char> buf(kChunkSize);
    for (;;) {
        const std::int64_t n = readChunk(file, remotePath, buf.data(), buf.size(), topic, done, err);
        if (n < 0) return false;
        if (n == 0) break; // EOF
        if (!consume(buf.data(), (std::size_t)n, err)) return false;
    }
    // An empty file still gets one final value.
    if (done == 0) progress_.report(topic, done);
    return closeRemote(file, remotePath, err);
}

bool TransferEngine::downloadFile(RemoteSession& s,
                                  const std::string& remotePath,
                                  const std::string& localDir,
                                  std::string& localPath,
                                  Error& err) {
    std::string name;
    if (!baseName(remotePath, name, err)) return false;

    std::error_code ec;
    if (localDir.empty() || !fs::is_directory(localDir, ec))
        return err.set(ErrorKind::LocalIO, "Failed to find the Downloads directory" +
                                               (localDir.empty() ? std::string() : " '" + localDir + "'"));

    RemoteAttributes attrs;
    std::string msg;
    if (!s.stat(remotePath, attrs, msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to stat remote file '" + remotePath + "': " +
                                                      (msg.empty() ? std::string("no such file") : msg));
    if (attrs.is_dir)
        return err.set(ErrorKind::RemoteProtocol, "Remote path '" + remotePath + "' is a directory");

    auto remote = openRemote(s, remotePath, err);
    if (!remote) return false;

    const std::string target = (fs::path(localDir) / name).string();
    FilePtr lf(std::fopen(target.c_str(), "wb"));
    if (!lf)
        return err.set(ErrorKind::LocalIO, "Failed to create local file at '" + target + "': " + lastErrno());

    progress_.report(ProgressTopic::TotalSize, attrs.has_size ? attrs.size : 0);

    std::FILE* out = lf.get();
    auto writeChunk = [out, &target](const char* data, std::size_t len, Error& e) {
        if (std::fwrite(data, 1, len, out) != len)
            return e.set(ErrorKind::LocalIO, "Failed to write to local file at '" + target + "': " + lastErrno());
        return true;
    };
    std::uint64_t done = 0;
    if (!pump(*remote, remotePath, ProgressTopic::DownloadProgress, done, writeChunk, err)) return false;

    if (std::fflush(out) != 0)
        return err.set(ErrorKind::LocalIO, "Failed to flush local file at '" + target + "': " + lastErrno());
    if (std::fclose(lf.release()) != 0)
        return err.set(ErrorKind::LocalIO, "Failed to close local file at '" + target + "': " + lastErrno());

    PIBRIDGE_LOGI("downloaded %s (%llu bytes)", remotePath.c_str(), (unsigned long long)done);
    localPath = target;
    return true;
}

bool TransferEngine::uploadFile(RemoteSession& s,
                                const std::string& remotePath,
                                const std::string& localPath,
                                Error& err) {
    std::error_code ec;
    const std::uintmax_t total = fs::file_size(localPath, ec);
    if (ec)
        return err.set(ErrorKind::LocalIO, "Failed to read local file '" + localPath + "': " + ec.message());

    FilePtr lf(std::fopen(localPath.c_str(), "rb"));
    if (!lf)
        return err.set(ErrorKind::LocalIO, "Failed to open local file '" + localPath + "': " + lastErrno());

    std::string msg;
    auto remote = s.openWrite(remotePath, msg, 0644);
    if (!remote)
        return err.set(ErrorKind::RemoteProtocol,
                       "Failed to create remote file '" + remotePath + "': " + msg);

    progress_.report(ProgressTopic::TotalSize, (std::uint64_t)total);

    std::vector<char> buf(kChunkSize);
    std::uint64_t done = 0;
    for (;;) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf.get());
        if (n > 0) {
            if (!remote->write(buf.data(), n, msg))
                return err.set(ErrorKind::RemoteProtocol,
                               "Failed to write to remote file '" + remotePath + "': " + msg);
            done += n;
            progress_.report(ProgressTopic::UploadProgress, done);
        }
        if (n < buf.size()) {
            if (std::ferror(lf.get()))
                return err.set(ErrorKind::LocalIO, "Failed to read local file '" + localPath + "'");
            break; // EOF
        }
    }

    if (!remote->close(msg))
        return err.set(ErrorKind::RemoteProtocol,
                       "Failed to close remote file '" + remotePath + "': " + msg);
    PIBRIDGE_LOGI("uploaded %s (%llu bytes)", remotePath.c_str(), (unsigned long long)done);
    return true;
}

} // namespace pibridge
