// Chunked transfers between the local and the remote filesystem. Peak
// memory is one chunk regardless of file size; progress values are
// cumulative byte counts.
#pragma once
#include "BridgeError.hpp"
#include "ProgressSink.hpp"
#include "RemoteSession.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pibridge {

class TransferEngine {
public:
    static constexpr std::size_t kChunkSize = 1024 * 1024;

    // Receives each chunk; returning false aborts the stream.
    using ChunkConsumer = std::function<bool(const char* data, std::size_t len, Error& err)>;

    explicit TransferEngine(ProgressSink& progress) : progress_(progress) {}

    // Writes <localDir>/<basename of remotePath>. Emits total-size once and
    // download-progress after every chunk. A partial local file is left on
    // failure.
    bool downloadFile(RemoteSession& s,
                      const std::string& remotePath,
                      const std::string& localDir,
                      std::string& localPath,
                      Error& err);

    // Creates or truncates `remotePath`. Emits total-size once and
    // upload-progress after every chunk.
    bool uploadFile(RemoteSession& s,
                    const std::string& remotePath,
                    const std::string& localPath,
                    Error& err);

    // Pull-style access for consumers that ask for data themselves, like
    // the archive writer. readChunk adds to `done` and reports it under
    // `topic`, so callers streaming several files keep one running total.
    std::unique_ptr<RemoteFile> openRemote(RemoteSession& s, const std::string& remotePath, Error& err);
    std::int64_t readChunk(RemoteFile& file,
                           const std::string& remotePath,
                           char* buf,
                           std::size_t len,
                           ProgressTopic topic,
                           std::uint64_t& done,
                           Error& err);
    bool closeRemote(RemoteFile& file, const std::string& remotePath, Error& err);

private:
    bool pump(RemoteFile& file,
              const std::string& remotePath,
              ProgressTopic topic,
              std::uint64_t& done,
              const ChunkConsumer& consume,
              Error& err);

    ProgressSink& progress_;
};

} // namespace pibridge
