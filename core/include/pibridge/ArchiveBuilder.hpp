// Packs remote files and directories into one ZIP in the downloads
// directory.
#pragma once
#include "BridgeError.hpp"
#include "ProgressSink.hpp"
#include "RemoteSession.hpp"
#include "TransferEngine.hpp"
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace pibridge {

struct ArchivePlanEntry {
    std::string   archiveName; // e.g. "docs/notes/a.txt"
    std::string   remotePath;
    std::uint64_t size  = 0;
    std::uint64_t mtime = 0;
};

class ArchiveBuilder {
public:
    ArchiveBuilder(TransferEngine& engine, ProgressSink& progress)
        : engine_(engine), progress_(progress) {}

    // Expands every item below `baseDir` into file entries, depth-first.
    bool plan(RemoteSession& s,
              const std::string& baseDir,
              const std::vector<std::string>& items,
              std::vector<ArchivePlanEntry>& out,
              std::uint64_t& totalBytes,
              Error& err) const;

    // Emits total-size once (fully expanded) and cumulative zip-progress.
    // The staging file is removed on every exit path.
    bool buildZip(RemoteSession& s,
                  const std::string& baseDir,
                  const std::vector<std::string>& items,
                  const std::string& downloadsDir,
                  std::string& archivePath,
                  Error& err);

    // "pibridge-YYYYMMDD-HHMMSS.zip" in local time.
    static std::string archiveFileName(std::time_t when);

private:
    TransferEngine& engine_;
    ProgressSink&   progress_;
};

} // namespace pibridge
