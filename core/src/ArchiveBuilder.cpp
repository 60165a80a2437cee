#include "pibridge/ArchiveBuilder.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/RemotePath.hpp"
#include "pibridge/RemoteWalk.hpp"
#include "pibridge/ZipWriter.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <cstring>
#include <set>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace pibridge {

namespace {

// Staging file in the system temp directory, removed when it goes out of
// scope whatever happened in between.
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    ~ScopedTempFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    bool create(Error& err) {
        static std::atomic<unsigned> counter{0};
        std::error_code ec;
        const fs::path dir = fs::temp_directory_path(ec);
        if (ec)
            return err.set(ErrorKind::LocalIO, "Failed to find the temporary directory: " + ec.message());
        path_ = (dir / ("pibridge-" + std::to_string(::getpid()) + "-" +
                        std::to_string(counter.fetch_add(1)) + ".zip.part")).string();
        return true;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Reserves a name in `dir` by creating it exclusively, adding "-N" before
// the extension on collision.
bool reserveTarget(const fs::path& dir, const std::string& fileName, std::string& out, Error& err) {
    const fs::path base(fileName);
    const std::string stem = base.stem().string();
    const std::string ext = base.extension().string();
    for (int n = 0; n < 1000; ++n) {
        const fs::path candidate = dir / (n == 0 ? fileName : stem + "-" + std::to_string(n) + ext);
        std::FILE* f = std::fopen(candidate.c_str(), "wx");
        if (f) {
            std::fclose(f);
            out = candidate.string();
            return true;
        }
        std::error_code ec;
        if (!fs::exists(candidate, ec))
            return err.set(ErrorKind::LocalIO, "Failed to create local file at '" + candidate.string() + "'");
    }
    return err.set(ErrorKind::LocalIO, "Failed to find a free archive name in '" + dir.string() + "'");
}

// Moves the staged archive over the reserved target. Falls back to a copy
// when the temp directory is on another filesystem.
bool moveInto(const std::string& from, const std::string& to, Error& err) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return true;
    std::error_code copyEc;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, copyEc);
    if (copyEc)
        return err.set(ErrorKind::LocalIO, "Failed to move archive to '" + to + "': " + copyEc.message());
    return true;
}

// Feeds one remote file to the zip writer. The remote side is read a full
// chunk at a time and served to libzip from that buffer, so zip-progress
// keeps the transfer granularity and only one chunk is held.
class RemoteEntrySource : public ZipEntrySource {
public:
    RemoteEntrySource(TransferEngine& engine, RemoteSession& s, std::string remotePath, std::uint64_t& done)
        : engine_(engine), session_(s), remotePath_(std::move(remotePath)), done_(done) {}

    bool open(Error& err) override {
        file_ = engine_.openRemote(session_, remotePath_, err);
        if (!file_) return false;
        chunk_.resize(TransferEngine::kChunkSize);
        pos_ = have_ = 0;
        return true;
    }

    std::int64_t read(char* buf, std::size_t len, Error& err) override {
        if (pos_ == have_) {
            const std::int64_t n = engine_.readChunk(*file_, remotePath_, chunk_.data(), chunk_.size(),
                                                     ProgressTopic::ZipProgress, done_, err);
            if (n <= 0) return n;
            pos_ = 0;
            have_ = static_cast<std::size_t>(n);
        }
        const std::size_t n = std::min(len, have_ - pos_);
        std::memcpy(buf, chunk_.data() + pos_, n);
        pos_ += n;
        return static_cast<std::int64_t>(n);
    }

    bool close(Error& err) override {
        std::vector<char>().swap(chunk_);
        if (!file_) return true;
        auto file = std::move(file_);
        return engine_.closeRemote(*file, remotePath_, err);
    }

private:
    TransferEngine&             engine_;
    RemoteSession&              session_;
    std::string                 remotePath_;
    std::uint64_t&              done_;
    std::unique_ptr<RemoteFile> file_;
    std::vector<char>           chunk_;
    std::size_t                 pos_  = 0;
    std::size_t                 have_ = 0;
};

} // namespace

std::string ArchiveBuilder::archiveFileName(std::time_t when) {
    std::tm tmv{};
    localtime_r(&when, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tmv);
    return std::string("pibridge-") + buf + ".zip";
}

bool ArchiveBuilder::plan(RemoteSession& s,
                          const std::string& baseDir,
                          const std::vector<std::string>& items,
                          std::vector<ArchivePlanEntry>& out,
                          std::uint64_t& totalBytes,
                          Error& err) const {
    out.clear();
    totalBytes = 0;
    std::set<std::string> seen;
    for (const auto& item : items) {
        if (!validateSegment(item, err)) return false;
        if (!seen.insert(item).second) continue;

        const std::string path = joinRemote(baseDir, item);
        RemoteAttributes attrs;
        std::string msg;
        if (!s.stat(path, attrs, msg))
            return err.set(ErrorKind::RemoteProtocol, "Failed to stat '" + path + "': " +
                                                          (msg.empty() ? std::string("no such file") : msg));
        if (!attrs.is_dir) {
            out.push_back({item, path, attrs.size, attrs.mtime});
            totalBytes += attrs.size;
            continue;
        }
        auto addFile = [&](const WalkItem& w, Error&) {
            if (!w.attrs.is_dir) {
                out.push_back({item + "/" + w.relative, w.path, w.attrs.size, w.attrs.mtime});
                totalBytes += w.attrs.size;
            }
            return true;
        };
        if (!walkRemoteTree(s, path, addFile, err)) return false;
    }
    return true;
}

bool ArchiveBuilder::buildZip(RemoteSession& s,
                              const std::string& baseDir,
                              const std::vector<std::string>& items,
                              const std::string& downloadsDir,
                              std::string& archivePath,
                              Error& err) {
    if (items.empty()) return err.set(ErrorKind::Path, "No files selected");
    std::error_code ec;
    if (downloadsDir.empty() || !fs::is_directory(downloadsDir, ec))
        return err.set(ErrorKind::LocalIO, "Failed to find the Downloads directory" +
                                               (downloadsDir.empty() ? std::string() : " '" + downloadsDir + "'"));

    std::vector<ArchivePlanEntry> entries;
    std::uint64_t total = 0;
    if (!plan(s, baseDir, items, entries, total, err)) return false;
    progress_.report(ProgressTopic::TotalSize, total);

    ScopedTempFile staging;
    if (!staging.create(err)) return false;

    ZipWriter zip;
    if (!zip.open(staging.path(), err)) return false;

    std::uint64_t done = 0;
    for (const auto& e : entries) {
        std::unique_ptr<ZipEntrySource> src(new RemoteEntrySource(engine_, s, e.remotePath, done));
        if (!zip.addEntry(e.archiveName, e.size, e.mtime, std::move(src), err)) return false;
    }
    if (!zip.finish(err)) return false;

    std::string target;
    if (!reserveTarget(downloadsDir, archiveFileName(std::time(nullptr)), target, err)) return false;
    if (!moveInto(staging.path(), target, err)) {
        fs::remove(target, ec);
        return false;
    }
    PIBRIDGE_LOGI("archive %s: %zu entries, %llu bytes", target.c_str(), entries.size(),
                  (unsigned long long)done);
    archivePath = target;
    return true;
}

} // namespace pibridge
