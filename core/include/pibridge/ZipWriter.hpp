// ZIP output through libzip. Entries are registered with a pull source and
// only read when the archive is finalized, one source open at a time.
#pragma once
#include "BridgeError.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace pibridge {

// Data for one archive entry, pulled by the writer during finish().
class ZipEntrySource {
public:
    virtual ~ZipEntrySource() = default;

    virtual bool open(Error& err) = 0;
    // Returns the byte count, 0 at end of data, or -1 with `err` set.
    virtual std::int64_t read(char* buf, std::size_t len, Error& err) = 0;
    virtual bool close(Error& err) = 0;
};

class ZipWriter {
public:
    // level: 1 (fast) .. 9 (best), 0 for the libzip default
    explicit ZipWriter(int level = 0);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Creates or truncates `path`. Nothing is written before finish().
    bool open(const std::string& path, Error& err);

    // `size` is the expected uncompressed size, `mtime` epoch seconds.
    bool addEntry(const std::string& name,
                  std::uint64_t size,
                  std::uint64_t mtime,
                  std::unique_ptr<ZipEntrySource> source,
                  Error& err);

    // Streams every entry and writes the archive. A source failure is
    // reported as the source's own error; anything else is an Archive error.
    bool finish(Error& err);

    // Drops the archive without writing it.
    void discard();

    std::size_t entryCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace pibridge
