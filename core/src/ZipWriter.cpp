#include "pibridge/ZipWriter.hpp"
#include <zip.h>

#include <ctime>

namespace pibridge {

namespace {

// State behind one zip_source_function. libzip owns it once the source is
// created and releases it through ZIP_SOURCE_FREE.
struct EntryContext {
    std::unique_ptr<ZipEntrySource> source;
    Error*        sourceError = nullptr; // first failure across all entries
    std::uint64_t size  = 0;
    std::uint64_t mtime = 0;
    bool          opened = false;
    zip_error_t   error;

    EntryContext() { zip_error_init(&error); }
    ~EntryContext() {
        if (opened) {
            Error ignored;
            (void)source->close(ignored);
        }
        zip_error_fini(&error);
    }
};

// Keeps the first source failure; libzip only learns that reading failed.
zip_int64_t failSource(EntryContext* ctx, const Error& e) {
    if (ctx->sourceError->ok()) *ctx->sourceError = e;
    zip_error_set(&ctx->error, ZIP_ER_READ, 0);
    return -1;
}

zip_int64_t entryCallback(void* userdata, void* data, zip_uint64_t len, zip_source_cmd_t cmd) {
    auto* ctx = static_cast<EntryContext*>(userdata);
    switch (cmd) {
        case ZIP_SOURCE_OPEN: {
            Error e;
            if (!ctx->source->open(e)) return failSource(ctx, e);
            ctx->opened = true;
            return 0;
        }
        case ZIP_SOURCE_READ: {
            Error e;
            const std::int64_t n = ctx->source->read(static_cast<char*>(data), static_cast<std::size_t>(len), e);
            if (n < 0) return failSource(ctx, e);
            return n;
        }
        case ZIP_SOURCE_CLOSE: {
            Error e;
            ctx->opened = false;
            if (!ctx->source->close(e)) return failSource(ctx, e);
            return 0;
        }
        case ZIP_SOURCE_STAT: {
            zip_stat_t* st = ZIP_SOURCE_GET_ARGS(zip_stat_t, data, len, &ctx->error);
            if (!st) return -1;
            zip_stat_init(st);
            st->size = ctx->size;
            st->mtime = static_cast<std::time_t>(ctx->mtime);
            st->valid |= ZIP_STAT_SIZE | ZIP_STAT_MTIME;
            return sizeof(*st);
        }
        case ZIP_SOURCE_ERROR:
            return zip_error_to_data(&ctx->error, data, len);
        case ZIP_SOURCE_FREE:
            delete ctx;
            return 0;
        case ZIP_SOURCE_SUPPORTS:
            return zip_source_make_command_bitmap(ZIP_SOURCE_OPEN, ZIP_SOURCE_READ, ZIP_SOURCE_CLOSE,
                                                  ZIP_SOURCE_STAT, ZIP_SOURCE_ERROR, ZIP_SOURCE_FREE, -1);
        default:
            zip_error_set(&ctx->error, ZIP_ER_OPNOTSUPP, 0);
            return -1;
    }
}

std::string archiveError(zip_t* za) {
    return zip_error_strerror(zip_get_error(za));
}

} // namespace

class ZipWriter::Impl {
public:
    zip_t*      za = nullptr;
    int         level = 0;
    std::size_t count = 0;
    std::string path;
    Error       sourceError;
};

ZipWriter::ZipWriter(int level) : pimpl_(new Impl) {
    pimpl_->level = level;
}

ZipWriter::~ZipWriter() {
    discard();
}

bool ZipWriter::open(const std::string& path, Error& err) {
    discard();
    int code = 0;
    pimpl_->za = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code);
    if (!pimpl_->za) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, code);
        const std::string why = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        return err.set(ErrorKind::Archive, "Failed to create archive '" + path + "': " + why);
    }
    pimpl_->path = path;
    pimpl_->count = 0;
    pimpl_->sourceError.clear();
    return true;
}

bool ZipWriter::addEntry(const std::string& name,
                         std::uint64_t size,
                         std::uint64_t mtime,
                         std::unique_ptr<ZipEntrySource> source,
                         Error& err) {
    if (!pimpl_->za) return err.set(ErrorKind::Archive, "Archive is not open");

    auto* ctx = new EntryContext;
    ctx->source = std::move(source);
    ctx->sourceError = &pimpl_->sourceError;
    ctx->size = size;
    ctx->mtime = mtime;

    zip_source_t* src = zip_source_function(pimpl_->za, entryCallback, ctx);
    if (!src) {
        delete ctx;
        return err.set(ErrorKind::Archive, "Failed to add '" + name + "': " + archiveError(pimpl_->za));
    }
    const zip_int64_t idx = zip_file_add(pimpl_->za, name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
        zip_source_free(src);
        return err.set(ErrorKind::Archive, "Failed to add '" + name + "': " + archiveError(pimpl_->za));
    }
    const zip_uint64_t index = static_cast<zip_uint64_t>(idx);
    if (zip_set_file_compression(pimpl_->za, index, ZIP_CM_DEFLATE,
                                 static_cast<zip_uint32_t>(pimpl_->level)) < 0 ||
        zip_file_set_mtime(pimpl_->za, index, static_cast<time_t>(mtime), 0) < 0)
        return err.set(ErrorKind::Archive, "Failed to configure '" + name + "': " + archiveError(pimpl_->za));
    ++pimpl_->count;
    return true;
}

bool ZipWriter::finish(Error& err) {
    if (!pimpl_->za) return err.set(ErrorKind::Archive, "Archive is not open");
    if (pimpl_->count == 0) {
        discard();
        return err.set(ErrorKind::Archive, "Nothing to archive: the selection holds no files");
    }
    if (zip_close(pimpl_->za) == 0) {
        pimpl_->za = nullptr;
        return true;
    }
    const std::string why = archiveError(pimpl_->za);
    discard();
    if (!pimpl_->sourceError.ok()) {
        err = pimpl_->sourceError;
        return false;
    }
    return err.set(ErrorKind::Archive, "Failed to write archive '" + pimpl_->path + "': " + why);
}

void ZipWriter::discard() {
    if (pimpl_->za) {
        zip_discard(pimpl_->za);
        pimpl_->za = nullptr;
    }
}

std::size_t ZipWriter::entryCount() const {
    return pimpl_->count;
}

} // namespace pibridge
