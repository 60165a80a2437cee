#include "pibridge/DirectoryLister.hpp"
#include "pibridge/RemotePath.hpp"

namespace pibridge {

FileKind classify(const std::string& name, bool isDir) {
    if (isDir) return FileKind::directory();
    std::string ext = extensionOf(name);
    if (ext.empty()) return FileKind::unknown();
    return FileKind::fromExtension(std::move(ext));
}

FileDescriptor describe(const RemoteEntry& entry) {
    FileDescriptor fd;
    fd.name = entry.name;
    fd.kind = classify(entry.name, entry.attrs.is_dir);
    fd.size = entry.attrs.has_size ? entry.attrs.size : 0;
    fd.last_modified = std::to_string(entry.attrs.has_mtime ? entry.attrs.mtime : 0);
    return fd;
}

bool DirectoryLister::list(RemoteSession& s,
                           const std::string& path,
                           std::vector<FileDescriptor>& out,
                           Error& err) const {
    std::vector<RemoteEntry> entries;
    std::string msg;
    if (!s.list(path, entries, msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to read directory " + path + ": " + msg);
    out.clear();
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(describe(e));
    return true;
}

} // namespace pibridge
