#include "pibridge/FileOpsService.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/RemotePath.hpp"
#include "pibridge/RemoteWalk.hpp"

namespace pibridge {

bool FileOpsService::createFolder(RemoteSession& s,
                                  const std::string& path,
                                  const std::string& name,
                                  Error& err) const {
    if (!validateSegment(name, err)) return false;
    const std::string dir = joinRemote(path, name);
    std::string msg;
    if (!s.mkdir(dir, msg, 0755))
        return err.set(ErrorKind::RemoteProtocol, "Failed to create folder " + dir + ": " + msg);
    return true;
}

bool FileOpsService::rename(RemoteSession& s,
                            const std::string& path,
                            const std::string& oldName,
                            const std::string& newName,
                            Error& err) const {
    if (!validateSegment(oldName, err) || !validateSegment(newName, err)) return false;
    const std::string from = joinRemote(path, oldName);
    const std::string to = joinRemote(path, newName);
    std::string msg;
    if (!s.rename(from, to, msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to rename " + from + " to " + to + ": " + msg);
    return true;
}

bool FileOpsService::removeTree(RemoteSession& s, const std::string& dir, Error& err) const {
    // Files go as they are found; directories are collected in visit order
    // and removed in reverse, so children always go before their parent.
    std::vector<std::string> dirs;
    auto visit = [&](const WalkItem& item, Error& e) {
        if (item.attrs.is_dir) {
            dirs.push_back(item.path);
            return true;
        }
        std::string msg;
        if (!s.removeFile(item.path, msg))
            return e.set(ErrorKind::RemoteProtocol, "Failed to delete file " + item.path + ": " + msg);
        return true;
    };
    if (!walkRemoteTree(s, dir, visit, err)) return false;

    dirs.insert(dirs.begin(), dir);
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        std::string msg;
        if (!s.removeDir(*it, msg))
            return err.set(ErrorKind::RemoteProtocol, "Failed to delete directory " + *it + ": " + msg);
    }
    return true;
}

bool FileOpsService::deleteMany(RemoteSession& s,
                                const std::string& path,
                                const std::vector<std::string>& names,
                                Error& err) const {
    for (const auto& name : names) {
        if (!validateSegment(name, err)) return false;
    }
    for (const auto& name : names) {
        const std::string target = joinRemote(path, name);
        RemoteAttributes attrs;
        std::string msg;
        // lstat: a link to a directory is unlinked, never walked into.
        if (!s.lstat(target, attrs, msg))
            return err.set(ErrorKind::RemoteProtocol, "Failed to stat " + target + ": " +
                                                          (msg.empty() ? std::string("no such file") : msg));
        if (attrs.is_dir) {
            if (!removeTree(s, target, err)) return false;
        } else if (!s.removeFile(target, msg)) {
            return err.set(ErrorKind::RemoteProtocol, "Failed to delete file " + target + ": " + msg);
        }
        PIBRIDGE_LOGI("deleted %s", target.c_str());
    }
    return true;
}

bool FileOpsService::readFile(RemoteSession& s,
                              const std::string& path,
                              const std::string& name,
                              std::string& content,
                              Error& err) const {
    if (!validateSegment(name, err)) return false;
    const std::string file = joinRemote(path, name);
    std::string msg;
    auto rf = s.openRead(file, msg);
    if (!rf)
        return err.set(ErrorKind::RemoteProtocol, "Failed to open remote file '" + file + "': " + msg);

    std::string data;
    char buf[64 * 1024];
    for (;;) {
        const std::int64_t n = rf->read(buf, sizeof(buf), msg);
        if (n == 0) break;
        if (n < 0)
            return err.set(ErrorKind::RemoteProtocol, "Failed to read remote file '" + file + "': " + msg);
        data.append(buf, (std::size_t)n);
    }
    if (!rf->close(msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to close remote file '" + file + "': " + msg);
    content = std::move(data);
    return true;
}

bool FileOpsService::saveFile(RemoteSession& s,
                              const std::string& path,
                              const std::string& name,
                              const std::string& content,
                              Error& err) const {
    if (!validateSegment(name, err)) return false;
    const std::string file = joinRemote(path, name);
    std::string msg;
    auto wf = s.openWrite(file, msg, 0644);
    if (!wf)
        return err.set(ErrorKind::RemoteProtocol, "Failed to create remote file '" + file + "': " + msg);
    if (!wf->write(content.data(), content.size(), msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to write to remote file '" + file + "': " + msg);
    if (!wf->close(msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to close remote file '" + file + "': " + msg);
    return true;
}

bool FileOpsService::storageUsed(RemoteSession& s,
                                 const std::string& root,
                                 std::uint64_t& total,
                                 Error& err) const {
    std::uint64_t sum = 0;
    auto add = [&sum](const WalkItem& item, Error&) {
        if (!item.attrs.is_dir) sum += item.attrs.size;
        return true;
    };
    if (!walkRemoteTree(s, root, add, err)) return false;
    total = sum;
    return true;
}

} // namespace pibridge
