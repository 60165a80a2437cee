#include "pibridge/BridgeCommands.hpp"
#include "pibridge/ArchiveBuilder.hpp"
#include "pibridge/DirectoryLister.hpp"
#include "pibridge/FileOpsService.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/RemotePath.hpp"
#include "pibridge/LogRedaction.hpp"
#include "pibridge/TransferEngine.hpp"
#include "pibridge/WorkspaceResolver.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace pibridge {

namespace {

bool logged(const char* command, bool ok, const Error& err) {
    if (ok)
        PIBRIDGE_LOGI("%s: ok", command);
    else
        PIBRIDGE_LOGE("%s: %s", command, err.describe().c_str());
    return ok;
}

} // namespace

BridgeCommands::BridgeCommands(SessionFactory& factory, ConfigProvider config, ProgressSink& progress)
    : factory_(factory), config_(std::move(config)), progress_(progress) {}

bool BridgeCommands::begin(const std::string& userName,
                           const std::vector<std::string>& currentPath,
                           Invocation& inv,
                           Error& err) const {
    if (!config_) return err.set(ErrorKind::Config, "No connection configuration available");
    if (!config_(inv.config, err)) return false;

    // Reject bad names before opening a connection.
    if (!validateSegment(userName, err)) return false;
    for (const auto& seg : currentPath) {
        if (!validateSegment(seg, err)) return false;
    }

    PIBRIDGE_LOGI("user %s: opening session", loggable(userName).c_str());
    inv.session = factory_.open(inv.config.sessionOptions(), err);
    if (!inv.session) return false;

    WorkspaceResolver resolver(inv.config.base_dir_name);
    if (!resolver.resolve(*inv.session, userName, inv.root, err)) return false;
    return joinSegments(inv.root, currentPath, inv.dir, err);
}

bool BridgeCommands::connectToPi(const std::string& userName,
                                 const std::string& path,
                                 std::vector<FileDescriptor>& out,
                                 Error& err) const {
    std::vector<std::string> segments;
    if (!splitPath(path, segments, err)) return logged("connect_to_pi", false, err);
    Invocation inv;
    const bool ok = begin(userName, segments, inv, err) &&
                    DirectoryLister().list(*inv.session, inv.dir, out, err);
    return logged("connect_to_pi", ok, err);
}

bool BridgeCommands::downloadFiles(const std::string& userName,
                                   const std::vector<std::string>& currentPath,
                                   const std::vector<std::string>& fileNames,
                                   std::string& localPath,
                                   Error& err) const {
    if (fileNames.empty()) {
        err.set(ErrorKind::Path, "No files selected");
        return logged("download_files", false, err);
    }
    for (const auto& name : fileNames) {
        if (!validateSegment(name, err)) return logged("download_files", false, err);
    }
    Invocation inv;
    if (!begin(userName, currentPath, inv, err)) return logged("download_files", false, err);

    TransferEngine engine(progress_);
    RemoteSession& s = *inv.session;
    const std::string& downloads = inv.config.downloads_dir;

    // One plain file: no archive.
    if (fileNames.size() == 1) {
        const std::string remote = joinRemote(inv.dir, fileNames.front());
        RemoteAttributes attrs;
        std::string msg;
        if (!s.stat(remote, attrs, msg)) {
            err.set(ErrorKind::RemoteProtocol, "Failed to stat '" + remote + "': " +
                                                   (msg.empty() ? std::string("no such file") : msg));
            return logged("download_files", false, err);
        }
        if (!attrs.is_dir) {
            const bool ok = engine.downloadFile(s, remote, downloads, localPath, err);
            return logged("download_files", ok, err);
        }
    }

    ArchiveBuilder archive(engine, progress_);
    const bool ok = archive.buildZip(s, inv.dir, fileNames, downloads, localPath, err);
    return logged("download_files", ok, err);
}

bool BridgeCommands::uploadFiles(const std::string& userName,
                                 const std::vector<std::string>& currentPath,
                                 const std::vector<std::string>& localFilePaths,
                                 Error& err) const {
    std::vector<std::string> names;
    names.reserve(localFilePaths.size());
    for (const auto& local : localFilePaths) {
        std::string name;
        if (!baseName(local, name, err) || !validateSegment(name, err))
            return logged("upload_files", false, err);
        names.push_back(std::move(name));
    }
    Invocation inv;
    if (!begin(userName, currentPath, inv, err)) return logged("upload_files", false, err);

    TransferEngine engine(progress_);
    for (std::size_t i = 0; i < localFilePaths.size(); ++i) {
        if (!engine.uploadFile(*inv.session, joinRemote(inv.dir, names[i]), localFilePaths[i], err))
            return logged("upload_files", false, err);
    }
    return logged("upload_files", true, err);
}

bool BridgeCommands::createFolder(const std::string& userName,
                                  const std::vector<std::string>& currentPath,
                                  const std::string& folderName,
                                  Error& err) const {
    Invocation inv;
    const bool ok = validateSegment(folderName, err) &&
                    begin(userName, currentPath, inv, err) &&
                    FileOpsService().createFolder(*inv.session, inv.dir, folderName, err);
    return logged("create_folder", ok, err);
}

bool BridgeCommands::renameFile(const std::string& userName,
                                const std::vector<std::string>& currentPath,
                                const std::string& oldName,
                                const std::string& newName,
                                Error& err) const {
    Invocation inv;
    const bool ok = validateSegment(oldName, err) && validateSegment(newName, err) &&
                    begin(userName, currentPath, inv, err) &&
                    FileOpsService().rename(*inv.session, inv.dir, oldName, newName, err);
    return logged("rename_file", ok, err);
}

bool BridgeCommands::deleteFiles(const std::string& userName,
                                 const std::vector<std::string>& currentPath,
                                 const std::vector<std::string>& fileNames,
                                 Error& err) const {
    for (const auto& name : fileNames) {
        if (!validateSegment(name, err)) return logged("delete_files", false, err);
    }
    Invocation inv;
    const bool ok = begin(userName, currentPath, inv, err) &&
                    FileOpsService().deleteMany(*inv.session, inv.dir, fileNames, err);
    return logged("delete_files", ok, err);
}

bool BridgeCommands::readFile(const std::string& userName,
                              const std::vector<std::string>& currentPath,
                              const std::string& fileName,
                              std::string& content,
                              Error& err) const {
    Invocation inv;
    const bool ok = validateSegment(fileName, err) &&
                    begin(userName, currentPath, inv, err) &&
                    FileOpsService().readFile(*inv.session, inv.dir, fileName, content, err);
    return logged("read_file", ok, err);
}

bool BridgeCommands::saveFile(const std::string& userName,
                              const std::vector<std::string>& currentPath,
                              const std::string& fileName,
                              const std::string& content,
                              Error& err) const {
    Invocation inv;
    const bool ok = validateSegment(fileName, err) &&
                    begin(userName, currentPath, inv, err) &&
                    FileOpsService().saveFile(*inv.session, inv.dir, fileName, content, err);
    return logged("save_file", ok, err);
}

bool BridgeCommands::storageUsed(const std::string& userName,
                                 std::uint64_t& total,
                                 Error& err) const {
    Invocation inv;
    const bool ok = begin(userName, {}, inv, err) &&
                    FileOpsService().storageUsed(*inv.session, inv.root, total, err);
    return logged("get_storage_used", ok, err);
}

bool BridgeCommands::fileSizes(const std::vector<std::string>& localFilePaths,
                               std::vector<std::uint64_t>& out,
                               Error& err) {
    std::vector<std::uint64_t> sizes;
    sizes.reserve(localFilePaths.size());
    for (const auto& p : localFilePaths) {
        std::error_code ec;
        const std::uintmax_t n = fs::file_size(p, ec);
        if (ec)
            return err.set(ErrorKind::LocalIO, "Failed to get size of '" + p + "': " + ec.message());
        sizes.push_back((std::uint64_t)n);
    }
    out = std::move(sizes);
    return true;
}

} // namespace pibridge
