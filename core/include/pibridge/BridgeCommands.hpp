// Command surface consumed by the presentation layer. Every command opens
// its own session, resolves the user's workspace and runs one operation;
// the session is dropped when the command returns.
#pragma once
#include "BridgeError.hpp"
#include "BridgeTypes.hpp"
#include "ConnectionConfig.hpp"
#include "ProgressSink.hpp"
#include "RemoteSession.hpp"
#include "SessionFactory.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pibridge {

class BridgeCommands {
public:
    // Called once at the start of every command.
    using ConfigProvider = std::function<bool(ConnectionConfig&, Error&)>;

    BridgeCommands(SessionFactory& factory, ConfigProvider config, ProgressSink& progress);

    // `path` is an optional '/' separated path below the workspace root.
    bool connectToPi(const std::string& userName,
                     const std::string& path,
                     std::vector<FileDescriptor>& out,
                     Error& err) const;

    // A single plain file is downloaded as is; anything else becomes a ZIP.
    // `localPath` receives the file written in the downloads directory.
    bool downloadFiles(const std::string& userName,
                       const std::vector<std::string>& currentPath,
                       const std::vector<std::string>& fileNames,
                       std::string& localPath,
                       Error& err) const;

    bool uploadFiles(const std::string& userName,
                     const std::vector<std::string>& currentPath,
                     const std::vector<std::string>& localFilePaths,
                     Error& err) const;

    bool createFolder(const std::string& userName,
                      const std::vector<std::string>& currentPath,
                      const std::string& folderName,
                      Error& err) const;

    bool renameFile(const std::string& userName,
                    const std::vector<std::string>& currentPath,
                    const std::string& oldName,
                    const std::string& newName,
                    Error& err) const;

    bool deleteFiles(const std::string& userName,
                     const std::vector<std::string>& currentPath,
                     const std::vector<std::string>& fileNames,
                     Error& err) const;

    bool readFile(const std::string& userName,
                  const std::vector<std::string>& currentPath,
                  const std::string& fileName,
                  std::string& content,
                  Error& err) const;

    bool saveFile(const std::string& userName,
                  const std::vector<std::string>& currentPath,
                  const std::string& fileName,
                  const std::string& content,
                  Error& err) const;

    // Total bytes stored below the user's workspace root.
    bool storageUsed(const std::string& userName,
                     std::uint64_t& total,
                     Error& err) const;

    // Local sizes, used to precompute upload totals. No remote access.
    static bool fileSizes(const std::vector<std::string>& localFilePaths,
                          std::vector<std::uint64_t>& out,
                          Error& err);

private:
    struct Invocation {
        ConnectionConfig config;
        std::unique_ptr<RemoteSession> session;
        std::string root; // workspace root
        std::string dir;  // root + current path
    };

    bool begin(const std::string& userName,
               const std::vector<std::string>& currentPath,
               Invocation& inv,
               Error& err) const;

    SessionFactory& factory_;
    ConfigProvider config_;
    ProgressSink& progress_;
};

} // namespace pibridge
