// Small-file and metadata operations inside a workspace directory.
#pragma once
#include "BridgeError.hpp"
#include "RemoteSession.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pibridge {

class FileOpsService {
public:
    // mkdir 0755; fails if the name already exists.
    bool createFolder(RemoteSession& s,
                      const std::string& path,
                      const std::string& name,
                      Error& err) const;

    bool rename(RemoteSession& s,
                const std::string& path,
                const std::string& oldName,
                const std::string& newName,
                Error& err) const;

    // Files are unlinked, directories removed recursively. Stops at the
    // first failure; already removed entries stay removed.
    bool deleteMany(RemoteSession& s,
                    const std::string& path,
                    const std::vector<std::string>& names,
                    Error& err) const;

    // Whole file in memory, meant for small editable text files.
    bool readFile(RemoteSession& s,
                  const std::string& path,
                  const std::string& name,
                  std::string& content,
                  Error& err) const;

    bool saveFile(RemoteSession& s,
                  const std::string& path,
                  const std::string& name,
                  const std::string& content,
                  Error& err) const;

    // Sum of all file sizes below `root`.
    bool storageUsed(RemoteSession& s,
                     const std::string& root,
                     std::uint64_t& total,
                     Error& err) const;

private:
    bool removeTree(RemoteSession& s, const std::string& dir, Error& err) const;
};

} // namespace pibridge
