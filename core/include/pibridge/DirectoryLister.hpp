#pragma once
#include "BridgeError.hpp"
#include "BridgeTypes.hpp"
#include "RemoteSession.hpp"
#include <string>
#include <vector>

namespace pibridge {

FileKind classify(const std::string& name, bool isDir);

// Missing size or mtime become 0.
FileDescriptor describe(const RemoteEntry& entry);

class DirectoryLister {
public:
    // Direct children of `path` in the order the server returns them.
    bool list(RemoteSession& s,
              const std::string& path,
              std::vector<FileDescriptor>& out,
              Error& err) const;
};

} // namespace pibridge
