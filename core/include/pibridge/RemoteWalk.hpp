// Depth-first traversal of a remote tree with an explicit frontier of
// pending directories, so deep trees do not grow the call stack.
#pragma once
#include "BridgeError.hpp"
#include "RemoteSession.hpp"
#include <functional>
#include <string>

namespace pibridge {

struct WalkItem {
    std::string      path;      // full remote path
    std::string      relative;  // path below the walk root, '/' separated
    RemoteAttributes attrs;
};

// Visits every descendant of `root` (not `root` itself). Directories are
// visited before their contents. Returning false from `visit` stops the walk.
bool walkRemoteTree(RemoteSession& s,
                    const std::string& root,
                    const std::function<bool(const WalkItem&, Error&)>& visit,
                    Error& err);

} // namespace pibridge
