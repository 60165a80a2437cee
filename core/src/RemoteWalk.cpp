#include "pibridge/RemoteWalk.hpp"
#include "pibridge/RemotePath.hpp"
#include <utility>
#include <vector>

namespace pibridge {

bool walkRemoteTree(RemoteSession& s,
                    const std::string& root,
                    const std::function<bool(const WalkItem&, Error&)>& visit,
                    Error& err) {
    // (remote path, path relative to root)
    std::vector<std::pair<std::string, std::string>> frontier;
    frontier.emplace_back(root, std::string());

    std::vector<RemoteEntry> entries;
    while (!frontier.empty()) {
        const auto dir = std::move(frontier.back());
        frontier.pop_back();

        std::string msg;
        if (!s.list(dir.first, entries, msg))
            return err.set(ErrorKind::RemoteProtocol, "Failed to read directory " + dir.first + ": " + msg);

        std::vector<std::pair<std::string, std::string>> subdirs;
        for (const auto& e : entries) {
            WalkItem item;
            item.path = joinRemote(dir.first, e.name);
            item.relative = dir.second.empty() ? e.name : dir.second + "/" + e.name;
            item.attrs = e.attrs;
            if (!visit(item, err)) return false;
            if (e.attrs.is_dir) subdirs.emplace_back(item.path, item.relative);
        }
        // Reverse push so the first listed subdirectory is expanded first.
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it)
            frontier.push_back(std::move(*it));
    }
    return true;
}

} // namespace pibridge
