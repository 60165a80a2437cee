// Resolves <home>/<base>/<user> on the remote host, creating the base and
// user directories on demand.
#pragma once
#include "BridgeError.hpp"
#include "RemoteSession.hpp"
#include <string>

namespace pibridge {

class WorkspaceResolver {
public:
    static constexpr const char* kDefaultBaseDir = "pi-interface";

    explicit WorkspaceResolver(std::string baseDirName = kDefaultBaseDir);

    // Runs `echo $HOME` and returns the trimmed output.
    bool resolveHome(RemoteSession& s, std::string& home, Error& err) const;

    bool ensureBase(RemoteSession& s,
                    const std::string& home,
                    std::string& base,
                    Error& err) const;

    bool ensureUserDir(RemoteSession& s,
                       const std::string& base,
                       const std::string& user,
                       std::string& userDir,
                       Error& err) const;

    // home -> base -> user, stopping at the first failure.
    bool resolve(RemoteSession& s,
                 const std::string& user,
                 std::string& root,
                 Error& err) const;

    const std::string& baseDirName() const { return baseDirName_; }

private:
    bool ensureDir(RemoteSession& s,
                   const std::string& path,
                   const char* what,
                   Error& err) const;

    std::string baseDirName_;
};

} // namespace pibridge
