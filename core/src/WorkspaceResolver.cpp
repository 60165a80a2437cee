#include "pibridge/WorkspaceResolver.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/RemotePath.hpp"
#include <cctype>

namespace pibridge {

namespace {

std::string trimmed(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

WorkspaceResolver::WorkspaceResolver(std::string baseDirName)
    : baseDirName_(std::move(baseDirName)) {}

bool WorkspaceResolver::resolveHome(RemoteSession& s, std::string& home, Error& err) const {
    std::string output;
    std::string msg;
    int status = -1;
    if (!s.exec("echo $HOME", output, status, msg))
        return err.set(ErrorKind::RemoteProtocol, "Failed to get home directory: " + msg);
    if (status != 0)
        return err.set(ErrorKind::RemoteProtocol,
                       "Command to get home directory failed with exit status: " + std::to_string(status));
    home = trimmed(output);
    if (home.empty())
        return err.set(ErrorKind::RemoteProtocol, "Command to get home directory printed nothing");
    return true;
}

bool WorkspaceResolver::ensureDir(RemoteSession& s,
                                  const std::string& path,
                                  const char* what,
                                  Error& err) const {
    RemoteAttributes attrs;
    std::string msg;
    if (s.stat(path, attrs, msg)) {
        if (!attrs.is_dir)
            return err.set(ErrorKind::RemoteProtocol,
                           std::string("Failed to create ") + what + " " + path + ": a file with that name exists");
        return true;
    }
    if (!msg.empty())
        return err.set(ErrorKind::RemoteProtocol, "Failed to stat " + path + ": " + msg);
    if (!s.mkdir(path, msg, 0755)) {
        // Another command may have created it in the meantime.
        std::string again;
        if (s.stat(path, attrs, again) && attrs.is_dir) return true;
        return err.set(ErrorKind::RemoteProtocol,
                       std::string("Failed to create ") + what + " " + path + ": " + msg);
    }
    PIBRIDGE_LOGI("created %s %s", what, path.c_str());
    return true;
}

bool WorkspaceResolver::ensureBase(RemoteSession& s,
                                   const std::string& home,
                                   std::string& base,
                                   Error& err) const {
    if (!validateSegment(baseDirName_, err)) return false;
    const std::string candidate = joinRemote(home, baseDirName_);
    if (!ensureDir(s, candidate, "base directory", err)) return false;
    base = candidate;
    return true;
}

bool WorkspaceResolver::ensureUserDir(RemoteSession& s,
                                      const std::string& base,
                                      const std::string& user,
                                      std::string& userDir,
                                      Error& err) const {
    if (!validateSegment(user, err)) return false;
    const std::string candidate = joinRemote(base, user);
    if (!ensureDir(s, candidate, "user directory", err)) return false;
    userDir = candidate;
    return true;
}

bool WorkspaceResolver::resolve(RemoteSession& s,
                                const std::string& user,
                                std::string& root,
                                Error& err) const {
    std::string home, base;
    return resolveHome(s, home, err) &&
           ensureBase(s, home, base, err) &&
           ensureUserDir(s, base, user, root, err);
}

} // namespace pibridge
