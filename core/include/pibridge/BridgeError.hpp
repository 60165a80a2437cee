// Error taxonomy reported by every core operation. Operations return bool
// and fill an Error; the message names the failing operation and path.
#pragma once
#include <string>

namespace pibridge {

enum class ErrorKind {
    None,
    Config,          // required connection value missing
    Connection,      // connect, handshake or authentication failure
    RemoteProtocol,  // failed remote filesystem operation or remote command
    LocalIO,         // local file or well-known directory failure
    Archive,         // archive write/finalize failure
    Path             // name cannot be used as a path component
};

// Stable lowercase tag: "config", "connection", "remote", ...
const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    // Always returns false so call sites can `return err.set(...)`.
    bool set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
        return false;
    }

    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }

    // "[remote] Failed to ..."
    std::string describe() const;
};

} // namespace pibridge
