// Produces one fresh authenticated session per command. Sessions are never
// pooled: the caller owns the returned session until the command returns.
#pragma once
#include "BridgeError.hpp"
#include "BridgeTypes.hpp"
#include "RemoteSession.hpp"
#include <memory>

namespace pibridge {

class SessionFactory {
public:
    virtual ~SessionFactory() = default;

    // Returns nullptr with a Connection error if any step fails.
    virtual std::unique_ptr<RemoteSession> open(const SessionOptions& opt,
                                                Error& err) = 0;
};

} // namespace pibridge
