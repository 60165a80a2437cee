// Outbound progress notifications. The core only reports; delivery is up to
// the host and is never waited on.
#pragma once
#include "BridgeTypes.hpp"
#include <cstdint>
#include <functional>
#include <utility>

namespace pibridge {

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void report(ProgressTopic topic, std::uint64_t value) = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void report(ProgressTopic, std::uint64_t) override {}
};

class CallbackProgressSink : public ProgressSink {
public:
    using Callback = std::function<void(ProgressTopic, std::uint64_t)>;

    explicit CallbackProgressSink(Callback cb) : cb_(std::move(cb)) {}

    void report(ProgressTopic topic, std::uint64_t value) override {
        if (cb_) cb_(topic, value);
    }

private:
    Callback cb_;
};

} // namespace pibridge
