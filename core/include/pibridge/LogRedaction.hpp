// Hosts and user names are redacted in log output unless PIBRIDGE_ENV names
// a development environment and PIBRIDGE_LOG_SENSITIVE switches them on.
#pragma once
#include <string>

namespace pibridge {

enum class LogExposure { Redacted, Verbatim };

// Read from the environment on every call.
LogExposure logExposure();

// `value`, or "<redacted>".
std::string loggable(const std::string& value);

} // namespace pibridge
