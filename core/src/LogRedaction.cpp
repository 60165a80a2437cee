#include "pibridge/LogRedaction.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace pibridge {

namespace {

// Environment value as one lowercase word; unset reads as empty.
std::string envWord(const char* name) {
    const char* raw = std::getenv(name);
    std::string v = raw ? raw : "";
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

bool oneOf(const std::string& v, std::initializer_list<const char*> words) {
    return std::any_of(words.begin(), words.end(), [&v](const char* w) { return v == w; });
}

} // namespace

LogExposure logExposure() {
    const bool dev = oneOf(envWord("PIBRIDGE_ENV"), {"dev", "development", "local", "debug"});
    const bool optIn = oneOf(envWord("PIBRIDGE_LOG_SENSITIVE"), {"1", "true", "yes", "on"});
    return dev && optIn ? LogExposure::Verbatim : LogExposure::Redacted;
}

std::string loggable(const std::string& value) {
    return logExposure() == LogExposure::Verbatim ? value : std::string("<redacted>");
}

} // namespace pibridge
