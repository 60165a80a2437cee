// Connection settings resolved once per command from the environment (and
// optionally a dotenv file). The host layers QSettings on top of this.
#pragma once
#include "BridgeError.hpp"
#include "BridgeTypes.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace pibridge {

constexpr const char* kEnvHost = "PIBRIDGE_HOST";
constexpr const char* kEnvUsername = "PIBRIDGE_USERNAME";
constexpr const char* kEnvPassword = "PIBRIDGE_PASSWORD";
constexpr const char* kEnvPort = "PIBRIDGE_PORT";
constexpr const char* kEnvKnownHostsPolicy = "PIBRIDGE_KNOWN_HOSTS_POLICY";
constexpr const char* kEnvKnownHosts = "PIBRIDGE_KNOWN_HOSTS";
constexpr const char* kEnvBaseDir = "PIBRIDGE_BASE_DIR";
constexpr const char* kEnvDownloadsDir = "PIBRIDGE_DOWNLOADS_DIR";

struct ConnectionConfig {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::string password;
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Off;
    std::optional<std::string> known_hosts_path;
    std::string base_dir_name = "pi-interface";
    std::string downloads_dir; // empty: not resolved

    SessionOptions sessionOptions() const;
};

// Returns the value for a key, or nullopt if unset or empty.
using EnvLookup = std::function<std::optional<std::string>(const std::string& key)>;

EnvLookup processEnvironment();

// `primary` first, then `fallback`.
EnvLookup layeredLookup(EnvLookup primary, std::map<std::string, std::string> fallback);

// KEY=VALUE lines; '#' comments, blank lines, an optional "export " prefix
// and single or double quotes around the value are accepted.
bool parseDotEnv(const std::string& text,
                 std::map<std::string, std::string>& out,
                 Error& err);

// A missing file is not an error: `out` is left empty.
bool loadDotEnvFile(const std::string& path,
                    std::map<std::string, std::string>& out,
                    Error& err);

// "strict", "accept-new" or "off" (case-insensitive).
bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out);

// Host, username and password are required (Config error naming the key).
bool loadConnectionConfig(const EnvLookup& env, ConnectionConfig& out, Error& err);

} // namespace pibridge
