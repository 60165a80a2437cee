#include "pibridge/ConnectionConfig.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace pibridge {

namespace {

std::string trim(const std::string& s) {
    std::size_t start = 0;
    while (start < s.size() && (s[start] == ' ' || s[start] == '\t')) ++start;
    std::size_t end = s.size();
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r')) --end;
    return s.substr(start, end - start);
}

bool required(const EnvLookup& env, const char* key, std::string& out, Error& err) {
    auto v = env(key);
    if (!v.has_value())
        return err.set(ErrorKind::Config, std::string("Failed to load ") + key + ": not set");
    out = *v;
    return true;
}

} // namespace

SessionOptions ConnectionConfig::sessionOptions() const {
    SessionOptions opt;
    opt.host = host;
    opt.port = port;
    opt.username = username;
    opt.password = password;
    opt.known_hosts_path = known_hosts_path;
    opt.known_hosts_policy = known_hosts_policy;
    return opt;
}

EnvLookup processEnvironment() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* raw = std::getenv(key.c_str());
        if (!raw || !*raw) return std::nullopt;
        return std::string(raw);
    };
}

EnvLookup layeredLookup(EnvLookup primary, std::map<std::string, std::string> fallback) {
    return [primary = std::move(primary), fallback = std::move(fallback)](
               const std::string& key) -> std::optional<std::string> {
        if (primary) {
            if (auto v = primary(key)) return v;
        }
        auto it = fallback.find(key);
        if (it == fallback.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };
}

bool parseDotEnv(const std::string& text,
                 std::map<std::string, std::string>& out,
                 Error& err) {
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0)
            return err.set(ErrorKind::Config, "Invalid dotenv line " + std::to_string(lineNo) + ": expected KEY=VALUE");
        const std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment.
            const auto hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        out[key] = value;
    }
    return true;
}

bool loadDotEnvFile(const std::string& path,
                    std::map<std::string, std::string>& out,
                    Error& err) {
    out.clear();
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return true; // optional
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return err.set(ErrorKind::Config, "Failed to read " + path + ": " + std::strerror(errno));
    return parseDotEnv(ss.str(), out, err);
}

bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out) {
    std::string v = trim(text);
    for (char& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "strict") {
        out = KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew") {
        out = KnownHostsPolicy::AcceptNew;
    } else if (v == "off" || v == "none") {
        out = KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

bool loadConnectionConfig(const EnvLookup& env, ConnectionConfig& out, Error& err) {
    ConnectionConfig cfg;
    if (!required(env, kEnvHost, cfg.host, err) ||
        !required(env, kEnvUsername, cfg.username, err) ||
        !required(env, kEnvPassword, cfg.password, err))
        return false;

    if (auto port = env(kEnvPort)) {
        char* end = nullptr;
        const long n = std::strtol(port->c_str(), &end, 10);
        if (!end || *end != '\0' || n < 1 || n > 65535)
            return err.set(ErrorKind::Config, std::string("Failed to load ") + kEnvPort + ": invalid port '" + *port + "'");
        cfg.port = static_cast<std::uint16_t>(n);
    }
    if (auto policy = env(kEnvKnownHostsPolicy)) {
        if (!parseKnownHostsPolicy(*policy, cfg.known_hosts_policy))
            return err.set(ErrorKind::Config, std::string("Failed to load ") + kEnvKnownHostsPolicy +
                                                  ": expected strict, accept-new or off");
    }
    if (auto kh = env(kEnvKnownHosts)) cfg.known_hosts_path = *kh;
    if (auto base = env(kEnvBaseDir)) cfg.base_dir_name = *base;
    if (auto dl = env(kEnvDownloadsDir)) cfg.downloads_dir = *dl;

    out = std::move(cfg);
    return true;
}

} // namespace pibridge
