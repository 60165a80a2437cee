// Integration tests for the libssh2 backend and the command surface against
// a real SSH server. Skipped (exit code 77) unless the PIBRIDGE_IT_* env
// vars exist.
#include "pibridge/BridgeCommands.hpp"
#include "pibridge/FileOpsService.hpp"
#include "pibridge/Libssh2Session.hpp"
#include "pibridge/WorkspaceResolver.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readLocal(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool listContainsName(const std::vector<pibridge::FileDescriptor> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const pibridge::FileDescriptor &e) {
                           return e.name == name;
                       });
}

} // namespace

int main() {
    const auto host = envValue("PIBRIDGE_IT_SFTP_HOST");
    const auto user = envValue("PIBRIDGE_IT_SFTP_USER");
    const auto pass = envValue("PIBRIDGE_IT_SFTP_PASS");

    if (!host.has_value() || !user.has_value() || !pass.has_value()) {
        std::cout << "[SKIP] pibridge_sftp_integration_tests requires env vars: "
                  << "PIBRIDGE_IT_SFTP_HOST, PIBRIDGE_IT_SFTP_USER and "
                     "PIBRIDGE_IT_SFTP_PASS\n";
        return kSkipExitCode;
    }

    std::uint16_t port = 22;
    if (const auto rawPort = envValue("PIBRIDGE_IT_SFTP_PORT")) {
        char *end = nullptr;
        const long n = std::strtol(rawPort->c_str(), &end, 10);
        if (!end || *end != '\0' || n < 1 || n > 65535) {
            std::cerr << "[FAIL] PIBRIDGE_IT_SFTP_PORT is invalid\n";
            return EXIT_FAILURE;
        }
        port = static_cast<std::uint16_t>(n);
    }

    TestContext t;
    const std::string token = uniqueToken();
    const std::string baseDir = "pibridge-it-" + token;

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("pibridge-it-" + token);
    const fs::path downloads = localTmpRoot / "downloads";
    std::error_code ec;
    fs::create_directories(downloads, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const std::string payload = "pibridge integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    pibridge::ConnectionConfig cfg;
    cfg.host = *host;
    cfg.port = port;
    cfg.username = *user;
    cfg.password = *pass;
    cfg.base_dir_name = baseDir;
    cfg.downloads_dir = downloads.string();

    pibridge::Libssh2SessionFactory factory;
    pibridge::NullProgressSink progress;
    pibridge::BridgeCommands bridge(
        factory,
        [cfg](pibridge::ConnectionConfig &out, pibridge::Error &) {
            out = cfg;
            return true;
        },
        progress);

    pibridge::Error err;
    std::vector<pibridge::FileDescriptor> entries;

    t.check(bridge.connectToPi("it", "", entries, err),
            "connect should succeed: " + err.message);
    if (t.failures == 0) {
        t.check(entries.empty(), "fresh workspace should be empty");
        t.check(bridge.createFolder("it", {}, "docs", err),
                "createFolder should succeed: " + err.message);
    }
    if (t.failures == 0) {
        t.check(bridge.saveFile("it", {"docs"}, "note.txt", "hello", err),
                "saveFile should succeed: " + err.message);
        std::string content;
        t.check(bridge.readFile("it", {"docs"}, "note.txt", content, err),
                "readFile should succeed: " + err.message);
        t.check(content == "hello", "read content should match saved content");
    }
    if (t.failures == 0) {
        t.check(bridge.uploadFiles("it", {"docs"}, {localSrc.string()}, err),
                "uploadFiles should succeed: " + err.message);
        t.check(bridge.connectToPi("it", "docs", entries, err) &&
                    listContainsName(entries, "payload.txt"),
                "listing should include payload.txt");
    }
    if (t.failures == 0) {
        std::string local;
        t.check(bridge.downloadFiles("it", {"docs"}, {"payload.txt"}, local, err),
                "single download should succeed: " + err.message);
        std::string downloaded;
        t.check(readLocal(local, downloaded) && downloaded == payload,
                "downloaded content should match uploaded payload");

        t.check(bridge.downloadFiles("it", {}, {"docs"}, local, err),
                "archive download should succeed: " + err.message);
        t.check(fs::path(local).extension() == ".zip" && fs::file_size(local, ec) > 0,
                "archive should be written");
    }
    if (t.failures == 0) {
        t.check(bridge.renameFile("it", {"docs"}, "payload.txt", "moved.txt", err),
                "rename should succeed: " + err.message);
        std::uint64_t used = 0;
        t.check(bridge.storageUsed("it", used, err) && used == payload.size() + 5,
                "storage used should count both files");
        t.check(bridge.deleteFiles("it", {}, {"docs"}, err),
                "recursive delete should succeed: " + err.message);
        t.check(bridge.connectToPi("it", "", entries, err) && entries.empty(),
                "workspace should be empty after delete");
    }

    // Best-effort cleanup of the suite's base directory.
    {
        pibridge::Error cleanupErr;
        auto session = factory.open(cfg.sessionOptions(), cleanupErr);
        if (session) {
            std::string home;
            if (pibridge::WorkspaceResolver(baseDir).resolveHome(*session, home, cleanupErr))
                (void)pibridge::FileOpsService().deleteMany(*session, home, {baseDir}, cleanupErr);
            session->disconnect();
        }
    }
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] pibridge_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
