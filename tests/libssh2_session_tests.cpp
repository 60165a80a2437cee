// Connection diagnostics of the libssh2 backend. Needs no SSH server: every
// case fails at a known step against a local socket.
#include "pibridge/Libssh2Session.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkPrefix(const std::string &text, const std::string &prefix,
                     const std::string &msg) {
        check(text.compare(0, prefix.size(), prefix) == 0,
              msg + " (got: " + text + ")");
    }
};

// Loopback TCP socket bound to an ephemeral port; closed at scope exit.
class LoopbackSocket {
public:
    LoopbackSocket() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0)
            return;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
            close();
            return;
        }
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackSocket() { close(); }

    LoopbackSocket(const LoopbackSocket &) = delete;
    LoopbackSocket &operator=(const LoopbackSocket &) = delete;

    bool valid() const { return fd_ >= 0 && port_ != 0; }
    int fd() const { return fd_; }
    std::uint16_t port() const { return port_; }

    void close() {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
    std::uint16_t port_ = 0;
};

pibridge::SessionOptions optionsFor(std::uint16_t port) {
    pibridge::SessionOptions opt;
    opt.host = "127.0.0.1";
    opt.port = port;
    opt.username = "pi";
    opt.password = "secret";
    return opt;
}

void test_closed_port_is_a_connect_failure(TestContext &t) {
    std::uint16_t port = 0;
    {
        // Reserve a port, then release it without listening.
        LoopbackSocket sock;
        t.check(sock.valid(), "loopback socket should bind");
        if (!sock.valid())
            return;
        port = sock.port();
    }

    pibridge::Libssh2SessionFactory factory;
    pibridge::Error err;
    auto session = factory.open(optionsFor(port), err);
    t.check(!session, "no session against a closed port");
    t.check(err.kind == pibridge::ErrorKind::Connection,
            "closed port is a connection error");
    t.checkPrefix(err.message, "Failed to connect to 127.0.0.1:",
                  "closed port names the connect step");
}

void test_peer_closing_is_a_handshake_failure(TestContext &t) {
    LoopbackSocket listener;
    t.check(listener.valid() && ::listen(listener.fd(), 1) == 0,
            "loopback listener should start");
    if (!listener.valid())
        return;

    // Accepts one connection and hangs up without sending a banner.
    std::thread peer([fd = listener.fd()] {
        const int c = ::accept(fd, nullptr, nullptr);
        if (c >= 0)
            ::close(c);
    });

    pibridge::Libssh2SessionFactory factory;
    pibridge::Error err;
    auto session = factory.open(optionsFor(listener.port()), err);
    peer.join();

    t.check(!session, "no session when the peer hangs up");
    t.check(err.kind == pibridge::ErrorKind::Connection,
            "handshake failure is a connection error");
    t.checkPrefix(err.message, "SSH handshake failed",
                  "hang-up names the handshake step");
}

} // namespace

int main() {
    TestContext t;
    test_closed_port_is_a_connect_failure(t);
    test_peer_closing_is_a_handshake_failure(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] pibridge_libssh2_session_tests\n";
    return EXIT_SUCCESS;
}
