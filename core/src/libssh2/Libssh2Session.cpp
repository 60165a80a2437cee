// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel
// for the duration of one command.
#include "pibridge/Libssh2Session.hpp"
#include "pibridge/Log.hpp"
#include "pibridge/LogRedaction.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace pibridge {

namespace {

std::once_flag g_libssh2_once;

// Password handed to the keyboard-interactive callback.
struct KbdIntCtx {
    const char* pass;
};

// Answers every keyboard-interactive prompt with the account password.
void kbint_password_callback(const char* /*name*/, int /*name_len*/,
                             const char* /*instruction*/, int /*instruction_len*/,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    const KbdIntCtx* ctx = (abstract && *abstract) ? static_cast<const KbdIntCtx*>(*abstract) : nullptr;
    const char* pass = ctx ? ctx->pass : nullptr;
    const size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0) continue;
        // libssh2 frees the responses with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(plen + 1));
        if (!buf) continue;
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = (unsigned int)plen;
    }
}

const char* sftpErrorName(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_OK: return "ok";
        case LIBSSH2_FX_EOF: return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
        case LIBSSH2_FX_FAILURE: return "failure";
        case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
        case LIBSSH2_FX_NO_CONNECTION: return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
        case LIBSSH2_FX_INVALID_HANDLE: return "invalid handle";
        case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
        case LIBSSH2_FX_NO_MEDIA: return "no media";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED: return "quota exceeded";
        case LIBSSH2_FX_UNKNOWN_PRINCIPAL: return "unknown principal";
        case LIBSSH2_FX_LOCK_CONFLICT: return "lock conflict";
        case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME: return "invalid filename";
        case LIBSSH2_FX_LINK_LOOP: return "link loop";
        default: return "unknown sftp error";
    }
}

RemoteAttributes toAttributes(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    RemoteAttributes out;
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.mode = (std::uint32_t)a.permissions;
        out.is_dir = (a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        out.is_link = (a.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK;
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) {
        out.has_size = true;
        out.size = (std::uint64_t)a.filesize;
    }
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) {
        out.has_mtime = true;
        out.mtime = (std::uint64_t)a.mtime;
    }
    return out;
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(LIBSSH2_SFTP* sftp, LIBSSH2_SFTP_HANDLE* h) : sftp_(sftp), h_(h) {}
    ~Libssh2RemoteFile() override {
        if (h_) libssh2_sftp_close(h_);
    }

    bool close(std::string& err) override {
        if (!h_) return true;
        const int rc = libssh2_sftp_close(h_);
        h_ = nullptr;
        if (rc != 0) {
            err = std::string("sftp close failed: ") + sftpErrorName(libssh2_sftp_last_error(sftp_));
            return false;
        }
        return true;
    }

    std::int64_t read(char* buf, std::size_t len, std::string& err) override {
        // libssh2 may return less than asked; keep reading until the buffer
        // is full so callers see one read per chunk.
        std::size_t got = 0;
        while (got < len) {
            ssize_t n = libssh2_sftp_read(h_, buf + got, len - got);
            if (n > 0) {
                got += (std::size_t)n;
            } else if (n == 0) {
                break; // EOF
            } else {
                err = std::string("sftp read failed: ") + sftpErrorName(libssh2_sftp_last_error(sftp_));
                return -1;
            }
        }
        return (std::int64_t)got;
    }

    bool write(const char* buf, std::size_t len, std::string& err) override {
        const char* p = buf;
        std::size_t remain = len;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(h_, p, remain);
            if (w < 0) {
                err = std::string("sftp write failed: ") + sftpErrorName(libssh2_sftp_last_error(sftp_));
                return false;
            }
            remain -= (std::size_t)w;
            p += w;
        }
        return true;
    }

private:
    LIBSSH2_SFTP* sftp_;
    LIBSSH2_SFTP_HANDLE* h_;
};

} // namespace

Libssh2Session::Libssh2Session() {
    std::call_once(g_libssh2_once, [] {
        int rc = libssh2_init(0);
        if (rc != 0) PIBRIDGE_LOGE("libssh2_init failed (%d)", rc);
    });
}

Libssh2Session::~Libssh2Session() {
    disconnect();
}

std::string Libssh2Session::lastSessionError() const {
    if (!session_) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string("unknown error");
}

std::string Libssh2Session::lastSftpError() const {
    if (!sftp_) return lastSessionError();
    return sftpErrorName(libssh2_sftp_last_error(sftp_));
}

bool Libssh2Session::tcpConnect(const std::string& host, std::uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));
    const std::string target = host + ":" + portStr;

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = "Failed to connect to " + target + ": " + gai_strerror(gai);
        return false;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Failed to connect to " + target + ": " +
          (lastErrno ? std::strerror(lastErrno) : "no usable address");
    return false;
}

bool Libssh2Session::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Host key check failed: could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "Host key check failed: known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Host key check failed: server sent no host key";
        return false;
    }

    int alg = 0;
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA: alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS: alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519: alg = LIBSSH2_KNOWNHOST_KEY_ED25519; break;
#endif
        default: alg = 0; break;
    }

    const int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    struct libssh2_knownhost* known = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask, &known);

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND &&
        opt.known_hosts_policy == KnownHostsPolicy::AcceptNew) {
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "Host key check failed: no known_hosts path to record the new host";
            return false;
        }
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                           hostkey, keylen, nullptr, 0,
                                           typemask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Host key check failed: could not write " + khPath;
            return false;
        }
        libssh2_knownhost_free(nh);
        PIBRIDGE_LOGI("recorded new host key for %s", loggable(opt.host).c_str());
        return true;
    }
    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key check failed: key does not match known_hosts"
              : "Host key check failed: host not found in known_hosts";
    return false;
}

bool Libssh2Session::authenticate(const SessionOptions& opt, std::string& err) {
    int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password.c_str());
    if (rc_pw == 0) return true;

    const std::string pwErr = lastSessionError();
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "SSH authentication failed: server closed the connection (" + pwErr + ")";
        return false;
    }

    // Some servers only allow passwords through keyboard-interactive.
    char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.password.c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        int rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(),
                                                           kbint_password_callback);
        if (abs) *abs = nullptr;
        if (rc_kbd == 0) return true;
    }

    err = "SSH authentication failed: " + pwErr +
          (authlist.empty() ? std::string() : " (methods: " + authlist + ")");
    return false;
}

bool Libssh2Session::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Session already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "Failed to create SSH session";
        disconnect();
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        disconnect();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        disconnect();
        return false;
    }
    if (!libssh2_userauth_authenticated(session_)) {
        err = "Authentication failed";
        disconnect();
        return false;
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Failed to create SFTP session: " + lastSessionError();
        disconnect();
        return false;
    }

    connected_ = true;
    return true;
}

void Libssh2Session::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2Session::exec(const std::string& command,
                          std::string& output,
                          int& exitStatus,
                          std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(session_);
    if (!ch) {
        err = "Failed to create channel session: " + lastSessionError();
        return false;
    }
    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        err = "Failed to execute '" + command + "': " + lastSessionError();
        libssh2_channel_free(ch);
        return false;
    }

    output.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, (size_t)n);
        } else if (n == 0) {
            break;
        } else {
            err = "Failed to read output of '" + command + "': " + lastSessionError();
            libssh2_channel_free(ch);
            return false;
        }
    }

    if (libssh2_channel_close(ch) != 0 || libssh2_channel_wait_closed(ch) != 0) {
        err = "Failed to close channel: " + lastSessionError();
        libssh2_channel_free(ch);
        return false;
    }
    exitStatus = libssh2_channel_get_exit_status(ch);
    libssh2_channel_free(ch);
    return true;
}

bool Libssh2Session::stat(const std::string& remote_path,
                          RemoteAttributes& attrs,
                          std::string& err) {
    return statWith(LIBSSH2_SFTP_STAT, remote_path, attrs, err);
}

bool Libssh2Session::lstat(const std::string& remote_path,
                           RemoteAttributes& attrs,
                           std::string& err) {
    return statWith(LIBSSH2_SFTP_LSTAT, remote_path, attrs, err);
}

bool Libssh2Session::statWith(int type,
                              const std::string& remote_path,
                              RemoteAttributes& attrs,
                              std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                                  type, &st);
    if (rc != 0) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            err.clear();
            return false; // does not exist
        }
        err = sftpErrorName(code);
        return false;
    }
    attrs = toAttributes(st);
    return true;
}

bool Libssh2Session::list(const std::string& remote_path,
                          std::vector<RemoteEntry>& out,
                          std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, remote_path.c_str());
    if (!dir) {
        err = lastSftpError();
        return false;
    }

    out.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            RemoteEntry e;
            e.name = std::string(filename, (size_t)rc);
            if (e.name == "." || e.name == "..") continue;
            e.attrs = toAttributes(attrs);
            out.push_back(std::move(e));
        } else if (rc == 0) {
            break;
        } else {
            err = lastSftpError();
            libssh2_sftp_closedir(dir);
            return false;
        }
    }
    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2Session::mkdir(const std::string& remote_dir, std::string& err, unsigned int mode) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), (long)mode) != 0) {
        err = lastSftpError();
        return false;
    }
    return true;
}

bool Libssh2Session::removeFile(const std::string& remote_path, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = lastSftpError();
        return false;
    }
    return true;
}

bool Libssh2Session::removeDir(const std::string& remote_dir, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = lastSftpError();
        return false;
    }
    return true;
}

bool Libssh2Session::rename(const std::string& from, const std::string& to, std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    // No OVERWRITE flag: an existing destination is a conflict.
    const long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    int rc = libssh2_sftp_rename_ex(sftp_, from.c_str(), (unsigned)from.size(),
                                    to.c_str(), (unsigned)to.size(), flags);
    if (rc != 0) {
        err = lastSftpError();
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile> Libssh2Session::openRead(const std::string& remote_path,
                                                     std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  (unsigned)remote_path.size(),
                                                  LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = lastSftpError();
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(sftp_, h);
}

std::unique_ptr<RemoteFile> Libssh2Session::openWrite(const std::string& remote_path,
                                                      std::string& err,
                                                      unsigned int mode) {
    if (!connected_) {
        err = "Not connected";
        return nullptr;
    }
    const unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(sftp_, remote_path.c_str(),
                                                  (unsigned)remote_path.size(),
                                                  flags, (long)mode, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = lastSftpError();
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(sftp_, h);
}

std::unique_ptr<RemoteSession> Libssh2SessionFactory::open(const SessionOptions& opt, Error& err) {
    auto session = std::make_unique<Libssh2Session>();
    std::string msg;
    if (!session->connect(opt, msg)) {
        err.set(ErrorKind::Connection, msg);
        return nullptr;
    }
    PIBRIDGE_LOGI("session open to %s:%u as %s", loggable(opt.host).c_str(),
                  (unsigned)opt.port, loggable(opt.username).c_str());
    return session;
}

} // namespace pibridge
