#pragma once
#include "RemoteSession.hpp"
#include "SessionFactory.hpp"
#include <string>
#include <vector>

// Forward declarations of the libssh2 internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace pibridge {

class Libssh2Session : public RemoteSession {
public:
    Libssh2Session();
    ~Libssh2Session() override;

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    // Connect, handshake, authenticate and start SFTP. One attempt.
    bool connect(const SessionOptions& opt, std::string& err);
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool exec(const std::string& command,
              std::string& output,
              int& exitStatus,
              std::string& err) override;

    bool stat(const std::string& remote_path,
              RemoteAttributes& attrs,
              std::string& err) override;

    bool lstat(const std::string& remote_path,
               RemoteAttributes& attrs,
               std::string& err) override;

    bool list(const std::string& remote_path,
              std::vector<RemoteEntry>& out,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path, std::string& err) override;
    bool removeDir(const std::string& remote_dir, std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err) override;

    std::unique_ptr<RemoteFile> openRead(const std::string& remote_path,
                                         std::string& err) override;
    std::unique_ptr<RemoteFile> openWrite(const std::string& remote_path,
                                          std::string& err,
                                          unsigned int mode = 0644) override;

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool statWith(int type, const std::string& remote_path, RemoteAttributes& attrs, std::string& err);
    bool tcpConnect(const std::string& host, std::uint16_t port, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    std::string lastSessionError() const;
    std::string lastSftpError() const;
};

class Libssh2SessionFactory : public SessionFactory {
public:
    std::unique_ptr<RemoteSession> open(const SessionOptions& opt,
                                        Error& err) override;
};

} // namespace pibridge
