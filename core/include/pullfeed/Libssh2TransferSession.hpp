#pragma once
#include "TransferSession.hpp"
#include <string>
#include <vector>

// libssh2's internal type names (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace pullfeed {

// SFTP backend: one TCP socket, one SSH session and one SFTP channel shared
// by every operation after a single authentication.
class Libssh2TransferSession : public TransferSession {
public:
    Libssh2TransferSession();
    ~Libssh2TransferSession() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_dir,
              std::vector<std::string>& names,
              std::string& err) override;

    bool stat(const std::string& remote_path,
              RemoteStat& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err) override;

    std::unique_ptr<TransferSession> newConnectionLike(const SessionOptions& opt,
                                                       std::string& err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP* sftp_ = nullptr;

    bool tcpConnect(const std::string& host, uint16_t port, long timeout_ms, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    std::string lastSessionError() const;
};

} // namespace pullfeed
