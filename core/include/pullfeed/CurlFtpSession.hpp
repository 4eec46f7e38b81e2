#pragma once
#include "TransferSession.hpp"
#include <string>
#include <vector>

typedef void CURL;

namespace pullfeed {

// curl limits derived from SessionOptions::timeout_ms. The total transfer time
// is not capped; a transfer fails once it stays below low_speed_limit bytes/s
// for low_speed_time_s seconds.
struct FtpTimeouts {
    long connect_ms = 0;
    long low_speed_limit = 1;
    long low_speed_time_s = 1;
};

FtpTimeouts ftpTimeoutsFor(long timeout_ms);

// Absolute remote path for `path` seen from working directory `cwd`.
std::string resolveFtpPath(const std::string& cwd, const std::string& path);

// ftp:// URL for an absolute remote path. The leading %2F keeps curl from
// resolving the path against the login directory; segments are
// percent-encoded and directories get a trailing slash.
std::string ftpUrlFor(const std::string& baseUrl, const std::string& absPath, bool asDirectory);

// FTP backend over a single libcurl easy handle. Reusing the handle keeps the
// control connection open between operations. The session has one current
// working directory; list() changes into the listed directory and restores
// the previous one afterwards.
class CurlFtpSession : public TransferSession {
public:
    CurlFtpSession();
    ~CurlFtpSession() override;

    CurlFtpSession(const CurlFtpSession&) = delete;
    CurlFtpSession& operator=(const CurlFtpSession&) = delete;

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
    CURL* curl_ = nullptr;
    bool connected_ = false;
    std::string baseUrl_;  // ftp://host:port
    std::string username_;
    std::string password_;
    long timeout_ms_ = 0;
    std::string cwd_;
    char errbuf_[256] = {};

    void resetHandle();
    bool perform(std::string& err);
};

} // namespace pullfeed
