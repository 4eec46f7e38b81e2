// libcurl FTP backend. curl owns the control/data connections; this class
// tracks the session working directory and maps paths to ftp:// URLs.
#include "pullfeed/CurlFtpSession.hpp"
#include "pullfeed/RuntimeLogging.hpp"
#include <curl/curl.h>

#include <QByteArray>
#include <QLoggingCategory>
#include <QString>
#include <QUrl>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <sstream>

Q_LOGGING_CATEGORY(pfFtp, "pullfeed.ftp")

namespace pullfeed {

namespace {

std::once_flag g_curl_init;

size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp)) * size;
}

// Restores the saved working directory when a listing leaves scope.
class CwdRestore {
public:
    CwdRestore(std::string& cwd) : cwd_(cwd), saved_(cwd) {}
    ~CwdRestore() { cwd_ = saved_; }

private:
    std::string& cwd_;
    std::string saved_;
};

std::string trimTrailingSlashes(std::string p) {
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

} // namespace

FtpTimeouts ftpTimeoutsFor(long timeout_ms) {
    FtpTimeouts t;
    t.connect_ms = timeout_ms;
    t.low_speed_time_s = std::max(1L, timeout_ms / 1000);
    return t;
}

std::string resolveFtpPath(const std::string& cwd, const std::string& path) {
    if (path.empty()) return cwd;
    if (path.front() == '/') return trimTrailingSlashes(path);
    if (cwd.empty() || cwd == "/") return "/" + trimTrailingSlashes(path);
    return cwd + "/" + trimTrailingSlashes(path);
}

std::string ftpUrlFor(const std::string& baseUrl, const std::string& absPath, bool asDirectory) {
    std::string url = baseUrl + "/%2F";
    std::istringstream segments(absPath);
    std::string seg;
    bool first = true;
    while (std::getline(segments, seg, '/')) {
        if (seg.empty()) continue;
        if (!first) url += '/';
        url += QUrl::toPercentEncoding(QString::fromStdString(seg)).toStdString();
        first = false;
    }
    if (asDirectory) url += '/';
    return url;
}

CurlFtpSession::CurlFtpSession() {
    std::call_once(g_curl_init, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            qCWarning(pfFtp) << "curl_global_init failed";
    });
}

CurlFtpSession::~CurlFtpSession() {
    disconnect();
}

void CurlFtpSession::resetHandle() {
    // curl_easy_reset keeps live connections, so the FTP login is reused
    curl_easy_reset(curl_);
    errbuf_[0] = '\0';
    const FtpTimeouts limits = ftpTimeoutsFor(timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_);
    curl_easy_setopt(curl_, CURLOPT_USERNAME, username_.c_str());
    curl_easy_setopt(curl_, CURLOPT_PASSWORD, password_.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, limits.connect_ms);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, limits.low_speed_limit);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, limits.low_speed_time_s);
    curl_easy_setopt(curl_, CURLOPT_SERVER_RESPONSE_TIMEOUT, limits.low_speed_time_s);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_MULTICWD));
}

bool CurlFtpSession::perform(std::string& err) {
    const CURLcode rc = curl_easy_perform(curl_);
    if (rc == CURLE_OK) return true;
    err = curl_easy_strerror(rc);
    if (errbuf_[0] != '\0') err += std::string(": ") + errbuf_;
    return false;
}

bool CurlFtpSession::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        err = "curl_easy_init failed";
        return false;
    }
    baseUrl_ = "ftp://" + opt.host + ":" + std::to_string(opt.port);
    username_ = opt.username;
    password_ = opt.password.value_or(std::string());
    timeout_ms_ = opt.timeout_ms;

    // Login and PWD only: no listing, no transfer.
    resetHandle();
    curl_easy_setopt(curl_, CURLOPT_URL, (baseUrl_ + "/").c_str());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (!perform(err)) {
        err = "FTP login to " + opt.host + " failed: " + err;
        disconnect();
        return false;
    }

    char* entry = nullptr;
    if (curl_easy_getinfo(curl_, CURLINFO_FTP_ENTRY_PATH, &entry) == CURLE_OK && entry && *entry)
        cwd_ = trimTrailingSlashes(entry);
    else
        cwd_ = "/";

    qCInfo(pfFtp).noquote() << "FTP session open to"
                            << QString::fromStdString(describeEndpoint(opt.host, opt.port, opt.username))
                            << "cwd" << QString::fromStdString(cwd_);
    connected_ = true;
    return true;
}

void CurlFtpSession::disconnect() {
    if (curl_) {
        // Cleanup sends QUIT on the cached control connection
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    connected_ = false;
}

bool CurlFtpSession::list(const std::string& remote_dir,
                          std::vector<std::string>& names,
                          std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }

    CwdRestore restore(cwd_);
    cwd_ = resolveFtpPath(cwd_, remote_dir);

    std::string listing;
    resetHandle();
    curl_easy_setopt(curl_, CURLOPT_URL, ftpUrlFor(baseUrl_, cwd_, true).c_str());
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &listing);
    if (!perform(err)) {
        err = "NLST failed for " + cwd_ + ": " + err;
        return false;
    }

    names.clear();
    std::istringstream iss(listing);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        // Some servers answer NLST with paths instead of bare names
        const auto slash = line.find_last_of('/');
        if (slash != std::string::npos) line = line.substr(slash + 1);
        if (line.empty() || line == "." || line == "..") continue;
        names.push_back(line);
    }
    return true;
}

bool CurlFtpSession::stat(const std::string& remote_path,
                          RemoteStat& out,
                          std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }

    out.size.reset();
    resetHandle();
    const std::string url = ftpUrlFor(baseUrl_, resolveFtpPath(cwd_, remote_path), false);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    std::string sizeErr;
    if (!perform(sizeErr)) {
        // SIZE is optional in FTP; a rejection only means the size is unknown
        qCDebug(pfFtp).noquote() << "SIZE unavailable for" << QString::fromStdString(remote_path)
                                 << QString::fromStdString(sizeErr);
        return true;
    }
    curl_off_t len = -1;
    if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) == CURLE_OK && len >= 0)
        out.size = static_cast<std::uint64_t>(len);
    return true;
}

bool CurlFtpSession::get(const std::string& remote,
                         const std::string& local,
                         std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(local).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            err = "Could not create local directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing: " + local;
        return false;
    }

    resetHandle();
    const std::string url = ftpUrlFor(baseUrl_, resolveFtpPath(cwd_, remote), false);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_file_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, lf);
    const bool ok = perform(err);
    if (std::fclose(lf) != 0 && ok) {
        err = "Could not flush local file: " + local;
        return false;
    }
    if (!ok) err = "RETR failed: " + err;
    return ok;
}

std::unique_ptr<TransferSession> CurlFtpSession::newConnectionLike(const SessionOptions& opt,
                                                                   std::string& err) {
    auto ptr = std::make_unique<CurlFtpSession>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace pullfeed
