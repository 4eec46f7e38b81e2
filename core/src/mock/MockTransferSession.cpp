#include "pullfeed/MockTransferSession.hpp"
#include <filesystem>
#include <fstream>

namespace pullfeed {

void MockRemote::addFile(const std::string& dir, const std::string& name,
                         const std::string& content,
                         std::optional<std::uint64_t> reportedSize) {
    std::string base = dir;
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    const std::string path = (base == "/" ? std::string() : base) + "/" + name;
    dirs[base].push_back(name);
    File f;
    f.content = content;
    f.size = reportedSize;
    files[path] = std::move(f);
}

MockTransferSession::MockTransferSession(std::shared_ptr<MockRemote> remote)
    : remote_(std::move(remote)) {}

MockTransferSession::~MockTransferSession() {
    disconnect();
}

bool MockTransferSession::connect(const SessionOptions& opt, std::string& err) {
    std::lock_guard<std::mutex> lk(remote_->mtx);
    ++remote_->connect_attempts;
    opened_ = true;
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (remote_->rejected_users.count(opt.username) > 0) {
        err = "Authentication failed for " + opt.username;
        return false;
    }
    if (remote_->connect_limit >= 0 && remote_->connects >= remote_->connect_limit) {
        err = "Too many connections";
        return false;
    }
    ++remote_->connects;
    connected_ = true;
    return true;
}

void MockTransferSession::disconnect() {
    if (!opened_) return;
    std::lock_guard<std::mutex> lk(remote_->mtx);
    ++remote_->closes;
    opened_ = false;
    connected_ = false;
}

bool MockTransferSession::list(const std::string& remote_dir,
                               std::vector<std::string>& names,
                               std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(remote_->mtx);
    if (remote_->list_fails) {
        err = "Permission denied: " + remote_dir;
        return false;
    }
    std::string path = remote_dir.empty() ? "/" : remote_dir;
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    auto it = remote_->dirs.find(path);
    if (it == remote_->dirs.end()) {
        err = "No such directory: " + path;
        return false;
    }
    names = it->second;
    return true;
}

bool MockTransferSession::stat(const std::string& remote_path,
                               RemoteStat& out,
                               std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(remote_->mtx);
    auto it = remote_->files.find(remote_path);
    if (it == remote_->files.end()) {
        err = "No such file: " + remote_path;
        return false;
    }
    if (it->second.stat_fails) {
        err = "stat failed: " + remote_path;
        return false;
    }
    out.size = it->second.size;
    return true;
}

bool MockTransferSession::get(const std::string& remote,
                              const std::string& local,
                              std::string& err) {
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    std::string content;
    {
        std::lock_guard<std::mutex> lk(remote_->mtx);
        ++remote_->gets;
        remote_->get_log.push_back(remote);
        auto it = remote_->files.find(remote);
        if (it == remote_->files.end()) {
            err = "No such file: " + remote;
            return false;
        }
        if (it->second.get_fails) {
            err = "Connection reset while reading " + remote;
            return false;
        }
        content = it->second.content;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(local).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            err = "Could not create local directory: " + ec.message();
            return false;
        }
    }
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        err = "Could not open local file for writing: " + local;
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        err = "Local write failed: " + local;
        return false;
    }
    return true;
}

std::unique_ptr<TransferSession> MockTransferSession::newConnectionLike(const SessionOptions& opt,
                                                                        std::string& err) {
    auto ptr = std::make_unique<MockTransferSession>(remote_);
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace pullfeed
