#pragma once
#include "TransferSession.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pullfeed {

// In-memory remote shared by every MockTransferSession created from it.
// Tests script failures per path and read back connect/close counters.
struct MockRemote {
    struct File {
        std::string content;               // bytes delivered by get()
        std::optional<std::uint64_t> size; // what stat() reports (absent: unknown)
        bool stat_fails = false;
        bool get_fails = false;
    };

    // directory -> entry names in listing order
    std::map<std::string, std::vector<std::string>> dirs;
    // full remote path -> file
    std::map<std::string, File> files;

    std::set<std::string> rejected_users; // connect() fails for these
    bool list_fails = false;
    int connect_limit = -1; // successful connects allowed in total, -1: unlimited

    // Counters (guarded by mtx)
    int connect_attempts = 0;
    int connects = 0;
    int closes = 0;
    int gets = 0;
    std::vector<std::string> get_log; // remote paths in get() order

    mutable std::mutex mtx;

    // Registers a file under dir with content and an optional reported size.
    void addFile(const std::string& dir, const std::string& name,
                 const std::string& content,
                 std::optional<std::uint64_t> reportedSize);
};

class MockTransferSession : public TransferSession {
public:
    explicit MockTransferSession(std::shared_ptr<MockRemote> remote);
    ~MockTransferSession() override;

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
    std::shared_ptr<MockRemote> remote_;
    bool connected_ = false;
    bool opened_ = false; // connect() was attempted and not yet closed
};

} // namespace pullfeed
