#include "pullfeed/Ingestor.hpp"
#include "pullfeed/RemoteCatalog.hpp"
#include "pullfeed/TransferSession.hpp"
#include "pullfeed/Validator.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <mutex>
#include <system_error>
#include <thread>

namespace pullfeed {

namespace {

// Owns a session and disconnects it exactly once, on whichever path leaves
// the scope first (explicit close() or destruction).
class ScopedSession {
public:
    explicit ScopedSession(std::unique_ptr<TransferSession> s) : s_(std::move(s)) {}
    ~ScopedSession() { close(); }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    explicit operator bool() const { return static_cast<bool>(s_); }
    TransferSession* operator->() { return s_.get(); }
    TransferSession& get() { return *s_; }

    void close() {
        if (s_ && !closed_) {
            closed_ = true;
            s_->disconnect();
        }
    }

private:
    std::unique_ptr<TransferSession> s_;
    bool closed_ = false;
};

std::string joinReasons(const std::vector<std::string>& reasons) {
    std::string out;
    for (const auto& r : reasons) {
        if (!out.empty()) out += ", ";
        out += r;
    }
    return out;
}

bool openSession(const IngestorConfig& cfg, IngestLogger& log,
                 ScopedSession& session, IngestError& err) {
    if (!session) {
        err.kind = IngestError::Kind::Connection;
        err.message = std::string("No session backend for ") + transportName(cfg.transport);
        return false;
    }
    log.info(std::string("Connecting via ") + transportName(cfg.transport) + " to " + cfg.host);
    std::string cerr;
    if (!session->connect(sessionOptionsFor(cfg), cerr)) {
        err.kind = IngestError::Kind::Connection;
        err.message = cerr;
        log.warning("Connection to " + cfg.host + " failed: " + cerr);
        return false;
    }
    return true;
}

bool listInSession(TransferSession& session, const IngestorConfig& cfg, IngestLogger& log,
                   std::vector<FileDescriptor>& out, IngestError& err) {
    std::string lerr;
    if (!RemoteCatalog::list(session, cfg.remote_dir, cfg.filename_glob, cfg.expected_md5, out, lerr)) {
        err.kind = IngestError::Kind::List;
        err.message = lerr;
        log.warning("Listing " + cfg.remote_dir + " failed: " + lerr);
        return false;
    }
    log.info(std::to_string(out.size()) + " file(s) in " + cfg.remote_dir +
             " match " + cfg.filename_glob);
    return true;
}

} // namespace

Ingestor::Ingestor(IngestorConfig cfg, SessionFactory factory, IngestLogger* logger)
    : cfg_(std::move(cfg)),
      factory_(std::move(factory)),
      logger_(logger ? logger : &defaultIngestLogger()) {}

std::string Ingestor::localPathFor(const FileDescriptor& fd) const {
    return (std::filesystem::path(cfg_.local_dir) / remoteBaseName(fd.remote_path)).string();
}

bool Ingestor::listRemote(std::vector<FileDescriptor>& out, IngestError& err) const {
    err = IngestError{};
    ScopedSession session(factory_ ? factory_(cfg_.transport) : nullptr);
    if (!openSession(cfg_, *logger_, session, err)) return false;
    const bool ok = listInSession(session.get(), cfg_, *logger_, out, err);
    session.close();
    return ok;
}

Ingestor::FileResult Ingestor::processFile(TransferSession& session, const FileDescriptor& fd) const {
    FileResult r;
    r.local_path = localPathFor(fd);
    try {
        logger_->info("Downloading " + fd.remote_path + " -> " + r.local_path);
        std::string err;
        if (!session.get(fd.remote_path, r.local_path, err)) {
            r.error = fd.remote_path + ": " + err;
            return r;
        }
        const ValidationResult v = validate(fd, r.local_path, cfg_);
        if (!v.ok) {
            r.error = "validation failed for " + fd.remote_path + ": " + joinReasons(v.reasons);
            return r;
        }
        r.ok = true;
    } catch (const std::exception& e) {
        r.error = fd.remote_path + ": " + e.what();
    }
    return r;
}

void Ingestor::processParallel(TransferSession& primary,
                               const std::vector<FileDescriptor>& files,
                               std::vector<FileResult>& results) const {
    const std::size_t workers =
        std::min(static_cast<std::size_t>(cfg_.max_concurrent), files.size());
    const SessionOptions opt = sessionOptionsFor(cfg_);
    std::atomic<std::size_t> next{0};
    std::mutex connMutex; // one connection setup at a time

    auto drain = [&](TransferSession& s) {
        for (;;) {
            const std::size_t i = next.fetch_add(1);
            if (i >= files.size()) break;
            results[i] = processFile(s, files[i]);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers > 0 ? workers - 1 : 0);
    for (std::size_t w = 1; w < workers; ++w) {
        try {
            threads.emplace_back([&, w]() {
                std::unique_ptr<TransferSession> conn;
                std::string err;
                try {
                    std::lock_guard<std::mutex> lk(connMutex);
                    conn = primary.newConnectionLike(opt, err);
                } catch (const std::exception& e) {
                    err = e.what();
                }
                if (!conn) {
                    logger_->warning("Worker " + std::to_string(w) + " could not connect: " + err);
                    return;
                }
                ScopedSession own(std::move(conn));
                drain(own.get());
            });
        } catch (const std::system_error& e) {
            logger_->warning("Worker " + std::to_string(w) + " could not start: " + e.what());
            break;
        }
    }
    // The listing session is worker 0, so every file is processed even if no
    // extra connection could be opened.
    drain(primary);
    for (auto& t : threads) t.join();
}

bool Ingestor::downloadAll(IngestOutcome& out, IngestError& err) const {
    out = IngestOutcome{};
    err = IngestError{};

    ScopedSession session(factory_ ? factory_(cfg_.transport) : nullptr);
    if (!openSession(cfg_, *logger_, session, err)) return false;

    std::vector<FileDescriptor> files;
    if (!listInSession(session.get(), cfg_, *logger_, files, err)) return false;

    std::vector<FileResult> results(files.size());
    if (cfg_.max_concurrent > 1 && files.size() > 1) {
        processParallel(session.get(), files, results);
    } else {
        for (std::size_t i = 0; i < files.size(); ++i)
            results[i] = processFile(session.get(), files[i]);
    }
    session.close();

    for (auto& r : results) {
        if (r.ok) {
            out.downloaded.push_back(std::move(r.local_path));
        } else {
            logger_->warning(r.error);
            out.errors.push_back(std::move(r.error));
        }
    }
    logger_->info("Ingest finished: " + std::to_string(out.downloaded.size()) + " downloaded, " +
                  std::to_string(out.errors.size()) + " error(s)");
    return true;
}

} // namespace pullfeed
