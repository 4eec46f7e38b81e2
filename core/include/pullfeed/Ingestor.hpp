// Batch ingestion: list a remote directory, download every matching file,
// validate it and report the outcome. Each call opens and closes its own
// session; nothing is shared between calls.
#pragma once
#include "IngestLog.hpp"
#include "SessionFactory.hpp"
#include "TransferTypes.hpp"
#include <string>
#include <vector>

namespace pullfeed {

class Ingestor {
public:
    // logger may be null (Qt logging categories are used then); a non-null
    // logger must outlive the Ingestor and be safe to call from worker threads.
    explicit Ingestor(IngestorConfig cfg,
                      SessionFactory factory = createSession,
                      IngestLogger* logger = nullptr);

    const IngestorConfig& config() const { return cfg_; }

    // Matching remote files with best-effort sizes. False when the session
    // cannot be opened or the directory cannot be listed.
    bool listRemote(std::vector<FileDescriptor>& out, IngestError& err) const;

    // One complete pass over the listing. Per-file transfer and validation
    // problems end up in out.errors and never fail the call; false means the
    // batch could not run at all (connection or listing failure).
    bool downloadAll(IngestOutcome& out, IngestError& err) const;

    // Local destination: <local_dir>/<final segment of the remote path>.
    std::string localPathFor(const FileDescriptor& fd) const;

private:
    struct FileResult {
        bool ok = false;
        std::string local_path;
        std::string error;
    };

    IngestorConfig cfg_;
    SessionFactory factory_;
    IngestLogger* logger_;

    FileResult processFile(TransferSession& session, const FileDescriptor& fd) const;
    void processParallel(TransferSession& primary,
                         const std::vector<FileDescriptor>& files,
                         std::vector<FileResult>& results) const;
};

} // namespace pullfeed
