// Abstract transfer capability. The SFTP (libssh2) and FTP (libcurl) backends
// implement it so the ingest logic never sees protocol details.
#pragma once
#include "TransferTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pullfeed {

class TransferSession {
public:
    virtual ~TransferSession() = default;

    // Connect and authenticate. On failure err describes the cause.
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    // Releases every underlying resource. Safe to call more than once.
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Entry names of a remote directory ("." and ".." excluded).
    virtual bool list(const std::string& remote_dir,
                      std::vector<std::string>& names,
                      std::string& err) = 0;

    // Returns true with out.size empty when the server cannot report a size.
    virtual bool stat(const std::string& remote_path,
                      RemoteStat& out,
                      std::string& err) = 0;

    // Download the whole remote file, overwriting local and creating its
    // parent directories.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err) = 0;

    // A new, already connected session of the same kind.
    virtual std::unique_ptr<TransferSession> newConnectionLike(const SessionOptions& opt,
                                                               std::string& err) = 0;
};

} // namespace pullfeed
