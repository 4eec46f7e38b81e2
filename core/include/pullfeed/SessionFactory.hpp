#pragma once
#include "TransferSession.hpp"
#include <functional>
#include <memory>

namespace pullfeed {

// Creates an unconnected session for a transport. Ingestor takes one so tests
// can hand out mock sessions.
using SessionFactory = std::function<std::unique_ptr<TransferSession>(Transport)>;

// libssh2 for SFTP, libcurl for FTP.
std::unique_ptr<TransferSession> createSession(Transport transport);

} // namespace pullfeed
