#pragma once
#include "TransferTypes.hpp"
#include <string>

namespace pullfeed {

// Reads an IngestorConfig from an INI file:
//
//   [remote]     transport (sftp|ftp), host, port, username, password, dir, glob
//   [local]      dir
//   [validation] enforce_size, enforce_md5
//   [expected_md5] <file name> = <hex digest>
//   [transfer]   timeout_ms, max_concurrent
//   [ssh]        known_hosts_policy (strict|accept-new|off), known_hosts_path, private_key
//
// PULLFEED_PASSWORD, when set, replaces remote/password.
bool loadIngestorConfig(const std::string& iniPath, IngestorConfig& out, std::string& err);

bool parseTransport(const std::string& text, Transport& out);
bool parseKnownHostsPolicy(const std::string& text, KnownHostsPolicy& out);

} // namespace pullfeed
