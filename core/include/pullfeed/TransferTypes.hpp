// Shared value types for transfer sessions, listings and ingest results.
// Kept plain (no Qt types) so the core headers stay usable from any caller.
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pullfeed {

enum class Transport {
    Sftp,
    Ftp
};

// Server host key verification against known_hosts (SFTP only).
enum class KnownHostsPolicy {
    Strict,     // Requires an exact known_hosts match.
    AcceptNew,  // TOFU: unknown hosts are stored, changed keys are rejected.
    Off         // No verification.
};

constexpr std::uint16_t kDefaultSftpPort = 22;
constexpr std::uint16_t kDefaultFtpPort = 21;
constexpr long kDefaultTimeoutMs = 30000;

struct SessionOptions {
    std::string host;
    std::uint16_t port = kDefaultSftpPort;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Upper bound for connect and for each blocking transfer operation.
    long timeout_ms = kDefaultTimeoutMs;
};

// Result of a remote stat. Size is absent when the server cannot report it.
struct RemoteStat {
    std::optional<std::uint64_t> size;
};

// One remote file and whatever was known about it before download.
struct FileDescriptor {
    std::string remote_path;
    std::optional<std::uint64_t> size;
    std::optional<std::string> content_hash; // hex MD5
};

struct ValidationResult {
    bool ok = true;
    std::vector<std::string> reasons;
};

struct IngestOutcome {
    std::vector<std::string> downloaded; // local paths, listing order
    std::vector<std::string> skipped;    // reserved, currently never filled
    std::vector<std::string> errors;     // per-file messages, listing order
};

// Why a batch could not run at all.
struct IngestError {
    enum class Kind { None, Connection, List } kind = Kind::None;
    std::string message;
};

struct IngestorConfig {
    std::string host;
    std::optional<std::uint16_t> port; // absent: protocol default
    std::string username;
    std::string password;
    std::string remote_dir;
    std::string local_dir;
    Transport transport = Transport::Sftp;
    std::string filename_glob = "*";
    bool enforce_size_match = false;
    bool enforce_md5_match = false;

    // Caller-supplied expected digests, keyed by remote file name.
    std::map<std::string, std::string> expected_md5;

    long timeout_ms = kDefaultTimeoutMs;
    int max_concurrent = 1;

    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    std::optional<std::string> known_hosts_path;
    std::optional<std::string> private_key_path;
};

// Builds the session options a config implies (port defaults per transport).
SessionOptions sessionOptionsFor(const IngestorConfig& cfg);

const char* transportName(Transport t);

} // namespace pullfeed
