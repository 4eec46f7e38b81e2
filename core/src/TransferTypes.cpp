#include "pullfeed/TransferTypes.hpp"

namespace pullfeed {

SessionOptions sessionOptionsFor(const IngestorConfig& cfg) {
    SessionOptions opt;
    opt.host = cfg.host;
    opt.port = cfg.port.value_or(cfg.transport == Transport::Ftp ? kDefaultFtpPort : kDefaultSftpPort);
    opt.username = cfg.username;
    opt.password = cfg.password;
    opt.private_key_path = cfg.private_key_path;
    opt.known_hosts_path = cfg.known_hosts_path;
    opt.known_hosts_policy = cfg.known_hosts_policy;
    opt.timeout_ms = cfg.timeout_ms;
    return opt;
}

const char* transportName(Transport t) {
    switch (t) {
    case Transport::Sftp:
        return "SFTP";
    case Transport::Ftp:
        return "FTP";
    }
    return "unknown";
}

} // namespace pullfeed
