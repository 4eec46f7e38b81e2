// Integration tests for the real SFTP (libssh2) and FTP (libcurl) backends.
// Each transport runs only when its PULLFEED_IT_<SFTP|FTP>_* env vars exist;
// the whole test is skipped (exit code 77) when neither is configured.
//
// The remote directory must already contain at least one file matching the
// glob (default "*"); the test only reads from the server.
#include "TestSupport.hpp"
#include "pullfeed/CurlFtpSession.hpp"
#include "pullfeed/Ingestor.hpp"
#include "pullfeed/Libssh2TransferSession.hpp"
#include "pullfeed/RemoteCatalog.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

using pullfeed_test::TempDir;
using pullfeed_test::TestContext;
namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

std::optional<std::string> envValue(const std::string &key) {
    const char *raw = std::getenv(key.c_str());
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parsePort(const std::optional<std::string> &raw, std::optional<std::uint16_t> &out) {
    if (!raw.has_value())
        return true;
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

// Builds an IngestorConfig from PULLFEED_IT_<prefix>_* or returns false when
// the transport is not configured.
bool configFromEnv(const std::string &prefix, pullfeed::Transport transport,
                   pullfeed::IngestorConfig &cfg, std::string &err) {
    const std::string p = "PULLFEED_IT_" + prefix + "_";
    const auto host = envValue(p + "HOST");
    const auto user = envValue(p + "USER");
    const auto pass = envValue(p + "PASS");
    const auto dir = envValue(p + "REMOTE_DIR");
    if (!host || !user || !pass || !dir)
        return false;
    if (!parsePort(envValue(p + "PORT"), cfg.port)) {
        err = p + "PORT is invalid";
        return false;
    }
    cfg.transport = transport;
    cfg.host = *host;
    cfg.username = *user;
    cfg.password = *pass;
    cfg.remote_dir = *dir;
    cfg.filename_glob = envValue(p + "GLOB").value_or("*");
    cfg.enforce_size_match = true;
    cfg.known_hosts_policy = pullfeed::KnownHostsPolicy::Off;
    return true;
}

void runIngest(TestContext &t, const std::string &label, pullfeed::IngestorConfig cfg,
               int maxConcurrent) {
    TempDir local("it_" + label);
    cfg.local_dir = local.str();
    cfg.max_concurrent = maxConcurrent;
    pullfeed::Ingestor ing(cfg);

    std::vector<pullfeed::FileDescriptor> files;
    pullfeed::IngestError err;
    t.check(ing.listRemote(files, err), label + ": listRemote should succeed: " + err.message);
    t.check(!files.empty(), label + ": remote dir should contain matching files");

    pullfeed::IngestOutcome out;
    t.check(ing.downloadAll(out, err), label + ": downloadAll should run: " + err.message);
    for (const auto &e : out.errors)
        t.check(false, label + ": unexpected per-file error: " + e);
    t.check(out.downloaded.size() == files.size(),
            label + ": every listed file should be downloaded");
    for (const auto &path : out.downloaded)
        t.check(fs::is_regular_file(path), label + ": missing local file " + path);
}

void checkFtpSession(TestContext &t, const pullfeed::IngestorConfig &cfg) {
    pullfeed::CurlFtpSession ftp;
    std::string err;
    if (!ftp.connect(pullfeed::sessionOptionsFor(cfg), err)) {
        t.check(false, "ftp: connect should succeed: " + err);
        return;
    }
    std::vector<std::string> names;
    t.check(ftp.list(cfg.remote_dir, names, err), "ftp: list should succeed: " + err);
    for (const auto &n : names)
        t.check(n.find('/') == std::string::npos, "ftp: listing holds bare names: " + n);
    pullfeed::RemoteStat st;
    if (!names.empty()) {
        t.check(ftp.stat(pullfeed::joinRemotePath(cfg.remote_dir, names.front()), st, err),
                "ftp: stat should not fail: " + err);
    }
    ftp.disconnect();
    ftp.disconnect();
    t.check(!ftp.isConnected(), "ftp: disconnect is idempotent");
}

void checkSftpBadPassword(TestContext &t, pullfeed::IngestorConfig cfg) {
    cfg.password += "-wrong";
    pullfeed::Libssh2TransferSession s;
    std::string err;
    t.check(!s.connect(pullfeed::sessionOptionsFor(cfg), err), "sftp: bad password rejected");
    t.check(!s.isConnected(), "sftp: failed connect leaves session closed");
    s.disconnect();
}

} // namespace

int main() {
    TestContext t;
    std::string err;
    bool ran = false;

    pullfeed::IngestorConfig sftp;
    if (configFromEnv("SFTP", pullfeed::Transport::Sftp, sftp, err)) {
        ran = true;
        runIngest(t, "sftp", sftp, 1);
        runIngest(t, "sftp-parallel", sftp, 3);
        checkSftpBadPassword(t, sftp);
    } else if (!err.empty()) {
        std::cerr << "[FAIL] " << err << "\n";
        return EXIT_FAILURE;
    }

    pullfeed::IngestorConfig ftp;
    if (configFromEnv("FTP", pullfeed::Transport::Ftp, ftp, err)) {
        ran = true;
        runIngest(t, "ftp", ftp, 1);
        checkFtpSession(t, ftp);
    } else if (!err.empty()) {
        std::cerr << "[FAIL] " << err << "\n";
        return EXIT_FAILURE;
    }

    if (!ran) {
        std::cout << "[SKIP] pullfeed_transfer_integration_tests requires env vars: "
                  << "PULLFEED_IT_SFTP_{HOST,USER,PASS,REMOTE_DIR} or "
                  << "PULLFEED_IT_FTP_{HOST,USER,PASS,REMOTE_DIR}\n";
        return kSkipExitCode;
    }

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] pullfeed_transfer_integration_tests\n";
    return EXIT_SUCCESS;
}
