// Core unit tests: mock session, hashing, remote catalog and validator.
#include "TestSupport.hpp"
#include "pullfeed/CurlFtpSession.hpp"
#include "pullfeed/Hashing.hpp"
#include "pullfeed/MockTransferSession.hpp"
#include "pullfeed/RemoteCatalog.hpp"
#include "pullfeed/Validator.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using pullfeed_test::TempDir;
using pullfeed_test::TestContext;
namespace fs = std::filesystem;

namespace {

const char *kMd5Abc = "900150983cd24fb0d6963f7d28e17f72";
const char *kMd5Empty = "d41d8cd98f00b204e9800998ecf8427e";

pullfeed::SessionOptions validOptions() {
    pullfeed::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

std::shared_ptr<pullfeed::MockRemote> sampleRemote() {
    auto r = std::make_shared<pullfeed::MockRemote>();
    r->addFile("/in", "a.csv", std::string(100, 'a'), 100);
    r->addFile("/in", "b.csv", "bbb", 200);
    r->addFile("/in", "c.txt", "ccc", 3);
    r->files["/in/b.csv"].stat_fails = true;
    return r;
}

void test_session_options_for(TestContext &t) {
    pullfeed::IngestorConfig cfg;
    cfg.host = "h";
    cfg.username = "u";
    cfg.password = "p";
    cfg.timeout_ms = 1234;

    cfg.transport = pullfeed::Transport::Sftp;
    auto opt = pullfeed::sessionOptionsFor(cfg);
    t.check(opt.port == 22, "SFTP should default to port 22");
    t.check(opt.password.has_value() && *opt.password == "p",
            "password should be carried into session options");
    t.check(opt.timeout_ms == 1234, "timeout should be carried over");

    cfg.transport = pullfeed::Transport::Ftp;
    t.check(pullfeed::sessionOptionsFor(cfg).port == 21,
            "FTP should default to port 21");

    cfg.port = 2121;
    t.check(pullfeed::sessionOptionsFor(cfg).port == 2121,
            "explicit port should win over the protocol default");
}

void test_mock_connect_validation(TestContext &t) {
    auto remote = sampleRemote();
    remote->rejected_users.insert("mallory");
    pullfeed::MockTransferSession s(remote);
    std::string err;

    auto opt = validOptions();
    opt.host.clear();
    t.check(!s.connect(opt, err), "connect should fail without host");

    pullfeed::MockTransferSession s2(remote);
    opt = validOptions();
    opt.username = "mallory";
    err.clear();
    t.check(!s2.connect(opt, err), "connect should fail for rejected user");
    t.checkContains(err, "Authentication failed", "auth failure message");

    pullfeed::MockTransferSession s3(remote);
    t.check(s3.connect(validOptions(), err), "connect should succeed");
    t.check(s3.isConnected(), "session should report connected");
}

void test_mock_disconnect_is_idempotent(TestContext &t) {
    auto remote = sampleRemote();
    {
        pullfeed::MockTransferSession s(remote);
        std::string err;
        t.check(s.connect(validOptions(), err), "connect before disconnect");
        s.disconnect();
        s.disconnect();
        t.check(!s.isConnected(), "disconnect should clear connected state");

        std::vector<std::string> names;
        t.check(!s.list("/in", names, err), "list should fail after disconnect");
    }
    t.check(remote->closes == 1, "repeated disconnect should close once");
}

void test_mock_get_creates_parent_dirs(TestContext &t) {
    TempDir tmp("mockget");
    auto remote = sampleRemote();
    pullfeed::MockTransferSession s(remote);
    std::string err;
    t.check(s.connect(validOptions(), err), "connect before get");

    const fs::path local = tmp.path() / "x" / "y" / "c.txt";
    t.check(s.get("/in/c.txt", local.string(), err), "get should succeed");
    std::string content;
    t.check(pullfeed_test::readFile(local, content) && content == "ccc",
            "get should write the remote bytes under new directories");

    err.clear();
    t.check(!s.get("/in/missing.csv", (tmp.path() / "m").string(), err),
            "get of a missing file should fail");
    t.check(!err.empty(), "get failure should report an error");
}

void test_md5_of_file(TestContext &t) {
    TempDir tmp("md5");
    const fs::path abc = tmp.path() / "abc.bin";
    const fs::path empty = tmp.path() / "empty.bin";
    pullfeed_test::writeFile(abc, "abc");
    pullfeed_test::writeFile(empty, "");

    std::string digest, err;
    t.check(pullfeed::md5OfFile(abc.string(), digest, err), "md5 of abc");
    t.check(digest == kMd5Abc, "md5(abc) should match the RFC 1321 vector");
    t.check(pullfeed::md5OfFile(empty.string(), digest, err), "md5 of empty");
    t.check(digest == kMd5Empty, "md5 of an empty file");

    err.clear();
    t.check(!pullfeed::md5OfFile((tmp.path() / "nope").string(), digest, err),
            "md5 of a missing file should fail");
    t.check(!err.empty(), "missing file should report an error");

    t.check(pullfeed::sameDigest("ABCdef01", "abcDEF01"),
            "digest comparison is case-insensitive");
    t.check(!pullfeed::sameDigest("abc", "abd"), "different digests differ");
    t.check(!pullfeed::sameDigest("abc", "abcd"), "length matters");
}

void test_glob_and_paths(TestContext &t) {
    t.check(pullfeed::globMatch("*.csv", "a.csv"), "*.csv matches a.csv");
    t.check(!pullfeed::globMatch("*.csv", "c.txt"), "*.csv rejects c.txt");
    t.check(!pullfeed::globMatch("*.csv", "A.CSV"), "glob is case-sensitive");
    t.check(pullfeed::globMatch("data_??.csv", "data_01.csv"), "? matches one char");
    t.check(!pullfeed::globMatch("data_??.csv", "data_1.csv"), "? needs a char");
    t.check(pullfeed::globMatch("[ab].csv", "b.csv"), "bracket set");
    t.check(!pullfeed::globMatch("[ab].csv", "c.csv"), "bracket set excludes");
    t.check(pullfeed::globMatch("[!a]*", "b.csv"), "negated set");
    t.check(!pullfeed::globMatch("[!a]*", "a.csv"), "negated set excludes");
    t.check(pullfeed::globMatch("*", ".hidden"), "* matches dot files");
    t.check(pullfeed::globMatch("a\\*.csv", "a\\x.csv"), "backslash is a literal character");
    t.check(!pullfeed::globMatch("a\\*.csv", "a*.csv"), "backslash does not escape *");

    t.check(pullfeed::joinRemotePath("/in/", "a.csv") == "/in/a.csv",
            "trailing slash is trimmed");
    t.check(pullfeed::joinRemotePath("/", "a.csv") == "/a.csv", "root dir");
    t.check(pullfeed::joinRemotePath("in", "a.csv") == "in/a.csv", "relative dir");
    t.check(pullfeed::remoteBaseName("/in/sub/a.csv") == "a.csv", "basename");
    t.check(pullfeed::remoteBaseName("a.csv") == "a.csv", "basename without dir");
}

void test_ftp_path_resolution(TestContext &t) {
    t.check(pullfeed::resolveFtpPath("/home/feeds", "in") == "/home/feeds/in",
            "relative dir resolves against the entry path");
    t.check(pullfeed::resolveFtpPath("/", "in/") == "/in", "relative dir from root");
    t.check(pullfeed::resolveFtpPath("", "in") == "/in", "unknown cwd treated as root");
    t.check(pullfeed::resolveFtpPath("/home/feeds", "/outbound/") == "/outbound",
            "absolute dir ignores cwd");
    t.check(pullfeed::resolveFtpPath("/home/feeds", "") == "/home/feeds",
            "empty path stays in cwd");
    t.check(pullfeed::resolveFtpPath("/home/feeds", "/") == "/", "root stays root");
}

void test_ftp_urls(TestContext &t) {
    const std::string base = "ftp://ftp.example.test:21";
    t.check(pullfeed::ftpUrlFor(base, "/home/feeds/in", true) ==
                "ftp://ftp.example.test:21/%2Fhome/feeds/in/",
            "directory url is absolute with trailing slash");
    t.check(pullfeed::ftpUrlFor(base, "/", true) == "ftp://ftp.example.test:21/%2F/",
            "root directory url");
    t.check(pullfeed::ftpUrlFor(base, "/in/a.csv", false) ==
                "ftp://ftp.example.test:21/%2Fin/a.csv",
            "file url has no trailing slash");
    t.check(pullfeed::ftpUrlFor(base, "/in/my file#1.csv", false) ==
                "ftp://ftp.example.test:21/%2Fin/my%20file%231.csv",
            "segments are percent-encoded");
}

void test_ftp_timeouts(TestContext &t) {
    const pullfeed::FtpTimeouts d = pullfeed::ftpTimeoutsFor(pullfeed::kDefaultTimeoutMs);
    t.check(d.connect_ms == 30000, "connect limited by timeout_ms");
    t.check(d.low_speed_limit == 1 && d.low_speed_time_s == 30,
            "transfers fail only after stalling for timeout_ms");
    t.check(pullfeed::ftpTimeoutsFor(200).low_speed_time_s == 1,
            "stall window is at least one second");
}

void test_catalog_filters_in_listing_order(TestContext &t) {
    auto remote = std::make_shared<pullfeed::MockRemote>();
    remote->addFile("/in", "z.csv", "z", 1);
    remote->addFile("/in", "notes.txt", "n", 1);
    remote->addFile("/in", "a.csv", "a", 1);
    remote->addFile("/in", "m.csv", "m", std::nullopt);
    pullfeed::MockTransferSession s(remote);
    std::string err;
    t.check(s.connect(validOptions(), err), "connect before catalog");

    std::vector<pullfeed::FileDescriptor> out;
    t.check(pullfeed::RemoteCatalog::list(s, "/in/", "*.csv", {}, out, err),
            "catalog listing should succeed");
    t.check(out.size() == 3, "three csv entries should match");
    if (out.size() == 3) {
        t.check(out[0].remote_path == "/in/z.csv", "listing order kept (0)");
        t.check(out[1].remote_path == "/in/a.csv", "listing order kept (1)");
        t.check(out[2].remote_path == "/in/m.csv", "listing order kept (2)");
        t.check(out[0].size == std::optional<std::uint64_t>(1), "size from stat");
        t.check(!out[2].size.has_value(), "unknown size stays absent");
        t.check(!out[0].content_hash.has_value(), "no expected hash given");
    }
}

void test_catalog_stat_failure_degrades(TestContext &t) {
    auto remote = sampleRemote();
    pullfeed::MockTransferSession s(remote);
    std::string err;
    t.check(s.connect(validOptions(), err), "connect before catalog");

    std::vector<pullfeed::FileDescriptor> out;
    const std::map<std::string, std::string> expected = {{"a.csv", "ABC"},
                                                         {"c.txt", "XYZ"}};
    t.check(pullfeed::RemoteCatalog::list(s, "/in", "*.csv", expected, out, err),
            "stat failure must not abort the listing");
    t.check(out.size() == 2, "a.csv and b.csv should match");
    if (out.size() == 2) {
        t.check(out[0].size == std::optional<std::uint64_t>(100), "a.csv size");
        t.check(!out[1].size.has_value(), "b.csv size unknown after stat failure");
        t.check(out[0].content_hash == std::optional<std::string>("ABC"),
                "expected hash attached by file name");
        t.check(!out[1].content_hash.has_value(), "no hash for b.csv");
    }
}

void test_catalog_list_failure(TestContext &t) {
    auto remote = sampleRemote();
    pullfeed::MockTransferSession s(remote);
    std::string err;
    t.check(s.connect(validOptions(), err), "connect before catalog");

    std::vector<pullfeed::FileDescriptor> out;
    err.clear();
    t.check(!pullfeed::RemoteCatalog::list(s, "/missing", "*", {}, out, err),
            "listing a missing dir should fail");
    t.checkContains(err, "/missing", "error should name the directory");
}

void test_validator(TestContext &t) {
    TempDir tmp("validator");
    const fs::path local = tmp.path() / "a.csv";
    pullfeed_test::writeFile(local, "abc");

    pullfeed::IngestorConfig cfg;
    pullfeed::FileDescriptor fd;
    fd.remote_path = "/in/a.csv";
    fd.size = 5;
    fd.content_hash = "ffffffffffffffffffffffffffffffff";

    auto r = pullfeed::validate(fd, local.string(), cfg);
    t.check(r.ok && r.reasons.empty(), "no checks enabled means ok");

    cfg.enforce_size_match = true;
    r = pullfeed::validate(fd, local.string(), cfg);
    t.check(!r.ok, "size mismatch should fail");
    t.check(r.reasons.size() == 1 &&
                r.reasons[0] == "size mismatch local=3 remote=5",
            "size mismatch reason format");

    fd.size.reset();
    r = pullfeed::validate(fd, local.string(), cfg);
    t.check(r.ok, "absent size is never a mismatch");

    cfg.enforce_md5_match = true;
    fd.size = 5;
    r = pullfeed::validate(fd, local.string(), cfg);
    t.check(!r.ok && r.reasons.size() == 2, "both failures are reported");
    if (r.reasons.size() == 2) {
        t.check(r.reasons[1] == std::string("md5 mismatch local=") + kMd5Abc +
                                    " remote=ffffffffffffffffffffffffffffffff",
                "md5 mismatch reason format");
    }

    fd.size = 3;
    fd.content_hash = "900150983CD24FB0D6963F7D28E17F72";
    r = pullfeed::validate(fd, local.string(), cfg);
    t.check(r.ok, "matching size and upper-case digest pass");

    fd.content_hash.reset();
    r = pullfeed::validate(fd, local.string(), cfg);
    t.check(r.ok, "md5 check is skipped without an expected hash");

    fd.content_hash = kMd5Abc;
    r = pullfeed::validate(fd, (tmp.path() / "gone.csv").string(), cfg);
    t.check(!r.ok && r.reasons.size() == 2,
            "an unreadable local file fails both applicable checks");
}

} // namespace

int main() {
    TestContext t;
    test_session_options_for(t);
    test_mock_connect_validation(t);
    test_mock_disconnect_is_idempotent(t);
    test_mock_get_creates_parent_dirs(t);
    test_md5_of_file(t);
    test_glob_and_paths(t);
    test_ftp_path_resolution(t);
    test_ftp_urls(t);
    test_ftp_timeouts(t);
    test_catalog_filters_in_listing_order(t);
    test_catalog_stat_failure_degrades(t);
    test_catalog_list_failure(t);
    test_validator(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] pullfeed_core_tests\n";
    return EXIT_SUCCESS;
}
