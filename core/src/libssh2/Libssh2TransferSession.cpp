// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, known_hosts verification and password/kbd-int/key auth.
#include "pullfeed/Libssh2TransferSession.hpp"
#include "pullfeed/RuntimeLogging.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <QLoggingCategory>
#include <QString>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

Q_LOGGING_CATEGORY(pfSftp, "pullfeed.sftp")

namespace pullfeed {

namespace {

std::once_flag g_libssh2_init;

// Password handed to keyboard-interactive prompts.
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

// Answers each prompt with the username when it asks for a user/name,
// otherwise with the password.
void kbint_password_callback(const char* /*name*/, int /*name_len*/,
                             const char* /*instruction*/, int /*instruction_len*/,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                             void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt;
        if (prompts && prompts[i].text)
            prompt.assign(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        for (char& c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        const char* ans = wantUser ? ctx->user : ctx->pass;
        const size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (alen == 0) continue;
        // libssh2 frees the responses with its own allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(alen + 1));
        if (!buf) continue;
        std::memcpy(buf, ans, alen + 1);
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(alen);
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
        default:
            return 0;
    }
}

std::string hostKeyFingerprint(LIBSSH2_SESSION* session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* label = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* label = "SHA1:";
#endif
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session, hashType));
    if (!h) return {};
    std::ostringstream oss;
    oss << label;
    for (int i = 0; i < hashLen; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

// Retries a libssh2 call while it reports EAGAIN.
template <typename Fn>
int retryAgain(Fn&& fn) {
    int rc;
    for (;;) {
        rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return rc;
}

} // namespace

Libssh2TransferSession::Libssh2TransferSession() {
    std::call_once(g_libssh2_init, [] {
        if (libssh2_init(0) != 0)
            qCWarning(pfSftp) << "libssh2_init failed";
    });
}

Libssh2TransferSession::~Libssh2TransferSession() {
    disconnect();
}

std::string Libssh2TransferSession::lastSessionError() const {
    if (!session_) return {};
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string();
}

bool Libssh2TransferSession::tcpConnect(const std::string& host, uint16_t port,
                                        long timeout_ms, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(port);
    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect bounded by timeout_ms, then back to blocking
        // mode; libssh2 applies its own timeout afterwards.
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = -1;
            if (::poll(&pfd, 1, static_cast<int>(timeout_ms)) == 1) {
                int soErr = 0;
                socklen_t len = sizeof(soErr);
                if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &soErr, &len) == 0 && soErr == 0)
                    rc = 0;
            }
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2TransferSession::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialise known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not read server host key";
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int plainMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int hashMask = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, plainMask, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, hashMask, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen, nullptr, 0,
                                                 plainMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        qCInfo(pfSftp).noquote() << "Accepted new host key for" << QString::fromStdString(opt.host)
                                 << QString::fromStdString(hostKeyFingerprint(session_));
        return true;
    }

    libssh2_knownhost_free(nh);
    // AcceptNew still rejects a changed key
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key does not match known_hosts";
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "Host not found in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2TransferSession::authenticate(const SessionOptions& opt, std::string& err) {
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        const int rc = retryAgain([&] {
            return libssh2_userauth_publickey_fromfile(session_, opt.username.c_str(), nullptr,
                                                       opt.private_key_path->c_str(), passphrase);
        });
        if (rc != 0) {
            err = "Public key authentication failed: " + lastSessionError();
            return false;
        }
        return true;
    }

    if (!opt.password.has_value()) {
        err = "No credentials: password or private key required";
        return false;
    }

    // Password first; keyboard-interactive only if the session is still alive
    // and the server offers it.
    const int rcPw = retryAgain([&] {
        return libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
    });
    if (rcPw == 0) return true;
    if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
        rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
        err = "Server closed the connection after password authentication";
        return false;
    }

    const char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                                static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    int rcKbd = -1;
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
        void** abs = libssh2_session_abstract(session_);
        if (abs) *abs = &ctx;
        rcKbd = retryAgain([&] {
            return libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(),
                                                         kbint_password_callback);
        });
        if (abs) *abs = nullptr;
    }
    if (rcKbd == 0) return true;

    err = "Password authentication failed";
    if (!authlist.empty()) err += " (methods: " + authlist + ")";
    const std::string last = lastSessionError();
    if (!last.empty()) err += ": " + last;
    err += " [rc_pw=" + std::to_string(rcPw) + ", rc_kbd=" + std::to_string(rcKbd) + "]";
    return false;
}

bool Libssh2TransferSession::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, opt.timeout_ms, err)) return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, opt.timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        return false;
    }
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not start SFTP subsystem: " + lastSessionError();
        return false;
    }

    qCInfo(pfSftp).noquote() << "SFTP session open to"
                             << QString::fromStdString(describeEndpoint(opt.host, opt.port, opt.username));
    connected_ = true;
    return true;
}

void Libssh2TransferSession::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2TransferSession::list(const std::string& remote_dir,
                                  std::vector<std::string>& names,
                                  std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_dir.empty() ? "/" : remote_dir;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        return false;
    }

    names.clear();
    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                         longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            std::string name(filename, static_cast<size_t>(rc));
            if (name == "." || name == "..") continue;
            names.push_back(std::move(name));
        } else if (rc == 0) {
            break;
        } else {
            err = "sftp_readdir_ex failed for: " + path;
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2TransferSession::stat(const std::string& remote_path,
                                  RemoteStat& out,
                                  std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  LIBSSH2_SFTP_STAT, &st);
    if (rc != 0) {
        err = "sftp_stat failed for " + remote_path +
              " (sftp error " + std::to_string(libssh2_sftp_last_error(sftp_)) + ")";
        return false;
    }
    out.size.reset();
    if (st.flags & LIBSSH2_SFTP_ATTR_SIZE)
        out.size = static_cast<std::uint64_t>(st.filesize);
    return true;
}

bool Libssh2TransferSession::get(const std::string& remote,
                                 const std::string& local,
                                 std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(local).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            err = "Could not create local directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading";
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing: " + local;
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, static_cast<size_t>(n), lf) != static_cast<size_t>(n)) {
                err = "Local write failed";
                std::fclose(lf);
                libssh2_sftp_close(rh);
                return false;
            }
        } else if (n == 0) {
            break; // EOF
        } else {
            err = n == LIBSSH2_ERROR_TIMEOUT ? "Remote read timed out" : "Remote read failed";
            std::fclose(lf);
            libssh2_sftp_close(rh);
            return false;
        }
    }

    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) {
        err = "Could not flush local file: " + local;
        return false;
    }
    return true;
}

std::unique_ptr<TransferSession> Libssh2TransferSession::newConnectionLike(const SessionOptions& opt,
                                                                           std::string& err) {
    auto ptr = std::make_unique<Libssh2TransferSession>();
    if (!ptr->connect(opt, err)) return nullptr;
    return ptr;
}

} // namespace pullfeed
