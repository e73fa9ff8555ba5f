#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <unistd.h>
#endif
#include <atomic>
#include <cstring>
#include <cerrno>
#include <mutex>

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto SESSION_OPEN_TIMEOUT = std::chrono::seconds(SSH_SESSION_OPEN_SECS);

// ── Shared connection state ─────────────────────────────────────

// Owned jointly by the channel and every session opened on it, so a session
// that outlives close() never touches a freed LIBSSH2_SESSION.
// Every libssh2 call happens under io_mutex.
struct Libssh2Link {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = KTEST_INVALID_SOCKET;
    std::mutex io_mutex;
    std::atomic<bool> closed{false};

    ~Libssh2Link() {
        if (session) {
            if (!closed) libssh2_session_disconnect(session, "Normal disconnection");
            libssh2_session_free(session);
        }
        if (sock != KTEST_INVALID_SOCKET) {
            platform::close_socket(sock);
        }
    }

    // Caller must hold io_mutex.
    std::string last_error() const {
        char* msg = nullptr;
        int len = 0;
        libssh2_session_last_error(session, &msg, &len, 0);
        return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown libssh2 error";
    }

    // Block until the socket is ready in whichever direction libssh2 is waiting on.
    void wait_socket(int timeout_ms) {
        int dir;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            dir = libssh2_session_block_directions(session);
        }
        short events = 0;
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
        if (events == 0) {
            platform::sleep_ms(10);
            return;
        }
        platform::poll_socket(sock, events, timeout_ms);
    }
};

// ── Session ─────────────────────────────────────────────────────

class Libssh2Session : public RemoteSession {
public:
    Libssh2Session(std::shared_ptr<Libssh2Link> link, LIBSSH2_CHANNEL* channel)
        : link_(std::move(link)), channel_(channel) {}

    ~Libssh2Session() override {
        // Freeing may need a few round trips in non-blocking mode
        for (int i = 0; i < 100; i++) {
            int rc;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                rc = libssh2_channel_free(channel_);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) break;
            platform::sleep_ms(10);
        }
    }

    Result<void> set_env(const std::string& name, const std::string& value) override {
        int rc = retry_eagain([&] {
            return libssh2_channel_setenv_ex(channel_,
                                             name.c_str(), static_cast<unsigned int>(name.size()),
                                             value.c_str(), static_cast<unsigned int>(value.size()));
        });
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::SessionCreation,
                fmt::format("setenv {} rejected: {}", name, error_text(rc)));
        }
        return Result<void>::Ok();
    }

    SSHResult exec(const std::string& command) override {
        // stderr goes into the stdout stream, preserving interleaving
        retry_eagain([&] {
            return libssh2_channel_handle_extended_data2(channel_, LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);
        });

        int rc = retry_eagain([&] {
            return libssh2_channel_process_startup(channel_, "exec", sizeof("exec") - 1,
                                                   command.c_str(),
                                                   static_cast<unsigned int>(command.size()));
        });
        if (rc != 0) {
            return SSHResult::fail(ErrorKind::Execution,
                                   "failed to start command: " + error_text(rc));
        }

        std::string output;
        char buf[SSH_READ_BUF_SIZE];
        while (true) {
            if (aborted_ || link_->closed) {
                return SSHResult::fail(ErrorKind::Execution, "session closed", output);
            }

            ssize_t n;
            bool eof = false;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                n = libssh2_channel_read(channel_, buf, sizeof(buf));
                if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                    eof = libssh2_channel_eof(channel_) != 0;
                    int seconds_to_next = 0;
                    if (!eof && libssh2_keepalive_send(link_->session, &seconds_to_next) != 0) {
                        return SSHResult::fail(ErrorKind::Execution,
                            "keepalive failed: " + link_->last_error(), output);
                    }
                }
            }

            if (n > 0) {
                output.append(buf, static_cast<size_t>(n));
            } else if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
                if (eof) break;
                link_->wait_socket(50);
            } else {
                return SSHResult::fail(ErrorKind::Execution,
                                       "channel read error: " + error_text(static_cast<int>(n)),
                                       output);
            }
        }

        retry_eagain([&] { return libssh2_channel_close(channel_); });
        retry_eagain([&] { return libssh2_channel_wait_closed(channel_); });

        int exit_status;
        std::string exit_signal;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            exit_status = libssh2_channel_get_exit_status(channel_);
            char* sig = nullptr;
            size_t sig_len = 0;
            libssh2_channel_get_exit_signal(channel_, &sig, &sig_len,
                                            nullptr, nullptr, nullptr, nullptr);
            if (sig) {
                exit_signal.assign(sig, sig_len);
                libssh2_free(link_->session, sig);
            }
        }

        if (!exit_signal.empty()) {
            return SSHResult::fail(ErrorKind::Execution,
                                   "Process exited with signal " + exit_signal, output);
        }
        if (exit_status != 0) {
            return SSHResult::fail(ErrorKind::Execution,
                                   fmt::format("Process exited with status {}", exit_status),
                                   output, exit_status);
        }
        return SSHResult::ok(std::move(output));
    }

    void close() override {
        aborted_ = true;
    }

private:
    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_CHANNEL* channel_;
    std::atomic<bool> aborted_{false};

    // Repeat a libssh2 call while it reports EAGAIN, unless the session is
    // closed underneath us.
    template <typename Fn>
    int retry_eagain(Fn&& fn) {
        while (true) {
            int rc;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                rc = fn();
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
            if (aborted_ || link_->closed) return LIBSSH2_ERROR_CHANNEL_CLOSED;
            link_->wait_socket(50);
        }
    }

    std::string error_text(int rc) {
        if (link_->closed) return "connection closed";
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        return fmt::format("{} ({})", link_->last_error(), rc);
    }
};

// ── Channel ─────────────────────────────────────────────────────

int knownhost_key_type(int hostkey_type);

class Libssh2Channel : public SecureChannel {
public:
    explicit Libssh2Channel(std::shared_ptr<Libssh2Link> link) : link_(std::move(link)) {}

    ~Libssh2Channel() override {
        close();
    }

    Result<std::unique_ptr<RemoteSession>> open_session() override {
        using SessionResult = Result<std::unique_ptr<RemoteSession>>;

        auto deadline = Clock::now() + SESSION_OPEN_TIMEOUT;
        while (Clock::now() < deadline) {
            if (link_->closed) {
                return SessionResult::Err(ErrorKind::SessionCreation, "connection closed");
            }
            LIBSSH2_CHANNEL* ch;
            {
                std::lock_guard<std::mutex> lock(link_->io_mutex);
                ch = libssh2_channel_open_session(link_->session);
                if (!ch && libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
                    return SessionResult::Err(ErrorKind::SessionCreation,
                        "failed to open session: " + link_->last_error());
                }
            }
            if (ch) {
                return SessionResult::Ok(std::make_unique<Libssh2Session>(link_, ch));
            }
            link_->wait_socket(50);
        }
        return SessionResult::Err(ErrorKind::SessionCreation, "timed out opening session");
    }

    Result<void> write_host_key(const std::string& host, const std::filesystem::path& file) override {
        std::lock_guard<std::mutex> lock(link_->io_mutex);
        size_t len = 0;
        int type = 0;
        const char* hostkey = libssh2_session_hostkey(link_->session, &len, &type);
        if (!hostkey) {
            return Result<void>::Err(ErrorKind::Handshake, "server presented no host key");
        }
        int key_type = knownhost_key_type(type);
        if (key_type == LIBSSH2_KNOWNHOST_KEY_UNKNOWN) {
            return Result<void>::Err(ErrorKind::Handshake,
                fmt::format("unsupported host key type {}", type));
        }

        LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(link_->session);
        if (!hosts) {
            return Result<void>::Err(ErrorKind::Handshake, "failed to initialize known_hosts");
        }
        int rc = libssh2_knownhost_addc(hosts, host.c_str(), nullptr, hostkey, len,
                                        nullptr, 0,
                                        LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                            LIBSSH2_KNOWNHOST_KEYENC_RAW | key_type,
                                        nullptr);
        const std::string path = file.string();
        if (rc == 0) {
            rc = libssh2_knownhost_writefile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        }
        libssh2_knownhost_free(hosts);
        if (rc != 0) {
            return Result<void>::Err(ErrorKind::Handshake,
                fmt::format("failed to write {}: {}", path, link_->last_error()));
        }
        return Result<void>::Ok();
    }

    Result<void> close() override {
        if (link_->closed.exchange(true)) {
            return Result<void>::Ok();
        }
        int rc;
        {
            std::lock_guard<std::mutex> lock(link_->io_mutex);
            rc = libssh2_session_disconnect(link_->session, "Normal disconnection");
        }
        // Tear the TCP connection down now even if sessions still hold the link
        platform::shutdown_socket(link_->sock);
        if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(fmt::format("disconnect failed ({})", rc));
        }
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<Libssh2Link> link_;
};

// ── Host key verification ───────────────────────────────────────

int knownhost_key_type(int hostkey_type) {
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

Result<void> check_known_hosts(LIBSSH2_SESSION* session, const RemoteTarget& target,
                               const HostTrustPolicy& trust,
                               const char* hostkey, size_t len, int type) {
    LIBSSH2_KNOWNHOSTS* hosts = libssh2_knownhost_init(session);
    if (!hosts) {
        return Result<void>::Err(ErrorKind::Handshake, "failed to initialize known_hosts");
    }

    const std::string path = trust.known_hosts_path().string();
    if (libssh2_knownhost_readfile(hosts, path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        libssh2_knownhost_free(hosts);
        return Result<void>::Err(ErrorKind::Handshake, "failed to read known_hosts " + path);
    }

    int typemask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW |
                   knownhost_key_type(type);

    // The DNS name is checked first, then the address
    int check = LIBSSH2_KNOWNHOST_CHECK_NOTFOUND;
    for (const std::string* name : {&target.public_dns_name, &target.public_ip}) {
        if (name->empty()) continue;
        struct libssh2_knownhost* entry = nullptr;
        check = libssh2_knownhost_checkp(hosts, name->c_str(), target.port,
                                         hostkey, len, typemask, &entry);
        if (check != LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) break;
    }
    libssh2_knownhost_free(hosts);

    switch (check) {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            return Result<void>::Ok();
        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            return Result<void>::Err(ErrorKind::Handshake,
                fmt::format("host key for {} does NOT match {}", target.identity(), path));
        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
            return Result<void>::Err(ErrorKind::Handshake,
                fmt::format("host {} not found in {}", target.identity(), path));
        default:
            return Result<void>::Err(ErrorKind::Handshake, "known_hosts check failed");
    }
}

Result<void> verify_host_key(LIBSSH2_SESSION* session, const RemoteTarget& target,
                             const HostTrustPolicy& trust) {
    size_t len = 0;
    int type = 0;
    const char* hostkey = libssh2_session_hostkey(session, &len, &type);
    if (!hostkey) {
        return Result<void>::Err(ErrorKind::Handshake, "server presented no host key");
    }

    switch (trust.mode()) {
        case HostTrustPolicy::Mode::AcceptAny:
            log_warn(fmt::format("host key verification disabled for {}", target.identity()));
            return Result<void>::Ok();

        case HostTrustPolicy::Mode::Fingerprint: {
            const char* hash = libssh2_hostkey_hash(session, LIBSSH2_HOSTKEY_HASH_SHA256);
            if (!hash) {
                return Result<void>::Err(ErrorKind::Handshake, "SHA-256 host key hash unavailable");
            }
            std::string digest(hash, 32);
            if (!trust.matches_fingerprint(digest)) {
                return Result<void>::Err(ErrorKind::Handshake,
                    fmt::format("host key {} for {} does not match pinned {}",
                                sha256_fingerprint(digest), target.identity(), trust.fingerprint()));
            }
            return Result<void>::Ok();
        }

        case HostTrustPolicy::Mode::KnownHosts:
            return check_known_hosts(session, target, trust, hostkey, len, type);
    }
    return Result<void>::Err(ErrorKind::Handshake, "unknown host trust policy");
}

} // namespace

// ── Libssh2Transport ────────────────────────────────────────────

Libssh2Transport::Libssh2Transport() {
    static std::once_flag init_once;
    std::call_once(init_once, [] {
        platform::init_networking();
        libssh2_init(0);
    });
}

DialOutcome Libssh2Transport::dial(const RemoteTarget& target,
                                   std::chrono::milliseconds timeout,
                                   const CancelScope& scope) {
    DialOutcome out;
    const std::string& host = target.public_ip.empty() ? target.public_dns_name : target.public_ip;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(target.port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        struct hostent* host_info = gethostbyname(host.c_str());
        if (!host_info) {
            out.error_code = EHOSTUNREACH;
            out.error = "failed to resolve host: " + host;
            return out;
        }
        std::memcpy(&addr.sin_addr, host_info->h_addr, sizeof(in_addr));
    }

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == KTEST_INVALID_SOCKET) {
        out.error_code = errno;
        out.error = "failed to create socket: " + std::string(strerror(errno));
        return out;
    }
    platform::set_nonblocking(sock);

    auto fail = [&](int code, const std::string& msg) {
        platform::close_socket(sock);
        out.error_code = code;
        out.error = fmt::format("dial tcp {}:{}: {}", host, target.port, msg);
        return out;
    };

    int ret = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        return fail(err, strerror(err));
    }

    // Wait for the non-blocking connect, in slices so cancellation is noticed
    if (ret < 0) {
        auto deadline = Clock::now() + timeout;
        int revents = 0;
        while (revents == 0) {
            if (scope.cancelled()) {
                return fail(ECANCELED, "operation was canceled");
            }
            if (Clock::now() >= deadline) {
                return fail(ETIMEDOUT, "i/o timeout");
            }
            revents = platform::poll_socket(sock, POLLOUT, 100);
        }
        int sock_err = platform::socket_error(sock);
        if (sock_err != 0) {
            return fail(sock_err, strerror(sock_err));
        }
    }

    out.sock = sock;
    return out;
}

Result<std::unique_ptr<SecureChannel>> Libssh2Transport::handshake(
        socket_t sock,
        const RemoteTarget& target,
        const std::string& user,
        const PrivateKey& key,
        const HostTrustPolicy& trust,
        std::chrono::milliseconds timeout) {
    using ChannelResult = Result<std::unique_ptr<SecureChannel>>;

    auto link = std::make_shared<Libssh2Link>();
    link->sock = sock;   // closed by the link from here on
    link->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!link->session) {
        return ChannelResult::Err(ErrorKind::Handshake, "failed to create SSH session");
    }
    libssh2_session_set_blocking(link->session, 0);

    auto deadline = Clock::now() + timeout;
    auto fail = [&](const std::string& msg) {
        {
            std::lock_guard<std::mutex> lock(link->io_mutex);
            libssh2_session_disconnect(link->session, "Handshake failed");
        }
        link->closed = true;
        return ChannelResult::Err(ErrorKind::Handshake, msg);
    };

    // Key exchange
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link->io_mutex);
            rc = libssh2_session_handshake(link->session, sock);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) return fail("SSH handshake timed out");
        link->wait_socket(100);
    }
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(link->io_mutex);
        std::string err = link->last_error();
        libssh2_session_disconnect(link->session, "Handshake failed");
        link->closed = true;
        return ChannelResult::Err(ErrorKind::Handshake, "SSH handshake failed: " + err);
    }

    Result<void> trusted;
    {
        std::lock_guard<std::mutex> lock(link->io_mutex);
        trusted = verify_host_key(link->session, target, trust);
    }
    if (trusted.is_err()) {
        return fail(trusted.error);
    }

    // Public key authentication
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link->io_mutex);
            rc = libssh2_userauth_publickey_frommemory(
                link->session,
                user.c_str(), user.size(),
                nullptr, 0,
                key.pem.c_str(), key.pem.size(),
                nullptr);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) return fail("authentication timed out");
        link->wait_socket(100);
    }
    if (rc != 0) {
        std::string err;
        {
            std::lock_guard<std::mutex> lock(link->io_mutex);
            err = link->last_error();
        }
        return fail(fmt::format("public key authentication as {} failed: {}", user, err));
    }

    platform::enable_keepalive(sock);
    libssh2_keepalive_config(link->session, 1, SSH_KEEPALIVE_SECS);

    return ChannelResult::Ok(std::make_unique<Libssh2Channel>(std::move(link)));
}
