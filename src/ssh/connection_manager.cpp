#include "connection_manager.hpp"
#include "private_key.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <cstring>

namespace fs = std::filesystem;

static fs::path verified_hosts_file() {
    static std::atomic<unsigned> counter{0};
    return platform::temp_dir() / fmt::format("ktest_known_hosts_{}_{}", getpid(), counter++);
}

// How OpenSSH spells the host scp connects to in known_hosts
static std::string known_hosts_name(const RemoteTarget& target) {
    if (target.port == DEFAULT_SSH_PORT) return target.identity();
    return fmt::format("[{}]:{}", target.identity(), target.port);
}

// Close a channel that was never installed
static void discard(SecureChannel& channel) {
    auto closed = channel.close();
    if (closed.is_err()) log_warn("closing unused channel: " + closed.error);
}

ConnectionManager::ConnectionManager(const ClientConfig& config, Transport& transport)
    : config_(config), transport_(transport) {
    if (config_.trust.mode() == HostTrustPolicy::Mode::Fingerprint) {
        verified_hosts_ = verified_hosts_file();
    }
}

ConnectionManager::~ConnectionManager() {
    close();
    if (!verified_hosts_.empty()) {
        std::error_code ec;
        fs::remove(verified_hosts_, ec);
    }
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_ != nullptr;
}

std::shared_ptr<SecureChannel> ConnectionManager::channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channel_;
}

CancelScope ConnectionManager::lifetime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifetime_;
}

std::vector<std::string> ConnectionManager::scp_host_key_options() const {
    return config_.trust.scp_options(verified_hosts_);
}

// ── Connect ────────────────────────────────────────────────────

SSHResult ConnectionManager::connect() {
    return connect_as(closes_.load());
}

// `generation` is the close() count the caller started from; any close()
// after it cancels this connect.
SSHResult ConnectionManager::connect_as(unsigned generation) {
    teardown();

    CancelScope scope = CancelScope::root();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lifetime_ = scope;
    }
    if (closes_.load() != generation) scope.cancel();

    auto fail = [this, &scope](SSHResult r) {
        scope.cancel();
        std::lock_guard<std::mutex> lock(mutex_);
        lifetime_ = CancelScope();
        return r;
    };

    auto raw = load_key_file(config_.key_path);
    if (raw.is_err()) return fail(SSHResult::fail(raw.kind, raw.error));
    auto key = parse_private_key(raw.value);
    if (key.is_err()) {
        return fail(SSHResult::fail(key.kind,
            fmt::format("{}: {}", config_.key_path.string(), key.error)));
    }

    auto start = std::chrono::steady_clock::now();
    log_info(fmt::format("dialing public-ip={} public-dns-name={} port={}",
                         config_.target.public_ip, config_.target.public_dns_name,
                         config_.target.port));

    auto sock = dial_with_retry(scope);
    if (sock.is_err()) return fail(SSHResult::fail(sock.kind, sock.error));

    log_info(fmt::format("dialed {} in {}", identity(), format_since(start)));

    auto handshake = transport_.handshake(sock.value, config_.target, config_.user,
                                          key.value, config_.trust,
                                          config_.policy.dial_timeout);
    if (handshake.is_err()) {
        log_warn(fmt::format("failed to create client for {}: {}", identity(), handshake.error));
        log_key_mode();
        return fail(SSHResult::fail(ErrorKind::Handshake, handshake.error));
    }
    std::shared_ptr<SecureChannel> channel(std::move(handshake.value));

    // scp makes its own connection; hand it the key this handshake verified
    if (!verified_hosts_.empty()) {
        auto written = channel->write_host_key(known_hosts_name(config_.target), verified_hosts_);
        if (written.is_err()) {
            discard(*channel);
            return fail(SSHResult::fail(ErrorKind::Handshake,
                fmt::format("recording host key in {}: {}",
                            verified_hosts_.string(), written.error)));
        }
    }

    bool installed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scope.cancelled()) {
            channel_ = channel;
            installed = true;
        }
    }
    if (!installed) {
        discard(*channel);
        return fail(SSHResult::fail(ErrorKind::Cancelled, "connect cancelled"));
    }

    log_info(fmt::format("created client for {} as {} ({})",
                         identity(), config_.user, config_.trust.describe()));
    return SSHResult::ok();
}

Result<socket_t> ConnectionManager::dial_with_retry(const CancelScope& scope) {
    const ConnectPolicy& policy = config_.policy;
    DialOutcome last;

    for (int attempt = 1; attempt <= policy.max_dial_attempts; attempt++) {
        if (scope.cancelled()) {
            return Result<socket_t>::Err(ErrorKind::Cancelled, "dial cancelled");
        }

        last = transport_.dial(config_.target, policy.dial_timeout, scope);
        if (last.ok()) {
            return Result<socket_t>::Ok(last.sock);
        }

        if (last.refused()) {
            log_warn(fmt::format("failed to dial {} (host likely not ready yet), attempt {}/{}: {}",
                                 identity(), attempt, policy.max_dial_attempts, last.error));
        } else {
            log_warn(fmt::format("failed to dial {}, attempt {}/{}: {} ({})",
                                 identity(), attempt, policy.max_dial_attempts,
                                 last.error, std::strerror(last.error_code)));
        }

        if (attempt < policy.max_dial_attempts && scope.wait_for(policy.dial_backoff)) {
            return Result<socket_t>::Err(ErrorKind::Cancelled, "dial cancelled");
        }
    }

    return Result<socket_t>::Err(ErrorKind::DialExhausted,
        fmt::format("failed to dial {} after {} attempts: {}",
                    identity(), policy.max_dial_attempts, last.error));
}

void ConnectionManager::log_key_mode() const {
    std::error_code ec;
    auto status = fs::status(config_.key_path, ec);
    if (ec) {
        log_warn(fmt::format("cannot stat key file {}: {}", config_.key_path.string(), ec.message()));
        return;
    }
    log_warn(fmt::format("key file {} has mode {:o}", config_.key_path.string(),
                         static_cast<unsigned>(status.permissions() & fs::perms::mask)));
}

// ── Close / reconnect ──────────────────────────────────────────

void ConnectionManager::close() {
    closes_++;
    teardown();
}

void ConnectionManager::teardown() {
    std::shared_ptr<SecureChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lifetime_.valid()) lifetime_.cancel();
        channel.swap(channel_);
    }
    if (!channel) return;

    auto result = channel->close();
    if (result.is_ok()) {
        log_info(fmt::format("closed connection to {}", identity()));
    } else {
        log_warn(fmt::format("closed connection to {}: {}", identity(), result.error));
    }
}

SSHResult ConnectionManager::reconnect() {
    const unsigned generation = closes_.load();
    teardown();

    SSHResult last;
    for (int cycle = 1; cycle <= config_.policy.max_reconnect_cycles; cycle++) {
        if (closes_.load() != generation) {
            return SSHResult::fail(ErrorKind::Cancelled, "reconnect cancelled");
        }
        last = connect_as(generation);
        if (last.success()) return last;
        if (last.kind == ErrorKind::KeyLoad || last.kind == ErrorKind::KeyParse ||
            last.kind == ErrorKind::Cancelled) {
            return last;
        }
        log_warn(fmt::format("reconnect to {} failed, cycle {}/{}: {}",
                             identity(), cycle, config_.policy.max_reconnect_cycles,
                             last.describe()));
    }

    return SSHResult::fail(ErrorKind::ReconnectExhausted,
        fmt::format("could not reconnect to {} after {} cycles: {}",
                    identity(), config_.policy.max_reconnect_cycles, last.error));
}
