#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_scope.hpp>
#include "client_config.hpp"
#include "transport.hpp"

// Lifecycle of one secure channel to one host.
//
// The channel is either absent or fully established: dialed, handshaked,
// host key verified and authenticated. reconnect() replaces it wholesale.
//
// Not thread-safe, except for close(): another thread may call it at any
// time to cancel whatever is in flight. A close() that lands during
// connect() or reconnect() makes them return Cancelled without installing
// a channel.
class ConnectionManager {
public:
    ConnectionManager(const ClientConfig& config, Transport& transport);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Close any existing channel, then load the key, dial with bounded
    // retry and handshake.
    SSHResult connect();

    // Cancel the lifetime and close the channel. Idempotent.
    void close();

    // close(), then connect() up to max_reconnect_cycles times
    SSHResult reconnect();

    bool is_connected() const;

    // Live channel, nullptr when not connected
    std::shared_ptr<SecureChannel> channel() const;

    // Scope created by the last connect() and cancelled by close().
    // Invalid before the first successful connect.
    CancelScope lifetime() const;

    // Host key options for the external scp. Under a pinned fingerprint
    // they point at a known_hosts file holding the key verified by the
    // last handshake.
    std::vector<std::string> scp_host_key_options() const;

    // Per-client known_hosts file, empty unless the fingerprint is pinned
    const std::filesystem::path& verified_hosts_path() const { return verified_hosts_; }

    const ClientConfig& config() const { return config_; }
    const std::string& identity() const { return config_.target.identity(); }

private:
    const ClientConfig& config_;
    Transport& transport_;
    std::filesystem::path verified_hosts_;

    mutable std::mutex mutex_;   // guards lifetime_ and channel_
    CancelScope lifetime_;
    std::shared_ptr<SecureChannel> channel_;
    std::atomic<unsigned> closes_{0};

    SSHResult connect_as(unsigned generation);
    void teardown();
    Result<socket_t> dial_with_retry(const CancelScope& scope);
    void log_key_mode() const;
};
