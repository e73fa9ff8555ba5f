#pragma once

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_scope.hpp>
#include <platform/socket_util.hpp>
#include "host_trust.hpp"
#include "private_key.hpp"

// One-shot command context on a secure channel. A session runs exactly one
// command; it is never reused.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Must be called before exec(). Servers may reject names outside AcceptEnv.
    virtual Result<void> set_env(const std::string& name, const std::string& value) = 0;

    // Run the command and block until it exits or close() is called.
    // Output is stdout and stderr merged; a nonzero exit status is an
    // Execution failure carrying the output.
    virtual SSHResult exec(const std::string& command) = 0;

    // Force-terminate. Safe to call from another thread while exec() runs.
    virtual void close() = 0;
};

// An established (dialed, handshaked, verified, authenticated) connection.
class SecureChannel {
public:
    virtual ~SecureChannel() = default;

    virtual Result<std::unique_ptr<RemoteSession>> open_session() = 0;

    // Write the host key verified during the handshake to `file` as its only
    // OpenSSH known_hosts entry, under `host` ("name" or "[name]:port").
    virtual Result<void> write_host_key(const std::string& host,
                                        const std::filesystem::path& file) = 0;

    // Tear down the connection. Sessions still open on it fail.
    virtual Result<void> close() = 0;
};

struct DialOutcome {
    socket_t sock = KTEST_INVALID_SOCKET;
    int error_code = 0;  // errno-style, 0 on success
    std::string error;

    bool ok() const { return error_code == 0; }
    bool refused() const { return error_code == ECONNREFUSED; }
};

// Network and protocol half of the client, split out so the connection,
// retry and cancellation logic can run against a scripted transport.
class Transport {
public:
    virtual ~Transport() = default;

    // One TCP connection attempt, bounded by `timeout` and abandoned early
    // if `scope` is cancelled.
    virtual DialOutcome dial(const RemoteTarget& target,
                             std::chrono::milliseconds timeout,
                             const CancelScope& scope) = 0;

    // SSH handshake, host key verification and public-key authentication
    // on a dialed socket. Takes ownership of `sock`; it is closed on failure.
    virtual Result<std::unique_ptr<SecureChannel>> handshake(
        socket_t sock,
        const RemoteTarget& target,
        const std::string& user,
        const PrivateKey& key,
        const HostTrustPolicy& trust,
        std::chrono::milliseconds timeout) = 0;
};
