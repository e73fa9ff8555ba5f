#pragma once

#include <string>
#include <map>
#include <chrono>
#include "constants.hpp"

// Error classification for every remote operation
enum class ErrorKind {
    None,
    KeyLoad,             // key file unreadable
    KeyParse,            // key file is not a private key
    DialExhausted,       // every dial attempt failed
    Handshake,           // SSH handshake, host key or auth rejected
    SessionCreation,     // could not open/prepare a session on the channel
    Execution,           // remote command failed or transport dropped
    Cancelled,           // client lifetime cancelled
    DeadlineExceeded,    // per-call timeout fired
    ToolLookup,          // scp not found on PATH
    PermissionChange,    // could not chmod the key file
    Transfer,            // scp exited nonzero
    NotConnected,        // operation issued before connect()
    ReconnectExhausted,  // retry protocol could not re-establish the channel
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Execution};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Execution};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of connect/run/send/download.
// `output` is stdout and stderr combined in the order they were produced.
struct SSHResult {
    ErrorKind kind = ErrorKind::None;
    int exit_code = 0;
    std::string output;
    std::string error;

    bool success() const { return kind == ErrorKind::None; }
    bool failed() const { return kind != ErrorKind::None; }

    static SSHResult ok(std::string output = "") {
        return SSHResult{ErrorKind::None, 0, std::move(output), ""};
    }

    static SSHResult fail(ErrorKind kind, const std::string& error,
                          std::string output = "", int exit_code = -1) {
        return SSHResult{kind, exit_code, std::move(output), error};
    }

    // "Execution: Process exited with status 1"
    std::string describe() const;
};

// Where the client connects to. The DNS name, when known, is the identity
// used in logs, retry keys and scp destinations.
struct RemoteTarget {
    std::string public_ip;
    std::string public_dns_name;
    int port = DEFAULT_SSH_PORT;

    const std::string& identity() const {
        return public_dns_name.empty() ? public_ip : public_dns_name;
    }
};

// Per-call configuration for run/send/download
struct OpOptions {
    bool verbose = true;
    int retries = 0;
    std::chrono::milliseconds retry_interval{0};
    std::chrono::milliseconds timeout{0};      // 0 = bounded only by the client lifetime
    std::map<std::string, std::string> env;    // merged over the client's env, wins on collision
};

// Dial/reconnect limits
struct ConnectPolicy {
    int max_dial_attempts = DIAL_MAX_ATTEMPTS;
    std::chrono::milliseconds dial_timeout = std::chrono::seconds(DIAL_TIMEOUT_SECS);
    std::chrono::milliseconds dial_backoff = std::chrono::seconds(DIAL_BACKOFF_SECS);
    int max_reconnect_cycles = RECONNECT_MAX_CYCLES;
};
