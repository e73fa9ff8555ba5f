#include "retry.hpp"
#include "connection_manager.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// ── RetryLedger ─────────────────────────────────────────────────

bool RetryLedger::seed(const std::string& key, int budget) {
    return budgets_.emplace(key, budget < 0 ? 0 : budget).second;
}

int RetryLedger::remaining(const std::string& key) const {
    auto it = budgets_.find(key);
    return it == budgets_.end() ? 0 : it->second;
}

int RetryLedger::consume(const std::string& key) {
    auto it = budgets_.find(key);
    if (it == budgets_.end()) return 0;
    if (it->second > 0) it->second--;
    return it->second;
}

void RetryLedger::erase(const std::string& key) {
    budgets_.erase(key);
}

bool RetryLedger::contains(const std::string& key) const {
    return budgets_.count(key) > 0;
}

// ── Keys ────────────────────────────────────────────────────────

std::string command_retry_key(const RemoteTarget& target, const std::string& command) {
    return fmt::format("run|{}|{}", target.identity(), command);
}

std::string transfer_retry_key(const RemoteTarget& target, TransferDirection direction,
                               const std::string& local_path, const std::string& remote_path) {
    return fmt::format("{}|{}|{}|{}",
                       direction == TransferDirection::Send ? "send" : "download",
                       target.identity(), local_path, remote_path);
}

bool is_retryable(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Execution:
        case ErrorKind::Transfer:
        case ErrorKind::DeadlineExceeded:
            return true;
        default:
            return false;
    }
}

SSHResult cancelled_result(CancelReason reason, const std::string& what, std::string output) {
    if (reason == CancelReason::DeadlineExceeded) {
        return SSHResult::fail(ErrorKind::DeadlineExceeded,
                               what + ": context deadline exceeded", std::move(output));
    }
    return SSHResult::fail(ErrorKind::Cancelled, what + ": context canceled", std::move(output));
}

// ── Retry protocol ──────────────────────────────────────────────

SSHResult run_with_retries(ConnectionManager& conn,
                           RetryLedger& ledger,
                           const std::string& key,
                           const std::string& what,
                           const OpOptions& opts,
                           const std::function<SSHResult()>& attempt) {
    ledger.seed(key, opts.retries);
    const std::string identity = conn.identity();

    while (true) {
        SSHResult result = attempt();
        if (result.success()) {
            ledger.erase(key);
            return result;
        }

        log_warn(fmt::format("{} on {} failed: {}", what, identity, result.describe()));

        if (!is_retryable(result.kind) || ledger.remaining(key) == 0) {
            ledger.erase(key);
            if (is_retryable(result.kind)) {
                log_warn(fmt::format("giving up on {} on {}: retries exhausted", what, identity));
            }
            return result;
        }

        int left = ledger.consume(key);
        log_info(fmt::format("retrying {} on {} ({} retries left after this one)",
                             what, identity, left));

        SSHResult rc = conn.reconnect();
        if (rc.failed()) {
            ledger.erase(key);
            log_warn(fmt::format("giving up on {} on {}: {}", what, identity, rc.describe()));
            return rc;
        }

        if (opts.retry_interval.count() > 0) {
            CancelScope lifetime = conn.lifetime();
            if (lifetime.wait_for(opts.retry_interval)) {
                ledger.erase(key);
                log_warn(fmt::format("giving up on {} on {}: client closed", what, identity));
                return cancelled_result(lifetime.reason(), what);
            }
        }
    }
}
