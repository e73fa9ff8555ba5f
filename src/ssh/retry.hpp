#pragma once

#include <functional>
#include <map>
#include <string>
#include <core/types.hpp>
#include <core/cancel_scope.hpp>

class ConnectionManager;

enum class TransferDirection { Send, Download };

// Remaining retry budget per operation key, shared by the command runner
// and the file transferer of one client. Not synchronized: a client is used
// from one thread at a time.
class RetryLedger {
public:
    // Record `budget` for `key` unless it is already present.
    // Returns true if the key was new.
    bool seed(const std::string& key, int budget);

    // Remaining budget, 0 for unknown keys
    int remaining(const std::string& key) const;

    // Decrement and return the new count (never below 0)
    int consume(const std::string& key);

    void erase(const std::string& key);
    bool contains(const std::string& key) const;
    size_t size() const { return budgets_.size(); }

private:
    std::map<std::string, int> budgets_;
};

std::string command_retry_key(const RemoteTarget& target, const std::string& command);

std::string transfer_retry_key(const RemoteTarget& target, TransferDirection direction,
                               const std::string& local_path, const std::string& remote_path);

// Execution, Transfer and DeadlineExceeded failures are
// worth a reconnect; everything else is returned as is.
bool is_retryable(ErrorKind kind);

// Attempt result for a call scope that fired before the work finished
SSHResult cancelled_result(CancelReason reason, const std::string& what,
                           std::string output = "");

// Run `attempt` until it succeeds, fails with a non-retryable error or the
// budget for `key` runs out. Each retry reconnects `conn` and then waits
// opts.retry_interval. The ledger entry is removed on return.
SSHResult run_with_retries(ConnectionManager& conn,
                           RetryLedger& ledger,
                           const std::string& key,
                           const std::string& what,
                           const OpOptions& opts,
                           const std::function<SSHResult()>& attempt);
