#pragma once

#include <string>
#include <core/types.hpp>
#include "connection_manager.hpp"
#include "retry.hpp"

// Runs one command per fresh session over the managed channel, racing the
// command against the call's timeout and the client lifetime.
class CommandRunner {
public:
    CommandRunner(ConnectionManager& conn, RetryLedger& ledger);

    // Combined stdout/stderr in `output`. Failures are retried per
    // opts.retries with a reconnect before each retry.
    SSHResult run(const std::string& command, const OpOptions& opts = {});

private:
    ConnectionManager& conn_;
    RetryLedger& ledger_;

    SSHResult attempt(const std::string& command, const OpOptions& opts);
};
