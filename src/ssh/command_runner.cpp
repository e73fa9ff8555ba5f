#include "command_runner.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <future>
#include <map>
#include <memory>

static constexpr auto RACE_POLL = std::chrono::milliseconds(10);

CommandRunner::CommandRunner(ConnectionManager& conn, RetryLedger& ledger)
    : conn_(conn), ledger_(ledger) {}

SSHResult CommandRunner::run(const std::string& command, const OpOptions& opts) {
    const std::string key = command_retry_key(conn_.config().target, command);
    return run_with_retries(conn_, ledger_, key, fmt::format("command \"{}\"", command), opts,
                            [&] { return attempt(command, opts); });
}

SSHResult CommandRunner::attempt(const std::string& command, const OpOptions& opts) {
    std::shared_ptr<SecureChannel> channel = conn_.channel();
    if (!channel) {
        return SSHResult::fail(ErrorKind::NotConnected, "not connected; call connect() first");
    }

    auto start = std::chrono::steady_clock::now();

    // A session accepts exactly one command
    auto opened = channel->open_session();
    if (opened.is_err()) {
        return SSHResult::fail(ErrorKind::SessionCreation, opened.error);
    }
    std::shared_ptr<RemoteSession> session(std::move(opened.value));
    log_info(fmt::format("created client session, running command \"{}\"", command));

    std::map<std::string, std::string> env = conn_.config().env;
    for (const auto& [name, value] : opts.env) {
        env[name] = value;
    }
    for (const auto& [name, value] : env) {
        auto set = session->set_env(name, value);
        if (set.is_err()) {
            session->close();
            return SSHResult::fail(ErrorKind::SessionCreation, set.error);
        }
    }

    CancelScope scope = conn_.lifetime().child(opts.timeout);

    auto task = std::async(std::launch::async, [session, command] {
        return session->exec(command);
    });

    SSHResult result;
    bool fired = false;
    while (task.wait_for(RACE_POLL) != std::future_status::ready) {
        if (scope.cancelled()) {
            session->close();
            task.wait();
            fired = true;
            break;
        }
    }

    if (fired) {
        result = cancelled_result(scope.reason(), "run");
    } else {
        result = task.get();
        // close() tears the channel down after cancelling the lifetime, so a
        // transport error here may really be a cancellation
        if (result.failed() && scope.cancelled()) {
            result = cancelled_result(scope.reason(), "run", std::move(result.output));
        }
    }

    if (opts.verbose) {
        log_info(fmt::format("ran command \"{}\" on {} in {}",
                             command, conn_.identity(), format_since(start)));
    }
    return result;
}
