#include "file_transfer.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

FileTransferer::FileTransferer(ConnectionManager& conn, RetryLedger& ledger)
    : conn_(conn), ledger_(ledger) {}

SSHResult FileTransferer::send(const std::string& local_path, const std::string& remote_path,
                               const OpOptions& opts) {
    return transfer(TransferDirection::Send, local_path, remote_path, opts);
}

SSHResult FileTransferer::download(const std::string& remote_path, const std::string& local_path,
                                   const OpOptions& opts) {
    return transfer(TransferDirection::Download, local_path, remote_path, opts);
}

// ── Preconditions + retry ───────────────────────────────────────

SSHResult FileTransferer::transfer(TransferDirection direction,
                                   const std::string& local_path, const std::string& remote_path,
                                   const OpOptions& opts) {
    const ClientConfig& config = conn_.config();

    auto scp = platform::find_in_path(config.scp_program);
    if (!scp) {
        return SSHResult::fail(ErrorKind::ToolLookup,
            fmt::format("executable file not found in $PATH: {}", config.scp_program));
    }

    // scp refuses keys readable by others
    std::error_code ec;
    fs::permissions(config.key_path, fs::perms::owner_read, fs::perm_options::replace, ec);
    if (ec) {
        return SSHResult::fail(ErrorKind::PermissionChange,
            fmt::format("chmod 0400 {}: {}", config.key_path.string(), ec.message()));
    }

    const std::string key = transfer_retry_key(config.target, direction, local_path, remote_path);
    const std::string what = direction == TransferDirection::Send
        ? fmt::format("send {} -> {}", local_path, remote_path)
        : fmt::format("download {} -> {}", remote_path, local_path);

    const std::string scp_path = scp->string();
    return run_with_retries(conn_, ledger_, key, what, opts, [&] {
        return attempt(scp_path, direction, local_path, remote_path, opts);
    });
}

// ── One scp run ─────────────────────────────────────────────────

std::string FileTransferer::remote_arg(const std::string& remote_path) const {
    const ClientConfig& config = conn_.config();
    return fmt::format("{}@{}:{}", config.user, config.target.identity(), remote_path);
}

SSHResult FileTransferer::attempt(const std::string& scp,
                                  TransferDirection direction,
                                  const std::string& local_path, const std::string& remote_path,
                                  const OpOptions& opts) {
    CancelScope lifetime = conn_.lifetime();
    if (!lifetime.valid()) {
        return SSHResult::fail(ErrorKind::NotConnected, "not connected; call connect() first");
    }
    const ClientConfig& config = conn_.config();

    std::vector<std::string> args = conn_.scp_host_key_options();
    args.push_back("-oBatchMode=yes");
    args.push_back("-P");
    args.push_back(std::to_string(config.target.port));
    args.push_back("-i");
    args.push_back(config.key_path.string());
    if (direction == TransferDirection::Send) {
        args.push_back(local_path);
        args.push_back(remote_arg(remote_path));
    } else {
        args.push_back(remote_arg(remote_path));
        args.push_back(local_path);
    }

    auto start = std::chrono::steady_clock::now();
    CancelScope scope = lifetime.child(opts.timeout);

    auto proc = platform::run_captured(scp, args, [&scope] { return scope.cancelled(); });

    SSHResult result;
    if (proc.stopped) {
        result = cancelled_result(scope.reason(), "scp", std::move(proc.output));
    } else if (!proc.spawned) {
        result = SSHResult::fail(ErrorKind::Transfer, "failed to start " + scp);
    } else if (proc.exit_code != 0) {
        result = SSHResult::fail(ErrorKind::Transfer,
                                 fmt::format("scp exited with status {}", proc.exit_code),
                                 std::move(proc.output), proc.exit_code);
    } else {
        result = SSHResult::ok(std::move(proc.output));
    }

    if (opts.verbose) {
        const bool sending = direction == TransferDirection::Send;
        std::error_code ec;
        auto size = fs::file_size(local_path, ec);
        if (!ec) {
            log_info(fmt::format("{} {} ({}) in {}", sending ? "sent" : "downloaded",
                                 local_path, format_bytes(size), format_since(start)));
        } else {
            log_info(fmt::format("{} {}: {} ({})", sending ? "failed to send" : "failed to download",
                                 local_path, ec.message(), format_since(start)));
        }
    }
    return result;
}
