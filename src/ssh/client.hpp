#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include "client_config.hpp"
#include "connection_manager.hpp"
#include "command_runner.hpp"
#include "file_transfer.hpp"
#include "retry.hpp"
#include "transport.hpp"

// SSHClient: resilient command execution and file transfer against one host.
//
//   SSHClient client(config);
//   auto r = client.connect();
//   if (r.success()) {
//       OpOptions opts;
//       opts.retries = 3;
//       opts.timeout = std::chrono::seconds(30);
//       auto out = client.run("uname -a", opts);
//   }
//
// One client serves one host from one thread. Calling close() from another
// thread cancels whatever operation is in flight.
class SSHClient {
public:
    // Without a transport, connects with libssh2
    explicit SSHClient(ClientConfig config, std::unique_ptr<Transport> transport = nullptr);
    ~SSHClient();

    SSHClient(const SSHClient&) = delete;
    SSHClient& operator=(const SSHClient&) = delete;

    SSHResult connect();
    void close();
    bool is_connected() const { return conn_.is_connected(); }

    SSHResult run(const std::string& command, const OpOptions& opts = {});
    SSHResult send(const std::string& local_path, const std::string& remote_path,
                   const OpOptions& opts = {});
    SSHResult download(const std::string& remote_path, const std::string& local_path,
                       const OpOptions& opts = {});

    const ClientConfig& config() const { return config_; }
    const RetryLedger& retry_ledger() const { return ledger_; }

private:
    ClientConfig config_;
    std::unique_ptr<Transport> transport_;
    RetryLedger ledger_;
    ConnectionManager conn_;
    CommandRunner runner_;
    FileTransferer transferer_;
};
