#pragma once

#include <string>
#include <core/types.hpp>
#include "connection_manager.hpp"
#include "retry.hpp"

// Copies files to and from the host with the external scp, authenticated
// with the client's key and checked against its host trust policy.
class FileTransferer {
public:
    FileTransferer(ConnectionManager& conn, RetryLedger& ledger);

    SSHResult send(const std::string& local_path, const std::string& remote_path,
                   const OpOptions& opts = {});

    SSHResult download(const std::string& remote_path, const std::string& local_path,
                       const OpOptions& opts = {});

private:
    ConnectionManager& conn_;
    RetryLedger& ledger_;

    SSHResult transfer(TransferDirection direction,
                       const std::string& local_path, const std::string& remote_path,
                       const OpOptions& opts);

    SSHResult attempt(const std::string& scp,
                      TransferDirection direction,
                      const std::string& local_path, const std::string& remote_path,
                      const OpOptions& opts);

    std::string remote_arg(const std::string& remote_path) const;
};
