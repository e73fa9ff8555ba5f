#include "client.hpp"
#include "libssh2_transport.hpp"

static std::unique_ptr<Transport> default_transport(std::unique_ptr<Transport> transport) {
    if (transport) return transport;
    return std::make_unique<Libssh2Transport>();
}

SSHClient::SSHClient(ClientConfig config, std::unique_ptr<Transport> transport)
    : config_(std::move(config)),
      transport_(default_transport(std::move(transport))),
      conn_(config_, *transport_),
      runner_(conn_, ledger_),
      transferer_(conn_, ledger_) {}

SSHClient::~SSHClient() {
    close();
}

SSHResult SSHClient::connect() {
    return conn_.connect();
}

void SSHClient::close() {
    conn_.close();
}

SSHResult SSHClient::run(const std::string& command, const OpOptions& opts) {
    return runner_.run(command, opts);
}

SSHResult SSHClient::send(const std::string& local_path, const std::string& remote_path,
                          const OpOptions& opts) {
    return transferer_.send(local_path, remote_path, opts);
}

SSHResult SSHClient::download(const std::string& remote_path, const std::string& local_path,
                              const OpOptions& opts) {
    return transferer_.download(remote_path, local_path, opts);
}
