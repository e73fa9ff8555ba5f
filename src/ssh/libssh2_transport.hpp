#pragma once

#include "transport.hpp"

// Transport over plain TCP sockets and libssh2 in non-blocking mode.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();

    DialOutcome dial(const RemoteTarget& target,
                     std::chrono::milliseconds timeout,
                     const CancelScope& scope) override;

    Result<std::unique_ptr<SecureChannel>> handshake(
        socket_t sock,
        const RemoteTarget& target,
        const std::string& user,
        const PrivateKey& key,
        const HostTrustPolicy& trust,
        std::chrono::milliseconds timeout) override;
};
