#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <core/types.hpp>
#include "host_trust.hpp"

// Everything needed to reach one host. A trust policy has no default, so a
// ClientConfig cannot exist without one.
struct ClientConfig {
    explicit ClientConfig(HostTrustPolicy trust_policy) : trust(std::move(trust_policy)) {}

    RemoteTarget target;
    std::string user;
    std::filesystem::path key_path;
    std::map<std::string, std::string> env;   // applied to every command
    HostTrustPolicy trust;
    ConnectPolicy policy;
    std::string scp_program = "scp";          // looked up on PATH per transfer
};
