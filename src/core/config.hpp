#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "types.hpp"
#include <ssh/client_config.hpp>
#include <ssh/host_trust.hpp>

namespace fs = std::filesystem;

// Client settings read from YAML:
//
//   host:
//     public_ip: 10.0.0.5
//     public_dns_name: ec2-10-0-0-5.compute.amazonaws.com
//     port: 22
//   user: ec2-user
//   key_path: ~/.ssh/test.pem
//   env:
//     AWS_REGION: us-west-2
//   host_key:
//     known_hosts: ~/.ssh/known_hosts      # or fingerprint: SHA256:...
//                                          # or insecure_accept_any: true
//   connect:
//     dial_attempts: 15
//     dial_timeout_secs: 15
//     dial_backoff_secs: 5
//     reconnect_cycles: 10
//   log:
//     path: /tmp/ktest.log
//     echo: false
class Config {
public:
    Config() = default;

    static Result<Config> load(const fs::path& path);

    // ~/.ktest/config.yaml; a missing file yields an empty Config
    static Result<Config> load_default();

    static Result<Config> parse(const std::string& yaml);

    // KTEST_PUBLIC_IP, KTEST_PUBLIC_DNS_NAME, KTEST_PORT, KTEST_USER,
    // KTEST_KEY_PATH and KTEST_KNOWN_HOSTS replace the matching settings.
    void apply_env_overrides();

    // Host, user, key path and host key policy must all be present.
    Result<void> validate() const;

    // Throws std::logic_error when no host key policy is configured.
    ClientConfig client_config() const;

    const RemoteTarget& target() const { return target_; }
    const std::string& user() const { return user_; }
    const fs::path& key_path() const { return key_path_; }
    const std::map<std::string, std::string>& env() const { return env_; }
    const std::optional<HostTrustPolicy>& trust() const { return trust_; }
    const ConnectPolicy& policy() const { return policy_; }
    const std::string& log_path() const { return log_path_; }
    bool log_echo() const { return log_echo_; }

private:
    RemoteTarget target_;
    std::string user_;
    fs::path key_path_;
    std::map<std::string, std::string> env_;
    std::optional<HostTrustPolicy> trust_;
    ConnectPolicy policy_;
    std::string log_path_;
    bool log_echo_ = false;
};

fs::path get_config_dir();
fs::path get_config_path();

// "~/x" -> "<home>/x"; anything else is returned unchanged
fs::path expand_home(const std::string& path);
