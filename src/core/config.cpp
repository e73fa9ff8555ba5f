#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

// ── Section parsers ───────────────────────────────────────────

// Unlike as<int>(fallback), a present but non-numeric value is an error
static int read_int(const YAML::Node& node, const char* key, int fallback) {
    if (!node[key]) return fallback;
    return node[key].as<int>();
}

static Result<HostTrustPolicy> parse_host_key(const YAML::Node& node) {
    // Result<T> needs a default value for errors
    auto err = [](const std::string& msg) {
        return Result<HostTrustPolicy>{false, HostTrustPolicy::insecure_accept_any(),
                                       msg, ErrorKind::Execution};
    };
    if (!node.IsMap()) {
        return err("host_key must be a mapping");
    }

    int modes = 0;
    std::optional<HostTrustPolicy> policy;
    if (node["known_hosts"]) {
        modes++;
        policy = HostTrustPolicy::known_hosts(expand_home(node["known_hosts"].as<std::string>()));
    }
    if (node["fingerprint"]) {
        modes++;
        std::string fp = node["fingerprint"].as<std::string>();
        if (fp.empty()) return err("host_key.fingerprint is empty");
        policy = HostTrustPolicy::pinned(fp);
    }
    if (node["insecure_accept_any"]) {
        modes++;
        if (!node["insecure_accept_any"].as<bool>(false)) {
            return err("host_key.insecure_accept_any must be true when present");
        }
        policy = HostTrustPolicy::insecure_accept_any();
    }

    if (modes != 1) {
        return err("host_key needs exactly one of known_hosts, fingerprint, insecure_accept_any");
    }
    return Result<HostTrustPolicy>::Ok(*policy);
}

static ConnectPolicy parse_connect_policy(const YAML::Node& node) {
    ConnectPolicy policy;
    policy.max_dial_attempts = read_int(node, "dial_attempts", DIAL_MAX_ATTEMPTS);
    policy.dial_timeout = std::chrono::seconds(read_int(node, "dial_timeout_secs", DIAL_TIMEOUT_SECS));
    policy.dial_backoff = std::chrono::seconds(read_int(node, "dial_backoff_secs", DIAL_BACKOFF_SECS));
    policy.max_reconnect_cycles = read_int(node, "reconnect_cycles", RECONNECT_MAX_CYCLES);
    return policy;
}

// ── Loading ───────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) return Result<Config>::Err("config root must be a mapping");

        if (root["host"]) {
            const YAML::Node& host = root["host"];
            config.target_.public_ip = host["public_ip"].as<std::string>("");
            config.target_.public_dns_name = host["public_dns_name"].as<std::string>("");
            config.target_.port = read_int(host, "port", DEFAULT_SSH_PORT);
        }
        config.user_ = root["user"].as<std::string>("");
        if (root["key_path"]) {
            config.key_path_ = expand_home(root["key_path"].as<std::string>());
        }

        if (root["env"] && root["env"].IsMap()) {
            for (const auto& kv : root["env"]) {
                config.env_[kv.first.as<std::string>()] = kv.second.as<std::string>("");
            }
        }

        if (root["host_key"]) {
            auto trust = parse_host_key(root["host_key"]);
            if (trust.is_err()) return Result<Config>::Err(trust.error);
            config.trust_ = trust.value;
        }

        if (root["connect"] && root["connect"].IsMap()) {
            config.policy_ = parse_connect_policy(root["connect"]);
        }

        if (root["log"] && root["log"].IsMap()) {
            config.log_path_ = root["log"]["path"].as<std::string>("");
            config.log_echo_ = root["log"]["echo"].as<bool>(false);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("invalid config: {}", e.what()));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<Config>::Err("cannot read config " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<Config> Config::load_default() {
    fs::path path = get_config_path();
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config());
    }
    return load(path);
}

void Config::apply_env_overrides() {
    auto env = [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };

    if (auto v = env("KTEST_PUBLIC_IP")) target_.public_ip = *v;
    if (auto v = env("KTEST_PUBLIC_DNS_NAME")) target_.public_dns_name = *v;
    if (auto v = env("KTEST_PORT")) target_.port = safe_stoi(*v, target_.port);
    if (auto v = env("KTEST_USER")) user_ = *v;
    if (auto v = env("KTEST_KEY_PATH")) key_path_ = expand_home(*v);
    if (auto v = env("KTEST_KNOWN_HOSTS")) trust_ = HostTrustPolicy::known_hosts(expand_home(*v));
}

Result<void> Config::validate() const {
    if (target_.public_ip.empty() && target_.public_dns_name.empty()) {
        return Result<void>::Err("host.public_ip or host.public_dns_name is required");
    }
    if (target_.port <= 0 || target_.port > 65535) {
        return Result<void>::Err(fmt::format("host.port {} is out of range", target_.port));
    }
    if (user_.empty()) return Result<void>::Err("user is required");
    if (key_path_.empty()) return Result<void>::Err("key_path is required");
    if (!trust_) {
        return Result<void>::Err(
            "host_key is required (known_hosts, fingerprint or insecure_accept_any)");
    }
    if (policy_.max_dial_attempts < 1) {
        return Result<void>::Err("connect.dial_attempts must be at least 1");
    }
    if (policy_.max_reconnect_cycles < 1) {
        return Result<void>::Err("connect.reconnect_cycles must be at least 1");
    }
    return Result<void>::Ok();
}

ClientConfig Config::client_config() const {
    if (!trust_) {
        throw std::logic_error("no host key policy configured");
    }
    ClientConfig config(*trust_);
    config.target = target_;
    config.user = user_;
    config.key_path = key_path_;
    config.env = env_;
    config.policy = policy_;
    return config;
}
