#include "host_trust.hpp"
#include <core/utils.hpp>

namespace fs = std::filesystem;

static const std::string SHA256_PREFIX = "SHA256:";

// "SHA256:abc=" and "abc" compare equal
static std::string normalize_fingerprint(std::string fp) {
    trim(fp);
    if (fp.rfind(SHA256_PREFIX, 0) == 0) fp.erase(0, SHA256_PREFIX.size());
    while (!fp.empty() && fp.back() == '=') fp.pop_back();
    return fp;
}

HostTrustPolicy::HostTrustPolicy(Mode mode, fs::path path, std::string fingerprint)
    : mode_(mode), known_hosts_path_(std::move(path)), fingerprint_(std::move(fingerprint)) {
}

HostTrustPolicy HostTrustPolicy::insecure_accept_any() {
    return HostTrustPolicy(Mode::AcceptAny, {}, "");
}

HostTrustPolicy HostTrustPolicy::known_hosts(fs::path path) {
    return HostTrustPolicy(Mode::KnownHosts, std::move(path), "");
}

HostTrustPolicy HostTrustPolicy::pinned(const std::string& fingerprint) {
    return HostTrustPolicy(Mode::Fingerprint, {}, SHA256_PREFIX + normalize_fingerprint(fingerprint));
}

bool HostTrustPolicy::matches_fingerprint(const std::string& sha256_digest) const {
    if (mode_ != Mode::Fingerprint) return false;
    return normalize_fingerprint(sha256_fingerprint(sha256_digest)) ==
           normalize_fingerprint(fingerprint_);
}

std::vector<std::string> HostTrustPolicy::scp_options(const fs::path& verified_hosts) const {
    switch (mode_) {
        case Mode::KnownHosts:
            return {"-oStrictHostKeyChecking=yes",
                    "-oUserKnownHostsFile=" + known_hosts_path_.string()};
        case Mode::Fingerprint:
            return {"-oStrictHostKeyChecking=yes",
                    "-oUserKnownHostsFile=" +
                        (verified_hosts.empty() ? std::string("/dev/null") : verified_hosts.string())};
        case Mode::AcceptAny:
            break;
    }
    return {"-oStrictHostKeyChecking=no", "-oUserKnownHostsFile=/dev/null"};
}

std::string HostTrustPolicy::describe() const {
    switch (mode_) {
        case Mode::AcceptAny:   return "accept-any (insecure)";
        case Mode::KnownHosts:  return "known_hosts " + known_hosts_path_.string();
        case Mode::Fingerprint: return "pinned " + fingerprint_;
    }
    return "unknown";
}

std::string sha256_fingerprint(const std::string& sha256_digest) {
    std::string encoded = base64_encode(sha256_digest);
    while (!encoded.empty() && encoded.back() == '=') encoded.pop_back();
    return SHA256_PREFIX + encoded;
}
