#pragma once

#include <filesystem>
#include <string>
#include <vector>

// How the remote host key is trusted. There is deliberately no default:
// every client states a policy, and accepting any key must be asked for
// by name.
class HostTrustPolicy {
public:
    enum class Mode {
        AcceptAny,    // no verification (person-in-the-middle exposed)
        KnownHosts,   // OpenSSH known_hosts file
        Fingerprint,  // pinned "SHA256:<base64>" fingerprint
    };

    static HostTrustPolicy insecure_accept_any();
    static HostTrustPolicy known_hosts(std::filesystem::path path);
    static HostTrustPolicy pinned(const std::string& fingerprint);

    Mode mode() const { return mode_; }
    const std::filesystem::path& known_hosts_path() const { return known_hosts_path_; }
    const std::string& fingerprint() const { return fingerprint_; }

    // Compare a raw 32-byte SHA-256 host key digest with the pinned fingerprint.
    bool matches_fingerprint(const std::string& sha256_digest) const;

    // ssh(1)-style -o options applying this policy to the external scp.
    // scp cannot pin a fingerprint, so Fingerprint checks strictly against
    // `verified_hosts`, a known_hosts file holding the key the pinned
    // handshake accepted. Without one scp refuses every host key.
    std::vector<std::string> scp_options(const std::filesystem::path& verified_hosts = {}) const;

    std::string describe() const;

private:
    HostTrustPolicy(Mode mode, std::filesystem::path path, std::string fingerprint);

    Mode mode_;
    std::filesystem::path known_hosts_path_;
    std::string fingerprint_;
};

// OpenSSH-style "SHA256:<unpadded base64>" rendering of a raw digest
std::string sha256_fingerprint(const std::string& sha256_digest);
