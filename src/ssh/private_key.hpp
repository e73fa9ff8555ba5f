#pragma once

#include <filesystem>
#include <string>
#include <core/types.hpp>

// A private key as loaded from disk. `pem` is handed to libssh2 unchanged;
// `blob` is the decoded body, kept so the key is parsed exactly once per connect.
struct PrivateKey {
    std::string label;   // armor label, e.g. "OPENSSH PRIVATE KEY"
    std::string pem;
    std::string blob;
};

// Read the key file as raw bytes. Fails with ErrorKind::KeyLoad.
Result<std::string> load_key_file(const std::filesystem::path& path);

// Validate and decode PEM/OpenSSH private key armor. Fails with
// ErrorKind::KeyParse for anything that is not an unencrypted private key.
Result<PrivateKey> parse_private_key(const std::string& data);
