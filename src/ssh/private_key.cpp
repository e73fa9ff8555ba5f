#include "private_key.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>

static const std::string OPENSSH_MAGIC("openssh-key-v1\0", 15);

Result<std::string> load_key_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::Err(ErrorKind::KeyLoad,
            fmt::format("failed to read private key {}: {}", path.string(), std::strerror(errno)));
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::Err(ErrorKind::KeyLoad,
            fmt::format("failed to read private key {}", path.string()));
    }
    return Result<std::string>::Ok(std::move(content));
}

static Result<PrivateKey> parse_error(const std::string& msg) {
    return Result<PrivateKey>::Err(ErrorKind::KeyParse, "failed to parse private key: " + msg);
}

// Big-endian uint32 length-prefixed string at `pos` (SSH wire format)
static bool read_ssh_string(const std::string& blob, size_t& pos, std::string& out) {
    if (pos + 4 > blob.size()) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(blob.data() + pos);
    uint32_t len = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
                   (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    pos += 4;
    if (len > blob.size() - pos) return false;
    out = blob.substr(pos, len);
    pos += len;
    return true;
}

Result<PrivateKey> parse_private_key(const std::string& data) {
    static const std::string BEGIN = "-----BEGIN ";
    static const std::string DASHES = "-----";

    size_t begin = data.find(BEGIN);
    if (begin == std::string::npos) {
        return parse_error("no PEM armor found");
    }
    size_t label_start = begin + BEGIN.size();
    size_t label_end = data.find(DASHES, label_start);
    if (label_end == std::string::npos) {
        return parse_error("malformed BEGIN line");
    }

    PrivateKey key;
    key.label = data.substr(label_start, label_end - label_start);
    const std::string suffix = "PRIVATE KEY";
    if (key.label.size() < suffix.size() ||
        key.label.compare(key.label.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return parse_error("not a private key (" + key.label + ")");
    }
    if (key.label == "ENCRYPTED PRIVATE KEY") {
        return parse_error("passphrase-protected keys are not supported");
    }

    std::string end_marker = "-----END " + key.label + DASHES;
    size_t body_start = label_end + DASHES.size();
    size_t end = data.find(end_marker, body_start);
    if (end == std::string::npos) {
        return parse_error("missing " + end_marker);
    }

    // Body lines; "Header: value" lines (Proc-Type, DEK-Info) mark legacy encryption
    std::istringstream body(data.substr(body_start, end - body_start));
    std::string line, encoded;
    while (std::getline(body, line)) {
        trim(line);
        if (line.empty()) continue;
        if (line.find(':') != std::string::npos) {
            if (line.rfind("Proc-Type:", 0) == 0 && line.find("ENCRYPTED") != std::string::npos) {
                return parse_error("passphrase-protected keys are not supported");
            }
            continue;
        }
        encoded += line;
    }

    if (!base64_decode(encoded, key.blob)) {
        return parse_error("invalid base64 body");
    }
    if (key.blob.empty()) {
        return parse_error("empty key body");
    }

    if (key.label == "OPENSSH PRIVATE KEY") {
        if (key.blob.compare(0, OPENSSH_MAGIC.size(), OPENSSH_MAGIC) != 0) {
            return parse_error("bad openssh-key-v1 magic");
        }
        // Cipher name follows the magic; anything but "none" needs a passphrase
        size_t pos = OPENSSH_MAGIC.size();
        std::string cipher;
        if (read_ssh_string(key.blob, pos, cipher) && cipher != "none") {
            return parse_error("passphrase-protected keys are not supported");
        }
    } else if (static_cast<unsigned char>(key.blob[0]) != 0x30) {
        // PKCS#1 / SEC1 / PKCS#8 are all DER SEQUENCEs
        return parse_error("key body is not DER encoded");
    }

    key.pem = data;
    return Result<PrivateKey>::Ok(std::move(key));
}
