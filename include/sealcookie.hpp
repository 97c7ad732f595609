#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace sealcookie {

// Session payloads are JSON documents: an object or an array at the top level.
using Json = nlohmann::json;

// Practical per-cookie byte ceiling for the encoded output.
static constexpr size_t kMaxEncodedLength = 4093;

enum class ErrorKind {
    InvalidConfig,          // algorithm / iv_length / secret missing or unusable
    InvalidPayload,         // null, scalar, invalid UTF-8 or non-finite payload
    InvalidInput,           // empty text handed to decode
    MalformedFrame,         // bad base64/hex, missing delimiter, wrong component count
    AuthenticationFailure,  // tag mismatch under an authenticated mode
    CorruptPayload,         // decrypted text is not a JSON object or array
    EncryptionFailure,      // OpenSSL failure not caused by the input
    SizeLimitExceeded,      // encoded cookie longer than the ceiling
};

const char* kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

struct CipherConfig {
    std::string algorithm;              // e.g. "aes-256-gcm", "aes-256-cbc"
    int iv_length = 0;                  // bytes; must suit the algorithm
    std::vector<uint8_t> secret;        // raw key, exactly the cipher's key length
    size_t max_encoded_length = kMaxEncodedLength;
};

// Serialize, encrypt and frame an object or array payload.
// Returns base64( hex(iv) "." hex(tag) "." hex(ciphertext) ).
// Throws Error: InvalidPayload, InvalidConfig, EncryptionFailure, SizeLimitExceeded.
std::string encode(const Json& payload, const CipherConfig& config);

// Reverse of encode. Never returns a partially decoded payload.
// Throws Error: InvalidInput, InvalidConfig, MalformedFrame,
//               AuthenticationFailure, CorruptPayload.
Json decode(const std::string& text, const CipherConfig& config);

} // namespace sealcookie
