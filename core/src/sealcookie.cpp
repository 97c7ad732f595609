#include "sealcookie.hpp"
#include "validate.hpp"
#include "codec.hpp"
#include "cipher.hpp"
#include "frame.hpp"

namespace sealcookie {

const char* kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidConfig:         return "InvalidConfig";
    case ErrorKind::InvalidPayload:        return "InvalidPayload";
    case ErrorKind::InvalidInput:          return "InvalidInput";
    case ErrorKind::MalformedFrame:        return "MalformedFrame";
    case ErrorKind::AuthenticationFailure: return "AuthenticationFailure";
    case ErrorKind::CorruptPayload:        return "CorruptPayload";
    case ErrorKind::EncryptionFailure:     return "EncryptionFailure";
    case ErrorKind::SizeLimitExceeded:     return "SizeLimitExceeded";
    }
    return "Unknown";
}

std::string encode(const Json& payload, const CipherConfig& config) {
    validate::assert_encodable(payload);
    validate::assert_config(config);
    const cipher::Suite& suite = cipher::find_suite(config.algorithm);
    cipher::check_lengths(suite, config.secret.size(), (size_t)config.iv_length);

    std::vector<uint8_t> iv = cipher::random_iv(config.iv_length);
    std::string text = codec::serialize(payload);

    cipher::Sealed sealed = cipher::encrypt(suite, config.secret, iv, text);
    std::string encoded = frame::join(iv, sealed.auth_tag, sealed.ciphertext);

    validate::assert_size_bound(encoded, config);
    return encoded;
}

Json decode(const std::string& text, const CipherConfig& config) {
    validate::assert_decodable(text);
    validate::assert_config(config);
    const cipher::Suite& suite = cipher::find_suite(config.algorithm);
    cipher::check_lengths(suite, config.secret.size(), (size_t)config.iv_length);

    frame::Frame f = frame::split(text);

    if (f.iv.size() != (size_t)config.iv_length)
        throw Error(ErrorKind::MalformedFrame,
                    "invalid frame: iv is " + std::to_string(f.iv.size()) +
                    " bytes, expected " + std::to_string(config.iv_length));
    if (suite.produces_tag && f.auth_tag.empty())
        throw Error(ErrorKind::MalformedFrame,
                    std::string("invalid frame: ") + suite.name + " requires an auth tag");
    if (!suite.produces_tag && !f.auth_tag.empty())
        throw Error(ErrorKind::MalformedFrame,
                    std::string("invalid frame: ") + suite.name + " does not use an auth tag");

    std::string plaintext = cipher::decrypt(suite, config.secret, f.iv, f.auth_tag, f.ciphertext);
    return codec::deserialize(plaintext);
}

} // namespace sealcookie
