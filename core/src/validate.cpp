#include "validate.hpp"
#include <string>

using sealcookie::Error;
using sealcookie::ErrorKind;

namespace validate {

void assert_config(const sealcookie::CipherConfig& config) {
    if (config.algorithm.empty() || config.iv_length <= 0 || config.secret.empty())
        throw Error(ErrorKind::InvalidConfig,
                    "cipher config {algorithm, iv_length, secret} is required");
}

void assert_encodable(const sealcookie::Json& payload) {
    if (payload.is_null())
        throw Error(ErrorKind::InvalidPayload, "session payload is null");
    if (!payload.is_structured())
        throw Error(ErrorKind::InvalidPayload,
                    std::string("session payload must be an object or an array, not ") +
                    payload.type_name());
}

void assert_decodable(const std::string& text) {
    if (text.size() < 1)
        throw Error(ErrorKind::InvalidInput, "cannot read encoded cookie: empty input");
}

void assert_frame_shape(const std::string& text) {
    size_t first = text.find('.');
    if (first == std::string::npos)
        throw Error(ErrorKind::MalformedFrame, "invalid frame: missing '.' delimiter");

    size_t second = text.find('.', first + 1);
    if (second == std::string::npos)
        throw Error(ErrorKind::MalformedFrame,
                    "invalid frame: expected 3 components, found 2");

    size_t third = text.find('.', second + 1);
    size_t ct_len = (third == std::string::npos ? text.size() : third) - (second + 1);

    if (first == 0)
        throw Error(ErrorKind::MalformedFrame, "invalid frame: empty IV component");
    if (ct_len == 0)
        throw Error(ErrorKind::MalformedFrame, "invalid frame: empty ciphertext component");
}

void assert_size_bound(const std::string& encoded, const sealcookie::CipherConfig& config) {
    if (encoded.size() > config.max_encoded_length)
        throw Error(ErrorKind::SizeLimitExceeded,
                    "encoded cookie is " + std::to_string(encoded.size()) +
                    " bytes, limit is " + std::to_string(config.max_encoded_length));
}

} // namespace validate
