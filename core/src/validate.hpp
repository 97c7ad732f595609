#pragma once
#include "sealcookie.hpp"
#include <string>

// Front-loaded checks for encode/decode. Each throws sealcookie::Error with the
// kind named below and returns normally otherwise.
namespace validate {

// InvalidConfig unless algorithm, iv_length and secret are all set.
void assert_config(const sealcookie::CipherConfig& config);

// InvalidPayload unless the payload is a JSON object or array.
void assert_encodable(const sealcookie::Json& payload);

// InvalidInput for zero-length text.
void assert_decodable(const std::string& text);

// MalformedFrame unless the base64-decoded text has at least three '.'-separated
// components with non-empty IV (first) and ciphertext (third) positions.
// The tag position may be empty; the caller decides against the cipher suite.
void assert_frame_shape(const std::string& text);

// SizeLimitExceeded when encoded is longer than config.max_encoded_length.
void assert_size_bound(const std::string& encoded, const sealcookie::CipherConfig& config);

} // namespace validate
