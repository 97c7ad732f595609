#pragma once
#include "sealcookie.hpp"
#include <string>
#include <cstddef>

// Session payload <-> canonical JSON text.
//
// serialize() writes compact JSON with nlohmann::json::dump():
//   {"admin":false,"roles":["admin","dev"],"user":"alice"}
// Object keys come out sorted. Strings must be valid UTF-8; control characters
// are written as \u00XX escapes.

namespace codec {

// Throws sealcookie::Error(InvalidPayload) on invalid UTF-8, non-finite or
// binary values, or nesting deeper than kMaxDepth containers.
std::string serialize(const sealcookie::Json& payload);

// Strict RFC 8259 parse. Throws sealcookie::Error(CorruptPayload) on a parse
// error, or when the document is null, a bare scalar or nested too deep.
sealcookie::Json deserialize(const std::string& text);

static constexpr size_t kMaxDepth = 256;

} // namespace codec
