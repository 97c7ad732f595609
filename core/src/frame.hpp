#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Cookie wire format:
//   base64( hex(iv) "." hex(auth_tag) "." hex(ciphertext) )
// hex(auth_tag) is empty for suites without a tag.

namespace frame {

struct Frame {
    std::vector<uint8_t> iv;
    std::vector<uint8_t> auth_tag;    // empty for non-AEAD suites
    std::vector<uint8_t> ciphertext;
};

std::string join(const std::vector<uint8_t>& iv,
                 const std::vector<uint8_t>& auth_tag,
                 const std::vector<uint8_t>& ciphertext);

// Throws sealcookie::Error(MalformedFrame) on bad base64, bad shape or bad hex.
// Components after the third are ignored.
Frame split(const std::string& encoded);

} // namespace frame
