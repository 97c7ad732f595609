#include "frame.hpp"
#include "base64.hpp"
#include "hex.hpp"
#include "validate.hpp"
#include "sealcookie.hpp"
#include <stdexcept>

using sealcookie::Error;
using sealcookie::ErrorKind;

namespace frame {

static constexpr char kDelimiter = '.';

static std::vector<std::string> split_components(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(kDelimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static std::vector<uint8_t> decode_component(const std::string& hex, const char* name) {
    try {
        return hex_decode(hex);
    } catch (const std::invalid_argument& e) {
        throw Error(ErrorKind::MalformedFrame,
                    std::string("invalid frame: ") + name + ": " + e.what());
    }
}

std::string join(const std::vector<uint8_t>& iv,
                 const std::vector<uint8_t>& auth_tag,
                 const std::vector<uint8_t>& ciphertext)
{
    std::string text;
    text.reserve(2 * (iv.size() + auth_tag.size() + ciphertext.size()) + 2);
    text += hex_encode(iv);
    text += kDelimiter;
    text += hex_encode(auth_tag);
    text += kDelimiter;
    text += hex_encode(ciphertext);
    return base64_encode(text);
}

Frame split(const std::string& encoded) {
    std::vector<uint8_t> raw;
    try {
        raw = base64_decode(encoded);
    } catch (const std::invalid_argument& e) {
        throw Error(ErrorKind::MalformedFrame, std::string("invalid frame: ") + e.what());
    }
    std::string text(raw.begin(), raw.end());

    validate::assert_frame_shape(text);
    std::vector<std::string> parts = split_components(text);

    Frame f;
    f.iv         = decode_component(parts[0], "iv");
    f.auth_tag   = decode_component(parts[1], "auth tag");
    f.ciphertext = decode_component(parts[2], "ciphertext");
    return f;
}

} // namespace frame
