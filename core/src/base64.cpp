#include "base64.hpp"
#include <openssl/evp.h>
#include <stdexcept>

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) return "";

    std::string out(4 * ((len + 2) / 3) + 1, '\0');    // EVP_EncodeBlock writes a NUL
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, (int)len);
    out.resize((size_t)n);
    return out;
}

std::string base64_encode(const std::string& text) {
    return base64_encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// EVP_DecodeBlock treats '=' as a zero sextet anywhere and counts padding in its
// result, so padding placement and the output length are settled here.
std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::string quads;
    quads.reserve(encoded.size() + 2);
    for (char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ') continue;
        quads += c;
    }

    switch (quads.size() % 4) {
    case 0:  break;
    case 1:  throw std::invalid_argument("Invalid base64: truncated quantum");
    case 2:  quads += "=="; break;
    default: quads += '=';  break;
    }
    if (quads.empty()) return {};

    size_t pad = 0;
    while (pad < quads.size() && quads[quads.size() - 1 - pad] == '=') ++pad;
    if (pad > 2)
        throw std::invalid_argument("Invalid base64: too much padding");
    if (quads.find('=') < quads.size() - pad)
        throw std::invalid_argument("Invalid base64: data after padding");

    std::vector<uint8_t> out(quads.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(quads.data()),
                            (int)quads.size());
    if (n < 0)
        throw std::invalid_argument("Invalid base64 character");
    out.resize((size_t)n - pad);
    return out;
}
