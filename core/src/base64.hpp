#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Standard alphabet, '=' padded, no line breaks.
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::string& text);

// Throws std::invalid_argument on characters outside the alphabet.
std::vector<uint8_t> base64_decode(const std::string& encoded);
