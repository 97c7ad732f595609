#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Lowercase hex, two digits per byte.
std::string hex_encode(const std::vector<uint8_t>& data);

// Accepts either case. Throws std::invalid_argument on odd length or a non-hex digit.
std::vector<uint8_t> hex_decode(const std::string& hex);
