#pragma once
#include "sealcookie.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

// Load a CipherConfig from a YAML file:
//
//   algorithm: aes-256-gcm
//   iv-length: 12
//   secret: "0123456789abcdef0123456789abcdef"    # raw bytes
//   secret-hex: "000102..."                        # or hex; wins over 'secret'
//   max-length: 4093                               # optional
//
// Missing keys are left at their defaults so encode/decode report them as
// InvalidConfig. Throws std::runtime_error on unreadable or malformed YAML.
sealcookie::CipherConfig load_config(const std::string& path);

sealcookie::CipherConfig parse_config(const YAML::Node& doc);
