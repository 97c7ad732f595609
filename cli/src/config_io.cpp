#include "config_io.hpp"
#include "hex.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

sealcookie::CipherConfig parse_config(const YAML::Node& doc) {
    if (!doc.IsMap())
        throw std::runtime_error("config: top level must be a mapping");

    sealcookie::CipherConfig cfg;
    // as<T>() without a fallback, so a present-but-mistyped key is an error
    try {
        if (doc["algorithm"])
            cfg.algorithm = doc["algorithm"].as<std::string>();
        if (doc["iv-length"])
            cfg.iv_length = doc["iv-length"].as<int>();
        if (doc["max-length"])
            cfg.max_encoded_length = doc["max-length"].as<size_t>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }

    if (doc["secret-hex"]) {
        try {
            cfg.secret = hex_decode(doc["secret-hex"].as<std::string>());
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("config: secret-hex: ") + e.what());
        }
    } else if (doc["secret"]) {
        std::string raw = doc["secret"].as<std::string>();
        cfg.secret.assign(raw.begin(), raw.end());
    }
    return cfg;
}

sealcookie::CipherConfig load_config(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("cannot load config '" + path + "': " + e.what());
    }
    return parse_config(doc);
}
