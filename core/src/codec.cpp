#include "codec.hpp"
#include <cmath>

using sealcookie::Error;
using sealcookie::ErrorKind;
using sealcookie::Json;

namespace codec {

// ── helpers ───────────────────────────────────────────────────────────────────

// Empty when the tree can be written as JSON and read back unchanged,
// otherwise the reason it cannot.
static std::string find_problem(const Json& node, size_t depth) {
    if (node.is_number_float() && !std::isfinite(node.get<double>()))
        return "contains a non-finite number";
    if (node.is_binary())
        return "contains a binary value";
    if (node.is_discarded())
        return "contains a discarded value";
    if (!node.is_structured())
        return "";

    if (depth > kMaxDepth)
        return "nested deeper than " + std::to_string(kMaxDepth);
    for (const auto& child : node) {
        std::string problem = find_problem(child, depth + 1);
        if (!problem.empty()) return problem;
    }
    return "";
}

// ── serialize / deserialize ───────────────────────────────────────────────────

std::string serialize(const Json& payload) {
    std::string problem = find_problem(payload, 1);
    if (!problem.empty())
        throw Error(ErrorKind::InvalidPayload, "session payload " + problem);

    try {
        return payload.dump();
    } catch (const Json::type_error& e) {
        // 316: a key or string is not valid UTF-8
        throw Error(ErrorKind::InvalidPayload,
                    std::string("cannot serialize session payload: ") + e.what());
    }
}

Json deserialize(const std::string& text) {
    Json doc;
    try {
        doc = Json::parse(text);
    } catch (const Json::exception& e) {
        throw Error(ErrorKind::CorruptPayload,
                    std::string("cannot parse decrypted session: ") + e.what());
    }

    // A clean parse can still yield nothing usable
    if (doc.is_null())
        throw Error(ErrorKind::CorruptPayload, "decrypted session parsed to null");
    if (!doc.is_structured())
        throw Error(ErrorKind::CorruptPayload, "decrypted session is a bare scalar");

    std::string problem = find_problem(doc, 1);
    if (!problem.empty())
        throw Error(ErrorKind::CorruptPayload, "decrypted session " + problem);
    return doc;
}

} // namespace codec
