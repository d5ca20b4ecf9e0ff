#include "determinism/StableHash.hpp"

namespace determinism {

uint64_t stable_hash(const std::string& bytes) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : bytes) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

std::string stable_hash_hex(const std::string& bytes) {
    return hex_u64(stable_hash(bytes));
}

std::string canonical_json(const nlohmann::json& j) {
    // nlohmann::json objects are std::map backed, so keys already dump sorted
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string canonical_hash(const nlohmann::json& j) {
    return hex_u64(stable_hash(std::string(kHashVersion) + "|" + canonical_json(j)));
}

}  // namespace determinism
