#pragma once

#include <cstdint>
#include <string>

#include "nlohmann/json.hpp"

namespace determinism {

// Bump when the hash function or canonical encoding changes.
constexpr const char* kHashVersion = "fnv1a64-v1";

// FNV-1a 64 over raw bytes. Stable across runs, platforms and builds.
uint64_t stable_hash(const std::string& bytes);

std::string hex_u64(uint64_t x);

std::string stable_hash_hex(const std::string& bytes);

// Compact JSON with sorted object keys.
std::string canonical_json(const nlohmann::json& j);

// hex hash of canonical_json(j); used for snapshot ids
std::string canonical_hash(const nlohmann::json& j);

}  // namespace determinism
