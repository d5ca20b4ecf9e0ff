#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "determinism/Determinism.hpp"
#include "nlohmann/json.hpp"
#include "sources/CandidateResolver.hpp"
#include "sources/ProviderRegistry.hpp"

namespace config {

struct UnitSpec {
    sources::CompanyRef company;
    int year = 0;
    std::string theme;
    std::string query;   // empty -> theme name from the rubric
};

struct EngineConfig {
    determinism::DeterminismContext determinism_ctx = determinism::DeterminismContext::live();

    double alpha = 0.6;
    size_t k = 5;

    sources::ResolverConfig resolver;
    std::vector<std::vector<sources::ProviderSpec>> tiers;

    std::string rubric_path;
    std::string store_dir;          // optional, already-ingested spans
    size_t max_quotes_per_theme = 8;
    size_t workers = 1;

    std::vector<UnitSpec> units;

    nlohmann::json to_json() const;
};

// Relative paths resolve against base_dir. Throws core::ConfigError.
EngineConfig parse_engine_config(const nlohmann::json& j, const std::filesystem::path& base_dir);
EngineConfig load_engine_config(const std::string& path);

}  // namespace config
