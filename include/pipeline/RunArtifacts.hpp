#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "pipeline/Pipeline.hpp"

namespace pipeline {

// Everything a `run` writes: scores.json, parity.json, run_manifest.json.
struct RunArtifacts {
    nlohmann::json config;
    std::string generated_at;      // context clock, ISO-8601
    std::string rubric_version;
    std::vector<UnitResult> results;

    nlohmann::json scores_json() const;
    nlohmann::json parity_json() const;
    nlohmann::json manifest_json() const;

    void write_to(const std::filesystem::path& outdir) const;
};

RunArtifacts make_run_artifacts(const Pipeline& p, std::vector<UnitResult> results);

}  // namespace pipeline
