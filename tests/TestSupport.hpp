#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "determinism/Determinism.hpp"
#include "nlohmann/json.hpp"
#include "scoring/Rubric.hpp"

namespace testsupport {

// 2024-06-30T00:00:00Z
constexpr int64_t kFixedTime = 1719705600;

inline determinism::DeterminismContext fixed_ctx(uint64_t seed = 42) {
    return determinism::DeterminismContext::create(true, kFixedTime, seed);
}

// Fresh, empty directory under the system temp dir.
inline std::filesystem::path temp_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / ("esg_agent_tests_" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
}

// Two themes. GHG climbs from "emissions" mentions to net-zero targets;
// WATER only has stage 1 and 2 rules.
inline nlohmann::json rubric_json() {
    return nlohmann::json::parse(R"JSON({
        "version": "test-rubric-1",
        "scoring_rules": {
            "evidence_min_per_stage_claim": 2,
            "freshness": {"thresholds_months": [24, 36, 48], "penalties": [0.1, 0.2, 0.3]},
            "confidence_guidance": [
                {"range": [0.0, 0.5], "label": "low"},
                {"range": [0.5, 0.8], "label": "medium"},
                {"range": [0.8, 1.0], "label": "high"}
            ]
        },
        "themes": [
            {
                "code": "GHG",
                "name": "greenhouse gas emissions",
                "stages": {
                    "1": {"label": "Mentions", "keywords": ["emissions"]},
                    "2": {"label": "Measured", "patterns": ["\\bscope\\s*[12]\\b"]},
                    "3": {"label": "Value chain", "patterns": ["\\bscope\\s*3\\b", "third[- ]party verified"]},
                    "4": {"label": "Targets", "patterns": ["net[- ]zero by 20[3-5]0", "science[- ]based target"]}
                }
            },
            {
                "code": "WATER",
                "name": "water stewardship",
                "min_quotes": 1,
                "stages": {
                    "1": {"keywords": ["water use"]},
                    "2": {"patterns": ["water (withdrawal|intensity) (fell|decreased)"]}
                }
            }
        ]
    })JSON");
}

inline std::shared_ptr<const scoring::Rubric> test_rubric() {
    return std::make_shared<const scoring::Rubric>(scoring::parse_rubric(rubric_json()));
}

}  // namespace testsupport
