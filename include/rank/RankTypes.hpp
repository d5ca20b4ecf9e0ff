#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "nlohmann/json.hpp"

namespace rank {

// One unit of rankable text with its precomputed lexical signal.
struct RankCandidate {
    std::string doc_id;
    std::string text;
    double lexical_score = 0.0;
    std::map<std::string, std::string> metadata;   // e.g. published_at, source
    int page = 0;
    size_t offset = 0;
};

struct RankedResult {
    std::string doc_id;
    std::string text;
    double lexical_score = 0.0;
    double semantic_score = 0.0;
    double fused_score = 0.0;
    size_t rank = 0;
    int page = 0;
    size_t offset = 0;
    std::map<std::string, std::string> metadata;

    nlohmann::json to_json() const;
};

}  // namespace rank
