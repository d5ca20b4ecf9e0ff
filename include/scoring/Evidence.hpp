#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scoring {

// A verbatim excerpt (<= 30 words) cited by a score.
struct EvidenceQuote {
    std::string evidence_id;     // ev-<theme>-<hash12>
    std::string doc_id;          // ranked span the quote came from
    std::string theme;
    std::string quote;
    std::string content_hash;    // stable hash of quote
    std::string published_at;    // ISO-8601, empty when unknown
    int page = 0;
    size_t offset = 0;
    int matched_stage = 0;       // highest rubric stage the quote matches

    nlohmann::json to_json() const;
};

struct StageScore {
    std::string theme;
    int stage = 0;
    double confidence = 0.0;
    std::vector<std::string> evidence_ids;
    std::string snapshot_id;

    std::string org_id;
    int year = 0;
    std::string audit;                      // why this stage; names any gate that fired
    std::string confidence_label;
    std::vector<std::string> frameworks;    // sorted
    std::vector<std::string> cited_doc_ids; // doc ids behind evidence_ids, first-seen order

    nlohmann::json to_json() const;
};

// Nascent / Emerging / Established / Advanced / Leading
std::string maturity_label(double average_stage);

}  // namespace scoring
