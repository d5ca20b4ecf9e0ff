#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scoring {

// Binds cited evidence back to the ranked output it must have come from.
struct ParityReport {
    std::string query;
    std::vector<std::string> evidence_ids;
    std::vector<std::string> top_k_ids;
    bool pass = true;
    std::vector<std::string> missing_ids;   // evidence_ids \ top_k_ids, sorted
    double coverage = 1.0;                  // |evidence & top_k| / |evidence|, 1.0 when no evidence

    const char* verdict() const { return pass ? "pass" : "fail"; }

    nlohmann::json to_json() const;
};

// pass iff every evidence id is in top_k_ids
ParityReport check_parity(const std::string& query,
                          const std::vector<std::string>& evidence_ids,
                          const std::vector<std::string>& top_k_ids);

// Throws core::ParityViolation carrying missing_ids when the report failed.
void enforce_parity(const ParityReport& report);

struct ParityBatchSummary {
    bool pass = true;
    size_t passing = 0;
    size_t failing = 0;

    nlohmann::json to_json() const;
};

ParityBatchSummary summarize_parity(const std::vector<ParityReport>& reports);

// Reads the to_json() form back. Throws core::ConfigError.
ParityReport parity_report_from_json(const nlohmann::json& j, const std::string& where);

}  // namespace scoring
