#include "scoring/ParityValidator.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <set>
#include <sstream>

namespace scoring {

ParityReport check_parity(const std::string& query,
                          const std::vector<std::string>& evidence_ids,
                          const std::vector<std::string>& top_k_ids) {
    ParityReport rep;
    rep.query = query;
    rep.evidence_ids = evidence_ids;
    rep.top_k_ids = top_k_ids;

    const std::set<std::string> topk(top_k_ids.begin(), top_k_ids.end());
    const std::set<std::string> cited(evidence_ids.begin(), evidence_ids.end());

    size_t covered = 0;
    for (const auto& id : cited) {
        if (topk.count(id)) ++covered;
        else rep.missing_ids.push_back(id);
    }

    rep.pass = rep.missing_ids.empty();
    rep.coverage = cited.empty() ? 1.0 : (double)covered / (double)cited.size();
    return rep;
}

void enforce_parity(const ParityReport& report) {
    if (report.pass) return;

    std::ostringstream oss;
    oss << "ParityValidator: PARITY VIOLATION query='" << report.query << "' missing=" << report.missing_ids.size()
        << " coverage=" << report.coverage << "\n";
    std::cerr << oss.str();

    throw core::ParityViolation(report.query, report.missing_ids);
}

ParityBatchSummary summarize_parity(const std::vector<ParityReport>& reports) {
    ParityBatchSummary s;
    for (const auto& r : reports) {
        if (r.pass) ++s.passing;
        else ++s.failing;
    }
    s.pass = s.failing == 0;
    return s;
}

nlohmann::json ParityBatchSummary::to_json() const {
    return {
        {"batch_verdict", pass ? "pass" : "fail"},
        {"passing", passing},
        {"failing", failing}
    };
}

nlohmann::json ParityReport::to_json() const {
    nlohmann::json j;
    j["query"] = query;
    j["evidence_ids"] = evidence_ids;
    j["top_k_ids"] = top_k_ids;
    j["verdict"] = verdict();
    j["missing_ids"] = missing_ids;
    j["coverage"] = coverage;
    return j;
}

ParityReport parity_report_from_json(const nlohmann::json& j, const std::string& where) {
    jsonio::require_object(j, where);

    ParityReport rep;
    rep.query = jsonio::require_string(j, "query", where);
    rep.evidence_ids = jsonio::require_string_array(j, "evidence_ids", where);
    rep.top_k_ids = jsonio::require_string_array(j, "top_k_ids", where);
    rep.missing_ids = jsonio::get_string_array_or(j, "missing_ids", where);

    const std::string verdict = jsonio::require_string(j, "verdict", where);
    if (verdict != "pass" && verdict != "fail") {
        throw core::ConfigError(where + ".verdict must be \"pass\" or \"fail\"");
    }
    rep.pass = verdict == "pass";
    rep.coverage = jsonio::get_number_or(j, "coverage", 1.0, where);
    return rep;
}

}  // namespace scoring
