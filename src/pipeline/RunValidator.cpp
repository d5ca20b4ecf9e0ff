#include "pipeline/RunValidator.hpp"

#include "io/JsonIO.hpp"
#include "rank/HybridRanker.hpp"
#include "scoring/ParityValidator.hpp"

#include "nlohmann/json.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace pipeline {

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& unit = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.unit = unit;
    rep.errors.push_back(std::move(e));
}

static std::string unit_key(const nlohmann::json& u) {
    std::ostringstream oss;
    oss << u.value("org_id", "?") << "/" << u.value("year", 0) << "/" << u.value("theme", "?");
    return oss.str();
}

static rank::RankedResult ranked_from_json(const nlohmann::json& j) {
    rank::RankedResult r;
    r.doc_id = j.value("doc_id", "");
    r.lexical_score = j.value("lexical_score", 0.0);
    r.semantic_score = j.value("semantic_score", 0.0);
    r.fused_score = j.value("fused_score", 0.0);
    return r;
}

static void check_unit(ValidationReport& rep, const nlohmann::json& u) {
    const std::string key = unit_key(u);

    if (!u.value("ok", false)) return;

    if (!u.contains("score") || !u["score"].is_object()) {
        add_error(rep, "bad_scores", "ok unit has no score object", key);
        return;
    }
    const nlohmann::json& score = u["score"];

    const int stage = score.value("stage", -1);
    const double confidence = score.value("confidence", -1.0);
    if (stage < 0 || stage > 4) add_error(rep, "bad_score", "stage outside 0..4", key);
    if (confidence < 0.0 || confidence > 1.0) add_error(rep, "bad_score", "confidence outside [0,1]", key);

    const auto& topk = u.value("top_k", nlohmann::json::array());
    const auto& evidence = u.value("evidence", nlohmann::json::array());

    std::unordered_set<std::string> topk_ids;
    std::vector<rank::RankedResult> ranked;
    for (const auto& r : topk) {
        ranked.push_back(ranked_from_json(r));
        topk_ids.insert(ranked.back().doc_id);
    }
    for (size_t i = 1; i < ranked.size(); ++i) {
        if (rank::ranked_before(ranked[i], ranked[i - 1])) {
            add_error(rep, "order_violation", "top_k entry " + std::to_string(i) + " ranks above its predecessor", key);
        }
    }

    std::unordered_map<std::string, std::string> doc_of;
    for (const auto& e : evidence) {
        doc_of[e.value("evidence_id", "")] = e.value("doc_id", "");
    }

    const auto& ids = score.value("evidence_ids", nlohmann::json::array());
    if (stage > 0 && ids.empty()) add_error(rep, "ungated_stage", "non-zero stage with no evidence", key);
    if (stage == 0 && !ids.empty()) add_error(rep, "bad_score", "stage 0 cites evidence", key);

    for (const auto& id_j : ids) {
        const std::string id = id_j.is_string() ? id_j.get<std::string>() : "";
        auto it = doc_of.find(id);
        if (it == doc_of.end()) {
            add_error(rep, "unknown_evidence", "evidence id not in unit evidence: " + id, key);
            continue;
        }
        if (!topk_ids.count(it->second)) {
            add_error(rep, "parity_violation", "evidence " + id + " cites doc outside top_k: " + it->second, key);
        }
    }
}

static void check_parity_reports(ValidationReport& rep, const nlohmann::json& parity_j) {
    if (!parity_j.contains("reports") || !parity_j["reports"].is_array()) {
        add_error(rep, "bad_parity", "missing or invalid reports array");
        return;
    }

    const auto& reports = parity_j["reports"];
    for (size_t i = 0; i < reports.size(); ++i) {
        const std::string key = reports[i].is_object() ? unit_key(reports[i]) : std::to_string(i);

        scoring::ParityReport recorded;
        try {
            recorded = scoring::parity_report_from_json(reports[i], jsonio::index_path("parity.reports", i));
        } catch (const std::exception& e) {
            add_error(rep, "bad_parity", e.what(), key);
            continue;
        }

        const scoring::ParityReport fresh = scoring::check_parity(recorded.query, recorded.evidence_ids, recorded.top_k_ids);
        if (fresh.pass != recorded.pass || fresh.missing_ids != recorded.missing_ids) {
            add_error(rep, "parity_mismatch", "recorded verdict disagrees with recomputation", key);
        }
        if (!fresh.pass) {
            add_error(rep, "parity_violation", std::to_string(fresh.missing_ids.size()) + " evidence id(s) outside top_k", key);
        }
    }
}

ValidationReport validate_run_dir(const fs::path& outdir) {
    ValidationReport rep;

    const fs::path scores_path = outdir / "scores.json";
    const fs::path parity_path = outdir / "parity.json";

    if (!fs::exists(scores_path)) add_error(rep, "missing_file", "scores.json missing in outdir: " + scores_path.string());
    if (!fs::exists(parity_path)) add_error(rep, "missing_file", "parity.json missing in outdir: " + parity_path.string());
    if (!rep.pass) return rep;

    nlohmann::json scores_j;
    nlohmann::json parity_j;
    try {
        scores_j = jsonio::read_json_file(scores_path);
        parity_j = jsonio::read_json_file(parity_path);
    } catch (const std::exception& e) {
        add_error(rep, "json_parse_error", e.what());
        return rep;
    }

    if (!scores_j.contains("units") || !scores_j["units"].is_array()) {
        add_error(rep, "bad_scores", "missing or invalid units array");
        return rep;
    }
    for (const auto& u : scores_j["units"]) {
        if (!u.is_object()) {
            add_error(rep, "bad_scores", "units entry is not an object");
            continue;
        }
        check_unit(rep, u);
    }

    check_parity_reports(rep, parity_j);
    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    nlohmann::json j;
    j["pass"] = rep.pass;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.unit.empty()) ej["unit"] = e.unit;
        j["errors"].push_back(ej);
    }

    jsonio::write_json_file(path, j);
}

}  // namespace pipeline
