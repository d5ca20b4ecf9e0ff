#include "pipeline/RunArtifacts.hpp"

#include "determinism/StableHash.hpp"
#include "io/JsonIO.hpp"

#include <map>
#include <utility>

namespace fs = std::filesystem;

namespace pipeline {

RunArtifacts make_run_artifacts(const Pipeline& p, std::vector<UnitResult> results) {
    RunArtifacts a;
    a.config = p.config().to_json();
    a.generated_at = determinism::format_iso8601(p.config().determinism_ctx.now());
    a.rubric_version = p.rubric().version;
    a.results = std::move(results);
    return a;
}

nlohmann::json RunArtifacts::scores_json() const {
    nlohmann::json units = nlohmann::json::array();
    size_t ok = 0;

    // (org, year) -> stages of successfully scored themes
    std::map<std::pair<std::string, int>, std::vector<int>> stages;

    for (const auto& r : results) {
        units.push_back(r.to_json());
        if (!r.ok) continue;
        ++ok;
        stages[{r.unit.company.key(), r.unit.year}].push_back(r.score->stage);
    }

    nlohmann::json maturity = nlohmann::json::array();
    for (const auto& kv : stages) {
        double sum = 0.0;
        for (int s : kv.second) sum += s;
        const double avg = sum / (double)kv.second.size();
        maturity.push_back({
            {"org_id", kv.first.first},
            {"year", kv.first.second},
            {"themes_scored", kv.second.size()},
            {"average_stage", avg},
            {"label", scoring::maturity_label(avg)}
        });
    }

    nlohmann::json j;
    j["rubric_version"] = rubric_version;
    j["units"] = units;
    j["maturity"] = maturity;
    j["summary"] = {{"ok", ok}, {"failed", results.size() - ok}};
    return j;
}

nlohmann::json RunArtifacts::parity_json() const {
    std::vector<scoring::ParityReport> reports;
    nlohmann::json arr = nlohmann::json::array();

    for (const auto& r : results) {
        if (!r.parity) continue;
        nlohmann::json j = r.parity->to_json();
        j["org_id"] = r.unit.company.key();
        j["year"] = r.unit.year;
        j["theme"] = r.unit.theme;
        j["snapshot_id"] = r.snapshot_id;
        arr.push_back(j);
        reports.push_back(*r.parity);
    }

    nlohmann::json j;
    j["reports"] = arr;
    j["summary"] = scoring::summarize_parity(reports).to_json();
    return j;
}

nlohmann::json RunArtifacts::manifest_json() const {
    nlohmann::json snapshots = nlohmann::json::array();
    for (const auto& r : results) snapshots.push_back(r.snapshot_id);

    nlohmann::json j;
    j["generated_at"] = generated_at;
    j["hash"] = determinism::kHashVersion;
    j["rubric_version"] = rubric_version;
    j["config"] = config;
    j["snapshot_ids"] = snapshots;
    j["run_id"] = determinism::canonical_hash({{"config", config}, {"snapshot_ids", snapshots}});
    return j;
}

void RunArtifacts::write_to(const fs::path& outdir) const {
    jsonio::write_json_file(outdir / "scores.json", scores_json());
    jsonio::write_json_file(outdir / "parity.json", parity_json());
    jsonio::write_json_file(outdir / "run_manifest.json", manifest_json());
}

}  // namespace pipeline
