#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/EngineConfig.hpp"
#include "core/CancelToken.hpp"
#include "ingest/DocumentStore.hpp"
#include "ingest/TextExtractor.hpp"
#include "nlohmann/json.hpp"
#include "rank/HybridRanker.hpp"
#include "scoring/EvidenceExtractor.hpp"
#include "scoring/ParityValidator.hpp"
#include "scoring/RubricScorer.hpp"
#include "sources/CandidateResolver.hpp"

namespace pipeline {

using ScoringUnit = config::UnitSpec;

struct ErrorRecord {
    std::string kind;      // core::error_kind()
    std::string message;
};

struct UnitResult {
    ScoringUnit unit;
    std::string query;          // effective query
    std::string snapshot_id;
    bool ok = false;

    std::optional<scoring::StageScore> score;
    std::optional<scoring::ParityReport> parity;
    std::vector<rank::RankedResult> top_k;
    std::vector<scoring::EvidenceQuote> evidence;
    nlohmann::json resolution;  // Resolution::summary_json(), null when unresolved
    ErrorRecord error;

    nlohmann::json to_json() const;
};

// Canonical output order: org key, year, theme, query.
bool unit_result_before(const UnitResult& a, const UnitResult& b);

// Resolve -> extract -> rank -> evidence -> score -> parity for independent
// (company, year, theme) units. All collaborators are immutable after
// construction, so one Pipeline is shared by every worker thread.
class Pipeline {
public:
    // Loads rubric, document store and providers. Throws core::ConfigError.
    // A null semantic scorer falls back to rank::TokenOverlapScorer.
    static Pipeline from_config(const config::EngineConfig& cfg,
                                std::shared_ptr<const rank::SemanticScorer> semantic = nullptr);

    Pipeline(config::EngineConfig cfg,
             std::shared_ptr<const scoring::Rubric> rubric,
             sources::ProviderTiers tiers,
             std::shared_ptr<const ingest::DocumentStore> store = nullptr,
             std::shared_ptr<const ingest::TextExtractor> extractor = nullptr,
             std::shared_ptr<const rank::SemanticScorer> semantic = nullptr);

    // Throws on any failure; cancellation (core::Cancelled) is only raised
    // between stages, so a returned result is always complete.
    UnitResult run_unit(const ScoringUnit& unit, const core::CancelToken* cancel = nullptr) const;

    // Runs units on up to `workers` threads. Unit failures become error
    // records; a core::ConfigError (checked up front for every unit) aborts
    // the whole batch. Results come back in canonical order.
    std::vector<UnitResult> run_batch(const std::vector<ScoringUnit>& units,
                                      size_t workers,
                                      const core::CancelToken* cancel = nullptr) const;

    // Throws core::ConfigError on a unit the rubric cannot score.
    void validate_units(const std::vector<ScoringUnit>& units) const;

    std::string effective_query(const ScoringUnit& unit) const;
    std::string snapshot_id(const ScoringUnit& unit) const;

    const config::EngineConfig& config() const { return m_cfg; }
    const sources::CandidateResolver& resolver() const { return m_resolver; }
    const scoring::Rubric& rubric() const { return *m_rubric; }

private:
    config::EngineConfig m_cfg;
    std::shared_ptr<const scoring::Rubric> m_rubric;
    std::shared_ptr<const ingest::DocumentStore> m_store;
    std::shared_ptr<const ingest::TextExtractor> m_extractor;
    sources::CandidateResolver m_resolver;
    rank::HybridRanker m_ranker;
    scoring::RubricScorer m_scorer;
};

}  // namespace pipeline
