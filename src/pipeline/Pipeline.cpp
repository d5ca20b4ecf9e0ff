#include "pipeline/Pipeline.hpp"

#include "core/Errors.hpp"
#include "determinism/StableHash.hpp"
#include "rank/LexicalIndex.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <tuple>
#include <unordered_set>

namespace pipeline {

static std::string unit_label(const ScoringUnit& u) {
    std::ostringstream oss;
    oss << u.company.key() << "/" << u.year << "/" << u.theme;
    return oss.str();
}

nlohmann::json UnitResult::to_json() const {
    nlohmann::json j;
    j["company"] = unit.company.name;
    j["org_id"] = unit.company.key();
    j["year"] = unit.year;
    j["theme"] = unit.theme;
    j["query"] = query;
    j["snapshot_id"] = snapshot_id;
    j["ok"] = ok;
    j["score"] = score ? score->to_json() : nlohmann::json(nullptr);
    j["parity_verdict"] = parity ? nlohmann::json(parity->verdict()) : nlohmann::json(nullptr);
    j["resolution"] = resolution;

    nlohmann::json topk = nlohmann::json::array();
    for (const auto& r : top_k) topk.push_back(r.to_json());
    j["top_k"] = topk;

    nlohmann::json ev = nlohmann::json::array();
    for (const auto& q : evidence) ev.push_back(q.to_json());
    j["evidence"] = ev;

    if (ok) {
        j["error"] = nullptr;
    } else {
        j["error"] = {{"kind", error.kind}, {"message", error.message}};
    }
    return j;
}

bool unit_result_before(const UnitResult& a, const UnitResult& b) {
    const std::string ak = a.unit.company.key();
    const std::string bk = b.unit.company.key();
    return std::tie(ak, a.unit.year, a.unit.theme, a.query) < std::tie(bk, b.unit.year, b.unit.theme, b.query);
}

Pipeline Pipeline::from_config(const config::EngineConfig& cfg,
                               std::shared_ptr<const rank::SemanticScorer> semantic) {
    auto rubric = std::make_shared<const scoring::Rubric>(scoring::load_rubric(cfg.rubric_path));

    std::shared_ptr<const ingest::DocumentStore> store;
    if (!cfg.store_dir.empty()) {
        store = std::make_shared<const ingest::DocumentStore>(ingest::DocumentStore::load_from_dir(cfg.store_dir));
    }

    sources::ProviderTiers tiers = sources::make_provider_tiers(cfg.tiers);
    return Pipeline(cfg, std::move(rubric), std::move(tiers), std::move(store), nullptr, std::move(semantic));
}

Pipeline::Pipeline(config::EngineConfig cfg,
                   std::shared_ptr<const scoring::Rubric> rubric,
                   sources::ProviderTiers tiers,
                   std::shared_ptr<const ingest::DocumentStore> store,
                   std::shared_ptr<const ingest::TextExtractor> extractor,
                   std::shared_ptr<const rank::SemanticScorer> semantic)
    : m_cfg(std::move(cfg)),
      m_rubric(std::move(rubric)),
      m_store(std::move(store)),
      m_extractor(extractor ? std::move(extractor)
                            : std::shared_ptr<const ingest::TextExtractor>(std::make_shared<ingest::PlainTextExtractor>())),
      m_resolver(std::move(tiers), m_cfg.resolver),
      m_ranker(m_cfg.determinism_ctx, std::move(semantic)),
      m_scorer(m_rubric, m_cfg.determinism_ctx) {
    validate_units(m_cfg.units);
}

void Pipeline::validate_units(const std::vector<ScoringUnit>& units) const {
    for (const auto& u : units) {
        if (!m_rubric->find_theme(u.theme)) {
            throw core::ConfigError("unit " + unit_label(u) + ": theme not in rubric " + m_rubric->version);
        }
    }
}

std::string Pipeline::effective_query(const ScoringUnit& unit) const {
    if (!unit.query.empty()) return unit.query;
    const scoring::ThemeRubric* t = m_rubric->find_theme(unit.theme);
    return t ? t->name : unit.theme;
}

std::string Pipeline::snapshot_id(const ScoringUnit& unit) const {
    const auto& ctx = m_cfg.determinism_ctx;
    nlohmann::json key;
    key["org_id"] = unit.company.key();
    key["year"] = unit.year;
    key["theme"] = unit.theme;
    key["query"] = effective_query(unit);
    key["alpha"] = m_cfg.alpha;
    key["k"] = m_cfg.k;
    key["seed"] = ctx.seed();
    key["fixed_time"] = ctx.fixed_time() ? nlohmann::json(*ctx.fixed_time()) : nlohmann::json(nullptr);
    key["rubric_version"] = m_rubric->version;
    return determinism::canonical_hash(key);
}

static std::vector<ingest::TextSpan> merge_spans(std::vector<ingest::TextSpan> extracted,
                                                 const std::vector<ingest::TextSpan>& stored) {
    std::unordered_set<std::string> ids;
    std::vector<ingest::TextSpan> out;
    out.reserve(extracted.size() + stored.size());

    for (auto& s : extracted) {
        if (ids.insert(s.span_id).second) out.push_back(std::move(s));
    }
    for (const auto& s : stored) {
        if (ids.insert(s.span_id).second) out.push_back(s);
    }
    return out;
}

UnitResult Pipeline::run_unit(const ScoringUnit& unit, const core::CancelToken* cancel) const {
    const scoring::ThemeRubric* theme = m_rubric->find_theme(unit.theme);
    if (!theme) throw core::ConfigError("theme not in rubric: " + unit.theme);

    UnitResult res;
    res.unit = unit;
    res.query = effective_query(unit);
    res.snapshot_id = snapshot_id(unit);

    const std::string org = unit.company.key();

    // Resolve
    core::check_cancel(cancel, "resolve");
    const sources::Resolution resolution = m_resolver.resolve_best(unit.company, unit.year, cancel);

    // Extract
    core::check_cancel(cancel, "extract");
    std::vector<ingest::TextSpan> spans = merge_spans(
        m_extractor->extract(resolution.document, org, unit.year),
        m_store ? m_store->spans_for(org, unit.year) : std::vector<ingest::TextSpan>());

    // Rank
    core::check_cancel(cancel, "rank");
    std::vector<rank::IndexedText> docs;
    docs.reserve(spans.size());
    for (const auto& s : spans) docs.push_back({s.span_id, s.text});

    const rank::LexicalIndex index(docs);
    const std::vector<double> lex = index.scores(res.query);

    std::vector<rank::RankCandidate> candidates;
    candidates.reserve(spans.size());
    for (size_t i = 0; i < spans.size(); ++i) {
        rank::RankCandidate c;
        c.doc_id = spans[i].span_id;
        c.text = spans[i].text;
        c.lexical_score = lex[i];
        c.page = spans[i].page;
        c.offset = spans[i].offset;
        c.metadata["published_at"] = spans[i].published_at;
        c.metadata["source"] = spans[i].source;
        candidates.push_back(std::move(c));
    }

    std::vector<rank::RankedResult> top_k = m_ranker.rank(res.query, candidates, m_cfg.alpha, m_cfg.k);

    // Score
    core::check_cancel(cancel, "score");
    scoring::ExtractorConfig ecfg;
    ecfg.max_quotes_per_theme = m_cfg.max_quotes_per_theme;
    std::vector<scoring::EvidenceQuote> evidence = scoring::extract_evidence(*theme, top_k, ecfg);
    scoring::StageScore score = m_scorer.score(unit.theme, evidence, org, unit.year, res.snapshot_id);

    // Validate
    core::check_cancel(cancel, "validate");
    std::vector<std::string> top_k_ids;
    top_k_ids.reserve(top_k.size());
    for (const auto& r : top_k) top_k_ids.push_back(r.doc_id);

    scoring::ParityReport parity = scoring::check_parity(res.query, score.cited_doc_ids, top_k_ids);
    scoring::enforce_parity(parity);

    res.ok = true;
    res.resolution = resolution.summary_json();
    res.top_k = std::move(top_k);
    res.evidence = std::move(evidence);
    res.score = std::move(score);
    res.parity = std::move(parity);
    return res;
}

static UnitResult failed_result(const Pipeline& p, const ScoringUnit& unit, const std::string& kind, const std::string& msg) {
    UnitResult r;
    r.unit = unit;
    r.query = p.effective_query(unit);
    r.snapshot_id = p.snapshot_id(unit);
    r.ok = false;
    r.resolution = nullptr;
    r.error = {kind, msg};
    return r;
}

std::vector<UnitResult> Pipeline::run_batch(const std::vector<ScoringUnit>& units,
                                            size_t workers,
                                            const core::CancelToken* cancel) const {
    validate_units(units);

    std::vector<std::optional<UnitResult>> slots(units.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> abort{false};
    std::exception_ptr fatal;
    std::mutex fatal_mu;

    auto worker = [&]() {
        for (;;) {
            if (abort.load()) return;
            const size_t i = next.fetch_add(1);
            if (i >= units.size()) return;

            const ScoringUnit& unit = units[i];
            if (cancel && cancel->cancelled()) {
                slots[i] = failed_result(*this, unit, "cancelled", "cancelled before start");
                continue;
            }

            try {
                slots[i] = run_unit(unit, cancel);
            } catch (const core::ConfigError&) {
                std::lock_guard<std::mutex> lock(fatal_mu);
                if (!fatal) fatal = std::current_exception();
                abort.store(true);
                return;
            } catch (const std::exception& e) {
                std::ostringstream oss;
                oss << "Pipeline: unit " << unit_label(unit) << " failed: " << core::error_kind(e) << ": " << e.what() << "\n";
                std::cerr << oss.str();
                slots[i] = failed_result(*this, unit, core::error_kind(e), e.what());
            }
        }
    };

    const size_t n = std::max<size_t>(1, std::min(workers, units.size()));
    if (n == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(n);
        for (size_t t = 0; t < n; ++t) threads.emplace_back(worker);
        for (auto& t : threads) t.join();
    }

    if (fatal) std::rethrow_exception(fatal);

    std::vector<UnitResult> out;
    out.reserve(units.size());
    for (auto& s : slots) {
        if (s) out.push_back(std::move(*s));
    }
    std::stable_sort(out.begin(), out.end(), unit_result_before);
    return out;
}

}  // namespace pipeline
