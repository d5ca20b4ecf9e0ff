#include "rank/HybridRanker.hpp"

#include "core/Errors.hpp"
#include "determinism/StableHash.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace rank {

nlohmann::json RankedResult::to_json() const {
    nlohmann::json j;
    j["doc_id"] = doc_id;
    j["rank"] = rank;
    j["lexical_score"] = lexical_score;
    j["semantic_score"] = semantic_score;
    j["fused_score"] = fused_score;
    j["page"] = page;
    j["offset"] = offset;
    return j;
}

static double clamp01(double x) {
    return std::min(1.0, std::max(0.0, x));
}

bool ranked_before(const RankedResult& a, const RankedResult& b) {
    if (a.fused_score != b.fused_score) return a.fused_score > b.fused_score;
    if (a.lexical_score != b.lexical_score) return a.lexical_score > b.lexical_score;
    if (a.semantic_score != b.semantic_score) return a.semantic_score > b.semantic_score;
    return a.doc_id < b.doc_id;
}

HybridRanker::HybridRanker(const determinism::DeterminismContext& ctx,
                           std::shared_ptr<const SemanticScorer> scorer)
    : m_seed(ctx.seed()),
      m_scorer(scorer ? std::move(scorer)
                      : std::shared_ptr<const SemanticScorer>(std::make_shared<TokenOverlapScorer>())) {}

double HybridRanker::tie_perturbation(const std::string& query, size_t index) const {
    std::ostringstream key;
    key << m_seed << ":" << query << ":" << index;
    return (double)(determinism::stable_hash(key.str()) % 1000) / 1e6;
}

std::vector<RankedResult> HybridRanker::rank(const std::string& query,
                                             const std::vector<RankCandidate>& candidates,
                                             double alpha,
                                             size_t k) const {
    if (candidates.empty()) throw core::InvalidInput("no candidates");
    if (!std::isfinite(alpha) || alpha < 0.0 || alpha > 1.0) {
        std::ostringstream oss;
        oss << "alpha must be in [0,1], got " << alpha;
        throw core::InvalidInput(oss.str());
    }

    std::vector<RankedResult> results;
    results.reserve(candidates.size());

    for (size_t i = 0; i < candidates.size(); ++i) {
        const RankCandidate& c = candidates[i];
        if (!std::isfinite(c.lexical_score)) {
            throw core::InvalidInput("nan/inf score: lexical score of " + c.doc_id);
        }

        const double raw_sem = m_scorer->semantic_score(query, c.text);
        if (!std::isfinite(raw_sem)) {
            throw core::InvalidInput("nan/inf score: semantic score of " + c.doc_id);
        }

        RankedResult r;
        r.doc_id = c.doc_id;
        r.text = c.text;
        r.page = c.page;
        r.offset = c.offset;
        r.metadata = c.metadata;
        r.lexical_score = clamp01(c.lexical_score);
        r.semantic_score = clamp01(raw_sem + tie_perturbation(query, i));
        r.fused_score = alpha * r.lexical_score + (1.0 - alpha) * r.semantic_score;
        results.push_back(std::move(r));
    }

    std::stable_sort(results.begin(), results.end(), ranked_before);

    if (results.size() > k) results.resize(k);
    for (size_t i = 0; i < results.size(); ++i) results[i].rank = i;
    return results;
}

}  // namespace rank
