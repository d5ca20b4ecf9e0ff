#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "determinism/Determinism.hpp"
#include "rank/RankTypes.hpp"
#include "rank/SemanticScorer.hpp"

namespace rank {

// Fuses lexical and semantic relevance into a deterministic top-K.
//
// fused = alpha * lexical + (1 - alpha) * semantic, both clamped to [0,1].
// Ties are broken by lexical desc, semantic desc, doc_id asc, so the output
// order is total and reproducible for a given seed.
class HybridRanker {
public:
    // scorer defaults to TokenOverlapScorer
    explicit HybridRanker(const determinism::DeterminismContext& ctx,
                          std::shared_ptr<const SemanticScorer> scorer = nullptr);

    // Throws core::InvalidInput on empty candidates, alpha outside [0,1],
    // or any non-finite lexical/semantic score. k == 0 returns empty.
    std::vector<RankedResult> rank(const std::string& query,
                                   const std::vector<RankCandidate>& candidates,
                                   double alpha,
                                   size_t k) const;

    // (stable_hash(seed:query:index) % 1000) / 1e6
    double tie_perturbation(const std::string& query, size_t index) const;

    const SemanticScorer& scorer() const { return *m_scorer; }

private:
    uint64_t m_seed = 0;
    std::shared_ptr<const SemanticScorer> m_scorer;
};

// Strict total order used by rank(); exposed for tests and validators.
bool ranked_before(const RankedResult& a, const RankedResult& b);

}  // namespace rank
