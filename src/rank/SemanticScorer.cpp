#include "rank/SemanticScorer.hpp"
#include "rank/TextUtil.hpp"

#include <algorithm>
#include <cmath>

namespace rank {

double TokenOverlapScorer::semantic_score(const std::string& query, const std::string& text) const {
    return textutil::jaccard(textutil::token_set(query), textutil::token_set(text));
}

static double dot(const std::vector<float>& a, const std::vector<float>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) s += (double)a[i] * (double)b[i];
    return s;
}

double EmbeddingSemanticScorer::semantic_score(const std::string& query, const std::string& text) const {
    const std::vector<float> q = m_embedder.embed(query);
    const std::vector<float> t = m_embedder.embed(text);
    if (q.empty() || q.size() != t.size()) return 0.0;

    // vectors are L2-normalized, so dot == cosine
    const double raw = dot(q, t);
    if (!std::isfinite(raw)) return raw;   // the ranker rejects it
    const double cos = std::max(-1.0, std::min(1.0, raw));
    return (1.0 + cos) / 2.0;
}

}  // namespace rank
