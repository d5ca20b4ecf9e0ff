#pragma once

#include <string>
#include <vector>

namespace rank {

// Query/text relevance in [0,1]. Implementations must be deterministic.
class SemanticScorer {
public:
    virtual ~SemanticScorer() = default;
    virtual double semantic_score(const std::string& query, const std::string& text) const = 0;
    virtual const char* name() const = 0;
};

// Jaccard overlap of normalized token sets.
class TokenOverlapScorer : public SemanticScorer {
public:
    double semantic_score(const std::string& query, const std::string& text) const override;
    const char* name() const override { return "token_overlap"; }
};

// Produces L2-normalized sentence embeddings.
class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;
    virtual std::vector<float> embed(const std::string& text) const = 0;
};

// (1 + cosine) / 2 over embeddings. Empty or mismatched vectors score 0.
class EmbeddingSemanticScorer : public SemanticScorer {
public:
    explicit EmbeddingSemanticScorer(const TextEmbedder& embedder) : m_embedder(embedder) {}

    double semantic_score(const std::string& query, const std::string& text) const override;
    const char* name() const override { return "embedding"; }

private:
    const TextEmbedder& m_embedder;
};

}  // namespace rank
