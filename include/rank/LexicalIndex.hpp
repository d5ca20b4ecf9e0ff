#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace rank {

struct IndexedText {
    std::string id;
    std::string text;
};

// Smoothed TF-IDF with log TF; cosine similarity against a query.
class LexicalIndex {
public:
    explicit LexicalIndex(const std::vector<IndexedText>& docs);

    // one score per indexed doc, in input order, clamped to [0,1]
    std::vector<double> scores(const std::string& query) const;

    size_t size() const { return m_postings.size(); }

private:
    struct PostingVec {
        std::vector<std::pair<uint32_t, float>> weights; // (term_id, tf-idf weight)
        double norm = 0.0;
    };

    // vocab
    std::vector<std::string> m_terms;             // term_id -> term
    std::vector<uint32_t> m_df;                   // term_id -> document frequency
    std::vector<double> m_idf;                    // term_id -> idf
    std::unordered_map<std::string, uint32_t> m_term_to_id;

    std::vector<PostingVec> m_postings;

    std::vector<std::pair<uint32_t, float>> query_vector(const std::string& query, double& norm) const;

    static double dot_sparse(
        const std::vector<std::pair<uint32_t, float>>& a,
        const std::vector<std::pair<uint32_t, float>>& b
    );
};

}  // namespace rank
