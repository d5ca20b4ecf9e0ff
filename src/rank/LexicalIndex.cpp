#include "rank/LexicalIndex.hpp"
#include "rank/TextUtil.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <unordered_set>

namespace rank {

static double safe_log(double x) {
    return std::log(x);
}

static void sort_and_merge(std::vector<std::pair<uint32_t, float>>& v) {
    std::sort(v.begin(), v.end(), [](auto& x, auto& y){ return x.first < y.first; });
    size_t w = 0;
    for (size_t i = 0; i < v.size(); ) {
        uint32_t id = v[i].first;
        float sum = 0.0f;
        size_t j = i;
        while (j < v.size() && v[j].first == id) {
            sum += v[j].second;
            ++j;
        }
        v[w++] = {id, sum};
        i = j;
    }
    v.resize(w);
}

double LexicalIndex::dot_sparse(
    const std::vector<std::pair<uint32_t, float>>& a,
    const std::vector<std::pair<uint32_t, float>>& b
) {
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            s += (double)a[i].second * (double)b[j].second;
            ++i; ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

LexicalIndex::LexicalIndex(const std::vector<IndexedText>& docs) {
    const uint32_t N = (uint32_t)docs.size();

    // Pass 1: DF + vocab. Ordered map so term ids do not depend on hash order.
    std::map<std::string, uint32_t> df_map;

    std::vector<std::vector<std::string>> doc_tokens;
    doc_tokens.reserve(docs.size());

    for (const auto& d : docs) {
        auto toks = textutil::tokenize(textutil::normalize(d.text));
        std::unordered_set<std::string> seen(toks.begin(), toks.end());
        for (const auto& t : seen) df_map[t] += 1;
        doc_tokens.push_back(std::move(toks));
    }

    m_terms.reserve(df_map.size());
    m_df.reserve(df_map.size());

    for (const auto& kv : df_map) {
        m_term_to_id.emplace(kv.first, (uint32_t)m_terms.size());
        m_terms.push_back(kv.first);
        m_df.push_back(kv.second);
    }

    m_idf.resize(m_terms.size());
    for (size_t term_id = 0; term_id < m_terms.size(); ++term_id) {
        // smooth: idf = log((N + 1)/(df + 1)) + 1
        double df = (double)m_df[term_id];
        m_idf[term_id] = safe_log(((double)N + 1.0) / (df + 1.0)) + 1.0;
    }

    // Pass 2: TF-IDF vectors
    m_postings.reserve(docs.size());

    for (size_t idx = 0; idx < docs.size(); ++idx) {
        const auto& toks = doc_tokens[idx];

        std::map<uint32_t, uint32_t> tf;
        for (const auto& t : toks) {
            auto it = m_term_to_id.find(t);
            if (it == m_term_to_id.end()) continue;
            tf[it->second] += 1;
        }

        PostingVec pv;
        pv.weights.reserve(tf.size());

        double norm2 = 0.0;
        for (const auto& kv : tf) {
            // log TF
            double w = (1.0 + safe_log((double)kv.second)) * m_idf[kv.first];
            pv.weights.push_back({kv.first, (float)w});
            norm2 += w * w;
        }

        sort_and_merge(pv.weights);
        pv.norm = std::sqrt(norm2);

        m_postings.push_back(std::move(pv));
    }
}

std::vector<std::pair<uint32_t, float>> LexicalIndex::query_vector(const std::string& query, double& norm) const {
    auto qtoks = textutil::tokenize(textutil::normalize(query));

    std::map<uint32_t, uint32_t> qtf;
    for (const auto& t : qtoks) {
        auto it = m_term_to_id.find(t);
        if (it == m_term_to_id.end()) continue;
        qtf[it->second] += 1;
    }

    std::vector<std::pair<uint32_t, float>> qvec;
    qvec.reserve(qtf.size());

    double qnorm2 = 0.0;
    for (const auto& kv : qtf) {
        double w = (1.0 + safe_log((double)kv.second)) * m_idf[kv.first];
        qvec.push_back({kv.first, (float)w});
        qnorm2 += w * w;
    }

    sort_and_merge(qvec);
    norm = std::sqrt(qnorm2);
    return qvec;
}

std::vector<double> LexicalIndex::scores(const std::string& query) const {
    std::vector<double> out(m_postings.size(), 0.0);

    double qn = 0.0;
    const auto qvec = query_vector(query, qn);
    if (qn == 0.0) return out; // no known terms

    for (size_t i = 0; i < m_postings.size(); ++i) {
        const auto& p = m_postings[i];
        if (p.norm == 0.0) continue;
        double score = dot_sparse(qvec, p.weights) / (qn * p.norm);
        // float weights can push an exact match a hair past 1
        out[i] = std::min(1.0, std::max(0.0, score));
    }
    return out;
}

}  // namespace rank
