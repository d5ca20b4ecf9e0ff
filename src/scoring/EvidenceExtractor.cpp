#include "scoring/EvidenceExtractor.hpp"

#include "determinism/StableHash.hpp"
#include "rank/TextUtil.hpp"

#include <sstream>
#include <unordered_set>

namespace scoring {

std::string make_evidence_id(const std::string& theme, const std::string& doc_id, size_t offset, const std::string& quote) {
    std::ostringstream key;
    key << doc_id << "|" << offset << "|" << quote;
    return "ev-" + theme + "-" + determinism::stable_hash_hex(key.str()).substr(0, 12);
}

std::vector<EvidenceQuote> extract_evidence(const ThemeRubric& theme,
                                            const std::vector<rank::RankedResult>& ranked,
                                            const ExtractorConfig& cfg) {
    std::vector<EvidenceQuote> out;
    std::unordered_set<std::string> seen_hashes;

    for (const auto& r : ranked) {
        if (out.size() >= cfg.max_quotes_per_theme) break;

        auto pub = r.metadata.find("published_at");

        for (const auto& sentence : textutil::split_sentences(r.text)) {
            if (out.size() >= cfg.max_quotes_per_theme) break;

            const std::string quote = textutil::truncate_words(sentence.text, cfg.max_words, cfg.min_boundary_words);
            const int stage = theme.highest_match(quote);
            if (stage == 0) continue;

            const std::string hash = determinism::stable_hash_hex(quote);
            if (!seen_hashes.insert(hash).second) continue;

            EvidenceQuote q;
            q.doc_id = r.doc_id;
            q.theme = theme.code;
            q.quote = quote;
            q.content_hash = hash;
            q.published_at = pub != r.metadata.end() ? pub->second : "";
            q.page = r.page;
            q.offset = r.offset + sentence.offset;
            q.matched_stage = stage;
            q.evidence_id = make_evidence_id(theme.code, q.doc_id, q.offset, q.quote);
            out.push_back(std::move(q));
        }
    }

    return out;
}

}  // namespace scoring
