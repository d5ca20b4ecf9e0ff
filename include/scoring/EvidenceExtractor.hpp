#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "rank/RankTypes.hpp"
#include "scoring/Evidence.hpp"
#include "scoring/Rubric.hpp"

namespace scoring {

struct ExtractorConfig {
    size_t max_quotes_per_theme = 8;
    size_t max_words = 30;
    size_t min_boundary_words = 20;
};

// Pulls quotes for one theme out of ranked spans: sentences that still match
// a stage rule after truncation, in ranked order then offset order, with
// duplicate text dropped.
std::vector<EvidenceQuote> extract_evidence(const ThemeRubric& theme,
                                            const std::vector<rank::RankedResult>& ranked,
                                            const ExtractorConfig& cfg = ExtractorConfig());

std::string make_evidence_id(const std::string& theme, const std::string& doc_id, size_t offset, const std::string& quote);

}  // namespace scoring
