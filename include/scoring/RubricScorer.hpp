#pragma once

#include <memory>
#include <string>
#include <vector>

#include "determinism/Determinism.hpp"
#include "scoring/Evidence.hpp"
#include "scoring/Rubric.hpp"

namespace scoring {

// Maps quoted evidence to a 0-4 maturity stage for one theme.
//
// The stage is the highest rubric stage any quote matches. A stage above 0
// needs at least min_quotes distinct quotes (unique id and unique text) that
// match it; otherwise the result is stage 0 with confidence 0.0 and the
// shortfall is named in the audit field.
//
// confidence = max(0, min(1, 0.70 + 0.05 * stage) - mean freshness penalty)
class RubricScorer {
public:
    // Throws core::ConfigError on a null rubric.
    RubricScorer(std::shared_ptr<const Rubric> rubric, const determinism::DeterminismContext& ctx);

    // Throws core::ConfigError when theme is not in the rubric.
    StageScore score(const std::string& theme,
                     const std::vector<EvidenceQuote>& evidence,
                     const std::string& org_id,
                     int year,
                     const std::string& snapshot_id) const;

    // Penalty for one quote's age against the context clock. Unknown or
    // unparseable dates get the schedule's largest penalty.
    double freshness_penalty(const EvidenceQuote& quote) const;

    const Rubric& rubric() const { return *m_rubric; }

private:
    std::shared_ptr<const Rubric> m_rubric;
    determinism::Timestamp m_now;
};

// Reporting frameworks named in the quotes, sorted and unique.
std::vector<std::string> detect_frameworks(const std::vector<EvidenceQuote>& quotes);

}  // namespace scoring
