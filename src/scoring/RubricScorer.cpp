#include "scoring/RubricScorer.hpp"

#include "core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace scoring {

static double round4(double x) {
    return std::round(x * 10000.0) / 10000.0;
}

RubricScorer::RubricScorer(std::shared_ptr<const Rubric> rubric, const determinism::DeterminismContext& ctx)
    : m_rubric(std::move(rubric)), m_now(ctx.now()) {
    if (!m_rubric) throw core::ConfigError("rubric scorer needs a rubric");
}

double RubricScorer::freshness_penalty(const EvidenceQuote& quote) const {
    const auto& sched = m_rubric->freshness;

    auto published = determinism::parse_iso8601(quote.published_at);
    if (!published) return sched.max_penalty();

    const double age_days =
        std::chrono::duration<double>(m_now - *published).count() / 86400.0;
    const double months = std::max(0.0, age_days) / 30.0;
    return sched.penalty_for_months(months);
}

static StageScore base_score(const std::string& theme, const std::string& org_id, int year, const std::string& snapshot_id) {
    StageScore s;
    s.theme = theme;
    s.org_id = org_id;
    s.year = year;
    s.snapshot_id = snapshot_id;
    s.stage = 0;
    s.confidence = 0.0;
    return s;
}

StageScore RubricScorer::score(const std::string& theme,
                               const std::vector<EvidenceQuote>& evidence,
                               const std::string& org_id,
                               int year,
                               const std::string& snapshot_id) const {
    const ThemeRubric* rules = m_rubric->find_theme(theme);
    if (!rules) throw core::ConfigError("theme not in rubric " + m_rubric->version + ": " + theme);

    StageScore out = base_score(theme, org_id, year, snapshot_id);

    // distinct = unique id and unique text
    std::vector<std::pair<const EvidenceQuote*, int>> distinct;
    std::unordered_set<std::string> ids;
    std::unordered_set<std::string> hashes;
    for (const auto& q : evidence) {
        if (!ids.insert(q.evidence_id).second) continue;
        if (!hashes.insert(q.content_hash).second) continue;
        distinct.push_back({&q, rules->highest_match(q.quote)});
    }

    if (distinct.empty()) {
        out.audit = "no_evidence";
        out.confidence_label = m_rubric->confidence_label(0.0);
        return out;
    }

    int chosen = 0;
    for (const auto& d : distinct) chosen = std::max(chosen, d.second);

    if (chosen == 0) {
        out.audit = "no_stage_match";
        out.confidence_label = m_rubric->confidence_label(0.0);
        return out;
    }

    std::vector<const EvidenceQuote*> support;
    for (const auto& d : distinct) {
        if (d.second == chosen) support.push_back(d.first);
    }

    const int min_quotes = m_rubric->min_quotes_for(*rules);
    if ((int)support.size() < min_quotes) {
        std::ostringstream oss;
        oss << "insufficient_evidence(" << support.size() << "<" << min_quotes << "); stage "
            << chosen << " demoted to 0";
        out.audit = oss.str();
        out.confidence_label = m_rubric->confidence_label(0.0);
        return out;
    }

    double penalty_sum = 0.0;
    std::vector<EvidenceQuote> cited;
    cited.reserve(support.size());
    std::unordered_set<std::string> seen_docs;
    for (const EvidenceQuote* q : support) {
        penalty_sum += freshness_penalty(*q);
        out.evidence_ids.push_back(q->evidence_id);
        if (seen_docs.insert(q->doc_id).second) out.cited_doc_ids.push_back(q->doc_id);
        cited.push_back(*q);
    }
    const double specificity = std::min(1.0, 0.70 + 0.05 * chosen);
    const double penalty = penalty_sum / (double)support.size();

    out.stage = chosen;
    out.confidence = round4(std::max(0.0, specificity - penalty));
    out.confidence_label = m_rubric->confidence_label(out.confidence);
    out.frameworks = detect_frameworks(cited);

    std::ostringstream oss;
    oss << "stage " << chosen << " supported by " << support.size() << " quote(s)";
    if (penalty > 0.0) oss << "; freshness penalty " << round4(penalty);
    out.audit = oss.str();
    return out;
}

std::vector<std::string> detect_frameworks(const std::vector<EvidenceQuote>& quotes) {
    static const std::vector<std::pair<std::string, std::regex>> known = {
        {"CDP", std::regex("\\bCDP\\b", std::regex::icase)},
        {"GHG Protocol", std::regex("\\bGHG\\s+Protocol\\b", std::regex::icase)},
        {"GRI", std::regex("\\bGRI\\b|global reporting initiative", std::regex::icase)},
        {"ISO 14001", std::regex("\\bISO\\s*14001\\b", std::regex::icase)},
        {"ISSB", std::regex("\\bISSB\\b", std::regex::icase)},
        {"RE100", std::regex("\\bRE100\\b", std::regex::icase)},
        {"SASB", std::regex("\\bSASB\\b", std::regex::icase)},
        {"SBTi", std::regex("\\bSBTi\\b|science[- ]based targets\\b", std::regex::icase)},
        {"TCFD", std::regex("\\bTCFD\\b|task force on climate", std::regex::icase)},
    };

    std::set<std::string> found;
    for (const auto& q : quotes) {
        for (const auto& kv : known) {
            if (std::regex_search(q.quote, kv.second)) found.insert(kv.first);
        }
    }
    return std::vector<std::string>(found.begin(), found.end());
}

}  // namespace scoring
