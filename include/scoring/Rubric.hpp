#pragma once

#include <regex>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace scoring {

struct StageRule {
    int stage = 0;                        // 1..4
    std::string label;
    std::vector<std::string> patterns;    // ECMAScript, matched case-insensitively
    std::vector<std::regex> compiled;
    std::vector<std::string> keywords;    // lowercase substrings

    bool matches(const std::string& text) const;
};

struct ThemeRubric {
    std::string code;
    std::string name;
    int min_quotes = 0;                   // 0 = use Rubric::min_quotes
    std::vector<StageRule> stages;        // ascending stage order

    // Highest stage whose rule matches text, 0 when none does.
    int highest_match(const std::string& text) const;
    const StageRule* stage_rule(int stage) const;
};

// Age-based confidence decay. Age <= thresholds_months[0] costs nothing;
// age > thresholds_months[i] costs penalties[i].
struct FreshnessSchedule {
    std::vector<int> thresholds_months{24, 36, 48};
    std::vector<double> penalties{0.1, 0.2, 0.3};

    double penalty_for_months(double months) const;
    double max_penalty() const { return penalties.empty() ? 0.0 : penalties.back(); }
};

struct ConfidenceBand {
    double lo = 0.0;
    double hi = 1.0;
    std::string label;
};

struct Rubric {
    std::string version;
    int min_quotes = 2;
    FreshnessSchedule freshness;
    std::vector<ConfidenceBand> guidance;
    std::vector<ThemeRubric> themes;

    const ThemeRubric* find_theme(const std::string& code) const;

    int min_quotes_for(const ThemeRubric& theme) const {
        return theme.min_quotes > 0 ? theme.min_quotes : min_quotes;
    }

    // weak / adequate / strong by default
    std::string confidence_label(double confidence) const;
};

// Both throw core::ConfigError with the JSON path of the first problem.
Rubric parse_rubric(const nlohmann::json& j, const std::string& where = "rubric");
Rubric load_rubric(const std::string& path);

}  // namespace scoring
