#include "scoring/Rubric.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "rank/TextUtil.hpp"

#include <algorithm>
#include <set>

namespace scoring {

bool StageRule::matches(const std::string& text) const {
    for (const auto& re : compiled) {
        if (std::regex_search(text, re)) return true;
    }
    if (keywords.empty()) return false;

    const std::string lower = textutil::lower_ascii(text);
    for (const auto& kw : keywords) {
        if (lower.find(kw) != std::string::npos) return true;
    }
    return false;
}

int ThemeRubric::highest_match(const std::string& text) const {
    for (auto it = stages.rbegin(); it != stages.rend(); ++it) {
        if (it->matches(text)) return it->stage;
    }
    return 0;
}

const StageRule* ThemeRubric::stage_rule(int stage) const {
    for (const auto& s : stages) {
        if (s.stage == stage) return &s;
    }
    return nullptr;
}

double FreshnessSchedule::penalty_for_months(double months) const {
    double penalty = 0.0;
    for (size_t i = 0; i < thresholds_months.size(); ++i) {
        if (months > (double)thresholds_months[i]) penalty = penalties[i];
    }
    return penalty;
}

const ThemeRubric* Rubric::find_theme(const std::string& code) const {
    for (const auto& t : themes) {
        if (t.code == code) return &t;
    }
    return nullptr;
}

std::string Rubric::confidence_label(double confidence) const {
    if (guidance.empty()) {
        if (confidence < 0.5) return "weak";
        if (confidence < 0.75) return "adequate";
        return "strong";
    }
    // last band starting at or below the value; bands are sorted by lo
    std::string label = guidance.front().label;
    for (const auto& b : guidance) {
        if (confidence >= b.lo) label = b.label;
    }
    return label;
}

static StageRule parse_stage(const jsonio::json& j, int stage, const std::string& where) {
    jsonio::require_object(j, where);

    StageRule r;
    r.stage = stage;
    r.label = jsonio::get_string_or(j, "label", "", where);
    r.patterns = jsonio::get_string_array_or(j, "patterns", where);
    r.keywords = jsonio::get_string_array_or(j, "keywords", where);

    if (r.patterns.empty() && r.keywords.empty()) {
        throw core::ConfigError(where + " needs at least one pattern or keyword");
    }

    for (size_t i = 0; i < r.patterns.size(); ++i) {
        try {
            r.compiled.emplace_back(r.patterns[i], std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw core::ConfigError(jsonio::index_path(where + ".patterns", i) + " is not a valid regex: " + e.what());
        }
    }
    for (auto& kw : r.keywords) {
        kw = textutil::lower_ascii(kw);
        if (kw.empty()) throw core::ConfigError(where + ".keywords contains an empty keyword");
    }
    return r;
}

static ThemeRubric parse_theme(const jsonio::json& j, const std::string& where) {
    jsonio::require_object(j, where);

    ThemeRubric t;
    t.code = jsonio::require_string(j, "code", where);
    if (t.code.empty()) throw core::ConfigError(where + ".code must not be empty");
    t.name = jsonio::get_string_or(j, "name", t.code, where);

    const int64_t mq = jsonio::get_int_or(j, "min_quotes", 0, where);
    if (mq < 0) throw core::ConfigError(where + ".min_quotes must be non-negative");
    t.min_quotes = (int)mq;

    const jsonio::json& stages = jsonio::require_field(j, "stages", where);
    jsonio::require_object(stages, where + ".stages");
    if (stages.empty()) throw core::ConfigError(where + ".stages must not be empty");

    for (auto it = stages.begin(); it != stages.end(); ++it) {
        const std::string& key = it.key();
        if (key != "1" && key != "2" && key != "3" && key != "4") {
            throw core::ConfigError(where + ".stages has invalid stage key '" + key + "' (expected 1..4)");
        }
        t.stages.push_back(parse_stage(it.value(), key[0] - '0', where + ".stages." + key));
    }
    std::sort(t.stages.begin(), t.stages.end(), [](const StageRule& a, const StageRule& b) {
        return a.stage < b.stage;
    });
    return t;
}

static FreshnessSchedule parse_freshness(const jsonio::json& j, const std::string& where) {
    jsonio::require_object(j, where);

    FreshnessSchedule f;
    const jsonio::json& th = jsonio::require_field(j, "thresholds_months", where);
    const jsonio::json& pe = jsonio::require_field(j, "penalties", where);
    jsonio::require_array(th, where + ".thresholds_months");
    jsonio::require_array(pe, where + ".penalties");

    if (th.size() != pe.size()) {
        throw core::ConfigError(where + ": thresholds_months and penalties must have the same length");
    }

    f.thresholds_months.clear();
    f.penalties.clear();
    for (size_t i = 0; i < th.size(); ++i) {
        if (!th[i].is_number_integer() || th[i].get<int64_t>() <= 0) {
            throw core::ConfigError(jsonio::index_path(where + ".thresholds_months", i) + " must be a positive integer");
        }
        if (!pe[i].is_number() || pe[i].get<double>() < 0.0 || pe[i].get<double>() > 1.0) {
            throw core::ConfigError(jsonio::index_path(where + ".penalties", i) + " must be a number in [0,1]");
        }
        const int months = th[i].get<int>();
        if (!f.thresholds_months.empty() && months <= f.thresholds_months.back()) {
            throw core::ConfigError(where + ".thresholds_months must be strictly increasing");
        }
        f.thresholds_months.push_back(months);
        f.penalties.push_back(pe[i].get<double>());
    }
    return f;
}

static std::vector<ConfidenceBand> parse_guidance(const jsonio::json& j, const std::string& where) {
    jsonio::require_array(j, where);

    std::vector<ConfidenceBand> out;
    for (size_t i = 0; i < j.size(); ++i) {
        const std::string w = jsonio::index_path(where, i);
        jsonio::require_object(j[i], w);

        const jsonio::json& range = jsonio::require_field(j[i], "range", w);
        if (!range.is_array() || range.size() != 2 || !range[0].is_number() || !range[1].is_number()) {
            throw core::ConfigError(w + ".range must be [lo, hi]");
        }
        ConfidenceBand b;
        b.lo = range[0].get<double>();
        b.hi = range[1].get<double>();
        b.label = jsonio::require_string(j[i], "label", w);
        if (b.lo > b.hi) throw core::ConfigError(w + ".range has lo > hi");
        out.push_back(std::move(b));
    }
    std::sort(out.begin(), out.end(), [](const ConfidenceBand& a, const ConfidenceBand& b) { return a.lo < b.lo; });
    return out;
}

Rubric parse_rubric(const nlohmann::json& j, const std::string& where) {
    jsonio::require_object(j, where);

    Rubric r;
    r.version = jsonio::require_string(j, "version", where);

    if (j.contains("scoring_rules")) {
        const std::string rw = where + ".scoring_rules";
        const jsonio::json& rules = j.at("scoring_rules");
        jsonio::require_object(rules, rw);

        const int64_t mq = jsonio::get_int_or(rules, "evidence_min_per_stage_claim", 2, rw);
        if (mq < 1) throw core::ConfigError(rw + ".evidence_min_per_stage_claim must be >= 1");
        r.min_quotes = (int)mq;

        if (rules.contains("freshness")) r.freshness = parse_freshness(rules.at("freshness"), rw + ".freshness");
        if (rules.contains("confidence_guidance")) {
            r.guidance = parse_guidance(rules.at("confidence_guidance"), rw + ".confidence_guidance");
        }
    }

    const jsonio::json& themes = jsonio::require_field(j, "themes", where);
    jsonio::require_array(themes, where + ".themes");
    if (themes.empty()) throw core::ConfigError(where + ".themes must not be empty");

    std::set<std::string> codes;
    for (size_t i = 0; i < themes.size(); ++i) {
        ThemeRubric t = parse_theme(themes[i], jsonio::index_path(where + ".themes", i));
        if (!codes.insert(t.code).second) {
            throw core::ConfigError(where + ".themes has duplicate code " + t.code);
        }
        r.themes.push_back(std::move(t));
    }
    return r;
}

Rubric load_rubric(const std::string& path) {
    const jsonio::json j = jsonio::read_json_file(path);
    return parse_rubric(j, "rubric(" + path + ")");
}

}  // namespace scoring
