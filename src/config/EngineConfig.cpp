#include "config/EngineConfig.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

#include <cmath>

namespace fs = std::filesystem;

namespace config {

static std::string resolve_path(const std::string& p, const fs::path& base_dir) {
    if (p.empty()) return p;
    fs::path path(p);
    if (path.is_relative()) path = base_dir / path;
    return path.lexically_normal().string();
}

static sources::ProviderSpec parse_provider(const jsonio::json& j, const std::string& where, const fs::path& base_dir) {
    jsonio::require_object(j, where);

    sources::ProviderSpec spec;
    spec.kind = sources::parse_provider_kind(jsonio::require_string(j, "kind", where));
    spec.id = jsonio::require_string(j, "id", where);
    spec.root = resolve_path(jsonio::require_string(j, "root", where), base_dir);
    spec.enabled = jsonio::get_bool_or(j, "enabled", true, where);
    if (spec.id.empty()) throw core::ConfigError(where + ".id must not be empty");
    return spec;
}

static void parse_units(const jsonio::json& arr, const std::string& where, EngineConfig& cfg) {
    jsonio::require_array(arr, where);

    for (size_t i = 0; i < arr.size(); ++i) {
        const std::string w = jsonio::index_path(where, i);
        const jsonio::json& u = arr[i];
        jsonio::require_object(u, w);

        sources::CompanyRef company;
        company.name = jsonio::require_string(u, "company", w);
        company.org_id = jsonio::get_string_or(u, "org_id", "", w);
        company.cik = jsonio::get_string_or(u, "cik", "", w);
        company.ticker = jsonio::get_string_or(u, "ticker", "", w);
        if (company.name.empty()) throw core::ConfigError(w + ".company must not be empty");

        const int year = (int)jsonio::require_int(u, "year", w);
        const std::string query = jsonio::get_string_or(u, "query", "", w);

        // "theme": "GHG" or "themes": ["GHG", "TSP"]
        std::vector<std::string> themes = jsonio::get_string_array_or(u, "themes", w);
        const std::string theme = jsonio::get_string_or(u, "theme", "", w);
        if (!theme.empty()) themes.insert(themes.begin(), theme);
        if (themes.empty()) throw core::ConfigError(w + " needs theme or themes");

        for (const auto& t : themes) {
            UnitSpec spec;
            spec.company = company;
            spec.year = year;
            spec.theme = t;
            spec.query = query;
            cfg.units.push_back(std::move(spec));
        }
    }
}

EngineConfig parse_engine_config(const nlohmann::json& j, const fs::path& base_dir) {
    const std::string where = "config";
    jsonio::require_object(j, where);

    EngineConfig cfg;

    cfg.determinism_ctx = determinism::context_from_json(
        j.contains("determinism") ? j.at("determinism") : jsonio::json(), where + ".determinism");

    if (j.contains("ranking")) {
        const std::string w = where + ".ranking";
        const jsonio::json& r = j.at("ranking");
        jsonio::require_object(r, w);
        cfg.alpha = jsonio::get_number_or(r, "alpha", cfg.alpha, w);
        const int64_t k = jsonio::get_int_or(r, "k", (int64_t)cfg.k, w);
        if (!std::isfinite(cfg.alpha) || cfg.alpha < 0.0 || cfg.alpha > 1.0) {
            throw core::ConfigError(w + ".alpha must be in [0,1]");
        }
        if (k < 0) throw core::ConfigError(w + ".k must be non-negative");
        cfg.k = (size_t)k;
    }

    if (j.contains("resolver")) {
        const std::string w = where + ".resolver";
        const jsonio::json& r = j.at("resolver");
        jsonio::require_object(r, w);

        const int64_t timeout = jsonio::get_int_or(r, "search_timeout_ms", 30000, w);
        if (timeout <= 0) throw core::ConfigError(w + ".search_timeout_ms must be positive");
        cfg.resolver.search_timeout = std::chrono::milliseconds(timeout);

        const int64_t download_timeout = jsonio::get_int_or(r, "download_timeout_ms", 120000, w);
        if (download_timeout <= 0) throw core::ConfigError(w + ".download_timeout_ms must be positive");
        cfg.resolver.download_timeout = std::chrono::milliseconds(download_timeout);

        const int64_t max_abandoned = jsonio::get_int_or(r, "max_abandoned_calls", 1, w);
        if (max_abandoned < 1) throw core::ConfigError(w + ".max_abandoned_calls must be >= 1");
        cfg.resolver.max_abandoned_calls = static_cast<size_t>(max_abandoned);

        if (r.contains("tier_overrides")) {
            const jsonio::json& ov = r.at("tier_overrides");
            jsonio::require_object(ov, w + ".tier_overrides");
            for (auto it = ov.begin(); it != ov.end(); ++it) {
                if (!it.value().is_number_integer()) {
                    throw core::ConfigError(w + ".tier_overrides." + it.key() + " must be an integer");
                }
                const int tier = it.value().get<int>();
                if (tier < 1 || tier > 3) {
                    throw core::ConfigError(w + ".tier_overrides." + it.key() + " must be in [1,3]");
                }
                cfg.resolver.tier_overrides[it.key()] = tier;
            }
        }
    }

    const jsonio::json& tiers = jsonio::require_field(j, "tiers", where);
    jsonio::require_array(tiers, where + ".tiers");
    for (size_t t = 0; t < tiers.size(); ++t) {
        const std::string tw = jsonio::index_path(where + ".tiers", t);
        jsonio::require_array(tiers[t], tw);

        std::vector<sources::ProviderSpec> tier;
        for (size_t p = 0; p < tiers[t].size(); ++p) {
            tier.push_back(parse_provider(tiers[t][p], jsonio::index_path(tw, p), base_dir));
        }
        cfg.tiers.push_back(std::move(tier));
    }
    if (cfg.tiers.size() > 3) throw core::ConfigError(where + ".tiers supports at most 3 tiers");

    cfg.rubric_path = resolve_path(jsonio::require_string(j, "rubric", where), base_dir);
    cfg.store_dir = resolve_path(jsonio::get_string_or(j, "store", "", where), base_dir);

    const int64_t mq = jsonio::get_int_or(j, "max_quotes_per_theme", 8, where);
    if (mq < 1) throw core::ConfigError(where + ".max_quotes_per_theme must be >= 1");
    cfg.max_quotes_per_theme = (size_t)mq;

    const int64_t workers = jsonio::get_int_or(j, "workers", 1, where);
    if (workers < 1) throw core::ConfigError(where + ".workers must be >= 1");
    cfg.workers = (size_t)workers;

    if (j.contains("units")) parse_units(j.at("units"), where + ".units", cfg);

    return cfg;
}

EngineConfig load_engine_config(const std::string& path) {
    const jsonio::json j = jsonio::read_json_file(path);
    return parse_engine_config(j, fs::path(path).parent_path());
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["determinism"] = determinism_ctx.to_json();
    j["ranking"] = {{"alpha", alpha}, {"k", k}};
    j["resolver"] = {
        {"search_timeout_ms", resolver.search_timeout.count()},
        {"download_timeout_ms", resolver.download_timeout.count()},
        {"max_abandoned_calls", resolver.max_abandoned_calls},
        {"tier_overrides", resolver.tier_overrides}
    };

    nlohmann::json tj = nlohmann::json::array();
    for (const auto& tier : tiers) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& p : tier) {
            arr.push_back({
                {"kind", sources::provider_kind_str(p.kind)},
                {"id", p.id},
                {"root", p.root},
                {"enabled", p.enabled}
            });
        }
        tj.push_back(arr);
    }
    j["tiers"] = tj;
    j["rubric"] = rubric_path;
    j["store"] = store_dir;
    j["max_quotes_per_theme"] = max_quotes_per_theme;
    j["workers"] = workers;
    return j;
}

}  // namespace config
