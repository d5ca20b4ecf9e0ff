#include "determinism/Determinism.hpp"

#include "core/Errors.hpp"
#include "determinism/StableHash.hpp"
#include "io/JsonIO.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace determinism {

SeededRng seeded_rng(uint64_t seed) {
    return SeededRng(seed);
}

DeterminismContext DeterminismContext::create(bool enabled, std::optional<int64_t> fixed_time, std::optional<uint64_t> seed) {
    if (enabled) {
        if (!fixed_time) throw core::ConfigError("determinism enabled but no fixed_time configured");
        if (!seed) throw core::ConfigError("determinism enabled but no seed configured");
    }
    DeterminismContext ctx;
    ctx.m_enabled = enabled;
    ctx.m_fixed_time = fixed_time;
    ctx.m_seed = seed;
    return ctx;
}

DeterminismContext DeterminismContext::live() {
    return DeterminismContext();
}

Timestamp DeterminismContext::now() const {
    if (m_fixed_time) {
        return Timestamp(std::chrono::seconds(*m_fixed_time));
    }
    return std::chrono::system_clock::now();
}

double DeterminismContext::clock_seconds() const {
    if (m_fixed_time) return (double)*m_fixed_time;
    auto d = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(d).count();
}

nlohmann::json DeterminismContext::to_json() const {
    nlohmann::json j;
    j["enabled"] = m_enabled;
    j["fixed_time"] = m_fixed_time ? nlohmann::json(*m_fixed_time) : nlohmann::json(nullptr);
    j["seed"] = seed();
    j["hash"] = kHashVersion;
    return j;
}

static std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

static int64_t parse_env_int(const std::string& name, const std::string& value) {
    size_t used = 0;
    int64_t out = 0;
    try {
        out = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw core::ConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw core::ConfigError(name + " must be an integer, got '" + value + "'");
    }
    return out;
}

static bool parse_env_bool(const std::string& name, std::string value) {
    for (char& c : value) c = (char)std::tolower((unsigned char)c);
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw core::ConfigError(name + " must be a boolean flag, got '" + value + "'");
}

DeterminismContext context_from_json(const nlohmann::json& j, const std::string& where) {
    bool enabled = false;
    std::optional<int64_t> fixed_time;
    std::optional<uint64_t> seed;

    if (!j.is_null()) {
        jsonio::require_object(j, where);
        enabled = jsonio::get_bool_or(j, "enabled", false, where);
        if (j.contains("fixed_time") && !j.at("fixed_time").is_null()) {
            fixed_time = jsonio::require_int(j, "fixed_time", where);
        }
        if (j.contains("seed") && !j.at("seed").is_null()) {
            int64_t s = jsonio::require_int(j, "seed", where);
            if (s < 0) throw core::ConfigError(where + ".seed must be non-negative");
            seed = (uint64_t)s;
        }
    }

    if (auto v = env_value("DETERMINISTIC")) enabled = parse_env_bool("DETERMINISTIC", *v);
    if (auto v = env_value("FIXED_TIME")) fixed_time = parse_env_int("FIXED_TIME", *v);
    if (auto v = env_value("SEED")) {
        int64_t s = parse_env_int("SEED", *v);
        if (s < 0) throw core::ConfigError("SEED must be non-negative");
        seed = (uint64_t)s;
    }

    return DeterminismContext::create(enabled, fixed_time, seed);
}

// days since 1970-01-01 for a proleptic Gregorian date
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = (int64_t)yoe + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

std::string format_iso8601(Timestamp t) {
    const int64_t secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    int64_t days = secs / 86400;
    int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }
    int64_t y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  (long long)y, m, d, (int)(rem / 3600), (int)((rem / 60) % 60), (int)(rem % 60));
    return buf;
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit((unsigned char)s[i])) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<Timestamp> parse_iso8601(const std::string& s) {
    int y = 0, mo = 0, d = 0, hh = 0, mm = 0, ss = 0;
    if (!read_digits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    if (!read_digits(s, 5, 2, mo) || !read_digits(s, 8, 2, d)) return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return std::nullopt;

    if (s.size() > 10) {
        if (s.size() != 20 || s[10] != 'T' || s[13] != ':' || s[16] != ':' || s[19] != 'Z') return std::nullopt;
        if (!read_digits(s, 11, 2, hh) || !read_digits(s, 14, 2, mm) || !read_digits(s, 17, 2, ss)) return std::nullopt;
        if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;
    }

    const int64_t days = days_from_civil(y, (unsigned)mo, (unsigned)d);
    const int64_t secs = days * 86400 + hh * 3600 + mm * 60 + ss;
    return Timestamp(std::chrono::seconds(secs));
}

}  // namespace determinism
