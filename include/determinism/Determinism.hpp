#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "nlohmann/json.hpp"

namespace determinism {

using Timestamp = std::chrono::system_clock::time_point;

constexpr uint64_t kDefaultSeed = 42;

// Seeded PRNG. std::mt19937_64 output is fixed by the standard; doubles are
// built from raw draws so no library distribution is involved.
class SeededRng {
public:
    explicit SeededRng(uint64_t seed) : m_engine(seed) {}

    uint64_t next_u64() { return m_engine(); }

    // uniform in [0, 1)
    double next_double() { return (double)(m_engine() >> 11) * (1.0 / 9007199254740992.0); }

    // uniform in [0, n); n must be > 0
    uint64_t next_below(uint64_t n) { return next_u64() % n; }

private:
    std::mt19937_64 m_engine;
};

SeededRng seeded_rng(uint64_t seed);

// Immutable run-wide determinism settings. Build once, pass by const reference.
class DeterminismContext {
public:
    // Throws core::ConfigError when enabled without both a fixed time and a seed.
    static DeterminismContext create(bool enabled, std::optional<int64_t> fixed_time, std::optional<uint64_t> seed);

    // Wall clock, default seed. For interactive use only.
    static DeterminismContext live();

    bool enabled() const { return m_enabled; }
    std::optional<int64_t> fixed_time() const { return m_fixed_time; }
    uint64_t seed() const { return m_seed ? *m_seed : kDefaultSeed; }

    Timestamp now() const;
    double clock_seconds() const;

    SeededRng rng() const { return seeded_rng(seed()); }

    nlohmann::json to_json() const;

private:
    DeterminismContext() = default;

    bool m_enabled = false;
    std::optional<int64_t> m_fixed_time;
    std::optional<uint64_t> m_seed;
};

// Reads {"enabled", "fixed_time", "seed"}; then FIXED_TIME / SEED / DETERMINISTIC
// environment variables override the file values.
DeterminismContext context_from_json(const nlohmann::json& j, const std::string& where);

std::string format_iso8601(Timestamp t);

// Accepts "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SSZ". Returns nullopt on anything else.
std::optional<Timestamp> parse_iso8601(const std::string& s);

}  // namespace determinism
