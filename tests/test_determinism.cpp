#include "core/Errors.hpp"
#include "determinism/Determinism.hpp"
#include "determinism/StableHash.hpp"

#include "TestSupport.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <vector>

using determinism::DeterminismContext;

TEST_CASE("Determinism mode fails closed without time and seed", "[determinism]") {
    SECTION("enabled without fixed_time") {
        REQUIRE_THROWS_AS(DeterminismContext::create(true, std::nullopt, 7), core::ConfigError);
    }
    SECTION("enabled without seed") {
        REQUIRE_THROWS_AS(DeterminismContext::create(true, 100, std::nullopt), core::ConfigError);
    }
    SECTION("disabled needs neither and falls back to the default seed") {
        const auto ctx = DeterminismContext::create(false, std::nullopt, std::nullopt);
        CHECK_FALSE(ctx.enabled());
        CHECK(ctx.seed() == determinism::kDefaultSeed);
        CHECK_FALSE(ctx.fixed_time().has_value());
    }
}

TEST_CASE("Fixed time pins the clock", "[determinism]") {
    const auto ctx = testsupport::fixed_ctx();
    CHECK(determinism::format_iso8601(ctx.now()) == "2024-06-30T00:00:00Z");
    CHECK(ctx.clock_seconds() == (double)testsupport::kFixedTime);
    CHECK(ctx.now() == ctx.now());

    const auto j = ctx.to_json();
    CHECK(j["enabled"] == true);
    CHECK(j["seed"] == 42);
    CHECK(j["fixed_time"] == testsupport::kFixedTime);
    CHECK(j["hash"] == determinism::kHashVersion);
}

TEST_CASE("Seeded RNG is repeatable", "[determinism][rng]") {
    const auto ctx = testsupport::fixed_ctx(1234);

    auto a = ctx.rng();
    auto b = ctx.rng();
    std::vector<uint64_t> xs, ys;
    for (int i = 0; i < 16; ++i) {
        xs.push_back(a.next_u64());
        ys.push_back(b.next_u64());
    }
    REQUIRE(xs == ys);

    auto c = determinism::seeded_rng(1235);
    CHECK(c.next_u64() != xs[0]);

    auto d = determinism::seeded_rng(9);
    for (int i = 0; i < 100; ++i) {
        const double x = d.next_double();
        CHECK(x >= 0.0);
        CHECK(x < 1.0);
        CHECK(d.next_below(7) < 7);
    }
}

TEST_CASE("Stable hash is FNV-1a 64", "[determinism][hash]") {
    CHECK(determinism::stable_hash("") == 0xcbf29ce484222325ull);
    CHECK(determinism::stable_hash("a") == 0xaf63dc4c8601ec8cull);
    CHECK(determinism::hex_u64(0) == "0000000000000000");
    CHECK(determinism::hex_u64(255) == "00000000000000ff");
    CHECK(determinism::stable_hash_hex("a") == "af63dc4c8601ec8c");
}

TEST_CASE("Canonical hash ignores key insertion order", "[determinism][hash]") {
    nlohmann::json a;
    a["year"] = 2023;
    a["org_id"] = "acme";
    a["theme"] = "GHG";

    nlohmann::json b;
    b["theme"] = "GHG";
    b["org_id"] = "acme";
    b["year"] = 2023;

    CHECK(determinism::canonical_json(a) == R"({"org_id":"acme","theme":"GHG","year":2023})");
    CHECK(determinism::canonical_hash(a) == determinism::canonical_hash(b));

    b["year"] = 2024;
    CHECK(determinism::canonical_hash(a) != determinism::canonical_hash(b));
}

TEST_CASE("ISO-8601 parsing", "[determinism][time]") {
    SECTION("date only") {
        auto t = determinism::parse_iso8601("2024-06-30");
        REQUIRE(t.has_value());
        CHECK(std::chrono::duration_cast<std::chrono::seconds>(t->time_since_epoch()).count() == testsupport::kFixedTime);
    }
    SECTION("date and time") {
        auto t = determinism::parse_iso8601("2024-06-30T12:00:00Z");
        REQUIRE(t.has_value());
        CHECK(std::chrono::duration_cast<std::chrono::seconds>(t->time_since_epoch()).count() == testsupport::kFixedTime + 43200);
        CHECK(determinism::format_iso8601(*t) == "2024-06-30T12:00:00Z");
    }
    SECTION("rejects other shapes") {
        CHECK_FALSE(determinism::parse_iso8601("").has_value());
        CHECK_FALSE(determinism::parse_iso8601("2024/06/30").has_value());
        CHECK_FALSE(determinism::parse_iso8601("2024-13-01").has_value());
        CHECK_FALSE(determinism::parse_iso8601("2024-06-30T12:00").has_value());
        CHECK_FALSE(determinism::parse_iso8601("unknown").has_value());
    }
}

TEST_CASE("Determinism context from config and environment", "[determinism][config]") {
    SECTION("config values") {
        const auto j = nlohmann::json::parse(R"({"enabled": true, "fixed_time": 1719705600, "seed": 7})");
        const auto ctx = determinism::context_from_json(j, "determinism");
        CHECK(ctx.enabled());
        CHECK(ctx.seed() == 7);
        CHECK(*ctx.fixed_time() == testsupport::kFixedTime);
    }
    SECTION("null config is live mode") {
        const auto ctx = determinism::context_from_json(nlohmann::json(), "determinism");
        CHECK_FALSE(ctx.enabled());
    }
    SECTION("enabled without values fails") {
        const auto j = nlohmann::json::parse(R"({"enabled": true})");
        CHECK_THROWS_AS(determinism::context_from_json(j, "determinism"), core::ConfigError);
    }
    SECTION("wrong type fails") {
        const auto j = nlohmann::json::parse(R"({"seed": "seven"})");
        CHECK_THROWS_AS(determinism::context_from_json(j, "determinism"), core::ConfigError);
    }
    SECTION("environment overrides the file") {
        ::setenv("SEED", "9", 1);
        const auto j = nlohmann::json::parse(R"({"enabled": true, "fixed_time": 1719705600, "seed": 7})");
        const auto ctx = determinism::context_from_json(j, "determinism");
        ::unsetenv("SEED");
        CHECK(ctx.seed() == 9);
    }
    SECTION("malformed environment value fails") {
        ::setenv("FIXED_TIME", "yesterday", 1);
        CHECK_THROWS_AS(determinism::context_from_json(nlohmann::json(), "determinism"), core::ConfigError);
        ::unsetenv("FIXED_TIME");
    }
}
