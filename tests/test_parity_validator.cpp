#include "core/Errors.hpp"
#include "scoring/ParityValidator.hpp"

#include <catch2/catch.hpp>

using scoring::check_parity;

TEST_CASE("parity passes when evidence is a subset of top-K", "[parity]") {
    const auto rep = check_parity("scope 3", {"d2", "d1"}, {"d1", "d2", "d3"});
    CHECK(rep.pass);
    CHECK(std::string(rep.verdict()) == "pass");
    CHECK(rep.missing_ids.empty());
    CHECK(rep.coverage == 1.0);
    CHECK_NOTHROW(scoring::enforce_parity(rep));
}

TEST_CASE("parity failure names exactly the missing ids", "[parity]") {
    const auto rep = check_parity("scope 3", {"d9", "d1", "d7", "d7"}, {"d1", "d2"});
    CHECK_FALSE(rep.pass);
    CHECK(std::string(rep.verdict()) == "fail");
    CHECK(rep.missing_ids == std::vector<std::string>{"d7", "d9"});
    CHECK(rep.coverage == Approx(1.0 / 3.0));

    try {
        scoring::enforce_parity(rep);
        FAIL("expected ParityViolation");
    } catch (const core::ParityViolation& e) {
        CHECK(e.missing_ids() == rep.missing_ids);
        CHECK(core::error_kind(e) == "parity_violation");
        CHECK(std::string(e.what()).find("d9") != std::string::npos);
    }
}

TEST_CASE("no evidence trivially passes", "[parity]") {
    const auto rep = check_parity("q", {}, {});
    CHECK(rep.pass);
    CHECK(rep.coverage == 1.0);
}

TEST_CASE("batch summary", "[parity]") {
    const std::vector<scoring::ParityReport> reports{
        check_parity("a", {"x"}, {"x"}),
        check_parity("b", {"y"}, {"x"}),
        check_parity("c", {}, {"x"}),
    };
    const auto s = scoring::summarize_parity(reports);
    CHECK_FALSE(s.pass);
    CHECK(s.passing == 2);
    CHECK(s.failing == 1);
    CHECK(s.to_json()["batch_verdict"] == "fail");

    CHECK(scoring::summarize_parity({reports[0]}).pass);
}

TEST_CASE("parity reports read back from JSON", "[parity]") {
    const auto rep = check_parity("q", {"a", "b"}, {"a"});
    const auto back = scoring::parity_report_from_json(rep.to_json(), "parity");
    CHECK(back.query == "q");
    CHECK_FALSE(back.pass);
    CHECK(back.missing_ids == rep.missing_ids);
    CHECK(back.coverage == rep.coverage);

    nlohmann::json bad = rep.to_json();
    bad["verdict"] = "maybe";
    CHECK_THROWS_AS(scoring::parity_report_from_json(bad, "parity"), core::ConfigError);
    bad.erase("verdict");
    CHECK_THROWS_AS(scoring::parity_report_from_json(bad, "parity"), core::ConfigError);
}
