#include "rank/LexicalIndex.hpp"

#include <catch2/catch.hpp>

using rank::IndexedText;
using rank::LexicalIndex;

static std::vector<IndexedText> corpus() {
    return {
        {"d1", "Scope 1 and scope 2 emissions fell by 12 percent against the 2019 baseline."},
        {"d2", "Our water stewardship program covers every manufacturing site."},
        {"d3", "Scope 3 emissions from purchased goods dominate our footprint."},
        {"d4", "Board oversight of climate risk is reviewed annually."},
    };
}

TEST_CASE("LexicalIndex scores follow input order", "[rank][lexical]") {
    const LexicalIndex index(corpus());
    REQUIRE(index.size() == 4);

    const auto s = index.scores("scope 3 emissions");
    REQUIRE(s.size() == 4);
    CHECK(s[2] > s[0]);
    CHECK(s[0] > 0.0);
    CHECK(s[1] == 0.0);
    CHECK(s[3] == 0.0);
    for (double x : s) {
        CHECK(x >= 0.0);
        CHECK(x <= 1.0);
    }
}

TEST_CASE("LexicalIndex handles queries with no known terms", "[rank][lexical]") {
    const LexicalIndex index(corpus());
    for (double x : index.scores("biodiversity offsets")) CHECK(x == 0.0);
}

TEST_CASE("LexicalIndex scores identical texts identically", "[rank][lexical]") {
    const LexicalIndex index({
        {"b", "net zero target"},
        {"a", "net zero target"},
        {"c", "unrelated text here"},
    });

    const auto s = index.scores("net zero");
    REQUIRE(s.size() == 3);
    CHECK(s[0] > 0.0);
    CHECK(s[0] == s[1]);
    CHECK(s[2] == 0.0);
}

TEST_CASE("LexicalIndex exact match scores at most 1", "[rank][lexical]") {
    const LexicalIndex index(std::vector<IndexedText>{{"only", "renewable electricity share"}});
    const auto s = index.scores("renewable electricity share");
    REQUIRE(s.size() == 1);
    CHECK(s[0] == Approx(1.0));
    CHECK(s[0] <= 1.0);
}

TEST_CASE("LexicalIndex is repeatable", "[rank][lexical][determinism]") {
    const LexicalIndex a(corpus());
    const LexicalIndex b(corpus());
    CHECK(a.scores("emissions baseline") == b.scores("emissions baseline"));
}
