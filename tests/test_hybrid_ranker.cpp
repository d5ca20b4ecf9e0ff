#include "core/Errors.hpp"
#include "rank/HybridRanker.hpp"

#include "TestSupport.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <map>

using rank::HybridRanker;
using rank::RankCandidate;
using rank::RankedResult;

namespace {

// Fixed semantic scores keyed by text.
class TableScorer : public rank::SemanticScorer {
public:
    explicit TableScorer(std::map<std::string, double> table) : m_table(std::move(table)) {}

    double semantic_score(const std::string&, const std::string& text) const override {
        auto it = m_table.find(text);
        return it == m_table.end() ? 0.0 : it->second;
    }
    const char* name() const override { return "table"; }

private:
    std::map<std::string, double> m_table;
};

class ConstantEmbedder : public rank::TextEmbedder {
public:
    explicit ConstantEmbedder(std::vector<float> v) : m_v(std::move(v)) {}
    std::vector<float> embed(const std::string&) const override { return m_v; }

private:
    std::vector<float> m_v;
};

RankCandidate cand(const std::string& id, const std::string& text, double lexical) {
    RankCandidate c;
    c.doc_id = id;
    c.text = text;
    c.lexical_score = lexical;
    return c;
}

std::vector<std::string> ids(const std::vector<RankedResult>& rs) {
    std::vector<std::string> out;
    for (const auto& r : rs) out.push_back(r.doc_id);
    return out;
}

}  // namespace

TEST_CASE("rank fuses lexical and semantic scores", "[rank][hybrid]") {
    const auto ctx = testsupport::fixed_ctx();
    auto scorer = std::make_shared<TableScorer>(std::map<std::string, double>{{"x", 0.2}, {"y", 0.9}});
    const HybridRanker ranker(ctx, scorer);

    const auto out = ranker.rank("q", {cand("lex", "x", 0.8), cand("sem", "y", 0.1)}, 0.5, 10);
    REQUIRE(out.size() == 2);

    for (const auto& r : out) {
        CHECK(r.fused_score == Approx(0.5 * r.lexical_score + 0.5 * r.semantic_score));
        CHECK(r.semantic_score >= 0.0);
        CHECK(r.semantic_score <= 1.0);
    }
    CHECK(out[0].rank == 0);
    CHECK(out[1].rank == 1);
    CHECK(rank::ranked_before(out[0], out[1]));
}

TEST_CASE("rank output is a strict total order", "[rank][hybrid]") {
    const auto ctx = testsupport::fixed_ctx();
    const HybridRanker ranker(ctx);

    std::vector<RankCandidate> cs;
    for (int i = 0; i < 20; ++i) {
        cs.push_back(cand("doc-" + std::to_string(i), "scope emissions report " + std::to_string(i % 3), (i % 4) * 0.25));
    }

    const auto out = ranker.rank("scope emissions", cs, 0.6, 20);
    REQUIRE(out.size() == 20);
    for (size_t i = 1; i < out.size(); ++i) {
        CHECK(rank::ranked_before(out[i - 1], out[i]));
        CHECK_FALSE(rank::ranked_before(out[i], out[i - 1]));
    }
}

TEST_CASE("equal fused scores resolve identically on every run", "[rank][hybrid][determinism]") {
    const auto ctx = testsupport::fixed_ctx();
    const HybridRanker ranker(ctx);

    const std::vector<RankCandidate> cs{cand("A", "same text", 0.9), cand("B", "same text", 0.9)};
    const auto first = ranker.rank("emissions target", cs, 1.0, 2);
    REQUIRE(first.size() == 2);
    CHECK(first[0].fused_score == first[1].fused_score);

    for (int i = 0; i < 100; ++i) {
        CHECK(ids(ranker.rank("emissions target", cs, 1.0, 2)) == ids(first));
    }

    // a second ranker with the same seed agrees
    const HybridRanker again(testsupport::fixed_ctx());
    CHECK(ids(again.rank("emissions target", cs, 1.0, 2)) == ids(first));
}

TEST_CASE("raising a lexical score never lowers the rank", "[rank][hybrid]") {
    const auto ctx = testsupport::fixed_ctx();
    auto scorer = std::make_shared<TableScorer>(std::map<std::string, double>{
        {"a", 0.9}, {"b", 0.1}, {"c", 0.5}, {"d", 0.3}, {"e", 0.7}, {"t", 0.4}});
    const HybridRanker ranker(ctx, scorer);

    auto position = [](const std::vector<RankedResult>& rs, const std::string& id) {
        for (const auto& r : rs) {
            if (r.doc_id == id) return r.rank;
        }
        return rs.size();
    };

    for (double alpha : {0.0, 0.25, 0.5, 0.75, 1.0}) {
        size_t last = std::numeric_limits<size_t>::max();
        for (int step = 0; step <= 10; ++step) {
            const double lex = step * 0.1;
            INFO("alpha " << alpha << " lexical " << lex);

            const std::vector<RankCandidate> cs{
                cand("a", "a", 0.2), cand("b", "b", 0.8), cand("t", "t", lex),
                cand("c", "c", 0.5), cand("d", "d", 0.6), cand("e", "e", 0.4)};
            const auto out = ranker.rank("emissions target", cs, alpha, cs.size());

            const size_t pos = position(out, "t");
            REQUIRE(pos < out.size());
            CHECK(pos <= last);
            last = pos;
        }
        if (alpha == 1.0) CHECK(last == 0);
    }
}

TEST_CASE("complete ties fall back to doc id", "[rank][hybrid]") {
    RankedResult a;
    a.doc_id = "a";
    a.fused_score = 0.5;
    RankedResult b = a;
    b.doc_id = "b";
    CHECK(rank::ranked_before(a, b));
    CHECK_FALSE(rank::ranked_before(b, a));
    CHECK_FALSE(rank::ranked_before(a, a));
}

TEST_CASE("tie perturbation is bounded and seeded", "[rank][hybrid][determinism]") {
    const HybridRanker r42(testsupport::fixed_ctx(42));
    const HybridRanker r43(testsupport::fixed_ctx(43));

    bool any_differs = false;
    for (size_t i = 0; i < 50; ++i) {
        const double p = r42.tie_perturbation("q", i);
        CHECK(p >= 0.0);
        CHECK(p < 0.001);
        CHECK(p == r42.tie_perturbation("q", i));
        if (p != r43.tie_perturbation("q", i)) any_differs = true;
    }
    CHECK(any_differs);
}

TEST_CASE("rank rejects invalid input", "[rank][hybrid][errors]") {
    const auto ctx = testsupport::fixed_ctx();
    const HybridRanker ranker(ctx);
    const std::vector<RankCandidate> one{cand("a", "text", 0.5)};

    SECTION("empty candidates") {
        CHECK_THROWS_AS(ranker.rank("q", {}, 0.5, 5), core::InvalidInput);
    }
    SECTION("alpha outside [0,1]") {
        CHECK_THROWS_AS(ranker.rank("q", one, -0.1, 5), core::InvalidInput);
        CHECK_THROWS_AS(ranker.rank("q", one, 1.5, 5), core::InvalidInput);
        CHECK_THROWS_AS(ranker.rank("q", one, std::nan(""), 5), core::InvalidInput);
    }
    SECTION("non-finite lexical score") {
        const std::vector<RankCandidate> bad{cand("a", "text", std::numeric_limits<double>::quiet_NaN())};
        CHECK_THROWS_AS(ranker.rank("q", bad, 0.5, 5), core::InvalidInput);
    }
    SECTION("non-finite semantic score") {
        auto scorer = std::make_shared<TableScorer>(
            std::map<std::string, double>{{"text", std::numeric_limits<double>::infinity()}});
        const HybridRanker inf_ranker(ctx, scorer);
        try {
            inf_ranker.rank("q", one, 0.5, 5);
            FAIL("expected InvalidInput");
        } catch (const core::InvalidInput& e) {
            CHECK(std::string(e.what()).find("nan/inf") != std::string::npos);
        }
    }
}

TEST_CASE("rank k bounds", "[rank][hybrid]") {
    const auto ctx = testsupport::fixed_ctx();
    const HybridRanker ranker(ctx);
    const std::vector<RankCandidate> cs{cand("a", "x", 0.9), cand("b", "y", 0.5), cand("c", "z", 0.1)};

    CHECK(ranker.rank("q", cs, 0.5, 0).empty());
    CHECK(ranker.rank("q", cs, 0.5, 2).size() == 2);
    CHECK(ranker.rank("q", cs, 0.5, 50).size() == 3);
}

TEST_CASE("out-of-range scores are clamped", "[rank][hybrid]") {
    const auto ctx = testsupport::fixed_ctx();
    auto scorer = std::make_shared<TableScorer>(std::map<std::string, double>{{"hi", 3.0}, {"lo", -2.0}});
    const HybridRanker ranker(ctx, scorer);

    const auto out = ranker.rank("q", {cand("a", "hi", 7.0), cand("b", "lo", -1.0)}, 0.5, 2);
    REQUIRE(out.size() == 2);
    CHECK(out[0].doc_id == "a");
    CHECK(out[0].lexical_score == 1.0);
    CHECK(out[0].semantic_score == 1.0);
    CHECK(out[1].lexical_score == 0.0);
    CHECK(out[1].semantic_score >= 0.0);
}

TEST_CASE("embedding scorer maps cosine into [0,1]", "[rank][semantic]") {
    const ConstantEmbedder unit({1.0f, 0.0f});
    const rank::EmbeddingSemanticScorer scorer(unit);
    CHECK(scorer.semantic_score("a", "b") == Approx(1.0));

    const ConstantEmbedder empty({});
    CHECK(rank::EmbeddingSemanticScorer(empty).semantic_score("a", "b") == 0.0);

    const ConstantEmbedder broken({std::numeric_limits<float>::quiet_NaN()});
    const auto ctx = testsupport::fixed_ctx();
    const HybridRanker ranker(ctx, std::make_shared<rank::EmbeddingSemanticScorer>(broken));
    CHECK_THROWS_AS(ranker.rank("q", {cand("a", "t", 0.5)}, 0.5, 1), core::InvalidInput);
}

TEST_CASE("token overlap scorer is Jaccard", "[rank][semantic]") {
    const rank::TokenOverlapScorer s;
    CHECK(s.semantic_score("net zero", "net zero") == 1.0);
    CHECK(s.semantic_score("net zero", "zero waste") == Approx(1.0 / 3.0));
    CHECK(std::string(s.name()) == "token_overlap");
}
