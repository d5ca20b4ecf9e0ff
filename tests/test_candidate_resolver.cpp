#include "core/CancelToken.hpp"
#include "core/Errors.hpp"
#include "determinism/StableHash.hpp"
#include "sources/CandidateResolver.hpp"
#include "sources/LocalReportProvider.hpp"
#include "sources/ManifestProvider.hpp"
#include "sources/ProviderRegistry.hpp"

#include "TestSupport.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

using sources::CandidateResolver;
using sources::CompanyRef;
using sources::ResolveState;
using sources::SourceCandidate;

namespace {

// In-memory provider: one candidate per priority, downloads of the listed
// priorities fail, downloads of the slow priorities sleep first.
class StubProvider : public sources::Provider {
public:
    StubProvider(std::string id, std::vector<int> priorities, std::set<int> failing = {})
        : m_id(std::move(id)), m_priorities(std::move(priorities)), m_failing(std::move(failing)) {}

    const std::string& id() const override { return m_id; }
    bool enabled() const override { return m_enabled; }

    std::vector<SourceCandidate> search(const CompanyRef&, int, int tier) const override {
        if (m_search_delay.count() > 0) std::this_thread::sleep_for(m_search_delay);
        if (m_search_throws) throw core::ProviderError(m_id, "search backend down");

        std::vector<SourceCandidate> out;
        for (int p : m_priorities) {
            out.emplace_back(m_id, tier, p, sources::AccessMethod::Api, "text/plain",
                             "stub://" + m_id + "/" + std::to_string(p));
        }
        return out;
    }

    sources::ResolvedDocument download(const SourceCandidate& c) const override {
        ++downloads;
        if (m_slow.count(c.priority_score())) std::this_thread::sleep_for(m_download_delay);
        if (m_failing.count(c.priority_score())) {
            throw core::ProviderError(m_id, "HTTP 503 for priority " + std::to_string(c.priority_score()));
        }
        const std::string content = "report from " + m_id + " priority " + std::to_string(c.priority_score());
        return {c, *c.url(), content, determinism::stable_hash_hex(content), content.size()};
    }

    bool m_enabled = true;
    bool m_search_throws = false;
    std::chrono::milliseconds m_search_delay{0};
    std::set<int> m_slow;
    std::chrono::milliseconds m_download_delay{0};
    mutable std::atomic<int> downloads{0};

private:
    std::string m_id;
    std::vector<int> m_priorities;
    std::set<int> m_failing;
};

CompanyRef acme() {
    CompanyRef c;
    c.name = "Acme Corp";
    c.org_id = "acme";
    return c;
}

}  // namespace

TEST_CASE("prioritize orders by tier then priority, stably", "[resolver]") {
    std::vector<SourceCandidate> in;
    in.emplace_back("b", 2, 5, sources::AccessMethod::Api, "text/plain");
    in.emplace_back("a", 1, 20, sources::AccessMethod::Api, "text/plain");
    in.emplace_back("first", 1, 10, sources::AccessMethod::Api, "text/plain");
    in.emplace_back("second", 1, 10, sources::AccessMethod::Api, "text/plain");

    const auto out = CandidateResolver::prioritize(in);
    REQUIRE(out.size() == 4);
    CHECK(out[0].provider_id() == "first");
    CHECK(out[1].provider_id() == "second");
    CHECK(out[2].provider_id() == "a");
    CHECK(out[3].provider_id() == "b");
}

TEST_CASE("SourceCandidate validates its fields", "[resolver]") {
    CHECK_THROWS_AS(SourceCandidate("p", 0, 10, sources::AccessMethod::File, "text/plain"), core::InvalidInput);
    CHECK_THROWS_AS(SourceCandidate("p", 4, 10, sources::AccessMethod::File, "text/plain"), core::InvalidInput);
    CHECK_THROWS_AS(SourceCandidate("p", 1, 101, sources::AccessMethod::File, "text/plain"), core::InvalidInput);
    CHECK_THROWS_AS(SourceCandidate("", 1, 10, sources::AccessMethod::File, "text/plain"), core::InvalidInput);
    CHECK(SourceCandidate("p", 1, 10, sources::AccessMethod::File, "text/plain").with_tier(3).tier() == 3);
}

TEST_CASE("resolve_best falls back across failed downloads", "[resolver]") {
    auto p1 = std::make_shared<StubProvider>("tier1", std::vector<int>{10, 20}, std::set<int>{10, 20});
    auto p2 = std::make_shared<StubProvider>("tier2", std::vector<int>{5});

    const CandidateResolver resolver({{p1}, {p2}}, sources::ResolverConfig());
    const auto res = resolver.resolve_best(acme(), 2023);

    CHECK(res.document.candidate.provider_id() == "tier2");
    CHECK(res.document.candidate.tier() == 2);
    CHECK(res.document.candidate.priority_score() == 5);
    CHECK(res.candidate_count == 3);
    CHECK(res.attempts() == 3);

    REQUIRE(res.failures.size() == 2);
    CHECK(res.failures[0].priority_score == 10);
    CHECK(res.failures[1].priority_score == 20);
    CHECK(res.failures[0].error.find("HTTP 503") != std::string::npos);

    const std::vector<ResolveState> expected{
        ResolveState::Searching, ResolveState::Prioritizing, ResolveState::Downloading,
        ResolveState::Downloading, ResolveState::Downloading, ResolveState::Resolved};
    CHECK(res.trace == expected);

    const auto j = res.summary_json();
    CHECK(j["provider"] == "tier2");
    CHECK(j["attempts"] == 3);
    CHECK(j["failures"].size() == 2);
}

TEST_CASE("resolve_best stops at the first success", "[resolver]") {
    auto p1 = std::make_shared<StubProvider>("tier1", std::vector<int>{10, 20});
    const CandidateResolver resolver({{p1}}, sources::ResolverConfig());

    const auto res = resolver.resolve_best(acme(), 2023);
    CHECK(res.document.candidate.priority_score() == 10);
    CHECK(res.failures.empty());
    CHECK(p1->downloads.load() == 1);
}

TEST_CASE("resolve_best reports exhaustion", "[resolver]") {
    SECTION("no candidates at all") {
        auto empty = std::make_shared<StubProvider>("empty", std::vector<int>{});
        const CandidateResolver resolver({{empty}}, sources::ResolverConfig());
        try {
            resolver.resolve_best(acme(), 2023);
            FAIL("expected ResolutionFailed");
        } catch (const core::ResolutionFailed& e) {
            CHECK(e.attempts() == 0);
            CHECK(core::error_kind(e) == "resolution_failed");
        }
    }
    SECTION("every download fails") {
        auto p = std::make_shared<StubProvider>("flaky", std::vector<int>{1, 2, 3}, std::set<int>{1, 2, 3});
        const CandidateResolver resolver({{p}}, sources::ResolverConfig());
        try {
            resolver.resolve_best(acme(), 2023);
            FAIL("expected ResolutionFailed");
        } catch (const core::ResolutionFailed& e) {
            CHECK(e.attempts() == 3);
            CHECK(e.last_error().find("priority 3") != std::string::npos);
            CHECK(p->downloads.load() == 3);
        }
    }
}

TEST_CASE("search is fail-open", "[resolver]") {
    SECTION("throwing provider contributes nothing") {
        auto bad = std::make_shared<StubProvider>("bad", std::vector<int>{1});
        bad->m_search_throws = true;
        auto good = std::make_shared<StubProvider>("good", std::vector<int>{30});

        const CandidateResolver resolver({{bad, good}}, sources::ResolverConfig());
        const auto found = resolver.search(acme(), 2023);
        REQUIRE(found.size() == 1);
        CHECK(found[0].provider_id() == "good");
    }
    SECTION("slow provider times out") {
        auto slow = std::make_shared<StubProvider>("slow", std::vector<int>{1});
        slow->m_search_delay = std::chrono::milliseconds(400);
        auto fast = std::make_shared<StubProvider>("fast", std::vector<int>{30});

        sources::ResolverConfig cfg;
        cfg.search_timeout = std::chrono::milliseconds(50);
        const CandidateResolver resolver({{slow, fast}}, cfg);

        const auto found = resolver.search(acme(), 2023);
        REQUIRE(found.size() == 1);
        CHECK(found[0].provider_id() == "fast");
    }
    SECTION("disabled provider is skipped") {
        auto off = std::make_shared<StubProvider>("off", std::vector<int>{1});
        off->m_enabled = false;
        const CandidateResolver resolver({{off}}, sources::ResolverConfig());
        CHECK(resolver.search(acme(), 2023).empty());
    }
}

TEST_CASE("slow downloads time out and the provider is held back", "[resolver][timeout]") {
    auto slow = std::make_shared<StubProvider>("slow", std::vector<int>{10, 20});
    slow->m_slow = {10};
    slow->m_download_delay = std::chrono::milliseconds(300);
    auto backup = std::make_shared<StubProvider>("backup", std::vector<int>{5});

    sources::ResolverConfig cfg;
    cfg.download_timeout = std::chrono::milliseconds(50);
    const CandidateResolver resolver({{slow}, {backup}}, cfg);

    const auto res = resolver.resolve_best(acme(), 2023);
    CHECK(res.document.candidate.provider_id() == "backup");
    REQUIRE(res.failures.size() == 2);
    CHECK(res.failures[0].priority_score == 10);
    CHECK(res.failures[0].error == "provider slow: download timed out after 50ms");
    CHECK(res.failures[1].priority_score == 20);
    CHECK(res.failures[1].error == "provider slow: still busy with a timed-out download");

    // the second slow candidate never reached the provider
    CHECK(slow->downloads.load() == 1);
    CHECK(resolver.abandoned_calls("slow") == 1);
    CHECK(resolver.abandoned_calls("backup") == 0);

    SECTION("a busy provider is skipped by search") {
        const auto found = resolver.search(acme(), 2023);
        REQUIRE(found.size() == 1);
        CHECK(found[0].provider_id() == "backup");
    }
    SECTION("the provider is released once the call returns") {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (resolver.abandoned_calls("slow") > 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        CHECK(resolver.abandoned_calls("slow") == 0);
        CHECK(resolver.search(acme(), 2023).size() == 3);
    }
}

TEST_CASE("resolver rejects bad timeouts", "[resolver][config]") {
    auto p = std::make_shared<StubProvider>("p", std::vector<int>{10});

    sources::ResolverConfig cfg;
    cfg.download_timeout = std::chrono::milliseconds(0);
    CHECK_THROWS_AS(CandidateResolver({{p}}, cfg), core::ConfigError);

    cfg = sources::ResolverConfig();
    cfg.max_abandoned_calls = 0;
    CHECK_THROWS_AS(CandidateResolver({{p}}, cfg), core::ConfigError);
}

TEST_CASE("tier overrides move a provider's candidates", "[resolver][config]") {
    auto p1 = std::make_shared<StubProvider>("primary", std::vector<int>{10});
    auto p2 = std::make_shared<StubProvider>("backup", std::vector<int>{5});

    SECTION("override promotes the backup") {
        sources::ResolverConfig cfg;
        cfg.tier_overrides["backup"] = 1;
        const CandidateResolver resolver({{p1}, {p2}}, cfg);

        const auto res = resolver.resolve_best(acme(), 2023);
        CHECK(res.document.candidate.provider_id() == "backup");
        CHECK(res.document.candidate.tier() == 1);
    }
    SECTION("override outside 1..3 is rejected") {
        sources::ResolverConfig cfg;
        cfg.tier_overrides["backup"] = 4;
        CHECK_THROWS_AS(CandidateResolver({{p1}, {p2}}, cfg), core::ConfigError);
    }
}

TEST_CASE("resolve_best honours cancellation", "[resolver][cancel]") {
    auto p = std::make_shared<StubProvider>("p", std::vector<int>{10});
    const CandidateResolver resolver({{p}}, sources::ResolverConfig());

    core::CancelToken token;
    token.cancel();
    CHECK_THROWS_AS(resolver.resolve_best(acme(), 2023, &token), core::Cancelled);
    CHECK(p->downloads.load() == 0);
}

TEST_CASE("LocalReportProvider scans <root>/<org>/<year>", "[resolver][providers]") {
    const auto root = testsupport::temp_dir("local_reports");
    testsupport::write_file(root / "acme" / "2023" / "report.txt", "Scope 1 emissions fell.");
    testsupport::write_file(root / "acme" / "2023" / "data.json", R"({"pages": ["x"]})");
    testsupport::write_file(root / "acme" / "2023" / "empty.txt", "");
    testsupport::write_file(root / "acme" / "2022" / "old.txt", "old");

    const sources::LocalReportProvider provider("disk", root.string());
    const auto found = provider.search(acme(), 2023, 2);
    REQUIRE(found.size() == 3);
    CHECK(found[0].title() == "data.json");
    CHECK(found[0].priority_score() == 5);
    CHECK(found[0].content_type() == "application/json");
    CHECK(found[1].title() == "empty.txt");
    CHECK(found[2].title() == "report.txt");
    CHECK(found[2].priority_score() == 30);
    CHECK(found[2].tier() == 2);

    const auto doc = provider.download(found[2]);
    CHECK(doc.content == "Scope 1 emissions fell.");
    CHECK(doc.byte_length == doc.content.size());
    CHECK(doc.content_hash == determinism::stable_hash_hex(doc.content));

    CHECK_THROWS_AS(provider.download(found[1]), core::ProviderError);
    CHECK(provider.search(acme(), 2021, 1).empty());
}

TEST_CASE("ManifestProvider lists known reports", "[resolver][providers]") {
    const auto dir = testsupport::temp_dir("manifest");
    testsupport::write_file(dir / "files" / "acme-2023.txt", "Acme sustainability report");
    testsupport::write_file(dir / "manifest.json", R"({
        "reports": [
            {"company": "Acme Corp", "year": 2023, "path": "files/acme-2023.txt", "priority_score": 15},
            {"company": "ACME CORP", "year": 2023, "url": "https://example.com/acme.pdf", "content_type": "application/pdf"},
            {"company": "Other Inc", "org_id": "other", "year": 2023, "path": "files/other.txt"}
        ]
    })");

    const sources::ManifestProvider provider("manifest", (dir / "manifest.json").string());
    CHECK(provider.size() == 3);

    CompanyRef by_name;
    by_name.name = "acme corp";
    const auto found = provider.search(by_name, 2023, 1);
    REQUIRE(found.size() == 2);
    CHECK(found[0].priority_score() == 15);
    CHECK(found[0].access() == sources::AccessMethod::File);
    CHECK(found[1].access() == sources::AccessMethod::Api);

    CHECK(provider.download(found[0]).content == "Acme sustainability report");
    CHECK_THROWS_AS(provider.download(found[1]), core::ProviderError);

    SECTION("manifest problems are config errors") {
        testsupport::write_file(dir / "bad.json", R"({"entries": []})");
        CHECK_THROWS_AS(sources::ManifestProvider("m", (dir / "bad.json").string()), core::ConfigError);

        testsupport::write_file(dir / "nolocation.json", R"({"reports": [{"company": "A", "year": 2023}]})");
        CHECK_THROWS_AS(sources::ManifestProvider("m", (dir / "nolocation.json").string()), core::ConfigError);
    }
}

TEST_CASE("Provider registry builds tiers from specs", "[resolver][providers][config]") {
    CHECK(sources::parse_provider_kind("manifest") == sources::ProviderKind::Manifest);
    CHECK_THROWS_AS(sources::parse_provider_kind("ftp"), core::ConfigError);

    sources::ProviderSpec a{sources::ProviderKind::LocalReports, "disk", "/tmp/does-not-matter", true};
    sources::ProviderSpec b{sources::ProviderKind::LocalReports, "disk", "/tmp/elsewhere", true};
    CHECK_THROWS_AS(sources::make_provider_tiers({{a}, {b}}), core::ConfigError);

    b.id = "disk2";
    const auto tiers = sources::make_provider_tiers({{a}, {b}});
    REQUIRE(tiers.size() == 2);
    CHECK(tiers[1][0]->id() == "disk2");
}

TEST_CASE("CompanyRef key falls back to a name slug", "[resolver]") {
    CompanyRef c;
    c.name = "Acme Corp. (Holdings)";
    CHECK(c.key() == "acme-corp-holdings");
    c.org_id = "ACME-1";
    CHECK(c.key() == "ACME-1");
}
