#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/CancelToken.hpp"
#include "nlohmann/json.hpp"
#include "sources/Provider.hpp"

namespace sources {

struct ResolverConfig {
    std::chrono::milliseconds search_timeout{30000};
    std::chrono::milliseconds download_timeout{120000};

    // timed-out calls a provider may still have running before it is skipped
    size_t max_abandoned_calls = 1;

    // provider id -> replacement tier (1..3)
    std::map<std::string, int> tier_overrides;
};

enum class ResolveState {
    Searching,
    Prioritizing,
    Downloading,
    Resolved,
    Exhausted
};

const char* resolve_state_str(ResolveState s);

struct FailedAttempt {
    std::string provider_id;
    int tier = 0;
    int priority_score = 0;
    std::string error;
};

struct Resolution {
    ResolvedDocument document;
    std::vector<FailedAttempt> failures;   // in attempt order
    std::vector<ResolveState> trace;       // Searching, Prioritizing, Downloading x n, Resolved
    size_t candidate_count = 0;

    size_t attempts() const { return failures.size() + 1; }

    nlohmann::json summary_json() const;
};

// Timed-out provider calls that are still running, per provider id.
struct CallTracker;

class CandidateResolver {
public:
    // Throws core::ConfigError on a bad tier override, timeout or call limit.
    CandidateResolver(ProviderTiers tiers, ResolverConfig cfg);

    // Fail-open: a provider that throws or times out contributes nothing.
    std::vector<SourceCandidate> search(const CompanyRef& company, int year,
                                        const core::CancelToken* cancel = nullptr) const;

    // Stable sort by (tier, priority_score).
    static std::vector<SourceCandidate> prioritize(std::vector<SourceCandidate> candidates);

    // First successful download wins; a download that times out is a failed
    // attempt. Throws core::ResolutionFailed when there is nothing to download
    // or every download failed.
    Resolution resolve_best(const CompanyRef& company, int year,
                            const core::CancelToken* cancel = nullptr) const;

    size_t abandoned_calls(const std::string& provider_id) const;

private:
    ProviderTiers m_tiers;
    ResolverConfig m_cfg;
    std::unordered_map<std::string, ProviderPtr> m_by_id;
    std::shared_ptr<CallTracker> m_calls;
};

}  // namespace sources
