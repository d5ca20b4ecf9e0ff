#include "sources/CandidateResolver.hpp"

#include "core/Errors.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace sources {

const char* resolve_state_str(ResolveState s) {
    switch (s) {
        case ResolveState::Searching: return "searching";
        case ResolveState::Prioritizing: return "prioritizing";
        case ResolveState::Downloading: return "downloading";
        case ResolveState::Resolved: return "resolved";
        case ResolveState::Exhausted: return "exhausted";
        default: return "unknown";
    }
}

nlohmann::json Resolution::summary_json() const {
    nlohmann::json j;
    j["provider"] = document.candidate.provider_id();
    j["tier"] = document.candidate.tier();
    j["priority_score"] = document.candidate.priority_score();
    j["handle"] = document.handle;
    j["content_hash"] = document.content_hash;
    j["byte_length"] = document.byte_length;
    j["candidate_count"] = candidate_count;
    j["attempts"] = attempts();

    nlohmann::json failed = nlohmann::json::array();
    for (const auto& f : failures) {
        failed.push_back({
            {"provider", f.provider_id},
            {"tier", f.tier},
            {"priority_score", f.priority_score},
            {"error", f.error}
        });
    }
    j["failures"] = failed;
    return j;
}

static void warn(const std::string& msg) {
    std::ostringstream oss;
    oss << "CandidateResolver: " << msg << "\n";
    std::cerr << oss.str();
}

struct CallTracker {
    std::mutex mu;
    std::unordered_map<std::string, size_t> abandoned;
    size_t limit = 1;
};

namespace {

// Guarded by CallTracker::mu.
struct CallState {
    bool done = false;
    bool abandoned = false;
};

}  // namespace

CandidateResolver::CandidateResolver(ProviderTiers tiers, ResolverConfig cfg)
    : m_tiers(std::move(tiers)), m_cfg(std::move(cfg)), m_calls(std::make_shared<CallTracker>()) {
    for (const auto& kv : m_cfg.tier_overrides) {
        if (kv.second < 1 || kv.second > 3) {
            throw core::ConfigError("tier override for " + kv.first + " must be in [1,3]");
        }
    }
    if (m_cfg.search_timeout.count() <= 0) {
        throw core::ConfigError("search timeout must be positive");
    }
    if (m_cfg.download_timeout.count() <= 0) {
        throw core::ConfigError("download timeout must be positive");
    }
    if (m_cfg.max_abandoned_calls < 1) {
        throw core::ConfigError("max abandoned calls must be >= 1");
    }
    m_calls->limit = m_cfg.max_abandoned_calls;
    for (const auto& tier : m_tiers) {
        for (const auto& p : tier) {
            if (!p) throw core::ConfigError("null provider in tier list");
            m_by_id[p->id()] = p;
        }
    }
}

size_t CandidateResolver::abandoned_calls(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lock(m_calls->mu);
    auto it = m_calls->abandoned.find(provider_id);
    return it == m_calls->abandoned.end() ? 0 : it->second;
}

// Runs one provider call on its own thread and waits at most `timeout`.
// A call that times out keeps running detached (holding the provider and the
// tracker alive) and counts against the provider until it returns; while the
// provider is at its limit, new calls fail fast with ProviderError.
template <typename T, typename Fn>
static T run_bounded(const std::shared_ptr<CallTracker>& tracker,
                     const std::string& provider_id,
                     std::chrono::milliseconds timeout,
                     const char* what,
                     Fn fn) {
    {
        std::lock_guard<std::mutex> lock(tracker->mu);
        if (tracker->abandoned[provider_id] >= tracker->limit) {
            throw core::ProviderError(provider_id, std::string("still busy with a timed-out ") + what);
        }
    }

    auto promise = std::make_shared<std::promise<T>>();
    auto state = std::make_shared<CallState>();
    std::future<T> fut = promise->get_future();

    std::thread([tracker, provider_id, promise, state, fn]() {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        std::lock_guard<std::mutex> lock(tracker->mu);
        state->done = true;
        if (state->abandoned) --tracker->abandoned[provider_id];
    }).detach();

    if (fut.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(tracker->mu);
        if (!state->done) {
            state->abandoned = true;
            ++tracker->abandoned[provider_id];

            std::ostringstream oss;
            oss << what << " timed out after " << timeout.count() << "ms";
            throw core::ProviderError(provider_id, oss.str());
        }
    }
    return fut.get();
}

std::vector<SourceCandidate> CandidateResolver::search(const CompanyRef& company, int year,
                                                       const core::CancelToken* cancel) const {
    std::vector<SourceCandidate> out;

    for (size_t t = 0; t < m_tiers.size(); ++t) {
        const int tier = (int)t + 1;

        for (const auto& provider : m_tiers[t]) {
            if (!provider->enabled()) continue;
            core::check_cancel(cancel, "search");

            std::vector<SourceCandidate> found;
            try {
                found = run_bounded<std::vector<SourceCandidate>>(
                    m_calls, provider->id(), m_cfg.search_timeout, "search",
                    [provider, company, year, tier]() { return provider->search(company, year, tier); });
            } catch (const std::exception& e) {
                warn("search skipped: " + std::string(e.what()));
                continue;
            }

            auto ov = m_cfg.tier_overrides.find(provider->id());
            for (auto& c : found) {
                if (ov != m_cfg.tier_overrides.end()) out.push_back(c.with_tier(ov->second));
                else out.push_back(std::move(c));
            }
        }
    }

    return out;
}

std::vector<SourceCandidate> CandidateResolver::prioritize(std::vector<SourceCandidate> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const SourceCandidate& a, const SourceCandidate& b) {
        if (a.tier() != b.tier()) return a.tier() < b.tier();
        return a.priority_score() < b.priority_score();
    });
    return candidates;
}

Resolution CandidateResolver::resolve_best(const CompanyRef& company, int year,
                                           const core::CancelToken* cancel) const {
    std::vector<ResolveState> trace;

    core::check_cancel(cancel, "search");
    trace.push_back(ResolveState::Searching);
    std::vector<SourceCandidate> found = search(company, year, cancel);

    core::check_cancel(cancel, "prioritize");
    trace.push_back(ResolveState::Prioritizing);
    const std::vector<SourceCandidate> ordered = prioritize(std::move(found));

    if (ordered.empty()) {
        warn("no candidates for " + company.name + " " + std::to_string(year));
        throw core::ResolutionFailed(0, "no candidates");
    }

    std::vector<FailedAttempt> failures;
    std::string last_error;

    for (const auto& c : ordered) {
        core::check_cancel(cancel, "download");
        trace.push_back(ResolveState::Downloading);

        auto it = m_by_id.find(c.provider_id());
        if (it == m_by_id.end()) {
            last_error = "provider not registered: " + c.provider_id();
            failures.push_back({c.provider_id(), c.tier(), c.priority_score(), last_error});
            warn(last_error);
            continue;
        }

        try {
            const ProviderPtr provider = it->second;
            ResolvedDocument doc = run_bounded<ResolvedDocument>(
                m_calls, provider->id(), m_cfg.download_timeout, "download",
                [provider, c]() { return provider->download(c); });
            trace.push_back(ResolveState::Resolved);

            if (!failures.empty()) {
                std::ostringstream oss;
                oss << "resolved " << company.name << " " << year << " via " << c.provider_id()
                    << " after " << failures.size() << " failed attempt(s)";
                warn(oss.str());
            }
            return Resolution{std::move(doc), std::move(failures), std::move(trace), ordered.size()};
        } catch (const std::exception& e) {
            last_error = e.what();
            failures.push_back({c.provider_id(), c.tier(), c.priority_score(), last_error});

            std::ostringstream oss;
            oss << "download from " << c.provider_id() << " (tier " << c.tier()
                << ", priority " << c.priority_score() << ") failed: " << last_error;
            warn(oss.str());
        }
    }

    std::ostringstream oss;
    oss << "exhausted " << ordered.size() << " candidate(s) for " << company.name << " " << year;
    warn(oss.str());
    throw core::ResolutionFailed(failures.size(), last_error);
}

}  // namespace sources
