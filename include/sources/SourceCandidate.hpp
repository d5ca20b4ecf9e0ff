#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace sources {

enum class AccessMethod {
    Api,
    Scrape,
    File
};

const char* access_method_str(AccessMethod m);

struct CompanyRef {
    std::string name;
    std::string org_id;   // stable id used for storage paths; defaults to a slug of name
    std::string cik;
    std::string ticker;

    // org_id if set, otherwise lowercase name with non-alnum runs turned into '-'
    std::string key() const;
};

// One provider's pointer to a possible report. Immutable once built.
class SourceCandidate {
public:
    // Throws core::InvalidInput on tier outside 1..3, priority outside 0..100,
    // or an empty provider id / content type.
    SourceCandidate(std::string provider_id,
                    int tier,
                    int priority_score,
                    AccessMethod access,
                    std::string content_type,
                    std::optional<std::string> url = std::nullopt,
                    std::optional<std::string> local_path = std::nullopt,
                    std::string title = "");

    const std::string& provider_id() const { return m_provider_id; }
    int tier() const { return m_tier; }
    int priority_score() const { return m_priority_score; }
    AccessMethod access() const { return m_access; }
    const std::string& content_type() const { return m_content_type; }
    const std::optional<std::string>& url() const { return m_url; }
    const std::optional<std::string>& local_path() const { return m_local_path; }
    const std::string& title() const { return m_title; }

    // Same candidate with a different tier (tier_overrides).
    SourceCandidate with_tier(int tier) const;

    nlohmann::json to_json() const;

private:
    std::string m_provider_id;
    int m_tier = 1;
    int m_priority_score = 100;
    AccessMethod m_access = AccessMethod::File;
    std::string m_content_type;
    std::optional<std::string> m_url;
    std::optional<std::string> m_local_path;
    std::string m_title;
};

struct ResolvedDocument {
    SourceCandidate candidate;
    std::string handle;         // local path or url the bytes were read from
    std::string content;
    std::string content_hash;   // stable_hash_hex(content)
    size_t byte_length = 0;
};

}  // namespace sources
