#include "sources/SourceCandidate.hpp"

#include "core/Errors.hpp"

#include <cctype>
#include <sstream>

namespace sources {

const char* access_method_str(AccessMethod m) {
    switch (m) {
        case AccessMethod::Api: return "api";
        case AccessMethod::Scrape: return "scrape";
        case AccessMethod::File: return "file";
        default: return "unknown";
    }
}

std::string CompanyRef::key() const {
    if (!org_id.empty()) return org_id;

    std::string out;
    bool prev_dash = true;
    for (unsigned char ch : name) {
        if (std::isalnum(ch)) {
            out.push_back((char)std::tolower(ch));
            prev_dash = false;
        } else if (!prev_dash) {
            out.push_back('-');
            prev_dash = true;
        }
    }
    if (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

SourceCandidate::SourceCandidate(std::string provider_id,
                                 int tier,
                                 int priority_score,
                                 AccessMethod access,
                                 std::string content_type,
                                 std::optional<std::string> url,
                                 std::optional<std::string> local_path,
                                 std::string title)
    : m_provider_id(std::move(provider_id)),
      m_tier(tier),
      m_priority_score(priority_score),
      m_access(access),
      m_content_type(std::move(content_type)),
      m_url(std::move(url)),
      m_local_path(std::move(local_path)),
      m_title(std::move(title)) {
    if (m_provider_id.empty()) {
        throw core::InvalidInput("source candidate has empty provider id");
    }
    if (m_tier < 1 || m_tier > 3) {
        std::ostringstream oss;
        oss << "source candidate tier must be in [1,3], got " << m_tier << " (provider " << m_provider_id << ")";
        throw core::InvalidInput(oss.str());
    }
    if (m_priority_score < 0 || m_priority_score > 100) {
        std::ostringstream oss;
        oss << "source candidate priority_score must be in [0,100], got " << m_priority_score
            << " (provider " << m_provider_id << ")";
        throw core::InvalidInput(oss.str());
    }
    if (m_content_type.empty()) {
        throw core::InvalidInput("source candidate has empty content type (provider " + m_provider_id + ")");
    }
}

SourceCandidate SourceCandidate::with_tier(int tier) const {
    return SourceCandidate(m_provider_id, tier, m_priority_score, m_access, m_content_type, m_url, m_local_path, m_title);
}

nlohmann::json SourceCandidate::to_json() const {
    nlohmann::json j;
    j["provider"] = m_provider_id;
    j["tier"] = m_tier;
    j["priority_score"] = m_priority_score;
    j["access"] = access_method_str(m_access);
    j["content_type"] = m_content_type;
    j["url"] = m_url ? nlohmann::json(*m_url) : nlohmann::json(nullptr);
    j["local_path"] = m_local_path ? nlohmann::json(*m_local_path) : nlohmann::json(nullptr);
    j["title"] = m_title;
    return j;
}

}  // namespace sources
