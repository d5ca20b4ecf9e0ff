#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sources/Provider.hpp"

namespace sources {

// Known reports listed in a JSON manifest:
// {"reports": [{"company", "org_id", "year", "priority_score", "content_type", "path", "url", "title"}]}
// Relative paths resolve against the manifest's directory.
class ManifestProvider : public Provider {
public:
    // Loads and validates the manifest. Throws core::ConfigError.
    ManifestProvider(std::string id, const std::string& manifest_path, bool enabled = true);

    const std::string& id() const override { return m_id; }
    bool enabled() const override { return m_enabled; }

    std::vector<SourceCandidate> search(const CompanyRef& company, int year, int tier) const override;
    ResolvedDocument download(const SourceCandidate& candidate) const override;

    size_t size() const { return m_entries.size(); }

private:
    struct Entry {
        std::string company;
        std::string org_id;
        int year = 0;
        int priority_score = 100;
        std::string content_type;
        std::optional<std::string> path;
        std::optional<std::string> url;
        std::string title;
    };

    std::string m_id;
    bool m_enabled = true;
    std::vector<Entry> m_entries;
};

}  // namespace sources
