#pragma once

#include <string>
#include <vector>

#include "sources/Provider.hpp"

namespace sources {

// Reports laid out on disk as <root>/<org key>/<year>/<file>.
class LocalReportProvider : public Provider {
public:
    LocalReportProvider(std::string id, std::string root, bool enabled = true);

    const std::string& id() const override { return m_id; }
    bool enabled() const override { return m_enabled; }

    std::vector<SourceCandidate> search(const CompanyRef& company, int year, int tier) const override;
    ResolvedDocument download(const SourceCandidate& candidate) const override;

private:
    std::string m_id;
    std::string m_root;
    bool m_enabled = true;
};

}  // namespace sources
