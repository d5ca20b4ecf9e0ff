#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sources/SourceCandidate.hpp"

namespace sources {

// A place that can list and fetch sustainability reports.
// search/download may throw; the resolver absorbs those failures.
class Provider {
public:
    virtual ~Provider() = default;

    virtual const std::string& id() const = 0;
    virtual bool enabled() const = 0;

    // tier is the provider's position in the configured tier list (1-based)
    virtual std::vector<SourceCandidate> search(const CompanyRef& company, int year, int tier) const = 0;

    virtual ResolvedDocument download(const SourceCandidate& candidate) const = 0;
};

using ProviderPtr = std::shared_ptr<const Provider>;
using ProviderTiers = std::vector<std::vector<ProviderPtr>>;

// Reads candidate.local_path() into a ResolvedDocument. Throws core::ProviderError.
ResolvedDocument read_local_document(const SourceCandidate& candidate);

// ".pdf" -> "application/pdf" etc. Unknown -> "application/octet-stream".
std::string content_type_for_extension(const std::string& ext);

// lower is better: json 5, pdf 10, html 20, text 30, other 50
int priority_for_content_type(const std::string& content_type);

}  // namespace sources
