#include "sources/ProviderRegistry.hpp"

#include "core/Errors.hpp"
#include "sources/LocalReportProvider.hpp"
#include "sources/ManifestProvider.hpp"

#include <memory>
#include <unordered_set>

namespace sources {

ProviderKind parse_provider_kind(const std::string& s) {
    if (s == "local_reports") return ProviderKind::LocalReports;
    if (s == "manifest") return ProviderKind::Manifest;
    throw core::ConfigError("unknown provider kind: " + s);
}

const char* provider_kind_str(ProviderKind k) {
    switch (k) {
        case ProviderKind::LocalReports: return "local_reports";
        case ProviderKind::Manifest: return "manifest";
        default: return "unknown";
    }
}

ProviderPtr make_provider(const ProviderSpec& spec) {
    if (spec.id.empty()) throw core::ConfigError("provider id must not be empty");
    if (spec.root.empty()) throw core::ConfigError("provider " + spec.id + " has no root");

    switch (spec.kind) {
        case ProviderKind::LocalReports:
            return std::make_shared<LocalReportProvider>(spec.id, spec.root, spec.enabled);
        case ProviderKind::Manifest:
            return std::make_shared<ManifestProvider>(spec.id, spec.root, spec.enabled);
    }
    throw core::ConfigError("unhandled provider kind for " + spec.id);
}

ProviderTiers make_provider_tiers(const std::vector<std::vector<ProviderSpec>>& specs) {
    ProviderTiers tiers;
    std::unordered_set<std::string> ids;

    for (const auto& tier_specs : specs) {
        std::vector<ProviderPtr> tier;
        for (const auto& spec : tier_specs) {
            if (!ids.insert(spec.id).second) {
                throw core::ConfigError("duplicate provider id: " + spec.id);
            }
            tier.push_back(make_provider(spec));
        }
        tiers.push_back(std::move(tier));
    }
    return tiers;
}

}  // namespace sources
