#pragma once

#include <string>
#include <vector>

#include "sources/Provider.hpp"

namespace sources {

enum class ProviderKind {
    LocalReports,
    Manifest
};

struct ProviderSpec {
    ProviderKind kind = ProviderKind::LocalReports;
    std::string id;
    std::string root;     // directory for local_reports, manifest file for manifest
    bool enabled = true;
};

// "local_reports" / "manifest". Throws core::ConfigError on anything else.
ProviderKind parse_provider_kind(const std::string& s);
const char* provider_kind_str(ProviderKind k);

ProviderPtr make_provider(const ProviderSpec& spec);

// One inner vector per tier, in tier order. Duplicate ids -> core::ConfigError.
ProviderTiers make_provider_tiers(const std::vector<std::vector<ProviderSpec>>& specs);

}  // namespace sources
