#include "sources/LocalReportProvider.hpp"

#include "core/Errors.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace sources {

LocalReportProvider::LocalReportProvider(std::string id, std::string root, bool enabled)
    : m_id(std::move(id)), m_root(std::move(root)), m_enabled(enabled) {}

std::vector<SourceCandidate> LocalReportProvider::search(const CompanyRef& company, int year, int tier) const {
    const fs::path dir = fs::path(m_root) / company.key() / std::to_string(year);

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return {};

    // directory_iterator order is unspecified
    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    std::vector<SourceCandidate> out;
    out.reserve(files.size());
    for (const auto& p : files) {
        const std::string ctype = content_type_for_extension(p.extension().string());
        out.emplace_back(m_id, tier, priority_for_content_type(ctype), AccessMethod::File, ctype,
                         std::nullopt, p.string(), p.filename().string());
    }
    return out;
}

ResolvedDocument LocalReportProvider::download(const SourceCandidate& candidate) const {
    if (candidate.provider_id() != m_id) {
        throw core::ProviderError(m_id, "candidate belongs to provider " + candidate.provider_id());
    }
    return read_local_document(candidate);
}

}  // namespace sources
