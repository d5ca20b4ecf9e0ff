#include "sources/ManifestProvider.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace sources {

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

ManifestProvider::ManifestProvider(std::string id, const std::string& manifest_path, bool enabled)
    : m_id(std::move(id)), m_enabled(enabled) {
    const jsonio::json j = jsonio::read_json_file(manifest_path);
    const std::string where = "manifest(" + m_id + ")";
    jsonio::require_object(j, where);

    const jsonio::json& reports = jsonio::require_field(j, "reports", where);
    jsonio::require_array(reports, where + ".reports");

    const fs::path base = fs::path(manifest_path).parent_path();

    for (size_t i = 0; i < reports.size(); ++i) {
        const std::string w = jsonio::index_path(where + ".reports", i);
        const jsonio::json& r = reports.at(i);
        jsonio::require_object(r, w);

        Entry e;
        e.company = jsonio::require_string(r, "company", w);
        e.org_id = jsonio::get_string_or(r, "org_id", "", w);
        e.year = (int)jsonio::require_int(r, "year", w);
        e.priority_score = (int)jsonio::get_int_or(r, "priority_score", 100, w);
        e.title = jsonio::get_string_or(r, "title", "", w);

        const std::string path = jsonio::get_string_or(r, "path", "", w);
        const std::string url = jsonio::get_string_or(r, "url", "", w);
        if (path.empty() && url.empty()) {
            throw core::ConfigError(w + " needs a path or a url");
        }
        if (!path.empty()) {
            fs::path p(path);
            if (p.is_relative()) p = base / p;
            e.path = p.lexically_normal().string();
        }
        if (!url.empty()) e.url = url;

        std::string default_ctype = "application/octet-stream";
        if (e.path) default_ctype = content_type_for_extension(fs::path(*e.path).extension().string());
        e.content_type = jsonio::get_string_or(r, "content_type", default_ctype, w);

        if (e.priority_score < 0 || e.priority_score > 100) {
            throw core::ConfigError(w + ".priority_score must be in [0,100]");
        }

        m_entries.push_back(std::move(e));
    }
}

std::vector<SourceCandidate> ManifestProvider::search(const CompanyRef& company, int year, int tier) const {
    const std::string want_name = lower_ascii(company.name);
    const std::string want_key = company.key();

    std::vector<SourceCandidate> out;
    for (const auto& e : m_entries) {
        if (e.year != year) continue;
        const bool match = (!e.org_id.empty() && e.org_id == want_key) || lower_ascii(e.company) == want_name;
        if (!match) continue;

        const AccessMethod access = e.path ? AccessMethod::File : AccessMethod::Api;
        out.emplace_back(m_id, tier, e.priority_score, access, e.content_type, e.url, e.path, e.title);
    }
    return out;
}

ResolvedDocument ManifestProvider::download(const SourceCandidate& candidate) const {
    if (candidate.provider_id() != m_id) {
        throw core::ProviderError(m_id, "candidate belongs to provider " + candidate.provider_id());
    }
    if (!candidate.local_path()) {
        // network fetching lives outside the engine
        throw core::ProviderError(m_id, "remote fetch not available for " + candidate.url().value_or("<no url>"));
    }
    return read_local_document(candidate);
}

}  // namespace sources
