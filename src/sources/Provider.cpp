#include "sources/Provider.hpp"

#include "core/Errors.hpp"
#include "determinism/StableHash.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace sources {

static std::string read_all_binary(const fs::path& p, const std::string& provider_id) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw core::ProviderError(provider_id, "failed to open: " + p.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw core::ProviderError(provider_id, "failed to read: " + p.string());
    return ss.str();
}

ResolvedDocument read_local_document(const SourceCandidate& candidate) {
    if (!candidate.local_path()) {
        throw core::ProviderError(candidate.provider_id(), "candidate has no local path");
    }

    const fs::path p(*candidate.local_path());
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw core::ProviderError(candidate.provider_id(), "file not found: " + p.string());
    }

    std::string bytes = read_all_binary(p, candidate.provider_id());
    if (bytes.empty()) {
        throw core::ProviderError(candidate.provider_id(), "empty document: " + p.string());
    }

    ResolvedDocument doc{candidate, p.string(), std::move(bytes), "", 0};
    doc.byte_length = doc.content.size();
    doc.content_hash = determinism::stable_hash_hex(doc.content);
    return doc;
}

std::string content_type_for_extension(const std::string& ext) {
    std::string e = ext;
    std::transform(e.begin(), e.end(), e.begin(), [](unsigned char c){ return (char)std::tolower(c); });

    if (e == ".json") return "application/json";
    if (e == ".pdf") return "application/pdf";
    if (e == ".html" || e == ".htm") return "text/html";
    if (e == ".txt" || e == ".md") return "text/plain";
    return "application/octet-stream";
}

int priority_for_content_type(const std::string& content_type) {
    if (content_type == "application/json") return 5;
    if (content_type == "application/pdf") return 10;
    if (content_type == "text/html") return 20;
    if (content_type == "text/plain") return 30;
    return 50;
}

}  // namespace sources
