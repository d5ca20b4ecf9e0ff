#include "ingest/DocumentStore.hpp"

#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ingest {

static TextSpan parse_span_line(const std::string& line, const std::string& where, const std::string& source) {
    jsonio::json j;
    try {
        j = jsonio::json::parse(line);
    } catch (const std::exception& e) {
        throw core::ConfigError(where + ": " + e.what());
    }
    jsonio::require_object(j, where);

    TextSpan s;
    s.span_id = jsonio::require_string(j, "doc_id", where);
    s.org_id = jsonio::require_string(j, "org_id", where);
    s.year = (int)jsonio::require_int(j, "year", where);
    s.text = jsonio::require_string(j, "text", where);
    s.page = (int)jsonio::get_int_or(j, "page", 1, where);
    const int64_t off = jsonio::get_int_or(j, "offset", 0, where);
    if (off < 0) throw core::ConfigError(where + ".offset must be non-negative");
    s.offset = (size_t)off;
    s.published_at = jsonio::get_string_or(j, "published_at", "", where);
    s.source = source;
    return s;
}

DocumentStore DocumentStore::load_from_dir(const std::string& dir) {
    DocumentStore store;

    fs::path root(dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) throw core::ConfigError("store dir not found: " + dir);

    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".jsonl") continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());

    for (const auto& p : files) {
        std::ifstream in(p);
        if (!in) throw core::ConfigError("failed to open store file: " + p.string());

        const std::string source = "store:" + p.filename().string();
        std::string line;
        size_t lineno = 0;
        while (std::getline(in, line)) {
            ++lineno;
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

            std::ostringstream where;
            where << p.filename().string() << ":" << lineno;
            store.m_spans.push_back(parse_span_line(line, where.str(), source));
        }
    }

    return store;
}

std::vector<TextSpan> DocumentStore::spans_for(const std::string& org_id, int year) const {
    std::vector<TextSpan> out;
    for (const auto& s : m_spans) {
        if (s.org_id == org_id && s.year == year) out.push_back(s);
    }
    return out;
}

}  // namespace ingest
