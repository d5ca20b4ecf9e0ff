#pragma once

#include <string>
#include <vector>

#include "ingest/TextSpan.hpp"

namespace ingest {

// Already-ingested spans, one JSON object per line in <dir>/*.jsonl:
// {"doc_id", "org_id", "year", "text", "page", "offset", "published_at"}
class DocumentStore {
public:
    // Throws core::ConfigError on a missing dir or a malformed line (file:line).
    static DocumentStore load_from_dir(const std::string& dir);

    // file-name order, then line order
    std::vector<TextSpan> spans_for(const std::string& org_id, int year) const;

    size_t size() const { return m_spans.size(); }

private:
    std::vector<TextSpan> m_spans;
};

}  // namespace ingest
