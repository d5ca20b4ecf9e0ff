#pragma once

#include <string>
#include <vector>

#include "ingest/TextSpan.hpp"
#include "sources/SourceCandidate.hpp"

namespace ingest {

class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    virtual std::vector<TextSpan> extract(const sources::ResolvedDocument& doc,
                                          const std::string& org_id,
                                          int year) const = 0;
};

// Handles text/plain, text/html (tags stripped) and pre-extracted JSON reports
// ({"published_at": "...", "pages": ["...", ...]}). Binary formats yield nothing.
//
// Plain text pages split on form feed, spans on blank lines. Span ids are
// <content hash prefix>:p<page>:<offset>. published_at defaults to <year>-12-31.
class PlainTextExtractor : public TextExtractor {
public:
    explicit PlainTextExtractor(size_t min_span_chars = 40) : m_min_span_chars(min_span_chars) {}

    std::vector<TextSpan> extract(const sources::ResolvedDocument& doc,
                                  const std::string& org_id,
                                  int year) const override;

private:
    size_t m_min_span_chars;
};

}  // namespace ingest
