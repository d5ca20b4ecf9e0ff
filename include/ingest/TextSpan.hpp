#pragma once

#include <cstddef>
#include <string>

namespace ingest {

// A page/paragraph of extracted report text.
struct TextSpan {
    std::string span_id;
    std::string org_id;
    int year = 0;
    std::string text;            // trimmed source bytes, markup blanked to spaces
    int page = 1;
    size_t offset = 0;           // byte offset within the source document (or page for JSON reports)
    std::string published_at;    // ISO-8601 date, empty when unknown
    std::string source;          // provider id or store file
};

}  // namespace ingest
