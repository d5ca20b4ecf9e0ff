#include "ingest/TextExtractor.hpp"

#include "core/Errors.hpp"
#include "rank/TextUtil.hpp"

#include "nlohmann/json.hpp"

#include <cctype>
#include <iostream>
#include <sstream>

namespace ingest {

// Blank out markup in place so byte offsets still point into the original.
static std::string blank_tags(const std::string& html) {
    std::string out = html;
    bool in_tag = false;
    for (char& c : out) {
        if (c == '<') in_tag = true;
        const bool was_in_tag = in_tag;
        if (c == '>') in_tag = false;
        if (was_in_tag && c != '\n') c = ' ';
    }
    return out;
}

static bool blank_line_at(const std::string& s, size_t i, size_t end, size_t& next) {
    // s[i] == '\n'; look for only horizontal whitespace up to another '\n'
    size_t j = i + 1;
    while (j < end && (s[j] == ' ' || s[j] == '\t' || s[j] == '\r')) ++j;
    if (j < end && s[j] == '\n') {
        next = j + 1;
        return true;
    }
    return false;
}

static std::string span_id(const std::string& content_hash, int page, size_t offset) {
    std::ostringstream oss;
    oss << content_hash.substr(0, 12) << ":p" << page << ":" << offset;
    return oss.str();
}

static void split_page(const std::string& text, size_t begin, size_t end, int page,
                       size_t min_chars, const TextSpan& proto, const std::string& content_hash,
                       std::vector<TextSpan>& out) {
    auto flush = [&](size_t b, size_t e) {
        while (b < e && std::isspace((unsigned char)text[b])) ++b;
        while (e > b && std::isspace((unsigned char)text[e - 1])) --e;
        if (e <= b) return;

        // span text stays byte-for-byte so offsets inside it map back to the document
        std::string para = text.substr(b, e - b);
        if (textutil::collapse_whitespace(para).size() < min_chars) return;

        TextSpan s = proto;
        s.page = page;
        s.offset = b;
        s.text = std::move(para);
        s.span_id = span_id(content_hash, page, b);
        out.push_back(std::move(s));
    };

    size_t start = begin;
    for (size_t i = begin; i < end; ++i) {
        size_t next = 0;
        if (text[i] == '\n' && blank_line_at(text, i, end, next)) {
            flush(start, i);
            start = next;
            i = next - 1;
        }
    }
    flush(start, end);
}

static std::vector<TextSpan> extract_paged_text(const std::string& text, size_t min_chars,
                                                const TextSpan& proto, const std::string& content_hash) {
    std::vector<TextSpan> out;
    int page = 1;
    size_t page_start = 0;
    for (size_t i = 0; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == '\f') {
            split_page(text, page_start, i, page, min_chars, proto, content_hash, out);
            page_start = i + 1;
            ++page;
        }
    }
    return out;
}

static std::vector<TextSpan> extract_json_report(const sources::ResolvedDocument& doc, size_t min_chars,
                                                 TextSpan proto) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(doc.content);
    } catch (const std::exception& e) {
        throw core::InvalidInput("malformed JSON report " + doc.handle + ": " + e.what());
    }
    if (!j.is_object() || !j.contains("pages") || !j["pages"].is_array()) {
        throw core::InvalidInput("JSON report " + doc.handle + " has no pages array");
    }
    if (j.contains("published_at") && j["published_at"].is_string()) {
        proto.published_at = j["published_at"].get<std::string>();
    }

    std::vector<TextSpan> out;
    const auto& pages = j["pages"];
    for (size_t p = 0; p < pages.size(); ++p) {
        if (!pages[p].is_string()) {
            throw core::InvalidInput("JSON report " + doc.handle + ": pages entries must be strings");
        }
        const std::string text = pages[p].get<std::string>();
        split_page(text, 0, text.size(), (int)p + 1, min_chars, proto, doc.content_hash, out);
    }
    return out;
}

std::vector<TextSpan> PlainTextExtractor::extract(const sources::ResolvedDocument& doc,
                                                  const std::string& org_id,
                                                  int year) const {
    TextSpan proto;
    proto.org_id = org_id;
    proto.year = year;
    proto.source = doc.candidate.provider_id();
    proto.published_at = std::to_string(year) + "-12-31";

    const std::string& ctype = doc.candidate.content_type();

    if (ctype == "text/plain") {
        return extract_paged_text(doc.content, m_min_span_chars, proto, doc.content_hash);
    }
    if (ctype == "text/html") {
        return extract_paged_text(blank_tags(doc.content), m_min_span_chars, proto, doc.content_hash);
    }
    if (ctype == "application/json") {
        return extract_json_report(doc, m_min_span_chars, proto);
    }

    std::cerr << "PlainTextExtractor: no text extraction for " << ctype << " (" << doc.handle << ")\n";
    return {};
}

}  // namespace ingest
