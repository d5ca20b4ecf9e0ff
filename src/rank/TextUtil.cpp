#include "rank/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

static bool keep_token(const std::string& t) {
    if (t.size() >= 2) return true;
    return !t.empty() && std::isdigit((unsigned char)t[0]);
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                if (keep_token(cur)) tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && keep_token(cur)) tokens.push_back(cur);
    return tokens;
}

std::set<std::string> token_set(const std::string& text) {
    auto toks = tokenize(normalize(text));
    return std::set<std::string>(toks.begin(), toks.end());
}

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;

    size_t inter = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia == *ib) {
            ++inter; ++ia; ++ib;
        } else if (*ia < *ib) {
            ++ia;
        } else {
            ++ib;
        }
    }
    const size_t uni = a.size() + b.size() - inter;
    return (double)inter / (double)uni;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string collapse_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back((char)c);
    }
    return out;
}

size_t word_count(const std::string& s) {
    size_t n = 0;
    bool in_word = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++n;
        }
    }
    return n;
}

static bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

std::vector<Sentence> split_sentences(const std::string& text) {
    std::vector<Sentence> out;

    auto flush = [&](size_t begin, size_t end) {
        // trim
        while (begin < end && std::isspace((unsigned char)text[begin])) ++begin;
        while (end > begin && std::isspace((unsigned char)text[end - 1])) --end;
        if (end > begin) out.push_back({text.substr(begin, end - begin), begin});
    };

    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (is_terminal(c) && (i + 1 == text.size() || std::isspace((unsigned char)text[i + 1]))) {
            flush(start, i + 1);
            start = i + 1;
            continue;
        }

        // blank line ends a sentence too (headings, table rows)
        if (c == '\n' && i + 1 < text.size() && text[i + 1] == '\n') {
            flush(start, i);
            start = i + 1;
        }
    }
    flush(start, text.size());
    return out;
}

std::string truncate_words(const std::string& text, size_t max_words, size_t min_boundary_words) {
    const std::string flat = collapse_whitespace(text);
    if (word_count(flat) <= max_words) return flat;

    // flat is single-spaced, so the n-th space ends word n
    size_t cut = 0;
    size_t boundary_limit = 0;
    size_t words = 0;
    for (size_t i = 0; i <= flat.size(); ++i) {
        if (i == flat.size() || flat[i] == ' ') {
            ++words;
            if (words == min_boundary_words) boundary_limit = i;
            if (words == max_words) {
                cut = i;
                break;
            }
        }
    }

    const std::string head = flat.substr(0, cut);
    size_t last = std::string::npos;
    for (size_t i = head.size(); i-- > 0; ) {
        if (is_terminal(head[i])) {
            last = i;
            break;
        }
    }

    if (last != std::string::npos && last > boundary_limit) {
        return head.substr(0, last + 1);
    }
    return head + "...";
}

}
