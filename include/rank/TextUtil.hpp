#pragma once
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop 1-char junk (digits are kept: "scope 1")
std::vector<std::string> tokenize(const std::string& normalized);

// normalize + tokenize + dedupe
std::set<std::string> token_set(const std::string& text);

// |a & b| / |a | b|, 0 when both are empty
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

std::string lower_ascii(std::string s);

// collapse runs of whitespace into one space, trim both ends
std::string collapse_whitespace(const std::string& s);

size_t word_count(const std::string& s);

struct Sentence {
    std::string text;
    size_t offset = 0;   // byte offset of text[0] in the source string
};

// split after . ! ? followed by whitespace, and on blank lines
std::vector<Sentence> split_sentences(const std::string& text);

// <= max_words words; cut at the last . ! ? if it falls past word min_boundary_words,
// otherwise cut at max_words and append "..."
std::string truncate_words(const std::string& text, size_t max_words = 30, size_t min_boundary_words = 20);

}
