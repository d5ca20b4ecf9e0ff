#include "emb/WordPieceTokenizer.hpp"

#include "core/Errors.hpp"
#include "rank/TextUtil.hpp"

#include <cctype>
#include <fstream>

namespace emb {

static const size_t kMaxWordChars = 100;

static bool is_punct(unsigned char c) {
    return (c >= 33 && c <= 47) || (c >= 58 && c <= 64) ||
           (c >= 91 && c <= 96) || (c >= 123 && c <= 126);
}

void WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) throw core::ConfigError("cannot open vocab: " + vocab_path);

    std::vector<std::string> tokens;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        tokens.push_back(line);
    }
    if (tokens.empty()) throw core::ConfigError("empty vocab: " + vocab_path);

    set_vocab(std::move(tokens));
}

void WordPieceTokenizer::set_vocab(std::vector<std::string> tokens) {
    m_id_to_tok = std::move(tokens);
    m_tok_to_id.clear();
    for (size_t i = 0; i < m_id_to_tok.size(); ++i) {
        // first occurrence wins
        m_tok_to_id.emplace(m_id_to_tok[i], (int64_t)i);
    }

    m_pad = id_of("[PAD]");
    m_unk = id_of("[UNK]");
    m_cls = id_of("[CLS]");
    m_sep = id_of("[SEP]");
    if (m_pad < 0 || m_unk < 0 || m_cls < 0 || m_sep < 0) {
        throw core::ConfigError("vocab is missing one of [PAD] [UNK] [CLS] [SEP]");
    }
}

int64_t WordPieceTokenizer::id_of(const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? -1 : it->second;
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string cur;

    for (char ch : textutil::lower_ascii(text)) {
        const unsigned char c = (unsigned char)ch;
        if (std::isspace(c) || c < 32) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else if (is_punct(c)) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
            out.emplace_back(1, ch);
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

// Greedy longest-match-first; continuation pieces carry the ## prefix.
std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& word) const {
    if (word.size() > kMaxWordChars) return {"[UNK]"};

    std::vector<std::string> out;
    size_t start = 0;
    while (start < word.size()) {
        size_t end = word.size();
        std::string match;
        for (; end > start; --end) {
            std::string sub = word.substr(start, end - start);
            if (start > 0) sub = "##" + sub;
            if (m_tok_to_id.count(sub)) {
                match = std::move(sub);
                break;
            }
        }
        if (match.empty()) return {"[UNK]"};
        out.push_back(std::move(match));
        start = end;
    }
    return out;
}

std::vector<std::string> WordPieceTokenizer::pieces(const std::string& text) const {
    std::vector<std::string> out;
    for (const auto& w : basic_tokenize(text)) {
        for (auto& p : wordpiece(w)) out.push_back(std::move(p));
    }
    return out;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (max_len < 2) throw core::InvalidInput("max_len must be >= 2");

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(m_cls);

    for (const auto& p : pieces(text)) {
        if (ids.size() + 1 >= max_len) break;   // room for [SEP]
        const int64_t id = id_of(p);
        ids.push_back(id < 0 ? m_unk : id);
    }

    ids.push_back(m_sep);
    return ids;
}

}  // namespace emb
