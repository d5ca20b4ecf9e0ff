#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// BERT-style uncased WordPiece over an ASCII-lowered basic tokenization.
class WordPieceTokenizer {
public:
    // One token per line; the line index is the token id.
    // Throws core::ConfigError when the file is missing, empty, or lacks
    // the [PAD] [UNK] [CLS] [SEP] specials.
    void load_vocab(const std::string& vocab_path);
    void set_vocab(std::vector<std::string> tokens);

    // [CLS] pieces... [SEP], never longer than max_len (max_len >= 2).
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // Surface pieces, without specials. Unknown words become [UNK].
    std::vector<std::string> pieces(const std::string& text) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }

    int64_t pad_id() const { return m_pad; }
    int64_t unk_id() const { return m_unk; }
    int64_t cls_id() const { return m_cls; }
    int64_t sep_id() const { return m_sep; }

private:
    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;
    int64_t m_pad = -1;
    int64_t m_unk = -1;
    int64_t m_cls = -1;
    int64_t m_sep = -1;

    std::vector<std::string> basic_tokenize(const std::string& text) const;
    std::vector<std::string> wordpiece(const std::string& word) const;
    int64_t id_of(const std::string& tok) const;
};

}  // namespace emb
