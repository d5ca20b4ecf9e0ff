#pragma once

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

#include "emb/WordPieceTokenizer.hpp"
#include "rank/SemanticScorer.hpp"

namespace emb {

// all-MiniLM-L6-v2 style sentence encoder: mean pooling over the last
// hidden state, L2-normalized. Session::Run is thread-safe, so one
// embedder serves every pipeline worker.
class MiniLmEmbedder : public rank::TextEmbedder {
public:
    // Throws core::ConfigError when the vocab or model cannot be loaded.
    MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path, size_t max_len = 256);

    std::vector<float> embed(const std::string& text) const override;

    size_t max_len() const { return m_max_len; }

private:
    WordPieceTokenizer m_tok;
    size_t m_max_len;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "esg-agent"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::string m_in_ids = "input_ids";
    std::string m_in_mask = "attention_mask";
    std::string m_in_type = "token_type_ids";
    std::string m_out_name;
    size_t m_input_count = 3;
};

}  // namespace emb
