#include "emb/MiniLmEmbedder.hpp"

#include "core/Errors.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace emb {

MiniLmEmbedder::MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path, size_t max_len)
    : m_max_len(max_len) {
    if (m_max_len < 2) throw core::ConfigError("embedder max_len must be >= 2");
    if (!std::filesystem::exists(model_path)) throw core::ConfigError("model not found: " + model_path);

    m_tok.load_vocab(vocab_path);

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        m_out_name = m_session->GetOutputNameAllocated(0, allocator).get();

        // Some exports drop token_type_ids.
        m_input_count = m_session->GetInputCount();
        if (m_input_count < 2 || m_input_count > 3) {
            throw core::ConfigError("unexpected model input count: " + std::to_string(m_input_count));
        }
        m_in_ids = m_session->GetInputNameAllocated(0, allocator).get();
        m_in_mask = m_session->GetInputNameAllocated(1, allocator).get();
        if (m_input_count == 3) m_in_type = m_session->GetInputNameAllocated(2, allocator).get();
    } catch (const Ort::Exception& e) {
        std::ostringstream oss;
        oss << "MiniLmEmbedder: ORT exception: " << e.what() << " (model_path=" << model_path << ")\n";
        std::cerr << oss.str();
        throw core::ConfigError(std::string("cannot load model: ") + e.what());
    }
}

static void l2_normalize(std::vector<float>& v) {
    double ss = 0.0;
    for (float x : v) ss += (double)x * (double)x;
    if (ss <= 0.0) return;
    const double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = (float)(x * inv);
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text) const {
    std::vector<int64_t> ids = m_tok.encode(text, m_max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);
    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()));
    if (m_input_count == 3) {
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));
    }

    const char* in_names[3] = {m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str()};
    const char* out_names[1] = {m_out_name.c_str()};

    std::vector<Ort::Value> outs;
    try {
        outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, inputs.data(), inputs.size(), out_names, 1);
    } catch (const Ort::Exception& e) {
        throw std::runtime_error(std::string("MiniLmEmbedder: inference failed: ") + e.what());
    }

    const auto shp = outs[0].GetTensorTypeAndShapeInfo().GetShape();   // [1, seq_len, hidden]
    if (shp.size() != 3 || shp[1] != (int64_t)seq_len) {
        throw std::runtime_error("MiniLmEmbedder: unexpected output shape");
    }

    const size_t hidden = (size_t)shp[2];
    const float* data = outs[0].GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }
    const float inv = 1.0f / (float)seq_len;
    for (float& x : pooled) x *= inv;

    l2_normalize(pooled);
    return pooled;
}

}  // namespace emb
