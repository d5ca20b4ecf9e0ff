#include "commands/run.hpp"

#include "config/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "pipeline/Pipeline.hpp"
#include "pipeline/RunArtifacts.hpp"

#ifdef ESG_AGENT_HAVE_EMB
#include "emb/MiniLmEmbedder.hpp"
#endif

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int run_usage() {
    std::cerr
        << "usage:\n"
        << "  esg-agent run --config <path> [--outdir <dir>] [--workers <n>] [--model <onnx> --vocab <txt>]\n";
    return 1;
}

int cmd_run(int argc, char** argv) {
    std::string config_path;
    std::string outdir = "out";
    int workers = 0;
    std::string model_path;
    std::string vocab_path;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--help") return run_usage();

        if (a == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "error: --config requires a value\n";
                return 2;
            }
            config_path = argv[++i];
            continue;
        }

        if (a == "--outdir") {
            if (i + 1 >= argc) {
                std::cerr << "error: --outdir requires a value\n";
                return 2;
            }
            outdir = argv[++i];
            continue;
        }

        if (a == "--workers") {
            if (i + 1 >= argc) {
                std::cerr << "error: --workers requires a value\n";
                return 2;
            }
            try {
                workers = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "error: --workers must be an integer\n";
                return 2;
            }
            if (workers < 1) {
                std::cerr << "error: --workers must be >= 1\n";
                return 2;
            }
            continue;
        }

        if (a == "--model" || a == "--vocab") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << a << " requires a value\n";
                return 2;
            }
            (a == "--model" ? model_path : vocab_path) = argv[++i];
            continue;
        }

        std::cerr << "error: unknown arg: " << a << "\n";
        return run_usage();
    }

    if (config_path.empty()) {
        std::cerr << "error: missing --config\n";
        return run_usage();
    }
    if (model_path.empty() != vocab_path.empty()) {
        std::cerr << "error: --model and --vocab go together\n";
        return 2;
    }
#ifndef ESG_AGENT_HAVE_EMB
    if (!model_path.empty()) {
        std::cerr << "error: --model requires a build with ONNX Runtime\n";
        return 2;
    }
#endif

    try {
        const config::EngineConfig cfg = config::load_engine_config(config_path);

        std::shared_ptr<const rank::SemanticScorer> semantic;
#ifdef ESG_AGENT_HAVE_EMB
        std::unique_ptr<emb::MiniLmEmbedder> embedder;
        if (!model_path.empty()) {
            embedder = std::make_unique<emb::MiniLmEmbedder>(model_path, vocab_path);
            semantic = std::make_shared<rank::EmbeddingSemanticScorer>(*embedder);
        }
#endif

        const pipeline::Pipeline p = pipeline::Pipeline::from_config(cfg, semantic);

        const size_t n = workers > 0 ? (size_t)workers : cfg.workers;
        std::vector<pipeline::UnitResult> results = p.run_batch(cfg.units, n);

        size_t ok = 0;
        for (const auto& r : results) {
            if (r.ok) ++ok;
        }
        const size_t total = results.size();

        const pipeline::RunArtifacts art = pipeline::make_run_artifacts(p, std::move(results));
        art.write_to(fs::path(outdir));

        for (const auto& r : art.results) {
            std::cout << r.unit.company.key() << " " << r.unit.year << " " << r.unit.theme << ": ";
            if (r.ok) {
                std::cout << "stage " << r.score->stage << " confidence " << r.score->confidence
                          << " (" << r.score->audit << ")\n";
            } else {
                std::cout << "FAILED " << r.error.kind << ": " << r.error.message << "\n";
            }
        }

        std::cout << "UNITS: " << ok << "/" << total << " ok\n";
        std::cout << "OUT_SCORES: " << (fs::path(outdir) / "scores.json").string() << "\n";
        std::cout << "OUT_PARITY: " << (fs::path(outdir) / "parity.json").string() << "\n";
        std::cout << "OUT_MANIFEST: " << (fs::path(outdir) / "run_manifest.json").string() << "\n";

        return ok == total ? 0 : 1;
    } catch (const core::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
