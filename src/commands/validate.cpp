#include "commands/validate.hpp"

#include "pipeline/RunValidator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_validate(int argc, char** argv) {
    const std::string outdir = get_arg(argc, argv, "--outdir", "out");

    const fs::path outdir_p(outdir);
    const std::string out_path = get_arg(argc, argv, "--out", (outdir_p / "validation_report.json").string());

    pipeline::ValidationReport rep;
    try {
        rep = pipeline::validate_run_dir(outdir_p);
        pipeline::write_validation_report(fs::path(out_path), rep);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    if (!rep.pass) {
        std::cerr << "validation failed: wrote " << out_path << "\n";
        for (const auto& e : rep.errors) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.unit.empty()) std::cerr << " (unit=" << e.unit << ")";
            std::cerr << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
