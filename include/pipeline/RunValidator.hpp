#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pipeline {

struct ValidationError {
    std::string code;
    std::string message;
    std::string unit;      // org/year/theme when the error belongs to one unit
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

// Re-checks a finished run directory (scores.json + parity.json): cited
// evidence exists, cited docs sit in the recorded top-K, top-K order is the
// ranker's total order, and each parity report agrees with a recomputation.
ValidationReport validate_run_dir(const std::filesystem::path& outdir);

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace pipeline
