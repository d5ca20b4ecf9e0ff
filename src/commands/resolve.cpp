#include "commands/resolve.hpp"

#include "config/EngineConfig.hpp"
#include "core/Errors.hpp"
#include "sources/CandidateResolver.hpp"
#include "sources/ProviderRegistry.hpp"

#include <iostream>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int resolve_usage() {
    std::cerr
        << "usage:\n"
        << "  esg-agent resolve --config <path> --company <name> --year <n> [--org_id <id>] [--list_only]\n";
    return 1;
}

int cmd_resolve(int argc, char** argv) {
    const std::string config_path = get_arg(argc, argv, "--config", "");
    const std::string company_name = get_arg(argc, argv, "--company", "");
    const std::string year_s = get_arg(argc, argv, "--year", "");
    const bool list_only = has_flag(argc, argv, "--list_only");

    if (config_path.empty() || company_name.empty() || year_s.empty()) {
        std::cerr << "error: --config, --company and --year are required\n";
        return resolve_usage();
    }

    int year = 0;
    try {
        year = std::stoi(year_s);
    } catch (const std::exception&) {
        std::cerr << "error: --year must be an integer\n";
        return 2;
    }

    sources::CompanyRef company;
    company.name = company_name;
    company.org_id = get_arg(argc, argv, "--org_id", "");

    try {
        const config::EngineConfig cfg = config::load_engine_config(config_path);
        const sources::CandidateResolver resolver(sources::make_provider_tiers(cfg.tiers), cfg.resolver);

        const auto ordered = sources::CandidateResolver::prioritize(resolver.search(company, year));
        std::cout << "CANDIDATES: " << ordered.size() << "\n";
        for (size_t i = 0; i < ordered.size(); ++i) {
            const auto& c = ordered[i];
            std::cout << "  " << (i + 1) << ". tier=" << c.tier() << " priority=" << c.priority_score()
                      << " provider=" << c.provider_id() << " type=" << c.content_type()
                      << " " << c.local_path().value_or(c.url().value_or("")) << "\n";
        }
        if (list_only) return 0;

        const sources::Resolution res = resolver.resolve_best(company, year);
        std::cout << "RESOLVED: " << res.document.handle << " (" << res.document.byte_length << " bytes, hash "
                  << res.document.content_hash << ")\n";
        std::cout << "FAILED_ATTEMPTS: " << res.failures.size() << "\n";
        return 0;
    } catch (const core::ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const core::ResolutionFailed& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
