#include "commands/resolve.hpp"
#include "commands/run.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  esg-agent run [args]\n"
        << "  esg-agent resolve [args]\n"
        << "  esg-agent validate [args]\n"
        << "  esg-agent help\n";
    return 1;
}

static int print_run_help() {
    std::cerr
        << "usage:\n"
        << "  esg-agent run --config <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              (required) engine config JSON\n"
        << "  --outdir <dir>               default: out\n"
        << "  --workers <n>                default: config \"workers\" (1)\n"
        << "\n"
        << "determinism (environment, overrides config):\n"
        << "  DETERMINISTIC=1              require fixed time and seed\n"
        << "  FIXED_TIME=<unix seconds>    clock used for freshness and manifests\n"
        << "  SEED=<n>                     tie-break seed\n"
        << "\n"
        << "exit codes: 0 all units scored, 1 some unit failed, 2 config error\n";
    return 0;
}

static int print_resolve_help() {
    std::cerr
        << "usage:\n"
        << "  esg-agent resolve --config <path> --company <name> --year <n> [options]\n"
        << "\n"
        << "options:\n"
        << "  --org_id <id>                storage key (default: slug of company name)\n"
        << "  --list_only                  print prioritized candidates, skip download\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  esg-agent validate [options]\n"
        << "\n"
        << "options:\n"
        << "  --outdir <dir>               default: out\n"
        << "  --out <path>                 default: <outdir>/validation_report.json\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "run"      && (argc >= 3 && std::string(argv[2]) == "--help")) return print_run_help();
    if (cmd == "resolve"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_resolve_help();
    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "run")      return cmd_run(argc - 1, argv + 1);
    if (cmd == "resolve")  return cmd_resolve(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
