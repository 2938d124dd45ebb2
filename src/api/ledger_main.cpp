#include <exception>
#include <iostream>
#include <string>

#include "api/ledger_run.hpp"
#include "util/log.hpp"

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <transactions.csv> [options]\n"
              << "       " << prog << " --input <transactions.csv> [options]\n"
              << "Options:\n"
              << "  --out <path>            Write the account snapshot here (default stdout)\n"
              << "  --no-client-check       Trust the client id on dispute/resolve/chargeback rows\n"
              << "  --cache-hint <N>        Initial transaction cache sizing, 1..67108864 (default 65536)\n"
              << "  --quiet                 Suppress non-error logs\n"
              << "  --verbose               Add per-outcome counters to the run summary\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    api::RunConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            cfg.input_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            cfg.output_path = argv[++i];
        } else if (arg == "--no-client-check") {
            cfg.ledger.enforce_client_match = false;
        } else if (arg == "--cache-hint" && i + 1 < argc) {
            if (!api::parse_cache_hint(argv[++i], cfg.ledger.txn_cache_capacity_hint)) {
                LOG_ERROR("Invalid --cache-hint %s", argv[i]);
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--quiet") {
            cfg.quiet = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && cfg.input_path.empty()) {
            cfg.input_path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        return api::run_ledger(cfg);
    } catch (const std::exception& ex) {
        LOG_FATAL("Ledger run failed: %s", ex.what());
        return 3;
    }
}
