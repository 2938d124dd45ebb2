#include <chrono>
#include <iostream>
#include <string>

#include "core/ledger_engine.hpp"
#include "ingest/csv_parser.hpp"

int main() {
    core::LedgerEngine engine;
    core::TxnRecord rec{};

    constexpr std::size_t iterations = 100000;
    constexpr core::ClientId clients = 64;
    std::string line;
    line.reserve(64);

    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const auto client = static_cast<unsigned>(i % clients);
        const auto tx = static_cast<unsigned>(i + 1);
        if (i % 4 == 3) {
            line = "withdrawal," + std::to_string(client) + "," + std::to_string(tx) + ",0.5";
        } else {
            line = "deposit," + std::to_string(client) + "," + std::to_string(tx) + ",1.2500";
        }
        if (ingest::parse_txn_record(line, rec) != ingest::ParseResult::Ok) {
            std::cerr << "parse failed at iteration " << i << "\n";
            return 1;
        }
        if (core::is_fatal(engine.apply(rec))) {
            std::cerr << "apply failed at iteration " << i << "\n";
            return 1;
        }
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Benchmark loop " << iterations << " iterations took " << ns << " ns (" << (ns / iterations)
              << " ns/iter), cached_txns=" << engine.txn_cache().size() << "\n";
    return 0;
}
