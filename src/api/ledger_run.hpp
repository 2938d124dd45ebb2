#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string_view>

#include "core/ledger_config.hpp"
#include "core/ledger_engine.hpp"
#include "ingest/txn_reader.hpp"

namespace api {

struct RunConfig {
    std::filesystem::path input_path{};
    // Empty writes the snapshot to stdout.
    std::filesystem::path output_path{};
    core::LedgerConfig ledger{core::default_ledger_config()};

    bool quiet{false};
    bool verbose{false};
};

enum class RunStatus {
    Completed = 0,
    InputError,
    MalformedRecord,
    FatalRecord,
};

struct ReplayOutcome {
    RunStatus status{RunStatus::Completed};
    // Line of the record that stopped the run; 0 when it completed.
    std::size_t line{0};
    core::ApplyResult apply{core::ApplyResult::Applied};
    ingest::ParseResult parse{ingest::ParseResult::Ok};
};

// Feeds every record of `in` through `engine` in order and stops at the first
// malformed record, read error or fatal ApplyResult. The engine keeps the
// effects of every record applied before the stop.
ReplayOutcome replay_records(std::istream& in, core::LedgerEngine& engine);

// Parses a --cache-hint value: decimal digits only, in
// [1, core::TxnCache::max_capacity_hint]. `out` is written only on success.
bool parse_cache_hint(std::string_view text, std::size_t& out) noexcept;

// Exit code for a finished run: 0 completed, 1 input or parse failure,
// 2 fatal ledger outcome (duplicate transaction id, overflow).
int exit_code(RunStatus status) noexcept;

// Runs the full pipeline: read cfg.input_path, apply, and on success write the
// account snapshot to `out`. Nothing is written to `out` when the run aborts.
int run_ledger(const RunConfig& cfg, std::ostream& out);

// As above, writing to cfg.output_path or stdout.
int run_ledger(const RunConfig& cfg);

} // namespace api
