#include "api/ledger_run.hpp"

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "persist/snapshot_writer.hpp"
#include "util/log.hpp"

namespace api {

namespace {

void apply_log_level(const RunConfig& cfg) noexcept {
    if (cfg.quiet) {
        util::set_log_level(util::LogLevel::Error);
    } else if (cfg.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    } else {
        util::set_log_level(util::LogLevel::Info);
    }
}

void log_summary(const core::LedgerEngine& engine, const ingest::TxnReaderStats& reader_stats) {
    const auto& c = engine.counters();
    LOG_INFO("Replayed %llu records: %llu applied, %llu skipped, %zu accounts",
             static_cast<unsigned long long>(c.records),
             static_cast<unsigned long long>(c.applied),
             static_cast<unsigned long long>(c.records - c.applied - c.fatal),
             engine.account_count());
    LOG_DEBUG("Ledger run: records=%llu applied=%llu deposits=%llu withdrawals=%llu disputes=%llu "
              "resolves=%llu chargebacks=%llu",
              static_cast<unsigned long long>(c.records),
              static_cast<unsigned long long>(c.applied),
              static_cast<unsigned long long>(c.deposits),
              static_cast<unsigned long long>(c.withdrawals),
              static_cast<unsigned long long>(c.disputes),
              static_cast<unsigned long long>(c.resolves),
              static_cast<unsigned long long>(c.chargebacks));
    LOG_DEBUG("Skipped: insufficient_funds=%llu locked=%llu unknown_txn=%llu invalid_transition=%llu "
              "client_mismatch=%llu",
              static_cast<unsigned long long>(c.skipped_insufficient_funds),
              static_cast<unsigned long long>(c.skipped_locked),
              static_cast<unsigned long long>(c.skipped_unknown_txn),
              static_cast<unsigned long long>(c.skipped_invalid_transition),
              static_cast<unsigned long long>(c.skipped_client_mismatch));
    LOG_DEBUG("Input: lines_ok=%llu blank=%llu header=%llu bytes=%llu accounts=%zu cached_txns=%zu",
              static_cast<unsigned long long>(reader_stats.records_ok),
              static_cast<unsigned long long>(reader_stats.blank_lines),
              static_cast<unsigned long long>(reader_stats.header_lines),
              static_cast<unsigned long long>(reader_stats.bytes_read),
              engine.account_count(),
              engine.txn_cache().size());
}

ReplayOutcome replay_with_reader(ingest::TxnReader& reader, core::LedgerEngine& engine) {
    ReplayOutcome outcome{};
    core::TxnRecord rec{};

    while (true) {
        const auto res = reader.next(rec);
        if (res.status == ingest::TxnReadStatus::EndOfStream) {
            break;
        }
        if (res.status == ingest::TxnReadStatus::Malformed) {
            LOG_ERROR("Malformed record at line %zu (%s); aborting", res.line, ingest::parse_result_name(res.parse));
            outcome.status = RunStatus::MalformedRecord;
            outcome.line = res.line;
            outcome.parse = res.parse;
            return outcome;
        }
        if (res.status != ingest::TxnReadStatus::Ok) {
            LOG_ERROR("Input read failed after line %zu (%s)", res.line, ingest::txn_read_status_name(res.status));
            outcome.status = RunStatus::InputError;
            outcome.line = res.line;
            return outcome;
        }

        const core::ApplyResult applied = engine.apply(rec);
        if (core::is_fatal(applied)) {
            LOG_ERROR("Fatal %s record at line %zu (client=%u tx=%u): %s; aborting",
                      core::txn_type_name(rec.type),
                      res.line,
                      static_cast<unsigned>(rec.client),
                      static_cast<unsigned>(rec.tx),
                      core::apply_result_name(applied));
            outcome.status = RunStatus::FatalRecord;
            outcome.line = res.line;
            outcome.apply = applied;
            return outcome;
        }
    }

    log_summary(engine, reader.stats());
    return outcome;
}

} // namespace

ReplayOutcome replay_records(std::istream& in, core::LedgerEngine& engine) {
    ingest::TxnReader reader(in);
    return replay_with_reader(reader, engine);
}

bool parse_cache_hint(std::string_view text, std::size_t& out) noexcept {
    std::size_t value = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || res.ec != std::errc{} || res.ptr != text.data() + text.size()) {
        return false;
    }
    if (value == 0 || value > core::TxnCache::max_capacity_hint) {
        return false;
    }
    out = value;
    return true;
}

int exit_code(RunStatus status) noexcept {
    switch (status) {
    case RunStatus::Completed: return 0;
    case RunStatus::InputError:
    case RunStatus::MalformedRecord: return 1;
    case RunStatus::FatalRecord: return 2;
    }
    return 1;
}

int run_ledger(const RunConfig& cfg, std::ostream& out) {
    apply_log_level(cfg);

    if (cfg.input_path.empty()) {
        LOG_ERROR("No input provided; pass the transactions CSV path");
        return 1;
    }
    if (cfg.ledger.txn_cache_capacity_hint == 0 ||
        cfg.ledger.txn_cache_capacity_hint > core::TxnCache::max_capacity_hint) {
        LOG_ERROR("Invalid cache hint %zu; must be in [1, %zu]",
                  cfg.ledger.txn_cache_capacity_hint,
                  core::TxnCache::max_capacity_hint);
        return 1;
    }

    std::ifstream in(cfg.input_path);
    if (!in.is_open()) {
        LOG_ERROR("Failed to open input %s", cfg.input_path.string().c_str());
        return 1;
    }

    core::LedgerEngine engine(cfg.ledger);
    LOG_DEBUG("Replaying %s (client check %s)",
              cfg.input_path.string().c_str(),
              cfg.ledger.enforce_client_match ? "on" : "off");

    const ReplayOutcome outcome = replay_records(in, engine);
    if (outcome.status != RunStatus::Completed) {
        return exit_code(outcome.status);
    }

    if (!persist::write_snapshot_csv(out, engine.snapshot())) {
        LOG_ERROR("Failed to write account snapshot");
        return 1;
    }
    return 0;
}

int run_ledger(const RunConfig& cfg) {
    if (cfg.output_path.empty()) {
        return run_ledger(cfg, std::cout);
    }

    // Buffer until the run succeeds so an aborted run leaves no partial file.
    std::ostringstream buffered;
    const int rc = run_ledger(cfg, buffered);
    if (rc != 0) {
        return rc;
    }

    std::ofstream file(cfg.output_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open output %s", cfg.output_path.string().c_str());
        return 1;
    }
    file << buffered.str();
    file.flush();
    if (!file) {
        LOG_ERROR("Failed to write output %s", cfg.output_path.string().c_str());
        return 1;
    }
    return 0;
}

} // namespace api
