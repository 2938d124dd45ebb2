#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "core/txn_record.hpp"
#include "ingest/csv_parser.hpp"

namespace ingest {

// Input contract: CSV text with an optional header row, followed by one record
// per line. A header names the columns (type, client, tx, amount) in any order
// and fixes the layout of every following row; without one the canonical
// "type,client,tx,amount" order applies. A leading UTF-8 byte order mark is
// dropped. Blank lines are skipped.

struct TxnReaderStats {
    std::uint64_t records_ok{0};
    std::uint64_t malformed{0};
    std::uint64_t blank_lines{0};
    std::uint64_t header_lines{0};
    std::uint64_t bytes_read{0};
};

enum class TxnReadStatus {
    Ok = 0,
    EndOfStream,
    Malformed,
    IoError,
};

inline constexpr const char* txn_read_status_name(TxnReadStatus s) noexcept {
    switch (s) {
    case TxnReadStatus::Ok: return "ok";
    case TxnReadStatus::EndOfStream: return "end_of_stream";
    case TxnReadStatus::Malformed: return "malformed";
    case TxnReadStatus::IoError: return "io_error";
    }
    return "unknown";
}

struct TxnReadResult {
    TxnReadStatus status{TxnReadStatus::EndOfStream};
    // 1-based line the status refers to; 0 at end of stream.
    std::size_t line{0};
    ParseResult parse{ParseResult::Ok};
};

class TxnReader {
public:
    explicit TxnReader(std::istream& in) noexcept : in_(in) {}

    TxnReader(const TxnReader&) = delete;
    TxnReader& operator=(const TxnReader&) = delete;

    // Returns the next record. A Malformed or IoError result is terminal for
    // the caller; the reader does not try to resynchronise.
    TxnReadResult next(core::TxnRecord& out);

    const TxnReaderStats& stats() const noexcept { return stats_; }
    std::size_t line() const noexcept { return line_no_; }
    const ColumnLayout& layout() const noexcept { return layout_; }

private:
    std::istream& in_;
    std::string buffer_;
    TxnReaderStats stats_;
    ColumnLayout layout_{};
    std::size_t line_no_{0};
    bool seen_content_{false};
};

} // namespace ingest
