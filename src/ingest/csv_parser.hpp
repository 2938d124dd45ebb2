#pragma once

#include <cstdint>
#include <string_view>

#include "core/amount.hpp"
#include "core/txn_record.hpp"

namespace ingest {

enum class ParseResult : uint8_t { Ok, MissingField, Invalid };

inline constexpr const char* parse_result_name(ParseResult r) noexcept {
    switch (r) {
    case ParseResult::Ok: return "ok";
    case ParseResult::MissingField: return "missing_field";
    case ParseResult::Invalid: return "invalid";
    }
    return "unknown";
}

// Positions of the record fields within a row. The default is the canonical
// "type,client,tx,amount" order; a header row may reorder the columns or omit
// amount entirely.
struct ColumnLayout {
    static constexpr std::uint8_t absent = 0xff;

    std::uint8_t type{0};
    std::uint8_t client{1};
    std::uint8_t tx{2};
    std::uint8_t amount{3};
    std::uint8_t width{4};
};

// Strips spaces, tabs and carriage returns from both ends.
std::string_view trim_field(std::string_view s) noexcept;

// Parses a decimal such as "12", "12.5", "+0.0001" or "-3.25" into an Amount.
// More than four fractional digits are accepted only if the excess digits are
// zero. Returns false on malformed text or a magnitude Amount cannot hold.
bool parse_amount(std::string_view text, core::Amount& out) noexcept;

// True if the first field of `line` is one of the column names, i.e. the row
// is a header rather than a record.
bool looks_like_header(std::string_view line) noexcept;

// Builds the layout from a header row. type, client and tx must each appear
// exactly once; amount may appear at most once. Unknown or empty names are
// Invalid. `out` is written only on Ok.
ParseResult parse_header(std::string_view line, ColumnLayout& out) noexcept;

// Parses one CSV row "type,client,tx[,amount]" (or the order given by
// `layout`). Deposits and withdrawals need a non-negative amount; dispute,
// resolve and chargeback rows must leave the amount column empty or omit it.
ParseResult parse_txn_record(std::string_view line, core::TxnRecord& out) noexcept;
ParseResult parse_txn_record(std::string_view line, const ColumnLayout& layout, core::TxnRecord& out) noexcept;

} // namespace ingest
