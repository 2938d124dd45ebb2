#include "ingest/csv_parser.hpp"

#include <array>
#include <charconv>
#include <cstddef>
#include <limits>

namespace ingest {
namespace {

constexpr std::size_t max_fields = 4;

template <typename T>
inline bool parse_unsigned(std::string_view s, T& out) noexcept {
    if (s.empty()) {
        return false;
    }
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc{} && res.ptr == s.data() + s.size();
}

using Fields = std::array<std::string_view, max_fields>;

// Splits on commas and trims each field. Returns the field count, or 0 if the
// row has more than max_fields columns.
std::size_t split_fields(std::string_view line, Fields& fields) noexcept {
    std::size_t count = 0;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        const auto field = line.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        if (count == max_fields) {
            return 0;
        }
        fields[count++] = trim_field(field);
        if (comma == std::string_view::npos) {
            return count;
        }
        start = comma + 1;
    }
}

inline std::string_view field_at(const Fields& fields, std::size_t count, std::uint8_t idx) noexcept {
    return idx < count ? fields[idx] : std::string_view{};
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool map_txn_type(std::string_view s, core::TxnType& out) noexcept {
    if (s == "deposit") {
        out = core::TxnType::Deposit;
    } else if (s == "withdrawal") {
        out = core::TxnType::Withdrawal;
    } else if (s == "dispute") {
        out = core::TxnType::Dispute;
    } else if (s == "resolve") {
        out = core::TxnType::Resolve;
    } else if (s == "chargeback") {
        out = core::TxnType::Chargeback;
    } else {
        return false;
    }
    return true;
}

} // namespace

std::string_view trim_field(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool parse_amount(std::string_view text, core::Amount& out) noexcept {
    const char* ptr = text.data();
    const char* end = text.data() + text.size();

    bool negative = false;
    if (ptr < end && (*ptr == '+' || *ptr == '-')) {
        negative = *ptr == '-';
        ++ptr;
    }

    constexpr std::int64_t max_raw = std::numeric_limits<std::int64_t>::max();
    std::int64_t whole = 0;
    std::size_t digits = 0;
    while (ptr < end && is_digit(*ptr)) {
        const std::int64_t d = *ptr - '0';
        if (whole > (max_raw / core::Amount::scale - d) / 10) {
            return false;
        }
        whole = whole * 10 + d;
        ++digits;
        ++ptr;
    }

    std::int64_t frac = 0;
    int frac_digits = 0;
    if (ptr < end && *ptr == '.') {
        ++ptr;
        while (ptr < end && is_digit(*ptr)) {
            if (frac_digits < core::Amount::fractional_digits) {
                frac = frac * 10 + (*ptr - '0');
                ++frac_digits;
            } else if (*ptr != '0') {
                return false; // finer than the representable precision
            }
            ++digits;
            ++ptr;
        }
    }

    if (ptr != end || digits == 0) {
        return false;
    }
    for (int i = frac_digits; i < core::Amount::fractional_digits; ++i) {
        frac *= 10;
    }
    if (whole > (max_raw - frac) / core::Amount::scale) {
        return false;
    }

    const std::int64_t raw = whole * core::Amount::scale + frac;
    out = core::Amount::from_raw(negative ? -raw : raw);
    return true;
}

bool looks_like_header(std::string_view line) noexcept {
    const auto first = trim_field(line.substr(0, line.find(',')));
    return first == "type" || first == "client" || first == "tx" || first == "amount";
}

ParseResult parse_header(std::string_view line, ColumnLayout& out) noexcept {
    Fields fields{};
    const std::size_t count = split_fields(line, fields);
    if (count == 0) {
        return ParseResult::Invalid;
    }

    ColumnLayout layout{ColumnLayout::absent, ColumnLayout::absent, ColumnLayout::absent, ColumnLayout::absent,
                        static_cast<std::uint8_t>(count)};
    for (std::size_t i = 0; i < count; ++i) {
        std::uint8_t* slot = nullptr;
        if (fields[i] == "type") {
            slot = &layout.type;
        } else if (fields[i] == "client") {
            slot = &layout.client;
        } else if (fields[i] == "tx") {
            slot = &layout.tx;
        } else if (fields[i] == "amount") {
            slot = &layout.amount;
        } else {
            return ParseResult::Invalid;
        }
        if (*slot != ColumnLayout::absent) {
            return ParseResult::Invalid;
        }
        *slot = static_cast<std::uint8_t>(i);
    }

    if (layout.type == ColumnLayout::absent || layout.client == ColumnLayout::absent ||
        layout.tx == ColumnLayout::absent) {
        return ParseResult::MissingField;
    }
    out = layout;
    return ParseResult::Ok;
}

ParseResult parse_txn_record(std::string_view line, core::TxnRecord& out) noexcept {
    return parse_txn_record(line, ColumnLayout{}, out);
}

ParseResult parse_txn_record(std::string_view line, const ColumnLayout& layout, core::TxnRecord& out) noexcept {
    Fields fields{};
    const std::size_t count = split_fields(line, fields);
    if (count == 0) {
        return ParseResult::Invalid;
    }
    // Trailing columns the header does not name must stay empty.
    for (std::size_t i = layout.width; i < count; ++i) {
        if (!fields[i].empty()) {
            return ParseResult::Invalid;
        }
    }

    const std::string_view type_field = field_at(fields, count, layout.type);
    const std::string_view client_field = field_at(fields, count, layout.client);
    const std::string_view tx_field = field_at(fields, count, layout.tx);
    if (type_field.empty() || client_field.empty() || tx_field.empty()) {
        return ParseResult::MissingField;
    }

    core::TxnRecord rec{};
    if (!map_txn_type(type_field, rec.type)) {
        return ParseResult::Invalid;
    }
    if (!parse_unsigned(client_field, rec.client)) {
        return ParseResult::Invalid;
    }
    if (!parse_unsigned(tx_field, rec.tx)) {
        return ParseResult::Invalid;
    }

    const std::string_view amount_field = field_at(fields, count, layout.amount);
    if (core::moves_funds(rec.type)) {
        if (amount_field.empty()) {
            return ParseResult::MissingField;
        }
        if (!parse_amount(amount_field, rec.amount) || rec.amount.is_negative()) {
            return ParseResult::Invalid;
        }
        rec.has_amount = true;
    } else if (!amount_field.empty()) {
        return ParseResult::Invalid;
    }

    out = rec;
    return ParseResult::Ok;
}

} // namespace ingest
