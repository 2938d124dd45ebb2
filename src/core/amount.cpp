#include "core/amount.hpp"

#include <charconv>
#include <cstdint>

namespace core {

std::string format_amount(Amount a) {
    const std::int64_t raw = a.raw();
    const bool negative = raw < 0;
    // raw is never INT64_MIN (see Amount::min), so negation is safe.
    const auto magnitude = static_cast<std::uint64_t>(negative ? -raw : raw);
    const std::uint64_t whole = magnitude / static_cast<std::uint64_t>(Amount::scale);
    const std::uint64_t frac = magnitude % static_cast<std::uint64_t>(Amount::scale);

    char buf[32];
    char* ptr = buf;
    if (negative) {
        *ptr++ = '-';
    }
    auto res = std::to_chars(ptr, buf + sizeof(buf), whole);
    ptr = res.ptr;
    *ptr++ = '.';

    char digits[Amount::fractional_digits];
    std::uint64_t rem = frac;
    for (int i = Amount::fractional_digits - 1; i >= 0; --i) {
        digits[i] = static_cast<char>('0' + rem % 10);
        rem /= 10;
    }
    for (char d : digits) {
        *ptr++ = d;
    }
    return std::string(buf, static_cast<std::size_t>(ptr - buf));
}

} // namespace core
