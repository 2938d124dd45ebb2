#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

namespace core {

// Amount is a signed fixed-point monetary value with four fractional digits,
// stored as an integer count of 1/10000 units (10.5 == 105000).
class Amount {
public:
    static constexpr std::int64_t scale = 10'000;
    static constexpr int fractional_digits = 4;

    constexpr Amount() noexcept = default;

    static constexpr Amount from_raw(std::int64_t raw) noexcept { return Amount{raw}; }
    static constexpr Amount zero() noexcept { return Amount{0}; }
    static constexpr Amount max() noexcept { return Amount{std::numeric_limits<std::int64_t>::max()}; }
    // Symmetric with max() so abs() never overflows.
    static constexpr Amount min() noexcept { return Amount{-std::numeric_limits<std::int64_t>::max()}; }

    constexpr std::int64_t raw() const noexcept { return raw_; }
    constexpr bool is_negative() const noexcept { return raw_ < 0; }
    constexpr Amount abs() const noexcept { return Amount{raw_ < 0 ? -raw_ : raw_}; }

    friend constexpr bool operator==(Amount a, Amount b) noexcept { return a.raw_ == b.raw_; }
    friend constexpr bool operator!=(Amount a, Amount b) noexcept { return a.raw_ != b.raw_; }
    friend constexpr bool operator<(Amount a, Amount b) noexcept { return a.raw_ < b.raw_; }
    friend constexpr bool operator<=(Amount a, Amount b) noexcept { return a.raw_ <= b.raw_; }
    friend constexpr bool operator>(Amount a, Amount b) noexcept { return a.raw_ > b.raw_; }
    friend constexpr bool operator>=(Amount a, Amount b) noexcept { return a.raw_ >= b.raw_; }

private:
    constexpr explicit Amount(std::int64_t raw) noexcept : raw_(raw) {}

    std::int64_t raw_{0};
};

static_assert(std::is_trivially_copyable_v<Amount>, "Amount must remain trivially copyable");

// Checked arithmetic. Returns false and leaves `out` untouched when the result
// would fall outside [Amount::min(), Amount::max()].
[[nodiscard]] inline constexpr bool checked_add(Amount a, Amount b, Amount& out) noexcept {
    const std::int64_t lhs = a.raw();
    const std::int64_t rhs = b.raw();
    const std::int64_t hi = Amount::max().raw();
    const std::int64_t lo = Amount::min().raw();
    if (rhs > 0 && lhs > hi - rhs) {
        return false;
    }
    if (rhs < 0 && lhs < lo - rhs) {
        return false;
    }
    out = Amount::from_raw(lhs + rhs);
    return true;
}

[[nodiscard]] inline constexpr bool checked_sub(Amount a, Amount b, Amount& out) noexcept {
    // b is within [min, max] which is symmetric, so negation is safe.
    return checked_add(a, Amount::from_raw(-b.raw()), out);
}

// Renders with exactly four fractional digits, e.g. "10.0000" or "-0.2500".
std::string format_amount(Amount a);

} // namespace core
