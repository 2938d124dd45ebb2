#include <gtest/gtest.h>

#include <limits>

#include "core/amount.hpp"

namespace {

TEST(AmountTest, FormatAlwaysFourDigits) {
    EXPECT_EQ(core::format_amount(core::Amount::from_raw(100'000)), "10.0000");
    EXPECT_EQ(core::format_amount(core::Amount::from_raw(1)), "0.0001");
    EXPECT_EQ(core::format_amount(core::Amount::zero()), "0.0000");
    EXPECT_EQ(core::format_amount(core::Amount::from_raw(-2'500)), "-0.2500");
    EXPECT_EQ(core::format_amount(core::Amount::from_raw(8'766)), "0.8766");
}

TEST(AmountTest, FormatExtremes) {
    EXPECT_EQ(core::format_amount(core::Amount::max()), "922337203685477.5807");
    EXPECT_EQ(core::format_amount(core::Amount::min()), "-922337203685477.5807");
}

TEST(AmountTest, CheckedAddWithinRange) {
    core::Amount out{};
    ASSERT_TRUE(core::checked_add(core::Amount::from_raw(10'000), core::Amount::from_raw(5'000), out));
    EXPECT_EQ(out.raw(), 15'000);

    ASSERT_TRUE(core::checked_add(core::Amount::from_raw(10'000), core::Amount::from_raw(-15'000), out));
    EXPECT_EQ(out.raw(), -5'000);
}

TEST(AmountTest, CheckedAddRejectsOverflow) {
    core::Amount out = core::Amount::from_raw(42);
    EXPECT_FALSE(core::checked_add(core::Amount::max(), core::Amount::from_raw(1), out));
    EXPECT_EQ(out.raw(), 42) << "out must be untouched on overflow";

    EXPECT_FALSE(core::checked_add(core::Amount::min(), core::Amount::from_raw(-1), out));
    EXPECT_EQ(out.raw(), 42);

    ASSERT_TRUE(core::checked_add(core::Amount::max(), core::Amount::min(), out));
    EXPECT_EQ(out.raw(), 0);
}

TEST(AmountTest, CheckedSubRejectsOverflow) {
    core::Amount out{};
    EXPECT_FALSE(core::checked_sub(core::Amount::min(), core::Amount::from_raw(1), out));
    EXPECT_FALSE(core::checked_sub(core::Amount::max(), core::Amount::from_raw(-1), out));

    ASSERT_TRUE(core::checked_sub(core::Amount::zero(), core::Amount::max(), out));
    EXPECT_EQ(out, core::Amount::min());
}

TEST(AmountTest, AbsAndOrdering) {
    const auto neg = core::Amount::from_raw(-30'000);
    EXPECT_TRUE(neg.is_negative());
    EXPECT_EQ(neg.abs().raw(), 30'000);
    EXPECT_EQ(core::Amount::min().abs(), core::Amount::max());
    EXPECT_LT(neg, core::Amount::zero());
    EXPECT_GE(core::Amount::from_raw(1), core::Amount::from_raw(1));
}

TEST(AmountTest, RangeIsSymmetric) {
    static_assert(core::Amount::min().raw() == -core::Amount::max().raw());
    EXPECT_GT(core::Amount::min().raw(), std::numeric_limits<std::int64_t>::min());
}

} // namespace
