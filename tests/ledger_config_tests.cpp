#include <gtest/gtest.h>

#include "core/ledger_config.hpp"
#include "core/ledger_engine.hpp"

namespace {

// LedgerConfig_DefaultValues - Verify default config values match expected
TEST(LedgerConfigTest, DefaultValues) {
    const core::LedgerConfig config{};

    EXPECT_EQ(config.txn_cache_capacity_hint, 65'536u);
    EXPECT_TRUE(config.enforce_client_match);
}

TEST(LedgerConfigTest, DefaultLedgerConfigFunction) {
    constexpr auto config = core::default_ledger_config();

    EXPECT_EQ(config.txn_cache_capacity_hint, 65'536u);
    EXPECT_TRUE(config.enforce_client_match);
}

TEST(LedgerConfigTest, EngineKeepsItsOwnCopy) {
    core::LedgerConfig config{};
    config.txn_cache_capacity_hint = 8;
    config.enforce_client_match = false;

    const core::LedgerEngine engine(config);
    config.enforce_client_match = true;

    EXPECT_FALSE(engine.config().enforce_client_match);
    EXPECT_EQ(engine.config().txn_cache_capacity_hint, 8u);
    EXPECT_GE(engine.txn_cache().bucket_count(), 16u);
}

} // namespace
