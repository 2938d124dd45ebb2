#pragma once

#include <cstddef>
#include <type_traits>

namespace core {

// Configuration for the ledger engine.
struct LedgerConfig {
    // Initial sizing of the transaction cache. The cache grows past this on
    // demand; the hint only avoids early rehashing. Must be in
    // [1, TxnCache::max_capacity_hint].
    std::size_t txn_cache_capacity_hint{1u << 16};

    // Dispute, resolve and chargeback records must name the client that owns
    // the referenced transaction. When disabled the record's client is trusted
    // and the owning client's account is the one adjusted.
    bool enforce_client_match{true};
};

static_assert(std::is_trivially_copyable_v<LedgerConfig>, "LedgerConfig must be trivially copyable");

[[nodiscard]] inline constexpr LedgerConfig default_ledger_config() noexcept {
    return LedgerConfig{};
}

} // namespace core
