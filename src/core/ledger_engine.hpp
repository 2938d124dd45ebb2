#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "core/account.hpp"
#include "core/ledger_config.hpp"
#include "core/txn_cache.hpp"
#include "core/txn_record.hpp"

namespace core {

// Outcome of applying one record. Skipped* outcomes leave all state untouched
// and the stream continues; Fatal* outcomes require the caller to stop.
enum class ApplyResult : std::uint8_t {
    Applied,
    SkippedInsufficientFunds,
    SkippedLocked,
    SkippedUnknownTxn,
    SkippedInvalidTransition,
    SkippedClientMismatch,
    FatalDuplicateTxn,
    FatalOverflow,
    FatalMalformed,
};

inline constexpr bool is_fatal(ApplyResult r) noexcept {
    return r == ApplyResult::FatalDuplicateTxn || r == ApplyResult::FatalOverflow ||
           r == ApplyResult::FatalMalformed;
}

inline constexpr bool is_skipped(ApplyResult r) noexcept {
    return r != ApplyResult::Applied && !is_fatal(r);
}

const char* apply_result_name(ApplyResult r) noexcept;

struct LedgerCounters {
    std::uint64_t records{0};
    std::uint64_t applied{0};

    std::uint64_t deposits{0};
    std::uint64_t withdrawals{0};
    std::uint64_t disputes{0};
    std::uint64_t resolves{0};
    std::uint64_t chargebacks{0};

    std::uint64_t skipped_insufficient_funds{0};
    std::uint64_t skipped_locked{0};
    std::uint64_t skipped_unknown_txn{0};
    std::uint64_t skipped_invalid_transition{0};
    std::uint64_t skipped_client_mismatch{0};

    std::uint64_t fatal{0};
};

// Point-in-time copy of every known account, ordered by client id. Iteration
// yields values, so nothing handed out refers back into the engine.
class AccountSnapshotRange {
public:
    using Rows = std::vector<AccountSnapshot>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = AccountSnapshot;
        using difference_type = std::ptrdiff_t;
        using pointer = const AccountSnapshot*;
        using reference = AccountSnapshot;

        iterator() = default;
        explicit iterator(Rows::const_iterator it) : it_(it) {}

        AccountSnapshot operator*() const { return *it_; }
        iterator& operator++() {
            ++it_;
            return *this;
        }
        iterator operator++(int) {
            iterator prev = *this;
            ++it_;
            return prev;
        }
        friend bool operator==(const iterator& a, const iterator& b) { return a.it_ == b.it_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return a.it_ != b.it_; }

    private:
        Rows::const_iterator it_{};
    };

    AccountSnapshotRange() : rows_(std::make_shared<const Rows>()) {}
    explicit AccountSnapshotRange(Rows rows) : rows_(std::make_shared<const Rows>(std::move(rows))) {}

    iterator begin() const { return iterator(rows_->cbegin()); }
    iterator end() const { return iterator(rows_->cend()); }
    std::size_t size() const noexcept { return rows_->size(); }
    bool empty() const noexcept { return rows_->empty(); }

private:
    std::shared_ptr<const Rows> rows_;
};

// LedgerEngine owns one Account per client and the cache of every applied
// deposit and withdrawal. Records must be applied one at a time in arrival
// order from a single thread; there is no internal locking.
class LedgerEngine {
public:
    explicit LedgerEngine(const LedgerConfig& cfg = default_ledger_config());

    LedgerEngine(const LedgerEngine&) = delete;
    LedgerEngine& operator=(const LedgerEngine&) = delete;

    // Only throws std::bad_alloc (account creation or cache growth).
    ApplyResult apply(const TxnRecord& rec);

    std::optional<Account> account(ClientId client) const noexcept;
    std::size_t account_count() const noexcept { return accounts_.size(); }
    AccountSnapshotRange snapshot() const;

    const TxnCache& txn_cache() const noexcept { return cache_; }
    const LedgerCounters& counters() const noexcept { return counters_; }
    const LedgerConfig& config() const noexcept { return config_; }

private:
    ApplyResult dispatch(const TxnRecord& rec);
    ApplyResult apply_deposit(Account& acct, const TxnRecord& rec);
    ApplyResult apply_withdrawal(Account& acct, const TxnRecord& rec);
    ApplyResult apply_dispute(const TxnRecord& rec) noexcept;
    ApplyResult apply_resolve(const TxnRecord& rec) noexcept;
    ApplyResult apply_chargeback(const TxnRecord& rec) noexcept;

    // Resolves the cached entry a dispute-chain record refers to and the
    // account it adjusts. Returns Applied when both were found.
    ApplyResult lookup_target(const TxnRecord& rec, const TxnEntry*& entry, Account*& acct) noexcept;
    void count(const TxnRecord& rec, ApplyResult r) noexcept;

    LedgerConfig config_;
    // Ordered so snapshots come out sorted by client id.
    std::map<ClientId, Account> accounts_;
    TxnCache cache_;
    LedgerCounters counters_{};
};

} // namespace core
