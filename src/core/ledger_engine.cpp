#include "core/ledger_engine.hpp"

#include "core/dispute_lifecycle.hpp"

namespace core {

const char* apply_result_name(ApplyResult r) noexcept {
    switch (r) {
    case ApplyResult::Applied: return "applied";
    case ApplyResult::SkippedInsufficientFunds: return "skipped_insufficient_funds";
    case ApplyResult::SkippedLocked: return "skipped_locked";
    case ApplyResult::SkippedUnknownTxn: return "skipped_unknown_txn";
    case ApplyResult::SkippedInvalidTransition: return "skipped_invalid_transition";
    case ApplyResult::SkippedClientMismatch: return "skipped_client_mismatch";
    case ApplyResult::FatalDuplicateTxn: return "fatal_duplicate_txn";
    case ApplyResult::FatalOverflow: return "fatal_overflow";
    case ApplyResult::FatalMalformed: return "fatal_malformed";
    }
    return "unknown";
}

LedgerEngine::LedgerEngine(const LedgerConfig& cfg)
    : config_(cfg),
      cache_(cfg.txn_cache_capacity_hint) {}

ApplyResult LedgerEngine::apply(const TxnRecord& rec) {
    ++counters_.records;
    const ApplyResult r = dispatch(rec);
    count(rec, r);
    return r;
}

ApplyResult LedgerEngine::dispatch(const TxnRecord& rec) {
    if (moves_funds(rec.type)) {
        if (!rec.has_amount || rec.amount.is_negative()) {
            return ApplyResult::FatalMalformed;
        }
        // Checked before anything else: a reused id is bad input even when
        // the record would otherwise be skipped.
        if (cache_.find(rec.tx) != nullptr) {
            return ApplyResult::FatalDuplicateTxn;
        }
    } else if (rec.has_amount) {
        return ApplyResult::FatalMalformed;
    }

    Account& acct = accounts_[rec.client];

    switch (rec.type) {
    case TxnType::Deposit:
        return apply_deposit(acct, rec);
    case TxnType::Withdrawal:
        return apply_withdrawal(acct, rec);
    case TxnType::Dispute:
        return apply_dispute(rec);
    case TxnType::Resolve:
        return apply_resolve(rec);
    case TxnType::Chargeback:
        return apply_chargeback(rec);
    }
    return ApplyResult::FatalMalformed;
}

ApplyResult LedgerEngine::apply_deposit(Account& acct, const TxnRecord& rec) {
    if (acct.locked) {
        return ApplyResult::SkippedLocked;
    }

    Amount available{};
    Amount total{};
    if (!checked_add(acct.available, rec.amount, available) || !checked_add(acct.total, rec.amount, total)) {
        return ApplyResult::FatalOverflow;
    }
    if (cache_.put(rec.tx, rec.client, rec.amount, EntryKind::Deposit) != PutResult::Inserted) {
        return ApplyResult::FatalDuplicateTxn;
    }

    acct.available = available;
    acct.total = total;
    return ApplyResult::Applied;
}

ApplyResult LedgerEngine::apply_withdrawal(Account& acct, const TxnRecord& rec) {
    if (acct.locked) {
        return ApplyResult::SkippedLocked;
    }
    if (acct.available < rec.amount) {
        return ApplyResult::SkippedInsufficientFunds;
    }

    Amount available{};
    Amount total{};
    if (!checked_sub(acct.available, rec.amount, available) || !checked_sub(acct.total, rec.amount, total)) {
        return ApplyResult::FatalOverflow;
    }
    const Amount signed_amount = Amount::from_raw(-rec.amount.raw());
    if (cache_.put(rec.tx, rec.client, signed_amount, EntryKind::Withdrawal) != PutResult::Inserted) {
        return ApplyResult::FatalDuplicateTxn;
    }

    acct.available = available;
    acct.total = total;
    return ApplyResult::Applied;
}

ApplyResult LedgerEngine::lookup_target(const TxnRecord& rec, const TxnEntry*& entry, Account*& acct) noexcept {
    entry = cache_.find(rec.tx);
    if (!entry) {
        return ApplyResult::SkippedUnknownTxn;
    }
    if (entry->client != rec.client && config_.enforce_client_match) {
        return ApplyResult::SkippedClientMismatch;
    }
    // The owner's account was created when the entry was cached.
    const auto it = accounts_.find(entry->client);
    if (it == accounts_.end()) {
        return ApplyResult::SkippedUnknownTxn;
    }
    acct = &it->second;
    return ApplyResult::Applied;
}

// Dispute, resolve and chargeback move |amount| regardless of the entry's
// sign, so held never goes negative and total only moves on chargeback.
// They apply to locked accounts too: locking blocks new money movement only.

ApplyResult LedgerEngine::apply_dispute(const TxnRecord& rec) noexcept {
    const TxnEntry* entry = nullptr;
    Account* acct = nullptr;
    if (const ApplyResult r = lookup_target(rec, entry, acct); r != ApplyResult::Applied) {
        return r;
    }
    if (!is_valid_dispute_transition(entry->state, DisputeState::Disputed)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    const Amount amount = entry->amount.abs();
    Amount available{};
    Amount held{};
    if (!checked_sub(acct->available, amount, available) || !checked_add(acct->held, amount, held)) {
        return ApplyResult::FatalOverflow;
    }
    if (!cache_.mark_disputed(rec.tx)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    acct->available = available;
    acct->held = held;
    return ApplyResult::Applied;
}

ApplyResult LedgerEngine::apply_resolve(const TxnRecord& rec) noexcept {
    const TxnEntry* entry = nullptr;
    Account* acct = nullptr;
    if (const ApplyResult r = lookup_target(rec, entry, acct); r != ApplyResult::Applied) {
        return r;
    }
    if (!is_valid_dispute_transition(entry->state, DisputeState::ResolvedFinal)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    const Amount amount = entry->amount.abs();
    Amount available{};
    Amount held{};
    if (!checked_add(acct->available, amount, available) || !checked_sub(acct->held, amount, held)) {
        return ApplyResult::FatalOverflow;
    }
    if (!cache_.mark_resolved(rec.tx)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    acct->available = available;
    acct->held = held;
    return ApplyResult::Applied;
}

ApplyResult LedgerEngine::apply_chargeback(const TxnRecord& rec) noexcept {
    const TxnEntry* entry = nullptr;
    Account* acct = nullptr;
    if (const ApplyResult r = lookup_target(rec, entry, acct); r != ApplyResult::Applied) {
        return r;
    }
    if (!is_valid_dispute_transition(entry->state, DisputeState::ResolvedFinal)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    const Amount amount = entry->amount.abs();
    Amount held{};
    Amount total{};
    if (!checked_sub(acct->held, amount, held) || !checked_sub(acct->total, amount, total)) {
        return ApplyResult::FatalOverflow;
    }
    if (!cache_.mark_resolved(rec.tx)) {
        return ApplyResult::SkippedInvalidTransition;
    }

    acct->held = held;
    acct->total = total;
    acct->locked = true;
    return ApplyResult::Applied;
}

void LedgerEngine::count(const TxnRecord& rec, ApplyResult r) noexcept {
    switch (r) {
    case ApplyResult::Applied:
        ++counters_.applied;
        switch (rec.type) {
        case TxnType::Deposit: ++counters_.deposits; break;
        case TxnType::Withdrawal: ++counters_.withdrawals; break;
        case TxnType::Dispute: ++counters_.disputes; break;
        case TxnType::Resolve: ++counters_.resolves; break;
        case TxnType::Chargeback: ++counters_.chargebacks; break;
        }
        break;
    case ApplyResult::SkippedInsufficientFunds:
        ++counters_.skipped_insufficient_funds;
        break;
    case ApplyResult::SkippedLocked:
        ++counters_.skipped_locked;
        break;
    case ApplyResult::SkippedUnknownTxn:
        ++counters_.skipped_unknown_txn;
        break;
    case ApplyResult::SkippedInvalidTransition:
        ++counters_.skipped_invalid_transition;
        break;
    case ApplyResult::SkippedClientMismatch:
        ++counters_.skipped_client_mismatch;
        break;
    case ApplyResult::FatalDuplicateTxn:
    case ApplyResult::FatalOverflow:
    case ApplyResult::FatalMalformed:
        ++counters_.fatal;
        break;
    }
}

std::optional<Account> LedgerEngine::account(ClientId client) const noexcept {
    if (const auto it = accounts_.find(client); it != accounts_.end()) {
        return it->second;
    }
    return std::nullopt;
}

AccountSnapshotRange LedgerEngine::snapshot() const {
    AccountSnapshotRange::Rows rows;
    rows.reserve(accounts_.size());
    for (const auto& [client, acct] : accounts_) {
        rows.push_back(AccountSnapshot{client, acct});
    }
    return AccountSnapshotRange(std::move(rows));
}

} // namespace core
