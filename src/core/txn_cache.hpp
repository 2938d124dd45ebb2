#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>

#include "core/amount.hpp"
#include "core/dispute_lifecycle.hpp"
#include "core/txn_record.hpp"

namespace core {

enum class EntryKind : std::uint8_t { Deposit, Withdrawal };

// Cached deposit or withdrawal. amount is signed: positive for deposits,
// negative for withdrawals.
struct TxnEntry {
    TxnId tx{0};
    ClientId client{0};
    Amount amount{};
    EntryKind kind{EntryKind::Deposit};
    DisputeState state{DisputeState::None};
};

static_assert(std::is_trivially_copyable_v<TxnEntry>, "TxnEntry must remain trivially copyable");

enum class PutResult : std::uint8_t { Inserted, Duplicate };

// TxnCache is a single-writer, open-addressed hash table keyed by TxnId that
// keeps every deposit and withdrawal for the lifetime of the run. There is no
// eviction: the bucket array doubles whenever the load factor passes 1/2, so
// memory is O(number of cached transactions). This is the scaling limit of the
// ledger; a bounded deployment would put an indexed external store behind the
// same put/get/mark_* calls.
class TxnCache {
public:
    // Largest accepted initial sizing. The table still grows past it on demand.
    static constexpr std::size_t max_capacity_hint = std::size_t{1} << 26;

    // Throws std::invalid_argument unless 0 < capacity_hint <= max_capacity_hint.
    explicit TxnCache(std::size_t capacity_hint);

    TxnCache(const TxnCache&) = delete;
    TxnCache& operator=(const TxnCache&) = delete;
    TxnCache(TxnCache&&) = delete;
    TxnCache& operator=(TxnCache&&) = delete;

    // May throw std::bad_alloc when growing.
    PutResult put(TxnId tx, ClientId client, Amount amount, EntryKind kind);

    std::optional<TxnEntry> get(TxnId tx) const noexcept;
    const TxnEntry* find(TxnId tx) const noexcept;

    // None -> Disputed and Disputed -> ResolvedFinal. Both return false for an
    // unknown tx or a transition the lifecycle rejects; the entry is unchanged.
    bool mark_disputed(TxnId tx) noexcept;
    bool mark_resolved(TxnId tx) noexcept;

    void clear() noexcept;

    std::size_t bucket_count() const noexcept { return bucket_count_; }
    std::size_t size() const noexcept { return size_; }

private:
    using SlotKey = std::uint64_t;
    // TxnId is 32 bits wide, so this never collides with a real key.
    static constexpr SlotKey empty_key_ = std::numeric_limits<SlotKey>::max();

    static std::size_t buckets_for(std::size_t capacity_hint);
    static std::size_t hash(SlotKey key) noexcept;
    static std::size_t probe(const SlotKey* keys, std::size_t mask, SlotKey key) noexcept;

    std::size_t mask() const noexcept { return bucket_count_ - 1; }
    std::size_t slot_of(TxnId tx) const noexcept;
    TxnEntry* find_mutable(TxnId tx) noexcept;
    bool transition(TxnId tx, DisputeState next) noexcept;
    void grow();

    std::size_t bucket_count_{0};
    std::size_t size_{0};
    std::unique_ptr<SlotKey[]> keys_;
    std::unique_ptr<TxnEntry[]> entries_;
};

} // namespace core
