#include "core/txn_cache.hpp"

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <utility>

namespace core {

// Enough buckets to hold capacity_hint entries below the 1/2 load factor.
std::size_t TxnCache::buckets_for(std::size_t capacity_hint) {
    if (capacity_hint == 0 || capacity_hint > max_capacity_hint) {
        throw std::invalid_argument("TxnCache capacity_hint must be in [1, max_capacity_hint]");
    }
    return std::bit_ceil(capacity_hint * 2);
}

std::size_t TxnCache::hash(SlotKey key) noexcept {
    // splitmix64 finalizer; transaction ids are often sequential.
    key ^= key >> 30;
    key *= 0xbf58476d1ce4e5b9ULL;
    key ^= key >> 27;
    key *= 0x94d049bb133111ebULL;
    key ^= key >> 31;
    return static_cast<std::size_t>(key);
}

TxnCache::TxnCache(std::size_t capacity_hint)
    : bucket_count_(buckets_for(capacity_hint)),
      keys_(std::make_unique<SlotKey[]>(bucket_count_)),
      entries_(std::make_unique<TxnEntry[]>(bucket_count_)) {
    clear();
}

std::size_t TxnCache::probe(const SlotKey* keys, std::size_t mask, SlotKey key) noexcept {
    std::size_t idx = hash(key) & mask;
    // Load factor stays <= 1/2, so an empty bucket always terminates the probe.
    while (keys[idx] != empty_key_ && keys[idx] != key) {
        idx = (idx + 1) & mask;
    }
    return idx;
}

std::size_t TxnCache::slot_of(TxnId tx) const noexcept {
    return probe(keys_.get(), mask(), tx);
}

PutResult TxnCache::put(TxnId tx, ClientId client, Amount amount, EntryKind kind) {
    if (keys_[slot_of(tx)] == tx) {
        return PutResult::Duplicate;
    }
    if ((size_ + 1) * 2 > bucket_count_) {
        grow();
    }

    const std::size_t idx = slot_of(tx);
    keys_[idx] = tx;
    TxnEntry& entry = entries_[idx];
    entry.tx = tx;
    entry.client = client;
    entry.amount = amount;
    entry.kind = kind;
    entry.state = DisputeState::None;
    ++size_;
    return PutResult::Inserted;
}

const TxnEntry* TxnCache::find(TxnId tx) const noexcept {
    const std::size_t idx = slot_of(tx);
    if (keys_[idx] == empty_key_) {
        return nullptr;
    }
    return &entries_[idx];
}

TxnEntry* TxnCache::find_mutable(TxnId tx) noexcept {
    return const_cast<TxnEntry*>(std::as_const(*this).find(tx));
}

std::optional<TxnEntry> TxnCache::get(TxnId tx) const noexcept {
    if (const TxnEntry* entry = find(tx)) {
        return *entry;
    }
    return std::nullopt;
}

bool TxnCache::transition(TxnId tx, DisputeState next) noexcept {
    TxnEntry* entry = find_mutable(tx);
    if (!entry) {
        return false;
    }
    return apply_dispute_transition(entry->state, next);
}

bool TxnCache::mark_disputed(TxnId tx) noexcept {
    return transition(tx, DisputeState::Disputed);
}

bool TxnCache::mark_resolved(TxnId tx) noexcept {
    return transition(tx, DisputeState::ResolvedFinal);
}

void TxnCache::grow() {
    if (bucket_count_ > (std::numeric_limits<std::size_t>::max() >> 1)) {
        throw std::length_error("TxnCache bucket array cannot grow further");
    }
    const std::size_t new_count = bucket_count_ * 2;
    auto new_keys = std::make_unique<SlotKey[]>(new_count);
    auto new_entries = std::make_unique<TxnEntry[]>(new_count);
    std::fill_n(new_keys.get(), new_count, empty_key_);

    for (std::size_t i = 0; i < bucket_count_; ++i) {
        if (keys_[i] == empty_key_) {
            continue;
        }
        const std::size_t idx = probe(new_keys.get(), new_count - 1, keys_[i]);
        new_keys[idx] = keys_[i];
        new_entries[idx] = entries_[i];
    }

    keys_ = std::move(new_keys);
    entries_ = std::move(new_entries);
    bucket_count_ = new_count;
}

void TxnCache::clear() noexcept {
    std::fill_n(keys_.get(), bucket_count_, empty_key_);
    std::fill_n(entries_.get(), bucket_count_, TxnEntry{});
    size_ = 0;
}

} // namespace core
