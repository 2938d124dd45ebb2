#pragma once

#include <cstdint>
#include <type_traits>

#include "core/amount.hpp"

namespace core {

using ClientId = std::uint16_t;
using TxnId = std::uint32_t;

enum class TxnType : std::uint8_t { Deposit, Withdrawal, Dispute, Resolve, Chargeback };

inline constexpr const char* txn_type_name(TxnType t) noexcept {
    switch (t) {
    case TxnType::Deposit: return "deposit";
    case TxnType::Withdrawal: return "withdrawal";
    case TxnType::Dispute: return "dispute";
    case TxnType::Resolve: return "resolve";
    case TxnType::Chargeback: return "chargeback";
    }
    return "unknown";
}

// Deposits and withdrawals move money; the rest refer back to one of those.
inline constexpr bool moves_funds(TxnType t) noexcept {
    return t == TxnType::Deposit || t == TxnType::Withdrawal;
}

struct TxnRecord {
    TxnType type{TxnType::Deposit};
    ClientId client{0};
    TxnId tx{0};
    Amount amount{};
    bool has_amount{false};
};

static_assert(std::is_trivially_copyable_v<TxnRecord>, "TxnRecord must remain trivially copyable");

inline constexpr TxnRecord make_funds_record(TxnType type, ClientId client, TxnId tx, Amount amount) noexcept {
    TxnRecord rec{};
    rec.type = type;
    rec.client = client;
    rec.tx = tx;
    rec.amount = amount;
    rec.has_amount = true;
    return rec;
}

inline constexpr TxnRecord make_control_record(TxnType type, ClientId client, TxnId tx) noexcept {
    TxnRecord rec{};
    rec.type = type;
    rec.client = client;
    rec.tx = tx;
    return rec;
}

} // namespace core
