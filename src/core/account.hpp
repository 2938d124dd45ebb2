#pragma once

#include <type_traits>

#include "core/amount.hpp"
#include "core/txn_record.hpp"

namespace core {

// Per-client balances. total is kept equal to available + held on every
// mutation rather than derived on read.
struct Account {
    Amount available{};
    Amount held{};
    Amount total{};
    bool locked{false};
};

struct AccountSnapshot {
    ClientId client{0};
    Account account{};
};

inline bool balances_consistent(const Account& acct) noexcept {
    Amount sum{};
    return checked_add(acct.available, acct.held, sum) && sum == acct.total;
}

static_assert(std::is_trivially_copyable_v<Account>, "Account must remain trivially copyable");
static_assert(std::is_trivially_copyable_v<AccountSnapshot>, "AccountSnapshot must remain trivially copyable");

} // namespace core
