#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "core/account.hpp"
#include "core/ledger_engine.hpp"

namespace persist {

inline constexpr std::string_view snapshot_csv_header() noexcept {
    return "client,available,held,total,locked";
}

// "1,1.5000,0.0000,1.5000,false"
std::string format_snapshot_row(const core::AccountSnapshot& snap);

// Writes the header and one row per account. Returns false if the stream
// reports a write failure.
bool write_snapshot_csv(std::ostream& out, const core::AccountSnapshotRange& accounts);

} // namespace persist
