#include "persist/snapshot_writer.hpp"

#include "core/amount.hpp"

namespace persist {

std::string format_snapshot_row(const core::AccountSnapshot& snap) {
    std::string row = std::to_string(snap.client);
    row.push_back(',');
    row += core::format_amount(snap.account.available);
    row.push_back(',');
    row += core::format_amount(snap.account.held);
    row.push_back(',');
    row += core::format_amount(snap.account.total);
    row.push_back(',');
    row += snap.account.locked ? "true" : "false";
    return row;
}

bool write_snapshot_csv(std::ostream& out, const core::AccountSnapshotRange& accounts) {
    out << snapshot_csv_header() << '\n';
    for (const core::AccountSnapshot snap : accounts) {
        out << format_snapshot_row(snap) << '\n';
    }
    out.flush();
    return static_cast<bool>(out);
}

} // namespace persist
