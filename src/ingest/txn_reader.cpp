#include "ingest/txn_reader.hpp"

#include <string_view>

namespace ingest {
namespace {

constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

} // namespace

TxnReadResult TxnReader::next(core::TxnRecord& out) {
    while (std::getline(in_, buffer_)) {
        ++line_no_;
        stats_.bytes_read += buffer_.size() + 1;

        if (line_no_ == 1 && std::string_view(buffer_).substr(0, utf8_bom.size()) == utf8_bom) {
            buffer_.erase(0, utf8_bom.size());
        }
        if (trim_field(buffer_).empty()) {
            ++stats_.blank_lines;
            continue;
        }
        if (!seen_content_) {
            seen_content_ = true;
            if (looks_like_header(buffer_)) {
                const ParseResult header = parse_header(buffer_, layout_);
                if (header != ParseResult::Ok) {
                    ++stats_.malformed;
                    return {TxnReadStatus::Malformed, line_no_, header};
                }
                ++stats_.header_lines;
                continue;
            }
        }

        const ParseResult parsed = parse_txn_record(buffer_, layout_, out);
        if (parsed != ParseResult::Ok) {
            ++stats_.malformed;
            return {TxnReadStatus::Malformed, line_no_, parsed};
        }
        ++stats_.records_ok;
        return {TxnReadStatus::Ok, line_no_, ParseResult::Ok};
    }

    if (in_.bad()) {
        return {TxnReadStatus::IoError, line_no_, ParseResult::Ok};
    }
    return {TxnReadStatus::EndOfStream, 0, ParseResult::Ok};
}

} // namespace ingest
