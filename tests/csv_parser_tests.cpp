#include <gtest/gtest.h>

#include <string>

#include "ingest/csv_parser.hpp"

namespace {

TEST(CsvParserTest, ParseDepositOk) {
    core::TxnRecord rec{};
    ASSERT_EQ(ingest::parse_txn_record("deposit,1,1,1.0", rec), ingest::ParseResult::Ok);

    EXPECT_EQ(rec.type, core::TxnType::Deposit);
    EXPECT_EQ(rec.client, 1u);
    EXPECT_EQ(rec.tx, 1u);
    EXPECT_TRUE(rec.has_amount);
    EXPECT_EQ(rec.amount.raw(), 10'000);
}

TEST(CsvParserTest, ToleratesPaddingAndCarriageReturn) {
    core::TxnRecord rec{};
    ASSERT_EQ(ingest::parse_txn_record("withdrawal, 2,\t5 ,  1.5\r", rec), ingest::ParseResult::Ok);

    EXPECT_EQ(rec.type, core::TxnType::Withdrawal);
    EXPECT_EQ(rec.client, 2u);
    EXPECT_EQ(rec.tx, 5u);
    EXPECT_EQ(rec.amount.raw(), 15'000);
}

TEST(CsvParserTest, ControlRowsWithOrWithoutAmountColumn) {
    core::TxnRecord rec{};
    ASSERT_EQ(ingest::parse_txn_record("dispute,1,1,", rec), ingest::ParseResult::Ok);
    EXPECT_EQ(rec.type, core::TxnType::Dispute);
    EXPECT_FALSE(rec.has_amount);

    ASSERT_EQ(ingest::parse_txn_record("resolve, 1, 1", rec), ingest::ParseResult::Ok);
    EXPECT_EQ(rec.type, core::TxnType::Resolve);

    ASSERT_EQ(ingest::parse_txn_record("chargeback,3,9, ", rec), ingest::ParseResult::Ok);
    EXPECT_EQ(rec.type, core::TxnType::Chargeback);
    EXPECT_EQ(rec.client, 3u);
    EXPECT_EQ(rec.tx, 9u);
}

TEST(CsvParserTest, ControlRowWithAmountIsInvalid) {
    core::TxnRecord rec{};
    EXPECT_EQ(ingest::parse_txn_record("dispute,1,1,2.0", rec), ingest::ParseResult::Invalid);
}

TEST(CsvParserTest, MissingRequiredField) {
    core::TxnRecord rec{};
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,1", rec), ingest::ParseResult::MissingField);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,1,", rec), ingest::ParseResult::MissingField);
    EXPECT_EQ(ingest::parse_txn_record("deposit,,1,1.0", rec), ingest::ParseResult::MissingField);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1", rec), ingest::ParseResult::MissingField);
}

TEST(CsvParserTest, InvalidFields) {
    core::TxnRecord rec{};
    EXPECT_EQ(ingest::parse_txn_record("transfer,1,1,1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("Deposit,1,1,1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,-1,1,1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,65536,1,1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,4294967296,1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,1,abc", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,1,-1.0", rec), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_txn_record("deposit,1,1,1.0,extra", rec), ingest::ParseResult::Invalid);
}

TEST(CsvParserTest, FailedParseLeavesOutputUntouched) {
    core::TxnRecord rec = core::make_control_record(core::TxnType::Resolve, 7, 7);
    ASSERT_NE(ingest::parse_txn_record("deposit,1,1,x", rec), ingest::ParseResult::Ok);
    EXPECT_EQ(rec.type, core::TxnType::Resolve);
    EXPECT_EQ(rec.client, 7u);
}

TEST(CsvParserTest, ParseAmountForms) {
    core::Amount a{};
    ASSERT_TRUE(ingest::parse_amount("12", a));
    EXPECT_EQ(a.raw(), 120'000);
    ASSERT_TRUE(ingest::parse_amount("0.0001", a));
    EXPECT_EQ(a.raw(), 1);
    ASSERT_TRUE(ingest::parse_amount("+3.25", a));
    EXPECT_EQ(a.raw(), 32'500);
    ASSERT_TRUE(ingest::parse_amount("-3.25", a));
    EXPECT_EQ(a.raw(), -32'500);
    ASSERT_TRUE(ingest::parse_amount(".5", a));
    EXPECT_EQ(a.raw(), 5'000);
    ASSERT_TRUE(ingest::parse_amount("7.", a));
    EXPECT_EQ(a.raw(), 70'000);
    ASSERT_TRUE(ingest::parse_amount("2.500000", a)) << "trailing zeros beyond four digits are exact";
    EXPECT_EQ(a.raw(), 25'000);
}

TEST(CsvParserTest, ParseAmountRejects) {
    core::Amount a = core::Amount::from_raw(9);
    EXPECT_FALSE(ingest::parse_amount("", a));
    EXPECT_FALSE(ingest::parse_amount(".", a));
    EXPECT_FALSE(ingest::parse_amount("-", a));
    EXPECT_FALSE(ingest::parse_amount("1.23456", a));
    EXPECT_FALSE(ingest::parse_amount("1e5", a));
    EXPECT_FALSE(ingest::parse_amount("1.2.3", a));
    EXPECT_FALSE(ingest::parse_amount(" 1", a));
    EXPECT_EQ(a.raw(), 9);
}

TEST(CsvParserTest, ParseAmountRangeBoundary) {
    core::Amount a{};
    ASSERT_TRUE(ingest::parse_amount("922337203685477.5807", a));
    EXPECT_EQ(a, core::Amount::max());
    ASSERT_TRUE(ingest::parse_amount("-922337203685477.5807", a));
    EXPECT_EQ(a, core::Amount::min());

    EXPECT_FALSE(ingest::parse_amount("922337203685477.5808", a));
    EXPECT_FALSE(ingest::parse_amount("922337203685478", a));
    EXPECT_FALSE(ingest::parse_amount("99999999999999999999999", a));
}

TEST(CsvParserTest, ParseHeaderLayout) {
    ingest::ColumnLayout layout{};
    ASSERT_EQ(ingest::parse_header("tx, amount, type, client", layout), ingest::ParseResult::Ok);
    EXPECT_EQ(layout.tx, 0u);
    EXPECT_EQ(layout.amount, 1u);
    EXPECT_EQ(layout.type, 2u);
    EXPECT_EQ(layout.client, 3u);
    EXPECT_EQ(layout.width, 4u);

    core::TxnRecord rec{};
    ASSERT_EQ(ingest::parse_txn_record("7, 0.25, withdrawal, 3", layout, rec), ingest::ParseResult::Ok);
    EXPECT_EQ(rec.type, core::TxnType::Withdrawal);
    EXPECT_EQ(rec.client, 3u);
    EXPECT_EQ(rec.tx, 7u);
    EXPECT_EQ(rec.amount.raw(), 2'500);
}

TEST(CsvParserTest, ParseHeaderRejects) {
    ingest::ColumnLayout layout{};
    EXPECT_EQ(ingest::parse_header("type,client,tx,tx", layout), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_header("type,client,tx,", layout), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_header("type,client,tx,amount,memo", layout), ingest::ParseResult::Invalid);
    EXPECT_EQ(ingest::parse_header("type,tx,amount", layout), ingest::ParseResult::MissingField);
    EXPECT_EQ(layout.amount, 3u) << "layout untouched on failure";
}

TEST(CsvParserTest, LooksLikeHeader) {
    EXPECT_TRUE(ingest::looks_like_header("type,client,tx,amount"));
    EXPECT_TRUE(ingest::looks_like_header(" client ,type,tx"));
    EXPECT_FALSE(ingest::looks_like_header("deposit,1,1,1.0"));
    EXPECT_FALSE(ingest::looks_like_header("types,client"));
}

TEST(CsvParserTest, TrimField) {
    EXPECT_EQ(ingest::trim_field("  a b \t"), "a b");
    EXPECT_EQ(ingest::trim_field(" \r"), "");
    EXPECT_EQ(ingest::trim_field("x"), "x");
}

} // namespace
