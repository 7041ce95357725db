/**
 * @file test_snapshot_ledger.cpp
 * @brief RPC transaction parsing and the snapshot-backed query service
 */

#include "opentreasury/ledger.hpp"
#include "opentreasury/version.hpp"

#include <gtest/gtest.h>

using namespace opentreasury;
using ledger::SnapshotLedger;

namespace {

constexpr const char* kSchemaDir = OPENTREASURY_SCHEMA_DIR;
constexpr const char* kTreasury = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";
constexpr const char* kAnchorSig = "5VfYmGBjvxKjKjuxV7XFQTdLX2L5VVXJGVC5XGRmLBQ9";

nlohmann::json rpc_transaction(const nlohmann::json& program_id, const nlohmann::json& parsed)
{
    return {
        {"transaction", {{"message", {{"instructions", nlohmann::json::array({{{"programId", program_id}, {"parsed", parsed}}})}}}}}
    };
}

nlohmann::json sample_snapshot()
{
    return {
        {"schema_version", "ledger_snapshot.v1"},
        {"cluster", "devnet"},
        {"balances", {{kTreasury, 2'500'000'000ULL}}},
        {"signatures",
         {{kTreasury,
           nlohmann::json::array({
               {{"signature", "sig-c"}, {"slot", 300}, {"blockTime", 1714560000}, {"err", nullptr}},
               {{"signature", "sig-b"}, {"slot", 200}, {"blockTime", nullptr}, {"err", {{"InstructionError", 0}}}},
               {{"signature", "sig-a"}, {"slot", 100}},
           })}}},
        {"transactions", {{kAnchorSig, rpc_transaction(kMemoProgramId, "hello")}, {"gone", nullptr}}},
        {"anchor_point", {{"blockhash", "GHtXQBsoZHVnNFa9YevAzFr17DJjgHXk3ycTKD5xD3Zi"}, {"lastValidBlockHeight", 1234}}},
    };
}

}  // namespace

TEST(ParseRpcTransaction, ReadsStringProgramIds)
{
    auto tx = ledger::parse_rpc_transaction("sig", rpc_transaction(kMemoProgramId, "memo text"));
    ASSERT_TRUE(tx) << tx.error().message;
    EXPECT_EQ(tx->signature, "sig");
    ASSERT_EQ(tx->instructions.size(), 1U);
    EXPECT_EQ(tx->instructions[0].program_id, kMemoProgramId);
    EXPECT_EQ(tx->instructions[0].parsed, "memo text");
}

TEST(ParseRpcTransaction, ReadsPubkeyObjects)
{
    auto tx = ledger::parse_rpc_transaction(
        "sig", rpc_transaction({{"$pubkey", kMemoProgramId}}, {{"memo", "object form"}}));
    ASSERT_TRUE(tx) << tx.error().message;
    EXPECT_EQ(tx->instructions[0].program_id, kMemoProgramId);
    EXPECT_EQ(tx->instructions[0].parsed.at("memo"), "object form");
}

TEST(ParseRpcTransaction, MissingParsedIsNull)
{
    nlohmann::json response = {
        {"transaction", {{"message", {{"instructions", nlohmann::json::array({{{"programId", "11111111111111111111111111111111"}}})}}}}}
    };
    auto tx = ledger::parse_rpc_transaction("sig", response);
    ASSERT_TRUE(tx);
    EXPECT_TRUE(tx->instructions[0].parsed.is_null());
}

TEST(ParseRpcTransaction, RejectsMissingInstructionList)
{
    auto tx = ledger::parse_rpc_transaction("sig", {{"transaction", {{"message", {}}}}});
    ASSERT_FALSE(tx);
    EXPECT_EQ(tx.error().code, errc::kParse);
}

TEST(ParseRpcTransaction, RejectsUnreadableProgramId)
{
    auto tx = ledger::parse_rpc_transaction("sig", rpc_transaction(42, nullptr));
    ASSERT_FALSE(tx);
    EXPECT_EQ(tx.error().code, errc::kParse);
}

TEST(SnapshotLedger, AnswersBalanceQueries)
{
    auto ledger = SnapshotLedger::from_json(sample_snapshot(), kSchemaDir);
    ASSERT_TRUE(ledger) << ledger.error().message;

    auto balance = ledger->get_balance(kTreasury);
    ASSERT_TRUE(balance);
    EXPECT_EQ(*balance, 2'500'000'000ULL);

    auto unfunded = ledger->get_balance("4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T");
    ASSERT_TRUE(unfunded);
    EXPECT_EQ(*unfunded, 0U);
}

TEST(SnapshotLedger, SignaturesRespectLimitAndOrder)
{
    auto ledger = SnapshotLedger::from_json(sample_snapshot(), kSchemaDir);
    ASSERT_TRUE(ledger);

    auto all = ledger->get_recent_transaction_signatures(kTreasury, 10);
    ASSERT_TRUE(all);
    ASSERT_EQ(all->size(), 3U);
    EXPECT_EQ((*all)[0].signature, "sig-c");
    EXPECT_EQ((*all)[0].block_time, 1714560000);
    EXPECT_FALSE((*all)[0].err);
    EXPECT_FALSE((*all)[1].block_time);
    EXPECT_TRUE((*all)[1].err);
    EXPECT_FALSE((*all)[2].block_time);

    auto two = ledger->get_recent_transaction_signatures(kTreasury, 2);
    ASSERT_TRUE(two);
    EXPECT_EQ(two->size(), 2U);

    auto unknown = ledger->get_recent_transaction_signatures("nobody", 10);
    ASSERT_TRUE(unknown);
    EXPECT_TRUE(unknown->empty());
}

TEST(SnapshotLedger, TransactionLookup)
{
    auto ledger = SnapshotLedger::from_json(sample_snapshot(), kSchemaDir);
    ASSERT_TRUE(ledger);

    auto found = ledger->get_transaction_details(kAnchorSig);
    ASSERT_TRUE(found);
    ASSERT_TRUE(found->has_value());
    EXPECT_EQ((*found)->instructions[0].parsed, "hello");

    auto null_entry = ledger->get_transaction_details("gone");
    ASSERT_TRUE(null_entry);
    EXPECT_FALSE(null_entry->has_value());

    auto missing = ledger->get_transaction_details("never-seen");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing->has_value());
}

TEST(SnapshotLedger, AnchorPoint)
{
    auto ledger = SnapshotLedger::from_json(sample_snapshot(), kSchemaDir);
    ASSERT_TRUE(ledger);
    auto point = ledger->get_recent_anchor_point();
    ASSERT_TRUE(point);
    EXPECT_EQ(point->anchor_id, "GHtXQBsoZHVnNFa9YevAzFr17DJjgHXk3ycTKD5xD3Zi");
    EXPECT_EQ(point->expiry_height, 1234U);

    auto snapshot = sample_snapshot();
    snapshot.erase("anchor_point");
    auto without = SnapshotLedger::from_json(snapshot, kSchemaDir);
    ASSERT_TRUE(without);
    auto none = without->get_recent_anchor_point();
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, errc::kNetwork);
}

TEST(SnapshotLedger, RejectsInvalidSnapshot)
{
    auto snapshot = sample_snapshot();
    snapshot["balances"][kTreasury] = -5;
    auto ledger = SnapshotLedger::from_json(snapshot, kSchemaDir);
    ASSERT_FALSE(ledger);
    EXPECT_EQ(ledger.error().code, errc::kSchemaInvalid);
}

TEST(SnapshotLedger, LoadReportsMissingFile)
{
    auto ledger = SnapshotLedger::load("/nonexistent/snapshot.json", kSchemaDir);
    ASSERT_FALSE(ledger);
    EXPECT_EQ(ledger.error().code, errc::kIo);
}
