/**
 * @file test_overview.cpp
 * @brief Treasury overview loading and stale-result protection
 */

#include "opentreasury/overview.hpp"

#include "fake_ledger.hpp"

#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace opentreasury;
using overview::AccountOverview;
using overview::OverviewLoader;
using test_support::FakeLedgerQuery;

namespace {

constexpr const char* kTreasury = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";
constexpr const char* kOtherTreasury = "4Nd1mBQtrMJVYVfKf2PJy9NZUZdTAsp7D4xWLs4gDB4T";

FakeLedgerQuery funded_query()
{
    FakeLedgerQuery query;
    query.balances[kTreasury] = 1'500'000'000ULL;
    query.balances[kOtherTreasury] = 42;
    for (int i = 0; i < 5; ++i) {
        query.signatures[kTreasury].push_back(
            ledger::SignatureInfo{.signature = "sig-" + std::to_string(i),
                                  .slot = static_cast<std::uint64_t>(100 - i),
                                  .block_time = 1714560000 - i,
                                  .err = std::nullopt});
    }
    return query;
}

}  // namespace

TEST(Overview, LamportsToSol)
{
    EXPECT_DOUBLE_EQ(overview::lamports_to_sol(0), 0.0);
    EXPECT_DOUBLE_EQ(overview::lamports_to_sol(overview::kLamportsPerSol), 1.0);
    EXPECT_DOUBLE_EQ(overview::lamports_to_sol(1'500'000'000ULL), 1.5);
    EXPECT_DOUBLE_EQ(overview::lamports_to_sol(1), 1e-9);
}

TEST(Overview, LoadsBalanceAndSignatures)
{
    auto query = funded_query();
    auto loaded = overview::load_overview(query, kTreasury, 3);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->treasury, kTreasury);
    EXPECT_EQ(loaded->lamports, 1'500'000'000ULL);
    EXPECT_DOUBLE_EQ(loaded->balance_sol, 1.5);
    ASSERT_EQ(loaded->transactions.size(), 3U);
    EXPECT_EQ(loaded->transactions.front().signature, "sig-0");
}

TEST(Overview, QueryFailureIsNetworkError)
{
    auto query = funded_query();
    query.query_error = Error::make("RpcError", "503 Service Unavailable");
    auto loaded = overview::load_overview(query, kTreasury);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kNetwork);
    EXPECT_NE(loaded.error().message.find("503 Service Unavailable"), std::string::npos);
}

TEST(Overview, ThrownQueryErrorIsNetworkError)
{
    auto query = funded_query();
    query.throw_on_balance = true;
    auto loaded = overview::load_overview(query, kTreasury);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kNetwork);
    EXPECT_NE(loaded.error().message.find("connection reset by peer"), std::string::npos);
    EXPECT_NE(loaded.error().message.find(kTreasury), std::string::npos);

    OverviewLoader loader;
    auto ticket = loader.begin(kTreasury);
    ASSERT_TRUE(ticket);
    auto fetched = loader.fetch(*ticket, query);
    ASSERT_FALSE(fetched);
    EXPECT_EQ(fetched.error().code, errc::kNetwork);
    EXPECT_FALSE(loader.current());
}

TEST(OverviewLoader, RejectsInvalidAddress)
{
    OverviewLoader loader;
    auto ticket = loader.begin("not a treasury");
    ASSERT_FALSE(ticket);
    EXPECT_EQ(ticket.error().code, errc::kValidation);
}

TEST(OverviewLoader, TrimsAddress)
{
    OverviewLoader loader;
    auto ticket = loader.begin(std::string("  ") + kTreasury + "\n");
    ASSERT_TRUE(ticket);
    EXPECT_EQ(ticket->treasury, kTreasury);
}

TEST(OverviewLoader, FetchCommitsCurrentTicket)
{
    auto query = funded_query();
    OverviewLoader loader;
    auto ticket = loader.begin(kTreasury);
    ASSERT_TRUE(ticket);

    auto fetched = loader.fetch(*ticket, query);
    ASSERT_TRUE(fetched) << fetched.error().message;
    EXPECT_TRUE(*fetched);
    auto current = loader.current();
    ASSERT_TRUE(current);
    EXPECT_EQ(current->treasury, kTreasury);
    EXPECT_EQ(current->transactions.size(), 5U);
}

TEST(OverviewLoader, LateResultForPreviousTreasuryIsDropped)
{
    auto query = funded_query();
    OverviewLoader loader;
    auto first = loader.begin(kTreasury);
    ASSERT_TRUE(first);
    auto first_result = overview::load_overview(query, first->treasury);
    ASSERT_TRUE(first_result);

    // User switched treasuries before the first load came back.
    auto second = loader.begin(kOtherTreasury);
    ASSERT_TRUE(second);
    EXPECT_FALSE(loader.is_current(*first));
    EXPECT_FALSE(loader.current());

    EXPECT_FALSE(loader.commit(*first, *first_result));
    EXPECT_FALSE(loader.current());

    auto fetched = loader.fetch(*second, query);
    ASSERT_TRUE(fetched);
    EXPECT_TRUE(*fetched);
    EXPECT_EQ(loader.current()->treasury, kOtherTreasury);
    EXPECT_EQ(loader.current()->lamports, 42U);

    // Stale tickets are neither queried nor committed.
    auto stale = loader.fetch(*first, query);
    ASSERT_TRUE(stale);
    EXPECT_FALSE(*stale);
    EXPECT_EQ(loader.current()->treasury, kOtherTreasury);
}

TEST(OverviewLoader, ReloadOfSameTreasuryInvalidatesOlderTicket)
{
    OverviewLoader loader;
    auto first = loader.begin(kTreasury);
    auto second = loader.begin(kTreasury);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_GT(second->generation, first->generation);
    EXPECT_FALSE(loader.commit(*first, AccountOverview{.treasury = kTreasury}));
    EXPECT_TRUE(loader.commit(*second, AccountOverview{.treasury = kTreasury}));
}

TEST(OverviewLoader, ConcurrentCommitsKeepNewest)
{
    OverviewLoader loader;
    std::vector<overview::LoadTicket> tickets;
    for (int i = 0; i < 8; ++i) {
        auto ticket = loader.begin(kTreasury);
        ASSERT_TRUE(ticket);
        tickets.push_back(*ticket);
    }

    std::vector<std::thread> threads;
    for (const auto& ticket : tickets) {
        threads.emplace_back([&loader, ticket] {
            (void)loader.commit(ticket, AccountOverview{.treasury = kTreasury, .lamports = ticket.generation});
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto current = loader.current();
    ASSERT_TRUE(current);
    EXPECT_EQ(current->lamports, tickets.back().generation);
}
