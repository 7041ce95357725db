#pragma once

/**
 * @file overview.hpp
 * @brief Treasury balance and recent activity, with stale-load protection
 */

#include "opentreasury/common.hpp"
#include "opentreasury/ledger.hpp"
#include "opentreasury/version.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace opentreasury::overview {

inline constexpr std::uint64_t kLamportsPerSol = 1'000'000'000;

struct AccountOverview
{
    std::string treasury;
    std::uint64_t lamports = 0;
    double balance_sol = 0.0;
    std::vector<ledger::SignatureInfo> transactions;
};

[[nodiscard]] double lamports_to_sol(std::uint64_t lamports);

/// Balance and the newest @p limit signatures of @p treasury.
[[nodiscard]] opentreasury::Result<AccountOverview>
load_overview(const ledger::LedgerQueryService& query,
              const std::string& treasury,
              int limit = kDefaultSignatureLimit);

struct LoadTicket
{
    std::uint64_t generation = 0;
    std::string treasury;
};

/**
 * @brief Holds the overview of the treasury currently on screen
 *
 * Each begin() invalidates earlier tickets. A load finishing after the user
 * switched treasuries is dropped by commit(), so a slow response can never
 * overwrite a newer one.
 */
class OverviewLoader
{
public:
    /// Start a load for @p treasury (trimmed). Fails on an invalid account id.
    [[nodiscard]] opentreasury::Result<LoadTicket> begin(std::string_view treasury);

    /// Run the queries for @p ticket and commit the result.
    [[nodiscard]] opentreasury::Result<bool> fetch(const LoadTicket& ticket,
                                                   const ledger::LedgerQueryService& query,
                                                   int limit = kDefaultSignatureLimit);

    /// Store @p overview when @p ticket is still the newest; false when dropped.
    bool commit(const LoadTicket& ticket, AccountOverview overview);

    [[nodiscard]] std::optional<AccountOverview> current() const;
    [[nodiscard]] bool is_current(const LoadTicket& ticket) const;

private:
    std::atomic<std::uint64_t> m_generation{0};
    mutable std::mutex m_mutex;
    std::optional<AccountOverview> m_current;
};

}  // namespace opentreasury::overview
