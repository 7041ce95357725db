/**
 * @file overview.cpp
 * @brief Account overview queries and generation-ticket bookkeeping
 */

#include "opentreasury/overview.hpp"

#include <format>
#include <utility>

namespace opentreasury::overview {

double lamports_to_sol(std::uint64_t lamports)
{
    return static_cast<double>(lamports) / static_cast<double>(kLamportsPerSol);
}

opentreasury::Result<AccountOverview> load_overview(const ledger::LedgerQueryService& query,
                                                    const std::string& treasury,
                                                    int limit)
{
    auto lamports = ledger::call_guarded([&] { return query.get_balance(treasury); });
    if (!lamports) {
        return std::unexpected(Error::make(
            errc::kNetwork, std::format("Failed to load balance of {}: {}", treasury, lamports.error().message)));
    }
    auto signatures =
        ledger::call_guarded([&] { return query.get_recent_transaction_signatures(treasury, limit); });
    if (!signatures) {
        return std::unexpected(Error::make(errc::kNetwork,
                                           std::format("Failed to load transactions of {}: {}",
                                                       treasury,
                                                       signatures.error().message)));
    }
    return AccountOverview{.treasury = treasury,
                           .lamports = *lamports,
                           .balance_sol = lamports_to_sol(*lamports),
                           .transactions = std::move(*signatures)};
}

opentreasury::Result<LoadTicket> OverviewLoader::begin(std::string_view treasury)
{
    const auto account = common::trim(treasury);
    if (!common::is_valid_account_id(account)) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Invalid treasury address: '{}'", account)));
    }
    std::lock_guard lock(m_mutex);
    const auto generation = m_generation.fetch_add(1) + 1;
    // The previous treasury's data must not stay on screen.
    m_current.reset();
    return LoadTicket{.generation = generation, .treasury = std::string(account)};
}

opentreasury::Result<bool> OverviewLoader::fetch(const LoadTicket& ticket,
                                                 const ledger::LedgerQueryService& query,
                                                 int limit)
{
    if (!is_current(ticket)) {
        return false;
    }
    auto loaded = load_overview(query, ticket.treasury, limit);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    return commit(ticket, std::move(*loaded));
}

bool OverviewLoader::commit(const LoadTicket& ticket, AccountOverview overview)
{
    std::lock_guard lock(m_mutex);
    if (!is_current(ticket)) {
        return false;
    }
    m_current = std::move(overview);
    return true;
}

std::optional<AccountOverview> OverviewLoader::current() const
{
    std::lock_guard lock(m_mutex);
    return m_current;
}

bool OverviewLoader::is_current(const LoadTicket& ticket) const
{
    return ticket.generation == m_generation.load();
}

}  // namespace opentreasury::overview
