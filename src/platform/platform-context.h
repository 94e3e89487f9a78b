#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <utils/sync.h>
#include <amount.h>
#include <ledger/address.h>
#include <ledger/payment-token.h>
#include <ledger/ledger-event.h>
#include <ledger/state-tx.h>
#include <platform/platform-config.h>

class CPlatformRegistry;
class CTicketFactory;
class COrganization;
class CTicketSeries;

using organization_t = std::shared_ptr<COrganization>;
using ticket_series_t = std::shared_ptr<CTicketSeries>;

/**
 * Platform execution context.
 * Owns the registry, the factory, every organization and ticket series (addressed by identity),
 * the payment token directory, the event log and the state transaction manager.
 * cs_ledger serializes all state-changing operations; nested cross-entity calls
 * re-enter it and join the outer state transaction.
 */
class CPlatformContext
{
public:
    explicit CPlatformContext(const CPlatformConfig& config);
    ~CPlatformContext();

    CPlatformContext(const CPlatformContext&) = delete;
    CPlatformContext& operator=(const CPlatformContext&) = delete;

    mutable CCriticalSection cs_ledger;

    CPlatformRegistry& GetRegistry() const noexcept { return *m_pRegistry; }
    CTicketFactory& GetFactory() const noexcept { return *m_pFactory; }
    CEventLog& GetEventLog() noexcept { return m_EventLog; }
    const CEventLog& GetEventLog() const noexcept { return m_EventLog; }
    CStateTxManager& GetTxManager() noexcept { return m_TxMgr; }

    // operation time: timestamp of the open state transaction or the current time
    int64_t GetCurrentTime() const noexcept;

    // generate next component address for the creator, the creator's nonce change is journaled
    address_t GenerateAddress(CStateTransaction& tx, const address_t& creator, const char* szKind);

    void PublishOrganization(CStateTransaction& tx, organization_t pOrganization);
    void PublishSeries(CStateTransaction& tx, ticket_series_t pSeries);

    organization_t FindOrganization(const address_t& address) const;
    ticket_series_t FindSeries(const address_t& address) const;
    // throw state_error if not found
    COrganization& GetOrganization(const address_t& address) const;
    CTicketSeries& GetSeries(const address_t& address) const;
    size_t GetOrganizationCount() const;
    size_t GetSeriesCount() const;

    // payment token directory
    bool RegisterToken(payment_token_t pToken, std::string &error);
    payment_token_t FindToken(const address_t& address) const;

    /**
     * Move tokens within the allowance granted to the spender, journal the reverse transfer.
     * Zero amount is not submitted to the token.
     * 
     * \throw payment_error if the token refuses the transfer
     */
    void TransferFrom(CStateTransaction& tx, const payment_token_t& pToken, const address_t& spender,
        const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose);
    // move tokens owned by "from", journal the reverse transfer
    void Transfer(CStateTransaction& tx, const payment_token_t& pToken,
        const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose);

    nlohmann::json getStateJSON() const;
    std::string ToJSON() const;

protected:
    CEventLog m_EventLog;
    CStateTxManager m_TxMgr;
    std::unique_ptr<CPlatformRegistry> m_pRegistry;
    std::unique_ptr<CTicketFactory> m_pFactory;

    std::map<address_t, organization_t> m_mapOrganizations;
    std::map<address_t, ticket_series_t> m_mapSeries;
    std::map<address_t, payment_token_t> m_mapTokens;
    std::map<address_t, uint64_t> m_mapNonces;

    void JournalReverseTransfer(CStateTransaction& tx, const payment_token_t& pToken,
        const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose);
};
