#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include <amount.h>
#include <ledger/address.h>
#include <platform/platform-config.h>

class CPlatformContext;
class CStateTransaction;

using s_addresses = std::set<address_t>;
using m_addresses = std::map<address_t, address_t>;

/**
 * Platform registry: directory of organizations and events, fee configuration, admin controls.
 * 
 * owner -> organization and organization -> owner maps are exact inverses of each other.
 * Global pause gates organization creation, ownership transfers, event registration
 * and every organization-level operation.
 */
class CPlatformRegistry
{
public:
    CPlatformRegistry(CPlatformContext& context, address_t address, const CPlatformConfig& config);

    CPlatformRegistry(const CPlatformRegistry&) = delete;
    CPlatformRegistry& operator=(const CPlatformRegistry&) = delete;

    // create organization owned by the caller, returns organization address
    address_t CreateOrganization(const address_t& caller);
    // move caller's organization to the new owner
    void TransferOrganizationOwnership(const address_t& caller, const address_t& newOwner);
    // called by an organization: track new active event
    void RegisterEvent(const address_t& callerOrg, const address_t& event);
    // called by an organization: move event from active to past set
    void MarkEventAsClosed(const address_t& callerOrg, const address_t& event);

    // admin operations
    void SetOrganizerStatus(const address_t& caller, const address_t& organizer, const bool bAllowed);
    void SetOrganizationStatus(const address_t& caller, const address_t& organization, const bool bActive);
    void UpdatePlatformFee(const address_t& caller, const int64_t nFeeBps);
    void UpdatePaymentToken(const address_t& caller, const address_t& token);
    void Pause(const address_t& caller);
    void Unpause(const address_t& caller);
    void TransferPlatformOwnership(const address_t& caller, const address_t& newOwner);
    // transfer accumulated platform fees in the given token to the owner
    CAmount WithdrawTokens(const address_t& caller, const address_t& token);

    const address_t& GetAddress() const noexcept { return m_address; }
    address_t GetOwner() const;
    uint32_t GetFeeBps() const;
    address_t GetPaymentToken() const;
    bool IsPaused() const;
    bool IsAllowedOrganizer(const address_t& organizer) const;
    bool IsOrganization(const address_t& organization) const;
    std::optional<address_t> GetOrganizationOf(const address_t& owner) const;
    std::optional<address_t> GetOwnerOf(const address_t& organization) const;
    bool IsActiveEvent(const address_t& event) const;
    bool IsPastEvent(const address_t& event) const;
    s_addresses GetActiveEvents() const;
    s_addresses GetPastEvents() const;
    size_t GetOrganizationCount() const;

    // check that owner <-> organization maps are exact injective inverses
    bool CheckOwnershipMappings(std::string &error) const;

    nlohmann::json getJSON() const;
    std::string ToJSON() const;

protected:
    CPlatformContext& m_context;
    const address_t m_address;
    address_t m_owner;
    uint32_t m_nFeeBps;
    address_t m_paymentToken;
    bool m_bPaused;
    std::atomic_bool m_bInWithdraw = false;

    s_addresses m_setAllowedOrganizers;
    std::map<address_t, bool> m_mapIsOrganization;
    m_addresses m_mapOwnerToOrganization;
    m_addresses m_mapOrganizationToOwner;
    s_addresses m_setActiveEvents;
    s_addresses m_setPastEvents;

    void CheckOwner(const address_t& caller, const char* szOperation) const;
    void CheckNotPaused(const char* szOperation) const;
    void CheckTrackedOrganization(const address_t& callerOrg, const char* szOperation) const;
};
