// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/sync.h>
#include <utils/util.h>
#include <platform/platform-consts.h>
#include <platform/platform-error.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/organization.h>
#include <platform/ticket-series.h>

using json = nlohmann::json;
using namespace std;

CPlatformRegistry::CPlatformRegistry(CPlatformContext& context, address_t address, const CPlatformConfig& config) :
    m_context(context),
    m_address(std::move(address)),
    m_owner(config.GetPlatformOwner()),
    m_nFeeBps(config.GetFeeBps()),
    m_paymentToken(config.GetPaymentToken()),
    m_bPaused(config.IsStartPaused())
{}

void CPlatformRegistry::CheckOwner(const address_t& caller, const char* szOperation) const
{
    if (caller != m_owner)
        throw authorization_error(strprintf(
            "%s: caller [%s] is not the platform owner [%s]", szOperation, caller, m_owner));
}

void CPlatformRegistry::CheckNotPaused(const char* szOperation) const
{
    if (m_bPaused)
        throw state_error(strprintf("%s: platform is paused", szOperation));
}

void CPlatformRegistry::CheckTrackedOrganization(const address_t& callerOrg, const char* szOperation) const
{
    const auto it = m_mapIsOrganization.find(callerOrg);
    if (it == m_mapIsOrganization.cend() || !it->second)
        throw authorization_error(strprintf(
            "%s: caller [%s] is not a registered organization", szOperation, callerOrg));
}

address_t CPlatformRegistry::CreateOrganization(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "createOrganization");

    CheckNotPaused("createOrganization");
    if (!m_setAllowedOrganizers.count(caller))
        throw authorization_error(strprintf(
            "createOrganization: caller [%s] is not an allowed organizer", caller));
    const auto itOwned = m_mapOwnerToOrganization.find(caller);
    if (itOwned != m_mapOwnerToOrganization.cend())
        throw state_error(strprintf(
            "createOrganization: caller [%s] already owns organization [%s]", caller, itOwned->second));

    const address_t organization = m_context.GenerateAddress(tx, m_address, COMPONENT_KIND_ORGANIZATION);
    m_context.PublishOrganization(tx, make_shared<COrganization>(m_context, organization, caller, m_address));
    tx.SetValue(m_mapOwnerToOrganization, caller, organization);
    tx.SetValue(m_mapOrganizationToOwner, organization, caller);
    tx.SetValue(m_mapIsOrganization, organization, true);

    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizationCreated, m_address, caller,
        { { "organization", organization }, { "owner", caller } }));
    tx.Commit();
    LogFnPrint("platform", "organization [%s] created for [%s]", organization, caller);
    return organization;
}

void CPlatformRegistry::TransferOrganizationOwnership(const address_t& caller, const address_t& newOwner)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "transferOrganizationOwnership");

    CheckNotPaused("transferOrganizationOwnership");
    if (is_zero_address(newOwner))
        throw validation_error("transferOrganizationOwnership: new owner cannot be the zero address");
    const auto itOwned = m_mapOwnerToOrganization.find(caller);
    if (itOwned == m_mapOwnerToOrganization.cend())
        throw state_error(strprintf(
            "transferOrganizationOwnership: caller [%s] does not own an organization", caller));
    const auto itNewOwned = m_mapOwnerToOrganization.find(newOwner);
    if (itNewOwned != m_mapOwnerToOrganization.cend())
        throw state_error(strprintf(
            "transferOrganizationOwnership: new owner [%s] already owns organization [%s]", newOwner, itNewOwned->second));

    const address_t organization = itOwned->second;
    tx.Erase(m_mapOwnerToOrganization, caller);
    tx.SetValue(m_mapOwnerToOrganization, newOwner, organization);
    tx.SetValue(m_mapOrganizationToOwner, organization, newOwner);
    m_context.GetOrganization(organization).UpdateOwner(m_address, newOwner);

    tx.SetOperationEvent(CLedgerEvent(LedgerEventID::OrganizationOwnershipTransferred, m_address, caller,
        { { "organization", organization }, { "previousOwner", caller }, { "newOwner", newOwner } }));
    tx.Commit();
}

void CPlatformRegistry::RegisterEvent(const address_t& callerOrg, const address_t& event)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "registerEvent");

    CheckNotPaused("registerEvent");
    CheckTrackedOrganization(callerOrg, "registerEvent");
    if (is_zero_address(event))
        throw validation_error("registerEvent: event cannot be the zero address");
    const auto pSeries = m_context.FindSeries(event);
    if (!pSeries || pSeries->GetOrganization() != callerOrg)
        throw authorization_error(strprintf(
            "registerEvent: event [%s] does not belong to organization [%s]", event, callerOrg));
    if (m_setActiveEvents.count(event) || m_setPastEvents.count(event))
        throw state_error(strprintf("registerEvent: event [%s] is already registered", event));

    tx.Insert(m_setActiveEvents, event);
    tx.AddEvent(CLedgerEvent(LedgerEventID::EventRegistered, m_address, callerOrg,
        { { "event", event }, { "organization", callerOrg } }));
    tx.Commit();
}

void CPlatformRegistry::MarkEventAsClosed(const address_t& callerOrg, const address_t& event)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "markEventAsClosed");

    CheckNotPaused("markEventAsClosed");
    CheckTrackedOrganization(callerOrg, "markEventAsClosed");
    if (!m_setActiveEvents.count(event))
        throw state_error(strprintf("markEventAsClosed: event [%s] is not active", event));
    const auto pSeries = m_context.FindSeries(event);
    if (!pSeries || pSeries->GetOrganization() != callerOrg)
        throw authorization_error(strprintf(
            "markEventAsClosed: event [%s] does not belong to organization [%s]", event, callerOrg));

    tx.Erase(m_setActiveEvents, event);
    tx.Insert(m_setPastEvents, event);
    tx.AddEvent(CLedgerEvent(LedgerEventID::EventMarkedClosed, m_address, callerOrg,
        { { "event", event }, { "organization", callerOrg } }));
    tx.Commit();
}

void CPlatformRegistry::SetOrganizerStatus(const address_t& caller, const address_t& organizer, const bool bAllowed)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "setOrganizerStatus");

    CheckOwner(caller, "setOrganizerStatus");
    if (is_zero_address(organizer))
        throw validation_error("setOrganizerStatus: organizer cannot be the zero address");
    if (bAllowed)
        tx.Insert(m_setAllowedOrganizers, organizer);
    else
        tx.Erase(m_setAllowedOrganizers, organizer);

    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizerStatusChanged, m_address, caller,
        { { "organizer", organizer }, { "allowed", bAllowed } }));
    tx.Commit();
}

void CPlatformRegistry::SetOrganizationStatus(const address_t& caller, const address_t& organization, const bool bActive)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "setOrganizationStatus");

    CheckOwner(caller, "setOrganizationStatus");
    if (!IsOrganization(organization))
        throw state_error(strprintf("setOrganizationStatus: [%s] is not a registered organization", organization));
    auto& org = m_context.GetOrganization(organization);
    if (bActive)
        org.Unpause(m_address);
    else
        org.Pause(m_address);

    tx.SetOperationEvent(CLedgerEvent(LedgerEventID::OrganizationStatusChanged, m_address, caller,
        { { "organization", organization }, { "active", bActive } }));
    tx.Commit();
}

void CPlatformRegistry::UpdatePlatformFee(const address_t& caller, const int64_t nFeeBps)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "updatePlatformFee");

    CheckOwner(caller, "updatePlatformFee");
    if (nFeeBps < 0 || nFeeBps > MAX_FEE_BPS)
        throw validation_error(strprintf(
            "updatePlatformFee: fee %d bps is out of range [0, %u]", nFeeBps, MAX_FEE_BPS));

    const uint32_t nOldFeeBps = m_nFeeBps;
    tx.Assign(m_nFeeBps, static_cast<uint32_t>(nFeeBps));
    tx.AddEvent(CLedgerEvent(LedgerEventID::PlatformFeeUpdated, m_address, caller,
        { { "oldFeeBps", nOldFeeBps }, { "newFeeBps", m_nFeeBps } }));
    tx.Commit();
}

void CPlatformRegistry::UpdatePaymentToken(const address_t& caller, const address_t& token)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "updatePaymentToken");

    CheckOwner(caller, "updatePaymentToken");
    if (is_zero_address(token))
        throw validation_error("updatePaymentToken: token cannot be the zero address");
    if (!m_context.FindToken(token))
        throw validation_error(strprintf("updatePaymentToken: token [%s] is not a known payment token", token));

    const address_t oldToken = m_paymentToken;
    tx.Assign(m_paymentToken, token);
    tx.AddEvent(CLedgerEvent(LedgerEventID::PaymentTokenUpdated, m_address, caller,
        { { "oldToken", oldToken }, { "newToken", token } }));
    tx.Commit();
}

void CPlatformRegistry::Pause(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "pause");

    CheckOwner(caller, "pause");
    if (m_bPaused)
        throw state_error("pause: platform is already paused");
    tx.Assign(m_bPaused, true);
    tx.AddEvent(CLedgerEvent(LedgerEventID::PlatformPaused, m_address, caller));
    tx.Commit();
}

void CPlatformRegistry::Unpause(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "unpause");

    CheckOwner(caller, "unpause");
    if (!m_bPaused)
        throw state_error("unpause: platform is not paused");
    tx.Assign(m_bPaused, false);
    tx.AddEvent(CLedgerEvent(LedgerEventID::PlatformUnpaused, m_address, caller));
    tx.Commit();
}

void CPlatformRegistry::TransferPlatformOwnership(const address_t& caller, const address_t& newOwner)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "transferPlatformOwnership");

    CheckOwner(caller, "transferPlatformOwnership");
    if (is_zero_address(newOwner))
        throw validation_error("transferPlatformOwnership: new owner cannot be the zero address");
    tx.Assign(m_owner, newOwner);
    tx.AddEvent(CLedgerEvent(LedgerEventID::PlatformOwnershipTransferred, m_address, caller,
        { { "previousOwner", caller }, { "newOwner", newOwner } }));
    tx.Commit();
}

CAmount CPlatformRegistry::WithdrawTokens(const address_t& caller, const address_t& token)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInWithdraw);
    if (!guard.IsAcquired())
        throw state_error("withdrawTokens: reentrant call");
    CStateTransaction tx(m_context.GetTxManager(), "withdrawTokens");

    CheckOwner(caller, "withdrawTokens");
    const auto pToken = m_context.FindToken(token);
    if (!pToken)
        throw validation_error(strprintf("withdrawTokens: token [%s] is not a known payment token", token));
    const CAmount nBalance = pToken->balanceOf(m_address);
    if (nBalance <= 0)
        throw payment_error(strprintf("withdrawTokens: platform has no %s balance", pToken->GetSymbol()));
    m_context.Transfer(tx, pToken, m_address, m_owner, nBalance, "platform fee withdrawal");

    tx.AddEvent(CLedgerEvent(LedgerEventID::PlatformTokensWithdrawn, m_address, caller,
        { { "token", token }, { "amount", nBalance }, { "to", m_owner } }));
    tx.Commit();
    return nBalance;
}

address_t CPlatformRegistry::GetOwner() const
{
    LOCK(m_context.cs_ledger);
    return m_owner;
}

uint32_t CPlatformRegistry::GetFeeBps() const
{
    LOCK(m_context.cs_ledger);
    return m_nFeeBps;
}

address_t CPlatformRegistry::GetPaymentToken() const
{
    LOCK(m_context.cs_ledger);
    return m_paymentToken;
}

bool CPlatformRegistry::IsPaused() const
{
    LOCK(m_context.cs_ledger);
    return m_bPaused;
}

bool CPlatformRegistry::IsAllowedOrganizer(const address_t& organizer) const
{
    LOCK(m_context.cs_ledger);
    return m_setAllowedOrganizers.count(organizer) > 0;
}

bool CPlatformRegistry::IsOrganization(const address_t& organization) const
{
    LOCK(m_context.cs_ledger);
    const auto it = m_mapIsOrganization.find(organization);
    return it != m_mapIsOrganization.cend() && it->second;
}

optional<address_t> CPlatformRegistry::GetOrganizationOf(const address_t& owner) const
{
    LOCK(m_context.cs_ledger);
    const auto it = m_mapOwnerToOrganization.find(owner);
    if (it == m_mapOwnerToOrganization.cend())
        return nullopt;
    return it->second;
}

optional<address_t> CPlatformRegistry::GetOwnerOf(const address_t& organization) const
{
    LOCK(m_context.cs_ledger);
    const auto it = m_mapOrganizationToOwner.find(organization);
    if (it == m_mapOrganizationToOwner.cend())
        return nullopt;
    return it->second;
}

bool CPlatformRegistry::IsActiveEvent(const address_t& event) const
{
    LOCK(m_context.cs_ledger);
    return m_setActiveEvents.count(event) > 0;
}

bool CPlatformRegistry::IsPastEvent(const address_t& event) const
{
    LOCK(m_context.cs_ledger);
    return m_setPastEvents.count(event) > 0;
}

s_addresses CPlatformRegistry::GetActiveEvents() const
{
    LOCK(m_context.cs_ledger);
    return m_setActiveEvents;
}

s_addresses CPlatformRegistry::GetPastEvents() const
{
    LOCK(m_context.cs_ledger);
    return m_setPastEvents;
}

size_t CPlatformRegistry::GetOrganizationCount() const
{
    LOCK(m_context.cs_ledger);
    return m_mapOrganizationToOwner.size();
}

bool CPlatformRegistry::CheckOwnershipMappings(string &error) const
{
    LOCK(m_context.cs_ledger);
    if (m_mapOwnerToOrganization.size() != m_mapOrganizationToOwner.size())
    {
        error = strprintf("owner map has %zu entries, organization map has %zu entries",
            m_mapOwnerToOrganization.size(), m_mapOrganizationToOwner.size());
        return false;
    }
    for (const auto& [owner, organization] : m_mapOwnerToOrganization)
    {
        const auto it = m_mapOrganizationToOwner.find(organization);
        if (it == m_mapOrganizationToOwner.cend() || it->second != owner)
        {
            error = strprintf("organization [%s] of owner [%s] does not map back to its owner", organization, owner);
            return false;
        }
        if (!IsOrganization(organization))
        {
            error = strprintf("organization [%s] is not flagged as an organization", organization);
            return false;
        }
    }
    return true;
}

json CPlatformRegistry::getJSON() const
{
    LOCK(m_context.cs_ledger);
    json jOrganizations = json::array();
    for (const auto& [organization, owner] : m_mapOrganizationToOwner)
        jOrganizations.push_back({ { "organization", organization }, { "owner", owner } });

    return json
    {
        { "address", m_address },
        { "owner", m_owner },
        { "feeBps", m_nFeeBps },
        { "paymentToken", m_paymentToken },
        { "paused", m_bPaused },
        { "allowedOrganizers", m_setAllowedOrganizers },
        { "organizations", std::move(jOrganizations) },
        { "activeEvents", m_setActiveEvents },
        { "pastEvents", m_setPastEvents }
    };
}

string CPlatformRegistry::ToJSON() const
{
    return getJSON().dump(4);
}
