// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/sync.h>
#include <utils/util.h>
#include <platform/platform-error.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/organization.h>
#include <platform/ticket-factory.h>
#include <platform/ticket-series.h>

using json = nlohmann::json;
using namespace std;

COrganization::COrganization(CPlatformContext& context, address_t address, address_t owner, address_t platform) :
    m_context(context),
    m_address(std::move(address)),
    m_platform(std::move(platform)),
    m_owner(std::move(owner))
{
    if (is_zero_address(m_owner))
        throw validation_error(strprintf("organization [%s] owner cannot be the zero address", m_address));
    if (is_zero_address(m_platform))
        throw validation_error(strprintf("organization [%s] platform cannot be the zero address", m_address));
}

void COrganization::CheckOwner(const address_t& caller, const char* szOperation) const
{
    if (caller != m_owner)
        throw authorization_error(strprintf(
            "%s: caller [%s] is not the owner of organization [%s]", szOperation, caller, m_address));
}

void COrganization::CheckPlatform(const address_t& caller, const char* szOperation) const
{
    if (caller != m_platform)
        throw authorization_error(strprintf(
            "%s: caller [%s] is not the platform registry of organization [%s]", szOperation, caller, m_address));
}

void COrganization::CheckOperational(const char* szOperation) const
{
    if (m_context.GetRegistry().IsPaused())
        throw state_error(strprintf("%s: platform is paused", szOperation));
    if (m_bPaused)
        throw state_error(strprintf("%s: organization [%s] is paused", szOperation, m_address));
}

void COrganization::CheckOwnSeries(const address_t& series, const char* szOperation) const
{
    const auto pSeries = m_context.FindSeries(series);
    if (!pSeries)
        throw state_error(strprintf("%s: ticket series [%s] not found", szOperation, series));
    if (pSeries->GetOrganization() != m_address)
        throw state_error(strprintf(
            "%s: ticket series [%s] does not belong to organization [%s]", szOperation, series, m_address));
}

void COrganization::UpdateBanner(const address_t& caller, const string& sBannerURI)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "updateBanner");

    CheckOwner(caller, "updateBanner");
    CheckOperational("updateBanner");
    tx.Assign(m_sBannerURI, sBannerURI);
    tx.AddEvent(CLedgerEvent(LedgerEventID::BannerUpdated, m_address, caller, { { "bannerURI", sBannerURI } }));
    tx.Commit();
}

address_t COrganization::CreateEvent(const address_t& caller, const string& sBaseURI, const CAmount nPrice,
    const int64_t nDeadline, const uint64_t nMaxSupply)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "createEvent");

    CheckOwner(caller, "createEvent");
    CheckOperational("createEvent");
    CTicketSeries::ValidateParameters("createEvent", nPrice, nDeadline, nMaxSupply, tx.GetTime());

    const address_t series = m_context.GetFactory().CreateEvent(m_address, m_address, sBaseURI,
        nPrice, nDeadline, nMaxSupply, m_platform);
    m_context.GetRegistry().RegisterEvent(m_address, series);
    tx.PushBack(m_vEvents, series);

    tx.SetOperationEvent(CLedgerEvent(LedgerEventID::EventCreated, m_address, caller,
        {
            { "event", series },
            { "factory", m_context.GetFactory().GetAddress() },
            { "baseURI", sBaseURI },
            { "price", nPrice },
            { "deadline", nDeadline },
            { "maxSupply", nMaxSupply }
        }));
    tx.Commit();
    LogFnPrint("platform", "organization [%s] created event [%s], price=%d, supply=%u", m_address, series, nPrice, nMaxSupply);
    return series;
}

void COrganization::CloseEvent(const address_t& caller, const address_t& series)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "closeEvent");

    CheckOwner(caller, "closeEvent");
    CheckOperational("closeEvent");
    CheckOwnSeries(series, "closeEvent");
    auto& ticketSeries = m_context.GetSeries(series);
    if (ticketSeries.IsClosed())
        throw state_error(strprintf("closeEvent: ticket series [%s] is already closed", series));

    ticketSeries.Close(m_address);
    m_context.GetRegistry().MarkEventAsClosed(m_address, series);
    tx.SetOperationEvent(CLedgerEvent(LedgerEventID::EventClosed, m_address, caller,
        { { "event", series }, { "supply", ticketSeries.GetCurrentSupply() } }));
    tx.Commit();
}

void COrganization::SetTicketPrice(const address_t& caller, const address_t& series, const CAmount nPrice)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "setTicketPrice");

    CheckOwner(caller, "setTicketPrice");
    CheckOperational("setTicketPrice");
    CheckOwnSeries(series, "setTicketPrice");
    m_context.GetSeries(series).SetTicketPrice(m_address, nPrice);
    tx.Commit();
}

void COrganization::SetDeadline(const address_t& caller, const address_t& series, const int64_t nDeadline)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "setDeadline");

    CheckOwner(caller, "setDeadline");
    CheckOperational("setDeadline");
    CheckOwnSeries(series, "setDeadline");
    m_context.GetSeries(series).SetDeadline(m_address, nDeadline);
    tx.Commit();
}

CAmount COrganization::WithdrawTokens(const address_t& caller, const address_t& token)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInWithdraw);
    if (!guard.IsAcquired())
        throw state_error(strprintf("withdrawTokens: reentrant call on organization [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "withdrawTokens");

    CheckOwner(caller, "withdrawTokens");
    const auto pToken = m_context.FindToken(token);
    if (!pToken)
        throw validation_error(strprintf("withdrawTokens: token [%s] is not a known payment token", token));
    const CAmount nBalance = pToken->balanceOf(m_address);
    if (nBalance <= 0)
        throw payment_error(strprintf("withdrawTokens: organization [%s] has no %s balance", m_address, pToken->GetSymbol()));
    m_context.Transfer(tx, pToken, m_address, m_owner, nBalance, "organization withdrawal");

    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizationTokensWithdrawn, m_address, caller,
        { { "token", token }, { "amount", nBalance }, { "to", m_owner } }));
    tx.Commit();
    return nBalance;
}

void COrganization::Pause(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "pauseOrganization");

    CheckPlatform(caller, "pause");
    if (m_bPaused)
        throw state_error(strprintf("pause: organization [%s] is already paused", m_address));
    tx.Assign(m_bPaused, true);
    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizationPaused, m_address, caller));
    tx.Commit();
}

void COrganization::Unpause(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "unpauseOrganization");

    CheckPlatform(caller, "unpause");
    if (!m_bPaused)
        throw state_error(strprintf("unpause: organization [%s] is not paused", m_address));
    tx.Assign(m_bPaused, false);
    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizationUnpaused, m_address, caller));
    tx.Commit();
}

void COrganization::UpdateOwner(const address_t& caller, const address_t& newOwner)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "updateOwner");

    CheckPlatform(caller, "updateOwner");
    if (is_zero_address(newOwner))
        throw validation_error(strprintf("updateOwner: new owner of organization [%s] cannot be the zero address", m_address));
    const address_t previousOwner = m_owner;
    tx.Assign(m_owner, newOwner);
    tx.AddEvent(CLedgerEvent(LedgerEventID::OrganizationOwnerUpdated, m_address, caller,
        { { "previousOwner", previousOwner }, { "newOwner", newOwner } }));
    tx.Commit();
}

address_t COrganization::GetOwner() const
{
    LOCK(m_context.cs_ledger);
    return m_owner;
}

string COrganization::GetBannerURI() const
{
    LOCK(m_context.cs_ledger);
    return m_sBannerURI;
}

bool COrganization::IsPaused() const
{
    LOCK(m_context.cs_ledger);
    return m_bPaused;
}

bool COrganization::IsOperational() const
{
    LOCK(m_context.cs_ledger);
    return !m_bPaused && !m_context.GetRegistry().IsPaused();
}

v_strings COrganization::GetEvents() const
{
    LOCK(m_context.cs_ledger);
    return m_vEvents;
}

json COrganization::getJSON() const
{
    LOCK(m_context.cs_ledger);
    return json
    {
        { "address", m_address },
        { "owner", m_owner },
        { "platform", m_platform },
        { "bannerURI", m_sBannerURI },
        { "paused", m_bPaused },
        { "events", m_vEvents }
    };
}

string COrganization::ToJSON() const
{
    return getJSON().dump(4);
}
