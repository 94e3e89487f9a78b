// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <algorithm>

#include <utils/sync.h>
#include <utils/util.h>
#include <platform/platform-consts.h>
#include <platform/platform-error.h>
#include <platform/fee-split.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/ticket-factory.h>
#include <platform/ticket-series.h>

using json = nlohmann::json;
using namespace std;

string GetSeriesStateName(const SeriesState state) noexcept
{
    string sName;
    if (state < SeriesState::COUNT)
        sName = SERIES_STATE_NAMES[to_integral_type<SeriesState>(state)];
    return sName;
}

CTicketSeries::CTicketSeries(CPlatformContext& context, shared_ptr<const CTicketSeriesTemplate> pTemplate, address_t address) :
    m_context(context),
    m_pTemplate(std::move(pTemplate)),
    m_address(std::move(address))
{}

void CTicketSeries::ValidateParameters(const char* szOperation, const CAmount nPrice, const int64_t nDeadline,
    const uint64_t nMaxSupply, const int64_t nNow)
{
    if (nDeadline <= nNow)
        throw validation_error(strprintf("%s: deadline %d must be in the future (now %d)", szOperation, nDeadline, nNow));
    if (nMaxSupply == 0)
        throw validation_error(strprintf("%s: max supply must be greater than zero", szOperation));
    if (nPrice <= 0 || nPrice > MAX_AMOUNT)
        throw validation_error(strprintf("%s: ticket price %d is out of range (0, %d]", szOperation, nPrice, MAX_AMOUNT));
}

void CTicketSeries::CheckOrganization(const address_t& caller, const char* szOperation) const
{
    if (m_state == SeriesState::Uninitialized)
        throw state_error(strprintf("%s: ticket series [%s] is not initialized", szOperation, m_address));
    if (caller != m_organization)
        throw authorization_error(strprintf(
            "%s: caller [%s] is not the organization [%s] of ticket series [%s]", szOperation, caller, m_organization, m_address));
}

void CTicketSeries::CheckTransferable(const char* szOperation, const int64_t nNow) const
{
    if (m_state == SeriesState::Uninitialized)
        throw state_error(strprintf("%s: ticket series [%s] is not initialized", szOperation, m_address));
    if (m_state == SeriesState::Closed)
        throw state_error(strprintf("%s: ticket series [%s] is closed", szOperation, m_address));
    if (nNow >= m_nDeadline)
        throw state_error(strprintf("%s: ticket series [%s] deadline %d has passed (now %d)", szOperation, m_address, m_nDeadline, nNow));
}

void CTicketSeries::CheckMinted(const ticket_id_t nTicketId, const char* szOperation) const
{
    if (nTicketId >= m_nCurrentSupply)
        throw state_error(strprintf("%s: ticket #%u of series [%s] is not minted", szOperation, nTicketId, m_address));
}

payment_token_t CTicketSeries::GetPaymentToken(const char* szOperation) const
{
    const address_t token = m_context.GetRegistry().GetPaymentToken();
    if (is_zero_address(token))
        throw payment_error(strprintf("%s: payment token is not configured", szOperation));
    auto pToken = m_context.FindToken(token);
    if (!pToken)
        throw payment_error(strprintf("%s: payment token [%s] is not available", szOperation, token));
    return pToken;
}

void CTicketSeries::AssignHolder(CStateTransaction& tx, const ticket_id_t nTicketId, const address_t& holder)
{
    tx.AddUndo([this, nTicketId, previousHolder = m_vHolders[nTicketId]]() { m_vHolders[nTicketId] = previousHolder; });
    m_vHolders[nTicketId] = holder;
}

void CTicketSeries::Initialize(const address_t& organization, const address_t& platform, const string& sBaseURI,
    const CAmount nPrice, const int64_t nDeadline, const uint64_t nMaxSupply)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("initialize: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "initialize");

    if (m_state != SeriesState::Uninitialized)
        throw state_error(strprintf("initialize: ticket series [%s] is already initialized", m_address));
    if (is_zero_address(organization))
        throw validation_error("initialize: organization cannot be the zero address");
    if (is_zero_address(platform))
        throw validation_error("initialize: platform cannot be the zero address");
    ValidateParameters("initialize", nPrice, nDeadline, nMaxSupply, tx.GetTime());

    tx.Assign(m_organization, organization);
    tx.Assign(m_platform, platform);
    tx.Assign(m_sBaseURI, sBaseURI);
    tx.Assign(m_nTicketPrice, nPrice);
    tx.Assign(m_nDeadline, nDeadline);
    tx.Assign(m_nMaxSupply, nMaxSupply);
    tx.Assign(m_state, SeriesState::Open);

    tx.AddEvent(CLedgerEvent(LedgerEventID::SeriesInitialized, m_address, organization,
        {
            { "organization", organization },
            { "platform", platform },
            { "baseURI", sBaseURI },
            { "price", nPrice },
            { "deadline", nDeadline },
            { "maxSupply", nMaxSupply }
        }));
    tx.Commit();
}

ticket_id_t CTicketSeries::Mint(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("mint: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "mint");

    CheckTransferable("mint", tx.GetTime());
    if (m_nCurrentSupply >= m_nMaxSupply)
        throw state_error(strprintf("mint: ticket series [%s] is sold out (%u tickets)", m_address, m_nMaxSupply));

    const auto pToken = GetPaymentToken("mint");
    const CAmount nPrice = m_nTicketPrice;
    const CAmount nAllowance = pToken->allowance(caller, m_address);
    if (nAllowance < nPrice)
        throw payment_error(strprintf("mint: allowance %d of [%s] is less than ticket price %d", nAllowance, caller, nPrice));

    const auto& registry = m_context.GetRegistry();
    const fee_split_t split = calculate_fee_split(nPrice, registry.GetFeeBps());
    m_context.TransferFrom(tx, pToken, m_address, caller, registry.GetAddress(), split.nFee, "platform fee");
    m_context.TransferFrom(tx, pToken, m_address, caller, m_organization, split.nRemainder, "ticket payment");

    // token calls are external, check again right before the assignment
    CheckTransferable("mint", tx.GetTime());
    if (m_nCurrentSupply >= m_nMaxSupply)
        throw state_error(strprintf("mint: ticket series [%s] is sold out (%u tickets)", m_address, m_nMaxSupply));

    const ticket_id_t nTicketId = m_nCurrentSupply;
    tx.PushBack(m_vHolders, caller);
    tx.Assign(m_nCurrentSupply, m_nCurrentSupply + 1);

    tx.AddEvent(CLedgerEvent(LedgerEventID::TicketMinted, m_address, caller,
        {
            { "ticketId", nTicketId },
            { "holder", caller },
            { "price", nPrice },
            { "fee", split.nFee },
            { "remainder", split.nRemainder },
            { "token", pToken->GetAddress() }
        }));
    tx.Commit();
    LogFnPrint("platform", "ticket #%u of series [%s] minted to [%s]", nTicketId, m_address, caller);
    return nTicketId;
}

void CTicketSeries::Resell(const address_t& caller, const ticket_id_t nTicketId, const address_t& to, const CAmount nPrice)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("resell: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "resell");

    CheckTransferable("resell", tx.GetTime());
    CheckMinted(nTicketId, "resell");
    if (m_vHolders[nTicketId] != caller)
        throw authorization_error(strprintf("resell: caller [%s] does not hold ticket #%u of series [%s]", caller, nTicketId, m_address));
    if (is_zero_address(to))
        throw validation_error("resell: buyer cannot be the zero address");
    if (nPrice <= 0 || nPrice > MAX_AMOUNT)
        throw validation_error(strprintf("resell: price %d is out of range (0, %d]", nPrice, MAX_AMOUNT));

    const auto pToken = GetPaymentToken("resell");
    const CAmount nAllowance = pToken->allowance(to, m_address);
    if (nAllowance < nPrice)
        throw payment_error(strprintf("resell: allowance %d of buyer [%s] is less than price %d", nAllowance, to, nPrice));

    const auto& registry = m_context.GetRegistry();
    const fee_split_t split = calculate_fee_split(nPrice, registry.GetFeeBps());
    m_context.TransferFrom(tx, pToken, m_address, to, registry.GetAddress(), split.nFee, "platform fee");
    m_context.TransferFrom(tx, pToken, m_address, to, caller, split.nRemainder, "resale payment");

    CheckTransferable("resell", tx.GetTime());
    if (m_vHolders[nTicketId] != caller)
        throw state_error(strprintf("resell: ticket #%u of series [%s] changed hands during payment", nTicketId, m_address));
    AssignHolder(tx, nTicketId, to);

    tx.AddEvent(CLedgerEvent(LedgerEventID::TicketResold, m_address, caller,
        {
            { "ticketId", nTicketId },
            { "seller", caller },
            { "buyer", to },
            { "price", nPrice },
            { "fee", split.nFee },
            { "remainder", split.nRemainder },
            { "token", pToken->GetAddress() }
        }));
    tx.Commit();
}

void CTicketSeries::TransferTicket(const address_t& caller, const address_t& to, const ticket_id_t nTicketId)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("transferTicket: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "transferTicket");

    CheckTransferable("transferTicket", tx.GetTime());
    CheckMinted(nTicketId, "transferTicket");
    if (m_vHolders[nTicketId] != caller)
        throw authorization_error(strprintf("transferTicket: caller [%s] does not hold ticket #%u of series [%s]", caller, nTicketId, m_address));
    if (is_zero_address(to))
        throw validation_error("transferTicket: recipient cannot be the zero address");

    AssignHolder(tx, nTicketId, to);
    tx.AddEvent(CLedgerEvent(LedgerEventID::TicketTransferred, m_address, caller,
        { { "ticketId", nTicketId }, { "from", caller }, { "to", to } }));
    tx.Commit();
}

void CTicketSeries::SetTicketPrice(const address_t& caller, const CAmount nPrice)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("setTicketPrice: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "setTicketPrice");

    CheckOrganization(caller, "setTicketPrice");
    if (m_state == SeriesState::Closed)
        throw state_error(strprintf("setTicketPrice: ticket series [%s] is closed", m_address));
    if (nPrice <= 0 || nPrice > MAX_AMOUNT)
        throw validation_error(strprintf("setTicketPrice: ticket price %d is out of range (0, %d]", nPrice, MAX_AMOUNT));

    const CAmount nOldPrice = m_nTicketPrice;
    tx.Assign(m_nTicketPrice, nPrice);
    tx.AddEvent(CLedgerEvent(LedgerEventID::TicketPriceUpdated, m_address, caller,
        { { "oldPrice", nOldPrice }, { "newPrice", nPrice } }));
    tx.Commit();
}

void CTicketSeries::SetDeadline(const address_t& caller, const int64_t nDeadline)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("setDeadline: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "setDeadline");

    CheckOrganization(caller, "setDeadline");
    if (m_state == SeriesState::Closed)
        throw state_error(strprintf("setDeadline: ticket series [%s] is closed", m_address));
    if (nDeadline <= tx.GetTime())
        throw validation_error(strprintf("setDeadline: deadline %d must be in the future (now %d)", nDeadline, tx.GetTime()));

    const int64_t nOldDeadline = m_nDeadline;
    tx.Assign(m_nDeadline, nDeadline);
    tx.AddEvent(CLedgerEvent(LedgerEventID::DeadlineUpdated, m_address, caller,
        { { "oldDeadline", nOldDeadline }, { "newDeadline", nDeadline } }));
    tx.Commit();
}

void CTicketSeries::Close(const address_t& caller)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CFlagGuard guard(m_bInCall);
    if (!guard.IsAcquired())
        throw state_error(strprintf("close: reentrant call on ticket series [%s]", m_address));
    CStateTransaction tx(m_context.GetTxManager(), "close");

    CheckOrganization(caller, "close");
    if (m_state == SeriesState::Closed)
        throw state_error(strprintf("close: ticket series [%s] is already closed", m_address));

    tx.Assign(m_state, SeriesState::Closed);
    tx.AddEvent(CLedgerEvent(LedgerEventID::SeriesClosed, m_address, caller,
        { { "currentSupply", m_nCurrentSupply }, { "maxSupply", m_nMaxSupply } }));
    tx.Commit();
}

bool CTicketSeries::ValidateTicket(const ticket_id_t nTicketId) const
{
    LOCK(m_context.cs_ledger);
    return m_state == SeriesState::Open &&
        nTicketId < m_nCurrentSupply &&
        m_context.GetCurrentTime() < m_nDeadline;
}

address_t CTicketSeries::GetOrganization() const
{
    LOCK(m_context.cs_ledger);
    return m_organization;
}

address_t CTicketSeries::GetPlatform() const
{
    LOCK(m_context.cs_ledger);
    return m_platform;
}

SeriesState CTicketSeries::GetState() const
{
    LOCK(m_context.cs_ledger);
    return m_state;
}

CAmount CTicketSeries::GetTicketPrice() const
{
    LOCK(m_context.cs_ledger);
    return m_nTicketPrice;
}

int64_t CTicketSeries::GetDeadline() const
{
    LOCK(m_context.cs_ledger);
    return m_nDeadline;
}

uint64_t CTicketSeries::GetMaxSupply() const
{
    LOCK(m_context.cs_ledger);
    return m_nMaxSupply;
}

uint64_t CTicketSeries::GetCurrentSupply() const
{
    LOCK(m_context.cs_ledger);
    return m_nCurrentSupply;
}

string CTicketSeries::GetBaseURI() const
{
    LOCK(m_context.cs_ledger);
    return m_sBaseURI;
}

address_t CTicketSeries::OwnerOf(const ticket_id_t nTicketId) const
{
    LOCK(m_context.cs_ledger);
    CheckMinted(nTicketId, "ownerOf");
    return m_vHolders[nTicketId];
}

uint64_t CTicketSeries::BalanceOf(const address_t& holder) const
{
    LOCK(m_context.cs_ledger);
    return static_cast<uint64_t>(count(m_vHolders.cbegin(), m_vHolders.cend(), holder));
}

v_ticket_ids CTicketSeries::TicketsOf(const address_t& holder) const
{
    v_ticket_ids vTicketIds;
    LOCK(m_context.cs_ledger);
    for (ticket_id_t nTicketId = 0; nTicketId < m_vHolders.size(); ++nTicketId)
    {
        if (m_vHolders[nTicketId] == holder)
            vTicketIds.push_back(nTicketId);
    }
    return vTicketIds;
}

string CTicketSeries::TokenURI(const ticket_id_t nTicketId) const
{
    LOCK(m_context.cs_ledger);
    CheckMinted(nTicketId, "tokenURI");
    return m_pTemplate->FormatTokenURI(m_sBaseURI, nTicketId);
}

json CTicketSeries::getJSON() const
{
    LOCK(m_context.cs_ledger);
    return json
    {
        { "address", m_address },
        { "template", m_pTemplate->GetSymbol() },
        { "organization", m_organization },
        { "platform", m_platform },
        { "state", GetSeriesStateName(m_state) },
        { "baseURI", m_sBaseURI },
        { "price", m_nTicketPrice },
        { "deadline", m_nDeadline },
        { "maxSupply", m_nMaxSupply },
        { "currentSupply", m_nCurrentSupply },
        { "holders", m_vHolders }
    };
}

string CTicketSeries::ToJSON() const
{
    return getJSON().dump(4);
}
