// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/util.h>
#include <platform/platform-error.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/organization.h>
#include <platform/ticket-factory.h>
#include <platform/ticket-series.h>

using json = nlohmann::json;
using namespace std;

CPlatformContext::CPlatformContext(const CPlatformConfig& config) :
    m_TxMgr(m_EventLog)
{
    string error;
    if (!config.Validate(error))
        throw validation_error(error);

    const address_t registryAddress = derive_address(config.GetPlatformOwner(), COMPONENT_KIND_REGISTRY, 0);
    const address_t factoryAddress = derive_address(registryAddress, COMPONENT_KIND_FACTORY, 0);
    m_pRegistry = make_unique<CPlatformRegistry>(*this, registryAddress, config);
    m_pFactory = make_unique<CTicketFactory>(*this, factoryAddress,
        make_shared<CTicketSeriesTemplate>(TICKET_SERIES_NAME, TICKET_SERIES_SYMBOL, TICKET_SERIES_VERSION));
    LogFnPrintf("platform registry [%s], ticket factory [%s], owner [%s], fee %u bps",
        registryAddress, factoryAddress, config.GetPlatformOwner(), config.GetFeeBps());
}

CPlatformContext::~CPlatformContext()
{
    // entities refer to the context, release them before the log and tx manager
    m_mapSeries.clear();
    m_mapOrganizations.clear();
    m_pFactory.reset();
    m_pRegistry.reset();
}

int64_t CPlatformContext::GetCurrentTime() const noexcept
{
    const auto pTx = m_TxMgr.GetCurrent();
    return pTx ? pTx->GetTime() : GetTime();
}

address_t CPlatformContext::GenerateAddress(CStateTransaction& tx, const address_t& creator, const char* szKind)
{
    LOCK(cs_ledger);
    const auto it = m_mapNonces.find(creator);
    const uint64_t nNonce = (it == m_mapNonces.cend() ? 0 : it->second) + 1;
    tx.SetValue(m_mapNonces, creator, nNonce);
    return derive_address(creator, szKind, nNonce);
}

void CPlatformContext::PublishOrganization(CStateTransaction& tx, organization_t pOrganization)
{
    LOCK(cs_ledger);
    const address_t address = pOrganization->GetAddress();
    if (m_mapOrganizations.count(address) || m_mapSeries.count(address))
        throw state_error(strprintf("address [%s] is already in use", address));
    tx.SetValue(m_mapOrganizations, address, std::move(pOrganization));
}

void CPlatformContext::PublishSeries(CStateTransaction& tx, ticket_series_t pSeries)
{
    LOCK(cs_ledger);
    const address_t address = pSeries->GetAddress();
    if (m_mapOrganizations.count(address) || m_mapSeries.count(address))
        throw state_error(strprintf("address [%s] is already in use", address));
    tx.SetValue(m_mapSeries, address, std::move(pSeries));
}

organization_t CPlatformContext::FindOrganization(const address_t& address) const
{
    LOCK(cs_ledger);
    const auto it = m_mapOrganizations.find(address);
    return it == m_mapOrganizations.cend() ? nullptr : it->second;
}

ticket_series_t CPlatformContext::FindSeries(const address_t& address) const
{
    LOCK(cs_ledger);
    const auto it = m_mapSeries.find(address);
    return it == m_mapSeries.cend() ? nullptr : it->second;
}

COrganization& CPlatformContext::GetOrganization(const address_t& address) const
{
    const auto pOrganization = FindOrganization(address);
    if (!pOrganization)
        throw state_error(strprintf("organization [%s] not found", address));
    return *pOrganization;
}

CTicketSeries& CPlatformContext::GetSeries(const address_t& address) const
{
    const auto pSeries = FindSeries(address);
    if (!pSeries)
        throw state_error(strprintf("ticket series [%s] not found", address));
    return *pSeries;
}

size_t CPlatformContext::GetOrganizationCount() const
{
    LOCK(cs_ledger);
    return m_mapOrganizations.size();
}

size_t CPlatformContext::GetSeriesCount() const
{
    LOCK(cs_ledger);
    return m_mapSeries.size();
}

bool CPlatformContext::RegisterToken(payment_token_t pToken, string &error)
{
    if (!pToken)
    {
        error = "payment token is not defined";
        return false;
    }
    const address_t address = pToken->GetAddress();
    if (is_zero_address(address))
    {
        error = "payment token address cannot be zero";
        return false;
    }
    LOCK(cs_ledger);
    if (m_mapTokens.count(address))
    {
        error = strprintf("payment token [%s] is already registered", address);
        return false;
    }
    m_mapTokens.emplace(address, std::move(pToken));
    return true;
}

payment_token_t CPlatformContext::FindToken(const address_t& address) const
{
    LOCK(cs_ledger);
    const auto it = m_mapTokens.find(address);
    return it == m_mapTokens.cend() ? nullptr : it->second;
}

void CPlatformContext::JournalReverseTransfer(CStateTransaction& tx, const payment_token_t& pToken,
    const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose)
{
    const string sPurpose(szPurpose);
    tx.AddUndo([pToken, from, to, nAmount, sPurpose]()
    {
        if (!pToken->transfer(to, from, nAmount))
            error("failed to return %s of %d %s from [%s] to [%s]", sPurpose, nAmount, pToken->GetSymbol(), to, from);
        else
            LogPrint("payment", "returned %s of %d %s from [%s] to [%s]\n", sPurpose, nAmount, pToken->GetSymbol(), to, from);
    });
}

void CPlatformContext::TransferFrom(CStateTransaction& tx, const payment_token_t& pToken, const address_t& spender,
    const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose)
{
    if (!nAmount)
        return;
    if (!pToken->transferFrom(spender, from, to, nAmount))
        throw payment_error(strprintf("%s transfer of %d %s from [%s] to [%s] failed",
            szPurpose, nAmount, pToken->GetSymbol(), from, to));
    JournalReverseTransfer(tx, pToken, from, to, nAmount, szPurpose);
}

void CPlatformContext::Transfer(CStateTransaction& tx, const payment_token_t& pToken,
    const address_t& from, const address_t& to, const CAmount nAmount, const char* szPurpose)
{
    if (!nAmount)
        return;
    if (!pToken->transfer(from, to, nAmount))
        throw payment_error(strprintf("%s transfer of %d %s from [%s] to [%s] failed",
            szPurpose, nAmount, pToken->GetSymbol(), from, to));
    JournalReverseTransfer(tx, pToken, from, to, nAmount, szPurpose);
}

json CPlatformContext::getStateJSON() const
{
    LOCK(cs_ledger);
    json jOrganizations = json::array();
    for (const auto& [address, pOrganization] : m_mapOrganizations)
        jOrganizations.push_back(pOrganization->getJSON());
    json jSeries = json::array();
    for (const auto& [address, pSeries] : m_mapSeries)
        jSeries.push_back(pSeries->getJSON());
    json jTokens = json::array();
    for (const auto& [address, pToken] : m_mapTokens)
        jTokens.push_back({ { "address", address }, { "symbol", pToken->GetSymbol() } });

    return json
    {
        { "registry", m_pRegistry->getJSON() },
        { "factory", m_pFactory->getJSON() },
        { "organizations", std::move(jOrganizations) },
        { "series", std::move(jSeries) },
        { "tokens", std::move(jTokens) },
        { "events", m_EventLog.size() }
    };
}

string CPlatformContext::ToJSON() const
{
    return getStateJSON().dump(4);
}
