// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/sync.h>
#include <utils/util.h>
#include <platform/platform-consts.h>
#include <platform/platform-error.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/ticket-factory.h>

using json = nlohmann::json;
using namespace std;

shared_ptr<CTicketSeries> CTicketSeriesTemplate::Instantiate(CPlatformContext& context, const address_t& address) const
{
    return make_shared<CTicketSeries>(context, shared_from_this(), address);
}

string CTicketSeriesTemplate::FormatTokenURI(const string& sBaseURI, const ticket_id_t nTicketId) const
{
    if (sBaseURI.empty())
        return string();
    return sBaseURI + to_string(nTicketId);
}

json CTicketSeriesTemplate::getJSON() const
{
    return json
    {
        { "name", m_sName },
        { "symbol", m_sSymbol },
        { "version", m_nVersion }
    };
}

CTicketFactory::CTicketFactory(CPlatformContext& context, address_t address, series_template_t pTemplate) :
    m_context(context),
    m_address(std::move(address)),
    m_pTemplate(std::move(pTemplate))
{
    if (!m_pTemplate)
        throw invalid_argument("ticket factory requires a series template");
}

address_t CTicketFactory::CreateEvent(const address_t& caller, const address_t& organization, const string& sBaseURI,
    const CAmount nPrice, const int64_t nDeadline, const uint64_t nMaxSupply, const address_t& platform)
{
    CLedgerNotifyScope notifyScope(m_context.GetEventLog());
    LOCK(m_context.cs_ledger);
    CStateTransaction tx(m_context.GetTxManager(), "factoryCreateEvent");

    if (is_zero_address(organization))
        throw validation_error("createEvent: organization cannot be the zero address");
    if (is_zero_address(platform))
        throw validation_error("createEvent: platform cannot be the zero address");
    if (caller != organization || !m_context.FindOrganization(organization))
        throw authorization_error(strprintf(
            "createEvent: caller [%s] cannot create ticket series for organization [%s]", caller, organization));
    if (platform != m_context.GetRegistry().GetAddress())
        throw validation_error(strprintf("createEvent: [%s] is not the platform registry", platform));
    CTicketSeries::ValidateParameters("createEvent", nPrice, nDeadline, nMaxSupply, tx.GetTime());

    const address_t series = m_context.GenerateAddress(tx, m_address, COMPONENT_KIND_SERIES);
    auto pSeries = m_pTemplate->Instantiate(m_context, series);
    m_context.PublishSeries(tx, pSeries);
    tx.Assign(m_nInstanceCount, m_nInstanceCount + 1);
    pSeries->Initialize(organization, platform, sBaseURI, nPrice, nDeadline, nMaxSupply);

    tx.SetOperationEvent(CLedgerEvent(LedgerEventID::SeriesInstantiated, m_address, caller,
        {
            { "series", series },
            { "template", m_pTemplate->GetSymbol() },
            { "version", m_pTemplate->GetVersion() },
            { "organization", organization },
            { "price", nPrice },
            { "deadline", nDeadline },
            { "maxSupply", nMaxSupply }
        }));
    tx.Commit();
    return series;
}

uint64_t CTicketFactory::GetInstanceCount() const
{
    LOCK(m_context.cs_ledger);
    return m_nInstanceCount;
}

json CTicketFactory::getJSON() const
{
    LOCK(m_context.cs_ledger);
    return json
    {
        { "address", m_address },
        { "template", m_pTemplate->getJSON() },
        { "instances", m_nInstanceCount }
    };
}
