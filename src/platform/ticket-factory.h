#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include <amount.h>
#include <ledger/address.h>
#include <platform/ticket-series.h>

class CPlatformContext;

/**
 * Immutable ticket series template.
 * Shared by all series instantiated by the factory: each clone gets a new identity
 * and fresh storage, the behavior and metadata scheme come from the template.
 */
class CTicketSeriesTemplate : public std::enable_shared_from_this<CTicketSeriesTemplate>
{
public:
    CTicketSeriesTemplate(std::string sName, std::string sSymbol, const uint16_t nVersion) :
        m_sName(std::move(sName)),
        m_sSymbol(std::move(sSymbol)),
        m_nVersion(nVersion)
    {}

    // create uninitialized series bound to this template
    std::shared_ptr<CTicketSeries> Instantiate(CPlatformContext& context, const address_t& address) const;
    // ticket metadata URI: baseURI + ticket id, empty if base URI is empty
    std::string FormatTokenURI(const std::string& sBaseURI, const ticket_id_t nTicketId) const;

    const std::string& GetName() const noexcept { return m_sName; }
    const std::string& GetSymbol() const noexcept { return m_sSymbol; }
    uint16_t GetVersion() const noexcept { return m_nVersion; }

    nlohmann::json getJSON() const;

protected:
    const std::string m_sName;
    const std::string m_sSymbol;
    const uint16_t m_nVersion;
};

using series_template_t = std::shared_ptr<const CTicketSeriesTemplate>;

/**
 * Ticket factory: clones the template into a new series and runs its initializer.
 */
class CTicketFactory
{
public:
    CTicketFactory(CPlatformContext& context, address_t address, series_template_t pTemplate);

    CTicketFactory(const CTicketFactory&) = delete;
    CTicketFactory& operator=(const CTicketFactory&) = delete;

    /**
     * Instantiate and initialize new ticket series.
     * 
     * \param caller - must be the organization the series is created for
     * \param organization - organization reference of the new series
     * \param sBaseURI - ticket metadata base URI
     * \param nPrice - ticket price, > 0
     * \param nDeadline - sales deadline, must be in the future
     * \param nMaxSupply - number of tickets, > 0
     * \param platform - platform registry reference of the new series
     * \return new series address
     */
    address_t CreateEvent(const address_t& caller, const address_t& organization, const std::string& sBaseURI,
        const CAmount nPrice, const int64_t nDeadline, const uint64_t nMaxSupply, const address_t& platform);

    const address_t& GetAddress() const noexcept { return m_address; }
    const series_template_t& GetTemplate() const noexcept { return m_pTemplate; }
    uint64_t GetInstanceCount() const;

    nlohmann::json getJSON() const;

protected:
    CPlatformContext& m_context;
    const address_t m_address;
    const series_template_t m_pTemplate;
    uint64_t m_nInstanceCount = 0;
};
