#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <atomic>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include <amount.h>
#include <utils/container_types.h>
#include <ledger/address.h>

class CPlatformContext;

/**
 * Organization: creates and closes its ticket series, holds banner metadata.
 * Owned by one identity; pause and ownership are controlled by the platform registry.
 */
class COrganization
{
public:
    COrganization(CPlatformContext& context, address_t address, address_t owner, address_t platform);

    COrganization(const COrganization&) = delete;
    COrganization& operator=(const COrganization&) = delete;

    void UpdateBanner(const address_t& caller, const std::string& sBannerURI);
    /**
     * Create new ticket series and register it with the platform as one transaction.
     * 
     * \param caller - organization owner
     * \param sBaseURI - ticket metadata base URI
     * \param nPrice - ticket price, > 0
     * \param nDeadline - sales deadline, must be in the future
     * \param nMaxSupply - number of tickets, > 0
     * \return new ticket series address
     */
    address_t CreateEvent(const address_t& caller, const std::string& sBaseURI, const CAmount nPrice,
        const int64_t nDeadline, const uint64_t nMaxSupply);
    // close own series and move it to the platform's past events
    void CloseEvent(const address_t& caller, const address_t& series);
    void SetTicketPrice(const address_t& caller, const address_t& series, const CAmount nPrice);
    void SetDeadline(const address_t& caller, const address_t& series, const int64_t nDeadline);
    // transfer the whole token balance of this organization to the owner
    CAmount WithdrawTokens(const address_t& caller, const address_t& token);

    // platform-only operations
    void Pause(const address_t& caller);
    void Unpause(const address_t& caller);
    void UpdateOwner(const address_t& caller, const address_t& newOwner);

    const address_t& GetAddress() const noexcept { return m_address; }
    const address_t& GetPlatform() const noexcept { return m_platform; }
    address_t GetOwner() const;
    std::string GetBannerURI() const;
    bool IsPaused() const;
    // neither the platform nor the organization is paused
    bool IsOperational() const;
    v_strings GetEvents() const;

    nlohmann::json getJSON() const;
    std::string ToJSON() const;

protected:
    CPlatformContext& m_context;
    const address_t m_address;
    const address_t m_platform;
    address_t m_owner;
    std::string m_sBannerURI;
    bool m_bPaused = false;
    v_strings m_vEvents;
    std::atomic_bool m_bInWithdraw = false;

    void CheckOwner(const address_t& caller, const char* szOperation) const;
    void CheckPlatform(const address_t& caller, const char* szOperation) const;
    void CheckOperational(const char* szOperation) const;
    void CheckOwnSeries(const address_t& series, const char* szOperation) const;
};
