#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <amount.h>
#include <utils/enum_util.h>
#include <ledger/address.h>
#include <ledger/payment-token.h>

class CPlatformContext;
class CTicketSeriesTemplate;
class CStateTransaction;

using ticket_id_t = uint64_t;
using v_ticket_ids = std::vector<ticket_id_t>;

/**
 * Ticket series lifecycle: Uninitialized -> Open -> Closed.
 * Closed is terminal.
 */
enum class SeriesState : uint8_t
{
    Uninitialized = 0,
    Open,
    Closed,

    COUNT
};

static constexpr std::array<const char*, to_integral_type<SeriesState>(SeriesState::COUNT)> SERIES_STATE_NAMES =
    { "uninitialized", "open", "closed" };

std::string GetSeriesStateName(const SeriesState state) noexcept;

// Ticket Series ////////////////////////////////////////////////////////////////////////////////////////////////
/*
	"series": {
		"address": string,       // series identity
		"organization": string,  // organization that created the series, set once by initialize
		"platform": string,      // platform registry, set once by initialize
		"state": string,         // uninitialized | open | closed
		"baseURI": string,       // ticket metadata base URI, tokenURI = baseURI + ticket id
		"price": int,            // ticket price in payment token units
		"deadline": int,         // sales deadline (Unix time), tickets are transferable before it
		"maxSupply": int,        // total number of tickets
		"currentSupply": int,    // number of minted tickets, ticket ids are 0..currentSupply-1
		"holders": [string]      // ticket holders indexed by ticket id
	}
 */
class CTicketSeries
{
public:
    CTicketSeries(CPlatformContext& context, std::shared_ptr<const CTicketSeriesTemplate> pTemplate, address_t address);

    CTicketSeries(const CTicketSeries&) = delete;
    CTicketSeries& operator=(const CTicketSeries&) = delete;

    // one-shot initializer: Uninitialized -> Open
    void Initialize(const address_t& organization, const address_t& platform, const std::string& sBaseURI,
        const CAmount nPrice, const int64_t nDeadline, const uint64_t nMaxSupply);

    // buy next ticket at the current price, returns ticket id
    ticket_id_t Mint(const address_t& caller);
    // sell held ticket to the buyer, the buyer pays the price
    void Resell(const address_t& caller, const ticket_id_t nTicketId, const address_t& to, const CAmount nPrice);
    // hand over held ticket without payment
    void TransferTicket(const address_t& caller, const address_t& to, const ticket_id_t nTicketId);

    // organization-only operations
    void SetTicketPrice(const address_t& caller, const CAmount nPrice);
    void SetDeadline(const address_t& caller, const int64_t nDeadline);
    void Close(const address_t& caller);

    // true if ticket was minted, series is not closed and the deadline has not passed
    bool ValidateTicket(const ticket_id_t nTicketId) const;

    const address_t& GetAddress() const noexcept { return m_address; }
    const std::shared_ptr<const CTicketSeriesTemplate>& GetTemplate() const noexcept { return m_pTemplate; }
    address_t GetOrganization() const;
    address_t GetPlatform() const;
    SeriesState GetState() const;
    bool IsInitialized() const { return GetState() != SeriesState::Uninitialized; }
    bool IsClosed() const { return GetState() == SeriesState::Closed; }
    CAmount GetTicketPrice() const;
    int64_t GetDeadline() const;
    uint64_t GetMaxSupply() const;
    uint64_t GetCurrentSupply() const;
    std::string GetBaseURI() const;

    // ticket holder, throws state_error if the ticket was not minted
    address_t OwnerOf(const ticket_id_t nTicketId) const;
    uint64_t BalanceOf(const address_t& holder) const;
    v_ticket_ids TicketsOf(const address_t& holder) const;
    std::string TokenURI(const ticket_id_t nTicketId) const;

    nlohmann::json getJSON() const;
    std::string ToJSON() const;

    /**
     * Validate series parameters.
     * 
     * \throw validation_error for non-positive price, non-future deadline or zero supply
     */
    static void ValidateParameters(const char* szOperation, const CAmount nPrice, const int64_t nDeadline,
        const uint64_t nMaxSupply, const int64_t nNow);

protected:
    CPlatformContext& m_context;
    const std::shared_ptr<const CTicketSeriesTemplate> m_pTemplate;
    const address_t m_address;

    address_t m_organization;
    address_t m_platform;
    SeriesState m_state = SeriesState::Uninitialized;
    std::string m_sBaseURI;
    CAmount m_nTicketPrice = 0;
    int64_t m_nDeadline = 0;
    uint64_t m_nMaxSupply = 0;
    uint64_t m_nCurrentSupply = 0;
    std::vector<address_t> m_vHolders; // index = ticket id

    // set while a mutator runs, rejects reentrant calls
    std::atomic_bool m_bInCall = false;

    void CheckOrganization(const address_t& caller, const char* szOperation) const;
    // Open and before the deadline
    void CheckTransferable(const char* szOperation, const int64_t nNow) const;
    void CheckMinted(const ticket_id_t nTicketId, const char* szOperation) const;
    payment_token_t GetPaymentToken(const char* szOperation) const;
    void AssignHolder(CStateTransaction& tx, const ticket_id_t nTicketId, const address_t& holder);
};
