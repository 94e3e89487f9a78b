#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <array>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <boost/signals2/signal.hpp>
#include <nlohmann/json.hpp>

#include <utils/enum_util.h>
#include <utils/sync.h>
#include <ledger/address.h>

/**
 * Ledger event (log record) type IDs.
 */
enum class LedgerEventID : uint8_t
{
    // platform registry
    OrganizerStatusChanged = 0,
    OrganizationCreated,
    OrganizationOwnershipTransferred,
    OrganizationStatusChanged,
    EventRegistered,
    EventMarkedClosed,
    PlatformFeeUpdated,
    PaymentTokenUpdated,
    PlatformPaused,
    PlatformUnpaused,
    PlatformOwnershipTransferred,
    PlatformTokensWithdrawn,
    // organization
    BannerUpdated,
    EventCreated,
    EventClosed,
    OrganizationPaused,
    OrganizationUnpaused,
    OrganizationOwnerUpdated,
    OrganizationTokensWithdrawn,
    // ticket factory
    SeriesInstantiated,
    // ticket series
    SeriesInitialized,
    TicketMinted,
    TicketResold,
    TicketTransferred,
    TicketPriceUpdated,
    DeadlineUpdated,
    SeriesClosed,

    COUNT,
    InvalidID = std::numeric_limits<uint8_t>::max()
};

using LedgerEventInfo = struct
{
    LedgerEventID id;
    const char* szName;        // record name
    const char* szEntityKind;  // kind of the emitting entity
};

static constexpr std::array<LedgerEventInfo, to_integral_type<LedgerEventID>(LedgerEventID::COUNT)> LEDGER_EVENT_INFO =
    {{
        //        event id                                 |       event name                    | entity kind
        { LedgerEventID::OrganizerStatusChanged,            "OrganizerStatusChanged",             "registry" },
        { LedgerEventID::OrganizationCreated,               "OrganizationCreated",                "registry" },
        { LedgerEventID::OrganizationOwnershipTransferred,  "OrganizationOwnershipTransferred",   "registry" },
        { LedgerEventID::OrganizationStatusChanged,         "OrganizationStatusChanged",          "registry" },
        { LedgerEventID::EventRegistered,                   "EventRegistered",                    "registry" },
        { LedgerEventID::EventMarkedClosed,                 "EventMarkedClosed",                  "registry" },
        { LedgerEventID::PlatformFeeUpdated,                "PlatformFeeUpdated",                 "registry" },
        { LedgerEventID::PaymentTokenUpdated,               "PaymentTokenUpdated",                "registry" },
        { LedgerEventID::PlatformPaused,                    "PlatformPaused",                     "registry" },
        { LedgerEventID::PlatformUnpaused,                  "PlatformUnpaused",                   "registry" },
        { LedgerEventID::PlatformOwnershipTransferred,      "PlatformOwnershipTransferred",       "registry" },
        { LedgerEventID::PlatformTokensWithdrawn,           "PlatformTokensWithdrawn",            "registry" },
        { LedgerEventID::BannerUpdated,                     "BannerUpdated",                      "organization" },
        { LedgerEventID::EventCreated,                      "EventCreated",                       "organization" },
        { LedgerEventID::EventClosed,                       "EventClosed",                        "organization" },
        { LedgerEventID::OrganizationPaused,                "OrganizationPaused",                 "organization" },
        { LedgerEventID::OrganizationUnpaused,              "OrganizationUnpaused",               "organization" },
        { LedgerEventID::OrganizationOwnerUpdated,          "OrganizationOwnerUpdated",           "organization" },
        { LedgerEventID::OrganizationTokensWithdrawn,       "OrganizationTokensWithdrawn",        "organization" },
        { LedgerEventID::SeriesInstantiated,                "SeriesInstantiated",                 "factory" },
        { LedgerEventID::SeriesInitialized,                 "SeriesInitialized",                  "series" },
        { LedgerEventID::TicketMinted,                      "TicketMinted",                       "series" },
        { LedgerEventID::TicketResold,                      "TicketResold",                       "series" },
        { LedgerEventID::TicketTransferred,                 "TicketTransferred",                  "series" },
        { LedgerEventID::TicketPriceUpdated,                "TicketPriceUpdated",                 "series" },
        { LedgerEventID::DeadlineUpdated,                   "DeadlineUpdated",                    "series" },
        { LedgerEventID::SeriesClosed,                      "SeriesClosed",                       "series" }
    }};

inline std::string GetLedgerEventName(const LedgerEventID id) noexcept
{
    std::string sName;
    if (id < LedgerEventID::COUNT)
        sName = LEDGER_EVENT_INFO[to_integral_type<LedgerEventID>(id)].szName;
    return sName;
}

/**
 * Structured record of one successful state transition.
 * Sequence number and timestamp are assigned by the state transaction.
 */
class CLedgerEvent
{
public:
    CLedgerEvent(const LedgerEventID id, address_t entity, address_t actor, nlohmann::json data = nlohmann::json::object()) :
        m_id(id),
        m_entity(std::move(entity)),
        m_actor(std::move(actor)),
        m_data(std::move(data))
    {}

    LedgerEventID ID() const noexcept { return m_id; }
    std::string GetName() const noexcept { return GetLedgerEventName(m_id); }
    uint64_t GetSequence() const noexcept { return m_nSequence; }
    int64_t GetTimestamp() const noexcept { return m_nTimestamp; }
    const address_t& GetEntity() const noexcept { return m_entity; }
    const address_t& GetActor() const noexcept { return m_actor; }
    const nlohmann::json& GetData() const noexcept { return m_data; }

    void SetSequence(const uint64_t nSequence) noexcept { m_nSequence = nSequence; }
    void SetTimestamp(const int64_t nTimestamp) noexcept { m_nTimestamp = nTimestamp; }

    nlohmann::json getJSON() const;
    std::string ToJSON() const;

protected:
    LedgerEventID m_id;
    uint64_t m_nSequence = 0;
    int64_t m_nTimestamp = 0;
    address_t m_entity;     // emitting entity
    address_t m_actor;      // acting identity (caller)
    nlohmann::json m_data;  // amounts and details
};

using v_ledger_events = std::vector<CLedgerEvent>;

/**
 * Append-only log of published ledger events.
 * Published records are queued for NotifyLedgerEvent subscribers. While a ledger operation
 * runs on the publishing thread (CLedgerNotifyScope), delivery waits until the outermost
 * operation has released its locks; otherwise records are delivered right away.
 * Subscribers receive records in sequence order, an exception thrown by a subscriber
 * is logged and does not reach the publisher.
 */
class CEventLog
{
public:
    CEventLog() = default;
    CEventLog(const CEventLog&) = delete;
    CEventLog& operator=(const CEventLog&) = delete;

    boost::signals2::signal<void (const CLedgerEvent&)> NotifyLedgerEvent;

    // publish records of a committed transaction, assigns sequence numbers
    void Publish(v_ledger_events &&vEvents);
    // deliver queued records to subscribers
    void NotifySubscribers();
    size_t GetPendingNotifyCount() const;

    size_t size() const;
    bool empty() const { return size() == 0; }
    v_ledger_events GetEvents() const;
    v_ledger_events GetEventsByEntity(const address_t& entity) const;
    size_t CountEvents(const LedgerEventID id) const;
    nlohmann::json getJSON() const;

protected:
    mutable CWaitableCriticalSection m_cs;
    v_ledger_events m_vEvents;
    v_ledger_events m_vPendingNotify;
    uint64_t m_nNextSequence = 1;

    // serializes delivery, held while subscribers run
    CCriticalSection m_csNotify;
    bool m_bNotifying = false;
};

/**
 * Marks a ledger operation running on the current thread.
 * Declared before the operation takes the ledger lock; the outermost scope
 * delivers queued records when it ends.
 */
class CLedgerNotifyScope
{
public:
    explicit CLedgerNotifyScope(CEventLog& eventLog) noexcept;
    ~CLedgerNotifyScope();

    CLedgerNotifyScope(const CLedgerNotifyScope&) = delete;
    CLedgerNotifyScope& operator=(const CLedgerNotifyScope&) = delete;

    // true if a ledger operation is running on the current thread
    static bool IsActive() noexcept;

private:
    CEventLog& m_EventLog;
};
