// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <algorithm>

#include <utils/util.h>
#include <ledger/ledger-event.h>

using json = nlohmann::json;
using namespace std;

json CLedgerEvent::getJSON() const
{
    return json
    {
        { "sequence", m_nSequence },
        { "event", GetName() },
        { "entity", m_entity },
        { "actor", m_actor },
        { "timestamp", m_nTimestamp },
        { "time", EncodeDumpTime(m_nTimestamp) },
        { "data", m_data }
    };
}

string CLedgerEvent::ToJSON() const
{
    return getJSON().dump(4);
}

// number of ledger operations running on this thread
static thread_local size_t nNotifyScopeDepth = 0;

CLedgerNotifyScope::CLedgerNotifyScope(CEventLog& eventLog) noexcept :
    m_EventLog(eventLog)
{
    ++nNotifyScopeDepth;
}

CLedgerNotifyScope::~CLedgerNotifyScope()
{
    if (--nNotifyScopeDepth == 0)
        m_EventLog.NotifySubscribers();
}

bool CLedgerNotifyScope::IsActive() noexcept
{
    return nNotifyScopeDepth > 0;
}

void CEventLog::Publish(v_ledger_events &&vEvents)
{
    if (vEvents.empty())
        return;
    {
        SIMPLE_LOCK(m_cs);
        for (auto& event : vEvents)
        {
            event.SetSequence(m_nNextSequence++);
            LogPrint("events", "[%u] %s entity=%s actor=%s %s\n", event.GetSequence(), event.GetName(),
                event.GetEntity(), event.GetActor(), event.GetData().dump());
            m_vEvents.push_back(event);
            m_vPendingNotify.push_back(std::move(event));
        }
    }
    if (!CLedgerNotifyScope::IsActive())
        NotifySubscribers();
}

void CEventLog::NotifySubscribers()
{
    LOCK(m_csNotify);
    // records published by a subscriber are picked up by the running delivery loop
    if (m_bNotifying)
        return;
    m_bNotifying = true;
    while (true)
    {
        v_ledger_events vPending;
        {
            SIMPLE_LOCK(m_cs);
            vPending.swap(m_vPendingNotify);
        }
        if (vPending.empty())
            break;
        for (const auto& event : vPending)
        {
            try
            {
                NotifyLedgerEvent(event);
            } catch (const exception& e)
            {
                PrintExceptionContinue(&e, strprintf("subscriber of %s #%u", event.GetName(), event.GetSequence()).c_str());
            }
        }
    }
    m_bNotifying = false;
}

size_t CEventLog::GetPendingNotifyCount() const
{
    SIMPLE_LOCK(m_cs);
    return m_vPendingNotify.size();
}

size_t CEventLog::size() const
{
    SIMPLE_LOCK(m_cs);
    return m_vEvents.size();
}

v_ledger_events CEventLog::GetEvents() const
{
    SIMPLE_LOCK(m_cs);
    return m_vEvents;
}

v_ledger_events CEventLog::GetEventsByEntity(const address_t& entity) const
{
    v_ledger_events v;
    SIMPLE_LOCK(m_cs);
    for (const auto& event : m_vEvents)
    {
        if (event.GetEntity() == entity)
            v.push_back(event);
    }
    return v;
}

size_t CEventLog::CountEvents(const LedgerEventID id) const
{
    SIMPLE_LOCK(m_cs);
    return count_if(m_vEvents.cbegin(), m_vEvents.cend(),
        [id](const auto& event) { return event.ID() == id; });
}

json CEventLog::getJSON() const
{
    json jEvents = json::array();
    SIMPLE_LOCK(m_cs);
    for (const auto& event : m_vEvents)
        jEvents.push_back(event.getJSON());
    return jEvents;
}
