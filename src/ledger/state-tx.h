#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <ledger/ledger-event.h>

class CStateTransaction;

/**
 * Tracks the stack of open state transactions.
 * Not synchronized: all access happens under the ledger critical section.
 */
class CStateTxManager
{
public:
    explicit CStateTxManager(CEventLog& eventLog) noexcept :
        m_EventLog(eventLog)
    {}
    CStateTxManager(const CStateTxManager&) = delete;
    CStateTxManager& operator=(const CStateTxManager&) = delete;

    bool IsInTransaction() const noexcept { return !m_vTxStack.empty(); }
    size_t GetDepth() const noexcept { return m_vTxStack.size(); }
    CStateTransaction* GetCurrent() const noexcept { return m_vTxStack.empty() ? nullptr : m_vTxStack.back(); }
    uint64_t GetCommittedCount() const noexcept { return m_nCommitted; }
    uint64_t GetRolledBackCount() const noexcept { return m_nRolledBack; }

protected:
    friend class CStateTransaction;

    CEventLog& m_EventLog;
    std::vector<CStateTransaction*> m_vTxStack;
    uint64_t m_nCommitted = 0;
    uint64_t m_nRolledBack = 0;
};

/**
 * Scoped state transaction.
 * Keeps an undo journal of internal mutations and the records emitted by the operation.
 * Commit of a nested transaction merges both into the parent; commit of the outermost one
 * publishes the records. Destruction without commit undoes the journal in reverse order
 * and discards the records.
 * The outermost transaction captures the operation timestamp, nested ones inherit it.
 */
class CStateTransaction
{
public:
    using undo_fn_t = std::function<void()>;

    CStateTransaction(CStateTxManager& txMgr, const char* szOperation);
    ~CStateTransaction();

    CStateTransaction(const CStateTransaction&) = delete;
    CStateTransaction& operator=(const CStateTransaction&) = delete;

    void Commit();

    bool IsNested() const noexcept { return m_pParent != nullptr; }
    bool IsCommitted() const noexcept { return m_bCommitted; }
    int64_t GetTime() const noexcept { return m_nTime; }
    const std::string& GetOperation() const noexcept { return m_sOperation; }
    size_t GetJournalSize() const noexcept { return m_vUndo.size(); }

    void AddUndo(undo_fn_t&& fnUndo);
    void AddEvent(CLedgerEvent&& event);
    // record of an operation built from nested component calls, replaces their records
    void SetOperationEvent(CLedgerEvent&& event);

    // assign new value to the variable, journal the old one
    template <typename T, typename V>
    void Assign(T& var, V&& newValue)
    {
        AddUndo([&var, oldValue = var]() mutable { var = std::move(oldValue); });
        var = std::forward<V>(newValue);
    }

    // insert value into std::set, journal the insertion
    template <typename C, typename K>
    bool Insert(C& container, const K& value)
    {
        if (!container.insert(value).second)
            return false;
        AddUndo([&container, value]() { container.erase(value); });
        return true;
    }

    // set std::map value, journal the previous value or its absence
    template <typename M, typename K, typename V>
    void SetValue(M& map, const K& key, V&& value)
    {
        auto it = map.find(key);
        if (it == map.end())
        {
            map.emplace(key, std::forward<V>(value));
            AddUndo([&map, key]() { map.erase(key); });
            return;
        }
        AddUndo([&map, key, oldValue = it->second]() mutable { map[key] = std::move(oldValue); });
        it->second = std::forward<V>(value);
    }

    // erase set or map entry, journal the erased entry
    template <typename C, typename K>
    bool Erase(C& container, const K& key)
    {
        auto it = container.find(key);
        if (it == container.end())
            return false;
        AddUndo([&container, entry = *it]() { container.insert(entry); });
        container.erase(it);
        return true;
    }

    template <typename V, typename T>
    void PushBack(V& vec, T&& value)
    {
        vec.push_back(std::forward<T>(value));
        AddUndo([&vec]() { vec.pop_back(); });
    }

protected:
    CStateTxManager& m_TxMgr;
    CStateTransaction* m_pParent;
    std::string m_sOperation;
    int64_t m_nTime;
    bool m_bCommitted = false;
    std::vector<undo_fn_t> m_vUndo;
    v_ledger_events m_vEvents;

    void Rollback() noexcept;
};
