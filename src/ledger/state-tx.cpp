// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <stdexcept>

#include <utils/str_utils.h>
#include <utils/util.h>
#include <ledger/state-tx.h>

using namespace std;

CStateTransaction::CStateTransaction(CStateTxManager& txMgr, const char* szOperation) :
    m_TxMgr(txMgr),
    m_pParent(txMgr.GetCurrent()),
    m_sOperation(SAFE_SZ(szOperation)),
    m_nTime(m_pParent ? m_pParent->GetTime() : ::GetTime())
{
    m_TxMgr.m_vTxStack.push_back(this);
}

CStateTransaction::~CStateTransaction()
{
    if (!m_bCommitted)
        Rollback();
    if (!m_TxMgr.m_vTxStack.empty() && m_TxMgr.m_vTxStack.back() == this)
        m_TxMgr.m_vTxStack.pop_back();
}

void CStateTransaction::AddUndo(undo_fn_t&& fnUndo)
{
    if (m_bCommitted)
        throw logic_error(strprintf("state transaction '%s' is already committed", m_sOperation));
    m_vUndo.push_back(std::move(fnUndo));
}

void CStateTransaction::AddEvent(CLedgerEvent&& event)
{
    if (m_bCommitted)
        throw logic_error(strprintf("state transaction '%s' is already committed", m_sOperation));
    event.SetTimestamp(m_nTime);
    m_vEvents.push_back(std::move(event));
}

void CStateTransaction::SetOperationEvent(CLedgerEvent&& event)
{
    if (m_bCommitted)
        throw logic_error(strprintf("state transaction '%s' is already committed", m_sOperation));
    m_vEvents.clear();
    event.SetTimestamp(m_nTime);
    m_vEvents.push_back(std::move(event));
}

void CStateTransaction::Commit()
{
    if (m_bCommitted)
        throw logic_error(strprintf("state transaction '%s' is already committed", m_sOperation));
    if (m_TxMgr.GetCurrent() != this)
        throw logic_error(strprintf("state transaction '%s' is not the innermost one", m_sOperation));
    m_bCommitted = true;
    // committed transaction is closed, the parent becomes the innermost one again
    m_TxMgr.m_vTxStack.pop_back();
    if (m_pParent)
    {
        // parent rollback undoes the nested changes as well
        for (auto& fnUndo : m_vUndo)
            m_pParent->m_vUndo.push_back(std::move(fnUndo));
        for (auto& event : m_vEvents)
            m_pParent->m_vEvents.push_back(std::move(event));
    } else {
        ++m_TxMgr.m_nCommitted;
        LogFnPrint("platform", "'%s' committed, %zu record(s)", m_sOperation, m_vEvents.size());
        m_TxMgr.m_EventLog.Publish(std::move(m_vEvents));
    }
    m_vUndo.clear();
    m_vEvents.clear();
}

void CStateTransaction::Rollback() noexcept
{
    try
    {
        for (auto it = m_vUndo.rbegin(); it != m_vUndo.rend(); ++it)
            (*it)();
        if (!m_pParent)
        {
            ++m_TxMgr.m_nRolledBack;
            LogFnPrint("platform", "'%s' rolled back, %zu change(s) undone", m_sOperation, m_vUndo.size());
        }
    } catch (const exception& e)
    {
        PrintExceptionContinue(&e, "state transaction rollback");
    }
    m_vUndo.clear();
    m_vEvents.clear();
}
