// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/util.h>
#include <ledger/token-ledger.h>

using json = nlohmann::json;
using namespace std;

CAmount CTokenLedger::balanceOf(const address_t& holder) const
{
    SIMPLE_LOCK(m_cs);
    const auto it = m_mapBalances.find(holder);
    return it == m_mapBalances.cend() ? 0 : it->second;
}

CAmount CTokenLedger::allowance(const address_t& owner, const address_t& spender) const
{
    SIMPLE_LOCK(m_cs);
    const auto it = m_mapAllowances.find(owner);
    if (it == m_mapAllowances.cend())
        return 0;
    const auto itSpender = it->second.find(spender);
    return itSpender == it->second.cend() ? 0 : itSpender->second;
}

// m_cs must be held
bool CTokenLedger::MoveBalance(const address_t& from, const address_t& to, const CAmount nAmount)
{
    if (!AmountRange(nAmount) || is_zero_address(to))
        return false;
    auto itFrom = m_mapBalances.find(from);
    if (itFrom == m_mapBalances.end() || itFrom->second < nAmount)
        return false;
    itFrom->second -= nAmount;
    m_mapBalances[to] += nAmount;
    return true;
}

bool CTokenLedger::transfer(const address_t& from, const address_t& to, const CAmount nAmount)
{
    SIMPLE_LOCK(m_cs);
    const bool bMoved = MoveBalance(from, to, nAmount);
    LogFnPrint("payment", "%s: %s -> %s, amount=%d %s", m_sSymbol, from, to, nAmount, bMoved ? "OK" : "FAILED");
    return bMoved;
}

bool CTokenLedger::transferFrom(const address_t& spender, const address_t& from, const address_t& to, const CAmount nAmount)
{
    SIMPLE_LOCK(m_cs);
    bool bMoved = false;
    do
    {
        auto itOwner = m_mapAllowances.find(from);
        if (itOwner == m_mapAllowances.end())
            break;
        auto itSpender = itOwner->second.find(spender);
        if (itSpender == itOwner->second.end() || itSpender->second < nAmount)
            break;
        if (!MoveBalance(from, to, nAmount))
            break;
        itSpender->second -= nAmount;
        bMoved = true;
    } while (false);
    LogFnPrint("payment", "%s: %s -> %s by %s, amount=%d %s", m_sSymbol, from, to, spender, nAmount, bMoved ? "OK" : "FAILED");
    return bMoved;
}

bool CTokenLedger::Mint(const address_t& to, const CAmount nAmount, string &error)
{
    SIMPLE_LOCK(m_cs);
    if (is_zero_address(to))
    {
        error = strprintf("cannot mint %s to the zero address", m_sSymbol);
        return false;
    }
    if (!AmountRange(nAmount) || nAmount > MAX_AMOUNT - m_nTotalSupply)
    {
        error = strprintf("invalid %s mint amount %d, total supply %d", m_sSymbol, nAmount, m_nTotalSupply);
        return false;
    }
    m_mapBalances[to] += nAmount;
    m_nTotalSupply += nAmount;
    return true;
}

bool CTokenLedger::Approve(const address_t& owner, const address_t& spender, const CAmount nAmount, string &error)
{
    SIMPLE_LOCK(m_cs);
    if (is_zero_address(owner) || is_zero_address(spender))
    {
        error = strprintf("%s approval requires non-zero owner and spender", m_sSymbol);
        return false;
    }
    if (!AmountRange(nAmount))
    {
        error = strprintf("invalid %s allowance %d", m_sSymbol, nAmount);
        return false;
    }
    m_mapAllowances[owner][spender] = nAmount;
    return true;
}

CAmount CTokenLedger::GetTotalSupply() const
{
    SIMPLE_LOCK(m_cs);
    return m_nTotalSupply;
}

json CTokenLedger::getJSON() const
{
    SIMPLE_LOCK(m_cs);
    json jBalances = json::object();
    for (const auto& [holder, nBalance] : m_mapBalances)
    {
        if (nBalance)
            jBalances[holder] = nBalance;
    }
    return json
    {
        { "address", m_address },
        { "symbol", m_sSymbol },
        { "totalSupply", m_nTotalSupply },
        { "balances", std::move(jBalances) }
    };
}
