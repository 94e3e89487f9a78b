#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include <utils/sync.h>
#include <ledger/payment-token.h>

/**
 * In-memory payment token.
 * Balances and allowances of a fungible asset, used by the replay tool and tests.
 */
class CTokenLedger : public IPaymentToken
{
public:
    CTokenLedger(address_t address, std::string sSymbol) :
        m_address(std::move(address)),
        m_sSymbol(std::move(sSymbol))
    {}

    const address_t& GetAddress() const noexcept override { return m_address; }
    std::string GetSymbol() const override { return m_sSymbol; }

    CAmount balanceOf(const address_t& holder) const override;
    CAmount allowance(const address_t& owner, const address_t& spender) const override;
    bool transfer(const address_t& from, const address_t& to, const CAmount nAmount) override;
    bool transferFrom(const address_t& spender, const address_t& from, const address_t& to, const CAmount nAmount) override;

    // issue new tokens to the holder
    bool Mint(const address_t& to, const CAmount nAmount, std::string &error);
    // set allowance granted by owner to spender
    bool Approve(const address_t& owner, const address_t& spender, const CAmount nAmount, std::string &error);

    CAmount GetTotalSupply() const;
    nlohmann::json getJSON() const;

protected:
    address_t m_address;
    std::string m_sSymbol;
    mutable CWaitableCriticalSection m_cs;
    std::map<address_t, CAmount> m_mapBalances;
    // owner -> (spender -> allowance)
    std::map<address_t, std::map<address_t, CAmount>> m_mapAllowances;
    CAmount m_nTotalSupply = 0;

    bool MoveBalance(const address_t& from, const address_t& to, const CAmount nAmount);
};
