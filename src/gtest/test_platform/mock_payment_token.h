// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <gmock/gmock.h>

#include <ledger/payment-token.h>

class MockPaymentToken : public IPaymentToken
{
public:
    explicit MockPaymentToken(address_t address) :
        m_address(std::move(address))
    {}

    const address_t& GetAddress() const noexcept override { return m_address; }

    MOCK_METHOD(std::string, GetSymbol, (), (const, override));
    MOCK_METHOD(CAmount, balanceOf, (const address_t& holder), (const, override));
    MOCK_METHOD(CAmount, allowance, (const address_t& owner, const address_t& spender), (const, override));
    MOCK_METHOD(bool, transfer, (const address_t& from, const address_t& to, const CAmount nAmount), (override));
    MOCK_METHOD(bool, transferFrom, (const address_t& spender, const address_t& from, const address_t& to, const CAmount nAmount), (override));

protected:
    address_t m_address;
};
