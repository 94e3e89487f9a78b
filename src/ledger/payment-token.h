#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <memory>
#include <string>

#include <amount.h>
#include <ledger/address.h>

/**
 * External fungible-asset ledger used for all payments.
 * The acting component is passed explicitly: transfer moves funds owned by "from",
 * transferFrom moves funds of "from" within the allowance granted to "spender".
 * false return means nothing was moved.
 */
class IPaymentToken
{
public:
    virtual ~IPaymentToken() = default;

    virtual const address_t& GetAddress() const noexcept = 0;
    virtual std::string GetSymbol() const = 0;

    virtual CAmount balanceOf(const address_t& holder) const = 0;
    virtual CAmount allowance(const address_t& owner, const address_t& spender) const = 0;
    virtual bool transfer(const address_t& from, const address_t& to, const CAmount nAmount) = 0;
    virtual bool transferFrom(const address_t& spender, const address_t& from, const address_t& to, const CAmount nAmount) = 0;
};

using payment_token_t = std::shared_ptr<IPaymentToken>;
