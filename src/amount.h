#pragma once
// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>

// amount in the smallest unit of the payment token
typedef int64_t CAmount;

/** No amount larger than this is valid.
 *
 * This is not the supply of any payment token, but a sanity bound
 * for prices, balances and allowances.
 */
static constexpr CAmount MAX_AMOUNT = 1'000'000'000'000'000'000;
inline bool AmountRange(const CAmount& nValue) noexcept { return (nValue >= 0 && nValue <= MAX_AMOUNT); }
