#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>

#include <amount.h>

typedef struct _fee_split_t
{
    CAmount nFee = 0;        // platform fee
    CAmount nRemainder = 0;  // beneficiary share (organization or seller)
} fee_split_t;

/**
 * Split price into platform fee and remainder.
 * fee = floor(price * feeBps / 10000), remainder = price - fee.
 * Rounding loss favors the remainder recipient.
 *
 * \param nPrice - price to split, must be in [0, MAX_AMOUNT]
 * \param nFeeBps - platform fee in basis points, must be in [0, 10000]
 * \return fee and remainder
 * \throw validation_error if price or fee rate are out of range
 */
fee_split_t calculate_fee_split(const CAmount nPrice, const uint32_t nFeeBps);
