// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/util.h>
#include <platform/platform-consts.h>
#include <platform/platform-error.h>
#include <platform/fee-split.h>

using namespace std;

fee_split_t calculate_fee_split(const CAmount nPrice, const uint32_t nFeeBps)
{
    if (!AmountRange(nPrice))
        throw validation_error(strprintf("price %d is out of range [0, %d]", nPrice, MAX_AMOUNT));
    if (nFeeBps > MAX_FEE_BPS)
        throw validation_error(strprintf("platform fee %u bps is out of range [0, %u]", nFeeBps, MAX_FEE_BPS));

    fee_split_t split;
    // floor(price * bps / 10000) without the 64-bit overflow of price * bps
    split.nFee = (nPrice / MAX_FEE_BPS) * nFeeBps + ((nPrice % MAX_FEE_BPS) * nFeeBps) / MAX_FEE_BPS;
    split.nRemainder = nPrice - split.nFee;
    return split;
}
