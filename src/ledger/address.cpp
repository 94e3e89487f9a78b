// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <openssl/sha.h>

#include <utils/str_utils.h>
#include <utils/util.h>
#include <ledger/address.h>

using namespace std;

bool is_zero_address(const address_t& address) noexcept
{
    if (address.empty() || address == "0")
        return true;
    if (!str_starts_with(address, "0x"))
        return false;
    return address.find_first_not_of('0', 2) == string::npos;
}

address_t derive_address(const address_t& creator, const string& sKind, const uint64_t nNonce)
{
    const string sPreimage = strprintf("%s:%s:%u", creator, sKind, nNonce);
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(sPreimage.data()), sPreimage.size(), hash);
    return "0x" + HexStr(hash + SHA256_DIGEST_LENGTH - ADDRESS_HASH_SIZE, ADDRESS_HASH_SIZE);
}
