#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <string>

// identity of an account or a platform component
using address_t = std::string;

constexpr auto ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";
constexpr size_t ADDRESS_HASH_SIZE = 20;

/**
 * Check if address is the zero identity.
 * Empty string, "0" and "0x" followed only by zeros are all zero identities.
 *
 * \param address - address to check
 * \return true if the address is the zero identity
 */
bool is_zero_address(const address_t& address) noexcept;

/**
 * Derive deterministic component address.
 * "0x" + hex(last 20 bytes of SHA-256(creator ":" kind ":" nonce)).
 *
 * \param creator - address of the creating account or component
 * \param sKind - component kind (registry, organization, series, ...)
 * \param nNonce - creator's nonce
 * \return derived address
 */
address_t derive_address(const address_t& creator, const std::string& sKind, const uint64_t nNonce);
