#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <string>

#include <ledger/address.h>

// deterministic test identity derived from the name
address_t generateTestAddress(const std::string& sName);

// generate random id
std::string generateRandomId(const size_t nLength);

// set command-line arguments, first argument is the executable name
void ResetArgs(const std::string& strArg);
