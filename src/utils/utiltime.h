#pragma once
// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <string>

int64_t GetTime() noexcept;
int64_t GetTimeMillis() noexcept;
// set mock time returned by GetTime(), 0 - use system clock
void SetMockTime(int64_t nMockTimeIn) noexcept;
int64_t GetMockTime() noexcept;

// format UTC time to string with the given format
std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);
// encode UTC time to ISO 8601 string "YYYY-MM-DDTHH:MM:SSZ"
std::string EncodeDumpTime(const int64_t nTime);
