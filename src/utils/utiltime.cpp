// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include <utils/utiltime.h>

using namespace std;
using namespace chrono;

static atomic<int64_t> nMockTime(0);

int64_t GetTime() noexcept
{
    const int64_t nTime = nMockTime;
    if (nTime)
        return nTime;
    return time(nullptr);
}

void SetMockTime(const int64_t nMockTimeIn) noexcept
{
    nMockTime = nMockTimeIn;
}

int64_t GetMockTime() noexcept
{
    return nMockTime;
}

int64_t GetTimeMillis() noexcept
{
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    const time_t time = static_cast<time_t>(nTime);
    tm tm;
    gmtime_r(&time, &tm);
    stringstream ss;
    ss.imbue(locale::classic());
    ss << put_time(&tm, pszFormat);
    return ss.str();
}

string EncodeDumpTime(const int64_t nTime)
{
    return DateTimeStrFormat("%Y-%m-%dT%H:%M:%SZ", nTime);
}
