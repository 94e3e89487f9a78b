// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <platform/platform-error.h>

using namespace std;

string GetPlatformErrorName(const PlatformErrorType errorType) noexcept
{
    string sName;
    if (errorType < PlatformErrorType::COUNT)
        sName = PLATFORM_ERROR_NAMES[to_integral_type<PlatformErrorType>(errorType)];
    return sName;
}
