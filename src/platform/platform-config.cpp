// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <utils/str_utils.h>
#include <utils/util.h>
#include <platform/platform-config.h>

using namespace std;

/**
 * Load platform parameters from the argument maps.
 * 
 * \param error - error message if parameters are invalid
 * \return true if all parameters were read and are valid
 */
bool CPlatformConfig::Load(string &error)
{
    m_PlatformOwner = GetArg("-platformowner", "");
    trim(m_PlatformOwner);

    const int64_t nFeeBps = GetArg("-platformfeebps", static_cast<int64_t>(DEFAULT_PLATFORM_FEE_BPS));
    if (nFeeBps < 0 || nFeeBps > MAX_FEE_BPS)
    {
        error = strprintf("-platformfeebps value [%d] is invalid. Supported range is [0, %u]", nFeeBps, MAX_FEE_BPS);
        return false;
    }
    m_nFeeBps = static_cast<uint32_t>(nFeeBps);

    m_PaymentToken = GetArg("-paymenttoken", "");
    trim(m_PaymentToken);
    m_bStartPaused = GetBoolArg("-startpaused", false);

    m_nMockTime = GetArg("-mocktime", static_cast<int64_t>(0));
    if (m_nMockTime < 0)
    {
        error = strprintf("-mocktime value [%d] is invalid", m_nMockTime);
        return false;
    }
    return Validate(error);
}

bool CPlatformConfig::Validate(string &error) const
{
    if (is_zero_address(m_PlatformOwner))
    {
        error = "platform owner is not defined, use -platformowner=<address>";
        return false;
    }
    if (m_nFeeBps > MAX_FEE_BPS)
    {
        error = strprintf("platform fee %u bps is out of range [0, %u]", m_nFeeBps, MAX_FEE_BPS);
        return false;
    }
    return true;
}

string CPlatformConfig::GetHelpMessage()
{
    string strUsage = HelpMessageGroup("Platform options:");
    strUsage += HelpMessageOpt("-platformowner=<address>", "Platform admin identity (required)");
    strUsage += HelpMessageOpt("-platformfeebps=<n>", strprintf("Platform fee in basis points, 0..%u (default: %u)", MAX_FEE_BPS, DEFAULT_PLATFORM_FEE_BPS));
    strUsage += HelpMessageOpt("-paymenttoken=<address>", "Payment token used for ticket sales");
    strUsage += HelpMessageOpt("-startpaused", "Start with the platform paused (default: 0)");
    strUsage += HelpMessageOpt("-mocktime=<n>", "Use fixed Unix time instead of the system clock");
    return strUsage;
}
