#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <string>

#include <ledger/address.h>
#include <platform/platform-consts.h>

/**
 * Platform start-up parameters.
 * Read from the command line and the -conf file:
 *   -platformowner=<address>   platform admin identity (required)
 *   -platformfeebps=<n>        platform fee in basis points (default 250)
 *   -paymenttoken=<address>    initial payment token
 *   -startpaused=<0|1>         start with the platform paused
 *   -mocktime=<n>              fixed Unix time for deterministic replays
 */
class CPlatformConfig
{
public:
    CPlatformConfig() = default;
    CPlatformConfig(address_t platformOwner, const uint32_t nFeeBps) :
        m_PlatformOwner(std::move(platformOwner)),
        m_nFeeBps(nFeeBps)
    {}

    bool Load(std::string &error);
    bool Validate(std::string &error) const;

    const address_t& GetPlatformOwner() const noexcept { return m_PlatformOwner; }
    uint32_t GetFeeBps() const noexcept { return m_nFeeBps; }
    const address_t& GetPaymentToken() const noexcept { return m_PaymentToken; }
    bool IsStartPaused() const noexcept { return m_bStartPaused; }
    int64_t GetMockTime() const noexcept { return m_nMockTime; }

    void SetPaymentToken(const address_t& token) { m_PaymentToken = token; }
    void SetStartPaused(const bool bPaused) noexcept { m_bStartPaused = bPaused; }

    static std::string GetHelpMessage();

protected:
    address_t m_PlatformOwner;
    uint32_t m_nFeeBps = DEFAULT_PLATFORM_FEE_BPS;
    address_t m_PaymentToken;
    bool m_bStartPaused = false;
    int64_t m_nMockTime = 0;
};
