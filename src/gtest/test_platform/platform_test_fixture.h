// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <utils/utiltime.h>
#include <ledger/token-ledger.h>
#include <platform/platform-consts.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/organization.h>
#include <platform/ticket-factory.h>
#include <platform/ticket-series.h>

#include <eventix_gtest_main.h>
#include <eventix_gtest_utils.h>

constexpr CAmount TEST_TICKET_PRICE = 200;
constexpr uint64_t TEST_MAX_SUPPLY = 3;
constexpr int64_t TEST_SALES_PERIOD = 86'400;
constexpr uint32_t TEST_FEE_BPS = 500;
constexpr auto TEST_BASE_URI = "ipfs://eventix/concert/";

/**
 * Platform with a registered in-memory payment token.
 * Owner, alice, bob and carol are plain identities; alice is an allowed organizer.
 */
class PlatformTest : public ::testing::Test
{
protected:
    const address_t m_owner = generateTestAddress("owner");
    const address_t m_alice = generateTestAddress("alice");
    const address_t m_bob = generateTestAddress("bob");
    const address_t m_carol = generateTestAddress("carol");

    std::unique_ptr<CPlatformContext> m_pContext;
    std::shared_ptr<CTokenLedger> m_pToken;

    void SetUp() override
    {
        gl_pEventixTestEnv->ResetTime();
        m_pContext = std::make_unique<CPlatformContext>(CPlatformConfig(m_owner, TEST_FEE_BPS));
        m_pToken = std::make_shared<CTokenLedger>(generateTestAddress("usd"), "USD");
        std::string error;
        ASSERT_TRUE(m_pContext->RegisterToken(m_pToken, error)) << error;
        registry().UpdatePaymentToken(m_owner, m_pToken->GetAddress());
        registry().SetOrganizerStatus(m_owner, m_alice, true);
    }

    void TearDown() override
    {
        m_pContext.reset();
        gl_pEventixTestEnv->ResetTime();
    }

    CPlatformRegistry& registry() { return m_pContext->GetRegistry(); }
    CTicketFactory& factory() { return m_pContext->GetFactory(); }
    COrganization& organization(const address_t& address) { return m_pContext->GetOrganization(address); }
    CTicketSeries& series(const address_t& address) { return m_pContext->GetSeries(address); }
    size_t eventCount() const { return m_pContext->GetEventLog().size(); }

    // allow organizer and create its organization
    address_t CreateOrganization(const address_t& organizer)
    {
        if (!registry().IsAllowedOrganizer(organizer))
            registry().SetOrganizerStatus(m_owner, organizer, true);
        return registry().CreateOrganization(organizer);
    }

    address_t CreateEvent(const address_t& org, const address_t& orgOwner,
        const CAmount nPrice = TEST_TICKET_PRICE, const uint64_t nMaxSupply = TEST_MAX_SUPPLY)
    {
        return organization(org).CreateEvent(orgOwner, TEST_BASE_URI, nPrice,
            GetTime() + TEST_SALES_PERIOD, nMaxSupply);
    }

    // issue tokens to the holder and approve the spender
    void Fund(const address_t& holder, const CAmount nAmount, const address_t& spender)
    {
        std::string error;
        ASSERT_TRUE(m_pToken->Mint(holder, nAmount, error)) << error;
        ASSERT_TRUE(m_pToken->Approve(holder, spender, nAmount, error)) << error;
    }

    CAmount balance(const address_t& holder) const { return m_pToken->balanceOf(holder); }
};
