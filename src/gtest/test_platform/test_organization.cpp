// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <memory>

#include <gtest/gtest.h>

#include <utils/sync.h>
#include <ledger/state-tx.h>
#include <platform/platform-error.h>

#include <test_platform/platform_test_fixture.h>

using namespace std;
using namespace testing;

class TestOrganization : public PlatformTest
{
protected:
    address_t m_org;

    void SetUp() override
    {
        PlatformTest::SetUp();
        m_org = CreateOrganization(m_alice);
    }

    COrganization& org() { return organization(m_org); }

    // organization known to the context but never registered with the platform registry
    address_t PublishUnregisteredOrganization(const address_t& owner)
    {
        const address_t org = generateTestAddress("unregistered-org");
        LOCK(m_pContext->cs_ledger);
        CStateTransaction tx(m_pContext->GetTxManager(), "publishOrganization");
        m_pContext->PublishOrganization(tx, std::make_shared<COrganization>(*m_pContext, org, owner, registry().GetAddress()));
        tx.Commit();
        return org;
    }
};

TEST_F(TestOrganization, created_by_registry)
{
    EXPECT_EQ(org().GetOwner(), m_alice);
    EXPECT_EQ(org().GetPlatform(), registry().GetAddress());
    EXPECT_FALSE(org().IsPaused());
    EXPECT_TRUE(org().IsOperational());
    EXPECT_TRUE(org().GetEvents().empty());
}

TEST_F(TestOrganization, constructor_validation)
{
    EXPECT_THROW(COrganization(*m_pContext, "0xorg", ZERO_ADDRESS, registry().GetAddress()), validation_error);
    EXPECT_THROW(COrganization(*m_pContext, "0xorg", m_alice, ""), validation_error);
}

TEST_F(TestOrganization, update_banner)
{
    org().UpdateBanner(m_alice, "ipfs://banner");
    EXPECT_EQ(org().GetBannerURI(), "ipfs://banner");
    EXPECT_THROW(org().UpdateBanner(m_bob, "ipfs://other"), authorization_error);
    EXPECT_EQ(org().GetBannerURI(), "ipfs://banner");
    EXPECT_EQ(m_pContext->GetEventLog().CountEvents(LedgerEventID::BannerUpdated), 1u);
}

TEST_F(TestOrganization, create_event)
{
    const size_t nEvents = eventCount();
    const address_t series = CreateEvent(m_org, m_alice);

    EXPECT_EQ(org().GetEvents(), v_strings{ series });
    EXPECT_TRUE(registry().IsActiveEvent(series));
    EXPECT_FALSE(registry().IsPastEvent(series));
    EXPECT_EQ(this->series(series).GetOrganization(), m_org);

    // one record for the whole operation
    const auto vEvents = m_pContext->GetEventLog().GetEvents();
    ASSERT_EQ(vEvents.size(), nEvents + 1);
    const auto& event = vEvents.back();
    EXPECT_EQ(event.ID(), LedgerEventID::EventCreated);
    EXPECT_EQ(event.GetActor(), m_alice);
    EXPECT_EQ(event.GetData()["event"], series);
    EXPECT_EQ(event.GetData()["price"], TEST_TICKET_PRICE);
    EXPECT_EQ(event.GetTimestamp(), TEST_START_TIME);
}

TEST_F(TestOrganization, create_event_rolled_back_when_registration_fails)
{
    const address_t unregistered = PublishUnregisteredOrganization(m_bob);
    const size_t nSeries = m_pContext->GetSeriesCount();
    const size_t nEvents = eventCount();

    // factory and initialization succeed, the registry rejects the caller
    EXPECT_THROW(organization(unregistered).CreateEvent(m_bob, TEST_BASE_URI, TEST_TICKET_PRICE,
        GetTime() + TEST_SALES_PERIOD, TEST_MAX_SUPPLY), authorization_error);

    EXPECT_EQ(m_pContext->GetSeriesCount(), nSeries);
    EXPECT_EQ(factory().GetInstanceCount(), 0u);
    EXPECT_FALSE(m_pContext->FindSeries(derive_address(factory().GetAddress(), COMPONENT_KIND_SERIES, 1)));
    EXPECT_TRUE(organization(unregistered).GetEvents().empty());
    EXPECT_TRUE(registry().GetActiveEvents().empty());
    EXPECT_EQ(eventCount(), nEvents);

    // factory nonce was not consumed
    const address_t series = CreateEvent(m_org, m_alice);
    EXPECT_EQ(series, derive_address(factory().GetAddress(), COMPONENT_KIND_SERIES, 1));
}

TEST_F(TestOrganization, close_event_rolled_back_when_registry_update_fails)
{
    const address_t unregistered = PublishUnregisteredOrganization(m_bob);
    // series created directly through the factory, never registered with the platform
    const address_t series = factory().CreateEvent(unregistered, unregistered, TEST_BASE_URI, TEST_TICKET_PRICE,
        GetTime() + TEST_SALES_PERIOD, TEST_MAX_SUPPLY, registry().GetAddress());
    const auto vActiveBefore = registry().GetActiveEvents();
    const auto vPastBefore = registry().GetPastEvents();
    const size_t nEvents = eventCount();

    // series close succeeds, the registry rejects the caller
    EXPECT_THROW(organization(unregistered).CloseEvent(m_bob, series), authorization_error);

    EXPECT_FALSE(this->series(series).IsClosed());
    EXPECT_EQ(this->series(series).GetState(), SeriesState::Open);
    EXPECT_EQ(registry().GetActiveEvents(), vActiveBefore);
    EXPECT_EQ(registry().GetPastEvents(), vPastBefore);
    EXPECT_EQ(eventCount(), nEvents);
}

TEST_F(TestOrganization, create_event_rejected)
{
    const int64_t nDeadline = GetTime() + TEST_SALES_PERIOD;
    EXPECT_THROW(org().CreateEvent(m_bob, TEST_BASE_URI, 100, nDeadline, 10), authorization_error);
    EXPECT_THROW(org().CreateEvent(m_alice, TEST_BASE_URI, 0, nDeadline, 10), validation_error);
    EXPECT_THROW(org().CreateEvent(m_alice, TEST_BASE_URI, 100, GetTime() - 1, 10), validation_error);
    EXPECT_THROW(org().CreateEvent(m_alice, TEST_BASE_URI, 100, nDeadline, 0), validation_error);
    EXPECT_EQ(m_pContext->GetSeriesCount(), 0u);
    EXPECT_TRUE(org().GetEvents().empty());
    EXPECT_TRUE(registry().GetActiveEvents().empty());
}

TEST_F(TestOrganization, close_event)
{
    const address_t series = CreateEvent(m_org, m_alice);
    EXPECT_THROW(org().CloseEvent(m_bob, series), authorization_error);

    size_t nEvents = eventCount();
    org().CloseEvent(m_alice, series);
    EXPECT_TRUE(this->series(series).IsClosed());
    ASSERT_EQ(eventCount(), nEvents + 1);
    EXPECT_EQ(m_pContext->GetEventLog().GetEvents().back().ID(), LedgerEventID::EventClosed);
    EXPECT_FALSE(registry().IsActiveEvent(series));
    EXPECT_TRUE(registry().IsPastEvent(series));

    nEvents = eventCount();
    EXPECT_THROW(org().CloseEvent(m_alice, series), state_error);
    EXPECT_TRUE(registry().IsPastEvent(series));
    EXPECT_EQ(eventCount(), nEvents);
}

TEST_F(TestOrganization, foreign_series)
{
    const address_t orgB = CreateOrganization(m_bob);
    const address_t seriesB = CreateEvent(orgB, m_bob);

    EXPECT_THROW(org().CloseEvent(m_alice, seriesB), state_error);
    EXPECT_THROW(org().SetTicketPrice(m_alice, seriesB, 1), state_error);
    EXPECT_THROW(org().SetDeadline(m_alice, seriesB, GetTime() + 10), state_error);
    EXPECT_THROW(org().CloseEvent(m_alice, generateTestAddress("unknown")), state_error);
    EXPECT_FALSE(series(seriesB).IsClosed());
}

TEST_F(TestOrganization, forwards_series_updates)
{
    const address_t series = CreateEvent(m_org, m_alice);
    org().SetTicketPrice(m_alice, series, 350);
    org().SetDeadline(m_alice, series, GetTime() + 3'600);
    EXPECT_EQ(this->series(series).GetTicketPrice(), 350);
    EXPECT_EQ(this->series(series).GetDeadline(), GetTime() + 3'600);
    EXPECT_THROW(org().SetTicketPrice(m_bob, series, 1), authorization_error);
    EXPECT_THROW(org().SetTicketPrice(m_alice, series, 0), validation_error);
    EXPECT_EQ(this->series(series).GetTicketPrice(), 350);
}

TEST_F(TestOrganization, platform_only_controls)
{
    EXPECT_THROW(org().Pause(m_alice), authorization_error);
    EXPECT_THROW(org().Pause(m_owner), authorization_error);
    EXPECT_THROW(org().UpdateOwner(m_alice, m_bob), authorization_error);

    org().Pause(registry().GetAddress());
    EXPECT_TRUE(org().IsPaused());
    EXPECT_FALSE(org().IsOperational());
    EXPECT_THROW(org().Pause(registry().GetAddress()), state_error);
    EXPECT_THROW(org().UpdateBanner(m_alice, "ipfs://b"), state_error);
    EXPECT_THROW(CreateEvent(m_org, m_alice), state_error);

    org().Unpause(registry().GetAddress());
    EXPECT_TRUE(org().IsOperational());
    EXPECT_THROW(org().Unpause(registry().GetAddress()), state_error);
}

TEST_F(TestOrganization, paused_platform_blocks_operations)
{
    const address_t series = CreateEvent(m_org, m_alice);
    registry().Pause(m_owner);
    EXPECT_FALSE(org().IsOperational());
    EXPECT_THROW(org().UpdateBanner(m_alice, "ipfs://b"), state_error);
    EXPECT_THROW(CreateEvent(m_org, m_alice), state_error);
    EXPECT_THROW(org().CloseEvent(m_alice, series), state_error);
    EXPECT_THROW(org().SetTicketPrice(m_alice, series, 1), state_error);

    // ticket sales are not gated by the platform pause
    Fund(m_bob, TEST_TICKET_PRICE, series);
    EXPECT_EQ(this->series(series).Mint(m_bob), 0u);
}

TEST_F(TestOrganization, withdraw_tokens)
{
    const address_t series = CreateEvent(m_org, m_alice);
    Fund(m_bob, TEST_TICKET_PRICE * 2, series);
    this->series(series).Mint(m_bob);
    this->series(series).Mint(m_bob);

    EXPECT_THROW(org().WithdrawTokens(m_bob, m_pToken->GetAddress()), authorization_error);
    EXPECT_THROW(org().WithdrawTokens(m_alice, generateTestAddress("unknown-token")), validation_error);

    EXPECT_EQ(org().WithdrawTokens(m_alice, m_pToken->GetAddress()), 380);
    EXPECT_EQ(balance(m_alice), 380);
    EXPECT_EQ(balance(m_org), 0);
    EXPECT_THROW(org().WithdrawTokens(m_alice, m_pToken->GetAddress()), payment_error);
}
