// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <gtest/gtest.h>

#include <platform/platform-error.h>

#include <test_platform/platform_test_fixture.h>

using namespace std;
using namespace testing;

class TestScenarios : public PlatformTest
{};

TEST_F(TestScenarios, allowed_organizer_creates_organization)
{
    ASSERT_TRUE(registry().IsAllowedOrganizer(m_alice));
    ASSERT_FALSE(registry().GetOrganizationOf(m_alice).has_value());

    const address_t org = registry().CreateOrganization(m_alice);
    EXPECT_FALSE(is_zero_address(org));
    EXPECT_EQ(registry().GetOrganizationOf(m_alice), org);
    EXPECT_EQ(registry().GetOwnerOf(org), m_alice);

    const auto vEvents = m_pContext->GetEventLog().GetEvents();
    ASSERT_FALSE(vEvents.empty());
    const auto& event = vEvents.back();
    EXPECT_EQ(event.ID(), LedgerEventID::OrganizationCreated);
    EXPECT_EQ(event.GetActor(), m_alice);
    EXPECT_EQ(event.GetData()["organization"], org);
}

TEST_F(TestScenarios, closed_series_stays_in_past_events)
{
    const address_t org = CreateOrganization(m_alice);
    const address_t event = CreateEvent(org, m_alice);
    Fund(m_bob, 1'000, event);
    organization(org).CloseEvent(m_alice, event);

    const size_t nEvents = eventCount();
    EXPECT_THROW(series(event).Mint(m_bob), state_error);
    EXPECT_EQ(eventCount(), nEvents);
    EXPECT_EQ(balance(m_bob), 1'000);
    EXPECT_TRUE(registry().IsPastEvent(event));
    EXPECT_FALSE(registry().IsActiveEvent(event));

    // a closed event cannot become active again
    EXPECT_THROW(registry().RegisterEvent(org, event), state_error);
    EXPECT_THROW(organization(org).CloseEvent(m_alice, event), state_error);
    EXPECT_FALSE(registry().IsActiveEvent(event));
    EXPECT_TRUE(registry().IsPastEvent(event));
}

TEST_F(TestScenarios, ownership_transfer_to_existing_owner_fails)
{
    const address_t orgA = CreateOrganization(m_alice);
    const address_t orgB = CreateOrganization(m_bob);
    const auto registryBefore = registry().getJSON();
    const size_t nEvents = eventCount();

    EXPECT_THROW(registry().TransferOrganizationOwnership(m_alice, m_bob), state_error);

    EXPECT_EQ(registry().GetOrganizationOf(m_alice), orgA);
    EXPECT_EQ(registry().GetOrganizationOf(m_bob), orgB);
    EXPECT_EQ(registry().GetOwnerOf(orgA), m_alice);
    EXPECT_EQ(registry().GetOwnerOf(orgB), m_bob);
    EXPECT_EQ(organization(orgA).GetOwner(), m_alice);
    EXPECT_EQ(registry().getJSON(), registryBefore);
    EXPECT_EQ(eventCount(), nEvents);
}

TEST_F(TestScenarios, event_lifecycle)
{
    const address_t org = CreateOrganization(m_alice);
    organization(org).UpdateBanner(m_alice, "ipfs://eventix/banner.png");
    const address_t event = CreateEvent(org, m_alice, 200, 2);

    Fund(m_bob, 200, event);
    Fund(m_carol, 500, event);
    EXPECT_EQ(series(event).Mint(m_bob), 0u);
    EXPECT_EQ(series(event).Mint(m_carol), 1u);
    EXPECT_THROW(series(event).Mint(m_carol), state_error);

    // carol buys bob's ticket on the secondary market
    series(event).Resell(m_bob, 0, m_carol, 300);
    EXPECT_EQ(series(event).TicketsOf(m_carol), (v_ticket_ids{ 0, 1 }));

    // door check before the event closes
    EXPECT_TRUE(series(event).ValidateTicket(0));
    organization(org).CloseEvent(m_alice, event);
    EXPECT_FALSE(series(event).ValidateTicket(0));

    // 200 + 200 + 300 sold: fees 10 + 10 + 15
    EXPECT_EQ(registry().WithdrawTokens(m_owner, m_pToken->GetAddress()), 35);
    EXPECT_EQ(organization(org).WithdrawTokens(m_alice, m_pToken->GetAddress()), 380);
    EXPECT_EQ(balance(m_bob), 285);
    EXPECT_EQ(balance(m_carol), 0);
    // value is conserved
    EXPECT_EQ(m_pToken->GetTotalSupply(), 700);
    EXPECT_EQ(balance(m_owner) + balance(m_alice) + balance(m_bob) + balance(m_carol), 700);
}

TEST_F(TestScenarios, failed_operation_has_no_effect)
{
    const address_t org = CreateOrganization(m_alice);
    const auto stateBefore = m_pContext->getStateJSON();
    const size_t nEvents = eventCount();

    // paused platform rejects the event, only pause records are published
    registry().Pause(m_owner);
    EXPECT_THROW(CreateEvent(org, m_alice), state_error);
    registry().Unpause(m_owner);

    auto stateAfter = m_pContext->getStateJSON();
    stateAfter["events"] = stateBefore["events"];
    EXPECT_EQ(stateAfter, stateBefore);
    EXPECT_EQ(eventCount(), nEvents + 2);
    EXPECT_EQ(factory().GetInstanceCount(), 0u);
}

TEST(test_scenarios, replay_is_deterministic)
{
    auto run = []()
    {
        gl_pEventixTestEnv->ResetTime();
        const address_t owner = generateTestAddress("owner");
        const address_t alice = generateTestAddress("alice");
        const address_t bob = generateTestAddress("bob");
        CPlatformContext context(CPlatformConfig(owner, 250));
        auto pToken = make_shared<CTokenLedger>(generateTestAddress("usd"), "USD");
        string error;
        EXPECT_TRUE(context.RegisterToken(pToken, error));
        context.GetRegistry().UpdatePaymentToken(owner, pToken->GetAddress());
        context.GetRegistry().SetOrganizerStatus(owner, alice, true);
        const address_t org = context.GetRegistry().CreateOrganization(alice);
        const address_t event = context.GetOrganization(org).CreateEvent(alice, "ipfs://x/", 1'000, GetTime() + 60, 5);
        EXPECT_TRUE(pToken->Mint(bob, 1'000, error));
        EXPECT_TRUE(pToken->Approve(bob, event, 1'000, error));
        context.GetSeries(event).Mint(bob);
        return make_pair(context.getStateJSON(), context.GetEventLog().getJSON());
    };
    const auto run1 = run();
    const auto run2 = run();
    EXPECT_EQ(run1.first, run2.first);
    EXPECT_EQ(run1.second, run2.second);
}
