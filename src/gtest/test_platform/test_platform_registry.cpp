// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <gtest/gtest.h>

#include <platform/platform-error.h>

#include <test_platform/platform_test_fixture.h>

using namespace std;
using namespace testing;

class TestPlatformRegistry : public PlatformTest
{
protected:
    void ExpectMappingsConsistent()
    {
        string error;
        EXPECT_TRUE(registry().CheckOwnershipMappings(error)) << error;
    }
};

TEST_F(TestPlatformRegistry, initial_state)
{
    EXPECT_EQ(registry().GetOwner(), m_owner);
    EXPECT_EQ(registry().GetFeeBps(), TEST_FEE_BPS);
    EXPECT_EQ(registry().GetPaymentToken(), m_pToken->GetAddress());
    EXPECT_FALSE(registry().IsPaused());
    EXPECT_EQ(registry().GetOrganizationCount(), 0u);
}

TEST_F(TestPlatformRegistry, invalid_config)
{
    EXPECT_THROW(CPlatformContext(CPlatformConfig(ZERO_ADDRESS, 100)), validation_error);
    EXPECT_THROW(CPlatformContext(CPlatformConfig(m_owner, MAX_FEE_BPS + 1)), validation_error);

    CPlatformConfig config(m_owner, 100);
    config.SetStartPaused(true);
    CPlatformContext context(config);
    EXPECT_TRUE(context.GetRegistry().IsPaused());
}

TEST_F(TestPlatformRegistry, organizer_allow_list)
{
    EXPECT_THROW(registry().SetOrganizerStatus(m_alice, m_bob, true), authorization_error);
    EXPECT_THROW(registry().SetOrganizerStatus(m_owner, ZERO_ADDRESS, true), validation_error);
    EXPECT_FALSE(registry().IsAllowedOrganizer(m_bob));
    EXPECT_THROW(registry().CreateOrganization(m_bob), authorization_error);

    registry().SetOrganizerStatus(m_owner, m_bob, true);
    EXPECT_TRUE(registry().IsAllowedOrganizer(m_bob));
    registry().SetOrganizerStatus(m_owner, m_bob, false);
    EXPECT_FALSE(registry().IsAllowedOrganizer(m_bob));
    EXPECT_EQ(m_pContext->GetEventLog().CountEvents(LedgerEventID::OrganizerStatusChanged), 3u);
}

TEST_F(TestPlatformRegistry, create_organization)
{
    const address_t org = registry().CreateOrganization(m_alice);
    EXPECT_TRUE(registry().IsOrganization(org));
    EXPECT_EQ(registry().GetOrganizationOf(m_alice), org);
    EXPECT_EQ(registry().GetOwnerOf(org), m_alice);
    EXPECT_EQ(organization(org).GetOwner(), m_alice);
    ExpectMappingsConsistent();

    // one organization per owner
    const size_t nEvents = eventCount();
    EXPECT_THROW(registry().CreateOrganization(m_alice), state_error);
    EXPECT_EQ(registry().GetOrganizationCount(), 1u);
    EXPECT_EQ(m_pContext->GetOrganizationCount(), 1u);
    EXPECT_EQ(eventCount(), nEvents);
}

TEST_F(TestPlatformRegistry, transfer_organization_ownership)
{
    const address_t org = CreateOrganization(m_alice);
    EXPECT_THROW(registry().TransferOrganizationOwnership(m_alice, ZERO_ADDRESS), validation_error);
    EXPECT_THROW(registry().TransferOrganizationOwnership(m_bob, m_carol), state_error);

    registry().TransferOrganizationOwnership(m_alice, m_carol);
    EXPECT_FALSE(registry().GetOrganizationOf(m_alice).has_value());
    EXPECT_EQ(registry().GetOrganizationOf(m_carol), org);
    EXPECT_EQ(registry().GetOwnerOf(org), m_carol);
    EXPECT_EQ(organization(org).GetOwner(), m_carol);
    EXPECT_TRUE(registry().IsOrganization(org));
    ExpectMappingsConsistent();

    // new owner controls the organization, previous one does not
    organization(org).UpdateBanner(m_carol, "ipfs://carol");
    EXPECT_THROW(organization(org).UpdateBanner(m_alice, "ipfs://alice"), authorization_error);
    // previous owner may create a new organization if still allowed
    EXPECT_NO_THROW(registry().CreateOrganization(m_alice));
    ExpectMappingsConsistent();
}

TEST_F(TestPlatformRegistry, register_event_requires_organization)
{
    const address_t org = CreateOrganization(m_alice);
    const address_t series = CreateEvent(org, m_alice);

    EXPECT_THROW(registry().RegisterEvent(m_alice, series), authorization_error);
    EXPECT_THROW(registry().RegisterEvent(org, series), state_error);
    EXPECT_THROW(registry().MarkEventAsClosed(m_bob, series), authorization_error);
    EXPECT_THROW(registry().MarkEventAsClosed(org, generateTestAddress("unknown")), state_error);

    // another organization cannot register or close a foreign series
    const address_t orgB = CreateOrganization(m_bob);
    EXPECT_THROW(registry().MarkEventAsClosed(orgB, series), authorization_error);
    EXPECT_TRUE(registry().IsActiveEvent(series));
}

TEST_F(TestPlatformRegistry, fee_and_token_updates)
{
    EXPECT_THROW(registry().UpdatePlatformFee(m_alice, 100), authorization_error);
    EXPECT_THROW(registry().UpdatePlatformFee(m_owner, MAX_FEE_BPS + 1), validation_error);
    EXPECT_THROW(registry().UpdatePlatformFee(m_owner, -1), validation_error);
    registry().UpdatePlatformFee(m_owner, MAX_FEE_BPS);
    EXPECT_EQ(registry().GetFeeBps(), MAX_FEE_BPS);
    registry().UpdatePlatformFee(m_owner, 0);
    EXPECT_EQ(registry().GetFeeBps(), 0u);

    EXPECT_THROW(registry().UpdatePaymentToken(m_owner, ZERO_ADDRESS), validation_error);
    EXPECT_THROW(registry().UpdatePaymentToken(m_owner, generateTestAddress("unknown-token")), validation_error);
    EXPECT_THROW(registry().UpdatePaymentToken(m_alice, m_pToken->GetAddress()), authorization_error);
    EXPECT_EQ(registry().GetPaymentToken(), m_pToken->GetAddress());
}

TEST_F(TestPlatformRegistry, fee_change_applies_to_next_sale)
{
    const address_t org = CreateOrganization(m_alice);
    const address_t series = CreateEvent(org, m_alice, 1'000);
    Fund(m_bob, 2'000, series);

    this->series(series).Mint(m_bob);
    registry().UpdatePlatformFee(m_owner, 1'000);
    this->series(series).Mint(m_bob);
    // 50 at 500 bps, then 100 at 1000 bps
    EXPECT_EQ(balance(registry().GetAddress()), 150);
    EXPECT_EQ(balance(org), 1'850);
}

TEST_F(TestPlatformRegistry, pause)
{
    EXPECT_THROW(registry().Pause(m_alice), authorization_error);
    EXPECT_THROW(registry().Unpause(m_owner), state_error);
    registry().Pause(m_owner);
    EXPECT_TRUE(registry().IsPaused());
    EXPECT_THROW(registry().Pause(m_owner), state_error);

    EXPECT_THROW(registry().CreateOrganization(m_alice), state_error);
    // admin functions stay available while paused
    registry().SetOrganizerStatus(m_owner, m_bob, true);
    registry().UpdatePlatformFee(m_owner, 100);

    registry().Unpause(m_owner);
    EXPECT_FALSE(registry().IsPaused());
    EXPECT_NO_THROW(registry().CreateOrganization(m_alice));
}

TEST_F(TestPlatformRegistry, paused_platform_blocks_ownership_transfer)
{
    const address_t org = CreateOrganization(m_alice);
    registry().Pause(m_owner);
    EXPECT_THROW(registry().TransferOrganizationOwnership(m_alice, m_carol), state_error);
    EXPECT_EQ(registry().GetOwnerOf(org), m_alice);
}

TEST_F(TestPlatformRegistry, organization_status)
{
    const address_t org = CreateOrganization(m_alice);
    EXPECT_THROW(registry().SetOrganizationStatus(m_alice, org, false), authorization_error);
    EXPECT_THROW(registry().SetOrganizationStatus(m_owner, generateTestAddress("unknown"), false), state_error);

    registry().SetOrganizationStatus(m_owner, org, false);
    EXPECT_TRUE(organization(org).IsPaused());
    // status change to the current status fails and changes nothing
    const size_t nEvents = eventCount();
    EXPECT_THROW(registry().SetOrganizationStatus(m_owner, org, false), state_error);
    EXPECT_EQ(eventCount(), nEvents);

    registry().SetOrganizationStatus(m_owner, org, true);
    EXPECT_FALSE(organization(org).IsPaused());
}

TEST_F(TestPlatformRegistry, transfer_platform_ownership)
{
    EXPECT_THROW(registry().TransferPlatformOwnership(m_alice, m_bob), authorization_error);
    EXPECT_THROW(registry().TransferPlatformOwnership(m_owner, ZERO_ADDRESS), validation_error);
    registry().TransferPlatformOwnership(m_owner, m_bob);
    EXPECT_EQ(registry().GetOwner(), m_bob);
    EXPECT_THROW(registry().Pause(m_owner), authorization_error);
    registry().Pause(m_bob);
}

TEST_F(TestPlatformRegistry, withdraw_platform_fees)
{
    const address_t org = CreateOrganization(m_alice);
    const address_t series = CreateEvent(org, m_alice);
    EXPECT_THROW(registry().WithdrawTokens(m_owner, m_pToken->GetAddress()), payment_error);

    Fund(m_bob, TEST_TICKET_PRICE, series);
    this->series(series).Mint(m_bob);
    EXPECT_THROW(registry().WithdrawTokens(m_alice, m_pToken->GetAddress()), authorization_error);
    EXPECT_EQ(registry().WithdrawTokens(m_owner, m_pToken->GetAddress()), 10);
    EXPECT_EQ(balance(m_owner), 10);
    EXPECT_EQ(balance(registry().GetAddress()), 0);
    EXPECT_EQ(m_pContext->GetEventLog().CountEvents(LedgerEventID::PlatformTokensWithdrawn), 1u);
}

TEST_F(TestPlatformRegistry, json)
{
    const address_t org = CreateOrganization(m_alice);
    const auto j = registry().getJSON();
    EXPECT_EQ(j["owner"], m_owner);
    EXPECT_EQ(j["feeBps"], TEST_FEE_BPS);
    const auto jState = m_pContext->getStateJSON();
    ASSERT_EQ(jState["organizations"].size(), 1u);
    EXPECT_EQ(jState["organizations"][0]["address"], org);
}
