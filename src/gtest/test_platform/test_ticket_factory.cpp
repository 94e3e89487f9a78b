// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <gtest/gtest.h>

#include <platform/platform-error.h>

#include <test_platform/platform_test_fixture.h>

using namespace std;
using namespace testing;

class TestTicketFactory : public PlatformTest
{
protected:
    address_t m_org;

    void SetUp() override
    {
        PlatformTest::SetUp();
        m_org = CreateOrganization(m_alice);
    }

    address_t FactoryCreate(const address_t& caller, const address_t& org, const address_t& platform,
        const CAmount nPrice = TEST_TICKET_PRICE, const int64_t nDeadlineOffset = TEST_SALES_PERIOD,
        const uint64_t nMaxSupply = TEST_MAX_SUPPLY)
    {
        return factory().CreateEvent(caller, org, TEST_BASE_URI, nPrice, GetTime() + nDeadlineOffset, nMaxSupply, platform);
    }
};

TEST_F(TestTicketFactory, addresses)
{
    const address_t registryAddress = derive_address(m_owner, COMPONENT_KIND_REGISTRY, 0);
    EXPECT_EQ(registry().GetAddress(), registryAddress);
    EXPECT_EQ(factory().GetAddress(), derive_address(registryAddress, COMPONENT_KIND_FACTORY, 0));
    // organizations are numbered by the registry nonce starting at 1
    EXPECT_EQ(m_org, derive_address(registryAddress, COMPONENT_KIND_ORGANIZATION, 1));
}

TEST_F(TestTicketFactory, instantiates_initialized_series)
{
    const address_t s1 = FactoryCreate(m_org, m_org, registry().GetAddress());
    const address_t s2 = FactoryCreate(m_org, m_org, registry().GetAddress());
    EXPECT_NE(s1, s2);
    EXPECT_EQ(s1, derive_address(factory().GetAddress(), COMPONENT_KIND_SERIES, 1));
    EXPECT_EQ(s2, derive_address(factory().GetAddress(), COMPONENT_KIND_SERIES, 2));
    EXPECT_EQ(factory().GetInstanceCount(), 2u);

    auto pSeries = m_pContext->FindSeries(s1);
    ASSERT_TRUE(pSeries);
    EXPECT_TRUE(pSeries->IsInitialized());
    EXPECT_EQ(pSeries->GetOrganization(), m_org);
    EXPECT_EQ(pSeries->GetTemplate(), factory().GetTemplate());
    EXPECT_EQ(pSeries->GetTemplate()->GetSymbol(), TICKET_SERIES_SYMBOL);

    // one record per instance, initialization is folded into it
    const auto vEvents = m_pContext->GetEventLog().GetEventsByEntity(factory().GetAddress());
    ASSERT_EQ(vEvents.size(), 2u);
    EXPECT_EQ(vEvents[0].ID(), LedgerEventID::SeriesInstantiated);
    EXPECT_EQ(vEvents[0].GetData()["series"], s1);
    EXPECT_EQ(vEvents[0].GetData()["organization"], m_org);
    EXPECT_EQ(vEvents[1].GetData()["series"], s2);
    EXPECT_EQ(m_pContext->GetEventLog().CountEvents(LedgerEventID::SeriesInitialized), 0u);
    // factory-created series are not registered with the platform until the organization does it
    EXPECT_FALSE(registry().IsActiveEvent(s1));
}

TEST_F(TestTicketFactory, rejects_invalid_requests)
{
    const address_t platform = registry().GetAddress();
    const size_t nEvents = eventCount();

    EXPECT_THROW(FactoryCreate(m_org, ZERO_ADDRESS, platform), validation_error);
    EXPECT_THROW(FactoryCreate(m_org, m_org, ZERO_ADDRESS), validation_error);
    // only the organization itself may create its series
    EXPECT_THROW(FactoryCreate(m_alice, m_org, platform), authorization_error);
    EXPECT_THROW(FactoryCreate(m_bob, m_bob, platform), authorization_error);
    EXPECT_THROW(FactoryCreate(m_org, m_org, generateTestAddress("other-platform")), validation_error);
    EXPECT_THROW(FactoryCreate(m_org, m_org, platform, 0), validation_error);
    EXPECT_THROW(FactoryCreate(m_org, m_org, platform, TEST_TICKET_PRICE, 0), validation_error);
    EXPECT_THROW(FactoryCreate(m_org, m_org, platform, TEST_TICKET_PRICE, TEST_SALES_PERIOD, 0), validation_error);

    EXPECT_EQ(factory().GetInstanceCount(), 0u);
    EXPECT_EQ(m_pContext->GetSeriesCount(), 0u);
    EXPECT_EQ(eventCount(), nEvents);

    // failed requests do not consume the factory nonce
    const address_t series = FactoryCreate(m_org, m_org, platform);
    EXPECT_EQ(series, derive_address(factory().GetAddress(), COMPONENT_KIND_SERIES, 1));
}

TEST(test_ticket_template, token_uri)
{
    const auto pTemplate = make_shared<CTicketSeriesTemplate>(TICKET_SERIES_NAME, TICKET_SERIES_SYMBOL, TICKET_SERIES_VERSION);
    EXPECT_EQ(pTemplate->FormatTokenURI("ipfs://x/", 42), "ipfs://x/42");
    EXPECT_TRUE(pTemplate->FormatTokenURI("", 42).empty());
    const auto j = pTemplate->getJSON();
    EXPECT_EQ(j["symbol"], TICKET_SERIES_SYMBOL);
    EXPECT_EQ(j["version"], TICKET_SERIES_VERSION);
}
