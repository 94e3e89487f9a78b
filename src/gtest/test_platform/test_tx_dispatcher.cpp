// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <memory>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <utils/utiltime.h>
#include <platform/platform-context.h>
#include <platform/platform-registry.h>
#include <platform/ticket-series.h>
#include <platform/tx-dispatcher.h>

#include <eventix_gtest_main.h>
#include <eventix_gtest_utils.h>

using json = nlohmann::json;
using namespace std;
using namespace testing;

class TestTxDispatcher : public Test
{
protected:
    unique_ptr<CPlatformContext> m_pContext;
    unique_ptr<CTxDispatcher> m_pDispatcher;

    void SetUp() override
    {
        gl_pEventixTestEnv->ResetTime();
        m_pContext = make_unique<CPlatformContext>(CPlatformConfig(generateTestAddress("owner"), 500));
        m_pDispatcher = make_unique<CTxDispatcher>(*m_pContext);
        m_pDispatcher->SetAlias("alice", generateTestAddress("alice"));
        m_pDispatcher->SetAlias("$bob", generateTestAddress("bob"));
    }

    void TearDown() override
    {
        m_pDispatcher.reset();
        m_pContext.reset();
        gl_pEventixTestEnv->ResetTime();
    }

    json ExecuteOk(const json& jTx)
    {
        json jResult = m_pDispatcher->Execute(jTx);
        EXPECT_EQ(jResult["status"], "ok") << jResult.dump();
        return jResult;
    }

    void SetupEvent()
    {
        const json jScript = R"([
            { "op": "createToken", "from": "$owner", "symbol": "USD", "as": "usd" },
            { "op": "updatePaymentToken", "from": "$owner", "token": "$usd" },
            { "op": "setOrganizerStatus", "from": "$owner", "organizer": "$alice", "allowed": true },
            { "op": "createOrganization", "from": "$alice", "as": "org" },
            { "op": "createEvent", "from": "$alice", "organization": "$org", "uri": "ipfs://show/",
              "price": 200, "deadline": "+3600", "maxSupply": 2, "as": "show" },
            { "op": "mintTokens", "token": "$usd", "to": "$bob", "amount": 1000 },
            { "op": "approve", "token": "$usd", "from": "$bob", "spender": "$show", "amount": 1000 }
        ])"_json;
        for (const auto& jTx : jScript)
            ExecuteOk(jTx);
    }
};

TEST_F(TestTxDispatcher, predefined_aliases)
{
    EXPECT_EQ(m_pDispatcher->Resolve("$owner"), generateTestAddress("owner"));
    EXPECT_EQ(m_pDispatcher->Resolve("$registry"), m_pContext->GetRegistry().GetAddress());
    EXPECT_EQ(m_pDispatcher->Resolve("$bob"), generateTestAddress("bob"));
    EXPECT_EQ(m_pDispatcher->Resolve("0xplain"), "0xplain");
    EXPECT_THROW(m_pDispatcher->Resolve("$nobody"), invalid_argument);
    EXPECT_TRUE(m_pDispatcher->IsOpSupported("mint"));
    EXPECT_FALSE(m_pDispatcher->IsOpSupported("burn"));
}

TEST_F(TestTxDispatcher, event_script)
{
    SetupEvent();
    const address_t show = m_pDispatcher->Resolve("$show");
    EXPECT_TRUE(m_pContext->GetRegistry().IsActiveEvent(show));
    EXPECT_EQ(m_pContext->GetSeries(show).GetDeadline(), TEST_START_TIME + 3'600);

    json jResult = ExecuteOk({ { "op", "mint" }, { "from", "$bob" }, { "event", "$show" } });
    EXPECT_EQ(jResult["result"], 0);
    jResult = ExecuteOk({ { "op", "validateTicket" }, { "event", "$show" }, { "ticketId", 0 } });
    EXPECT_EQ(jResult["result"], true);
    jResult = ExecuteOk({ { "op", "balanceOf" }, { "token", "$usd" }, { "holder", "$bob" } });
    EXPECT_EQ(jResult["result"], 800);
    jResult = ExecuteOk({ { "op", "balanceOf" }, { "token", "$usd" }, { "holder", "$registry" } });
    EXPECT_EQ(jResult["result"], 10);

    ExecuteOk({ { "op", "advanceTime" }, { "seconds", 3'600 } });
    jResult = ExecuteOk({ { "op", "validateTicket" }, { "event", "$show" }, { "ticketId", 0 } });
    EXPECT_EQ(jResult["result"], false);
    EXPECT_EQ(m_pDispatcher->GetFailedCount(), 0u);
}

TEST_F(TestTxDispatcher, failures_are_reported)
{
    SetupEvent();
    const size_t nEvents = m_pContext->GetEventLog().size();

    json jResult = m_pDispatcher->Execute({ { "op", "createOrganization" }, { "from", "$bob" } });
    EXPECT_EQ(jResult["status"], "error");
    EXPECT_EQ(jResult["error"]["type"], "AuthorizationError");

    jResult = m_pDispatcher->Execute({ { "op", "updatePlatformFee" }, { "from", "$owner" }, { "feeBps", 20'000 } });
    EXPECT_EQ(jResult["error"]["type"], "ValidationError");

    jResult = m_pDispatcher->Execute({ { "op", "closeEvent" }, { "from", "$alice" }, { "organization", "$org" }, { "event", "$bob" } });
    EXPECT_EQ(jResult["error"]["type"], "StateError");

    jResult = m_pDispatcher->Execute({ { "op", "resell" }, { "from", "$bob" }, { "event", "$show" },
        { "ticketId", 0 }, { "to", "$alice" }, { "price", 100 } });
    EXPECT_EQ(jResult["error"]["type"], "StateError");

    jResult = m_pDispatcher->Execute({ { "op", "burn" } });
    EXPECT_EQ(jResult["error"]["type"], "ScriptError");
    jResult = m_pDispatcher->Execute({ { "op", "mint" }, { "from", "$bob" } });
    EXPECT_EQ(jResult["error"]["type"], "ScriptError");
    jResult = m_pDispatcher->Execute({ { "op", "mint" }, { "from", "$bob" }, { "event", "$unknown" } });
    EXPECT_EQ(jResult["error"]["type"], "ScriptError");
    jResult = m_pDispatcher->Execute(json::array());
    EXPECT_EQ(jResult["error"]["type"], "ScriptError");

    EXPECT_EQ(m_pDispatcher->GetFailedCount(), 8u);
    EXPECT_EQ(m_pContext->GetEventLog().size(), nEvents);
}

TEST_F(TestTxDispatcher, execute_all_continues_after_failure)
{
    const json jResults = m_pDispatcher->ExecuteAll(R"([
        { "op": "pause", "from": "$owner" },
        { "op": "pause", "from": "$owner" },
        { "op": "unpause", "from": "$owner" }
    ])"_json);
    ASSERT_EQ(jResults.size(), 3u);
    EXPECT_EQ(jResults[0]["status"], "ok");
    EXPECT_EQ(jResults[1]["status"], "error");
    EXPECT_EQ(jResults[2]["status"], "ok");
    EXPECT_EQ(jResults[2]["index"], 2);
    EXPECT_FALSE(m_pContext->GetRegistry().IsPaused());
    EXPECT_THROW(m_pDispatcher->ExecuteAll(json::object()), invalid_argument);
}

TEST_F(TestTxDispatcher, platform_ownership_updates_alias)
{
    ExecuteOk({ { "op", "transferPlatformOwnership" }, { "from", "$owner" }, { "newOwner", "$bob" } });
    EXPECT_EQ(m_pDispatcher->Resolve("$owner"), generateTestAddress("bob"));
    ExecuteOk({ { "op", "pause" }, { "from", "$owner" } });
    EXPECT_TRUE(m_pContext->GetRegistry().IsPaused());
}

TEST_F(TestTxDispatcher, time_ops)
{
    json jResult = ExecuteOk({ { "op", "setTime" }, { "time", 1'800'000'000 } });
    EXPECT_EQ(GetTime(), 1'800'000'000);
    jResult = ExecuteOk({ { "op", "advanceTime" }, { "seconds", 60 } });
    EXPECT_EQ(jResult["result"], 1'800'000'060);
    EXPECT_EQ(m_pDispatcher->Execute({ { "op", "advanceTime" }, { "seconds", -1 } })["status"], "error");
    EXPECT_EQ(m_pDispatcher->Execute({ { "op", "setTime" }, { "time", 0 } })["status"], "error");
}
