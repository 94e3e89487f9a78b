// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <iostream>

#include <gmock/gmock.h>

#include <utils/util.h>
#include <utils/utiltime.h>

#include <eventix_gtest_main.h>

using namespace std;

CEventixTest_Environment *gl_pEventixTestEnv = nullptr;

void CEventixTest_Environment::SetUp()
{
    // log records are not written anywhere unless -printtoconsole is passed
    const char* argv[] = { "eventix-gtest", "-printtoconsole=0" };
    ParseParameters(2, argv);
    ResetTime();
}

void CEventixTest_Environment::TearDown()
{
    SetMockTime(0);
}

void CEventixTest_Environment::ResetTime()
{
    SetMockTime(TEST_START_TIME);
}

int main(int argc, char **argv)
{
    // supported command-line options
    /*
    * Google Test supports the following command-line parameters:
        --gtest_list_tests
        --gtest_filter=<test string> - use google test filter, where
           <test string> is a series of wildcard patterns separated by colons (:).
           examples:
             --gtest_filter=*
             --gtest_filter=test_ticket_series*:test_fee_split*
             --gtest_filter=-test_concurrency*
        --gtest_repeat=N - repeat test N times
        --gtest_break_on_failure
        --gtest_output="(xml|json):<filename>"
    */
    testing::InitGoogleMock(&argc, argv);

    gl_pEventixTestEnv = new CEventixTest_Environment();
    if (!gl_pEventixTestEnv)
    {
        cerr << "Failed to create Eventix test environment";
        return 2;
    }
    ::testing::AddGlobalTestEnvironment(gl_pEventixTestEnv);

    return RUN_ALL_TESTS();
}
