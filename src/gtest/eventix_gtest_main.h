#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>

#include <gtest/gtest.h>

// fixed Unix time used by all platform tests (2024-01-01 00:00:00 UTC)
constexpr int64_t TEST_START_TIME = 1'704'067'200;

class CEventixTest_Environment : public ::testing::Environment
{
public:
    CEventixTest_Environment() = default;

    // reset mock time to the test start time
    void ResetTime();

protected:
    void SetUp() override;
    void TearDown() override;
};

extern CEventixTest_Environment *gl_pEventixTestEnv;
