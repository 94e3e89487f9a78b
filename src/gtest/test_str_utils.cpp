// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <string>

#include <gtest/gtest.h>

#include <utils/str_utils.h>
#include <utils/utiltime.h>

using namespace std;
using namespace testing;

TEST(test_str_utils, trim)
{
    string s = " \t value \r\n";
    trim(s);
    EXPECT_EQ(s, "value");

    s = "   ";
    trim(s);
    EXPECT_TRUE(s.empty());
}

TEST(test_str_utils, split_join)
{
    v_strings v;
    // empty tokens are skipped, tokens are trimmed
    str_split(v, "a, b,,c ", ',');
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[1], "b");
    EXPECT_EQ(str_join(v, "|"), "a|b|c");
}

TEST(test_str_utils, tobool)
{
    bool bValue = false;
    EXPECT_TRUE(str_tobool("true", bValue));
    EXPECT_TRUE(bValue);
    EXPECT_TRUE(str_tobool("OFF", bValue));
    EXPECT_FALSE(bValue);
    EXPECT_FALSE(str_tobool("maybe", bValue));
}

TEST(test_str_utils, hex)
{
    const unsigned char data[] = { 0x00, 0x0f, 0xab, 0xff };
    EXPECT_EQ(HexStr(data, sizeof(data)), "000fabff");
    EXPECT_TRUE(str_starts_with("0x1234", "0x"));
    EXPECT_FALSE(str_starts_with("x", "0x"));
}

TEST(test_utiltime, mock_time)
{
    const int64_t nSaved = GetMockTime();
    SetMockTime(1'704'067'200);
    EXPECT_EQ(GetTime(), 1'704'067'200);
    EXPECT_EQ(EncodeDumpTime(GetTime()), "2024-01-01T00:00:00Z");
    EXPECT_EQ(DateTimeStrFormat("%Y-%m-%d", GetTime()), "2024-01-01");
    SetMockTime(nSaved);
}
