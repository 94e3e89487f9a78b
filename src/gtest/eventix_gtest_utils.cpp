// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <random>
#include <regex>
#include <vector>

#include <utils/util.h>

#include <eventix_gtest_utils.h>

using namespace std;

address_t generateTestAddress(const string& sName)
{
    return derive_address("test", sName, 0);
}

string generateRandomId(const size_t nLength)
{
    static constexpr char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    random_device rd;
    mt19937 gen(rd());
    uniform_int_distribution<size_t> dist(0, sizeof(ALPHABET) - 2);

    string s;
    s.reserve(nLength);
    for (size_t i = 0; i < nLength; ++i)
        s += ALPHABET[dist(gen)];
    return s;
}

void ResetArgs(const string& strArg)
{
    vector<string> vecArg;
    regex space(" ");
    if (strArg.size())
        vecArg = vector<string>(
                    sregex_token_iterator(strArg.begin(), strArg.end(), space, -1),
                    sregex_token_iterator()
                    );

    // Insert dummy executable name:
    vecArg.insert(vecArg.begin(), "eventix-gtest");

    // Convert to char*:
    vector<const char*> vecChar;
    for (const auto& s : vecArg)
        vecChar.push_back(s.c_str());

    ParseParameters(static_cast<int>(vecChar.size()), &vecChar[0]);
}
