#pragma once
// Copyright (c) 2021-2024 Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <algorithm>
#include <cstring>
#include <cstdint>
#include <string>

#include <utils/container_types.h>

/**
 * test if character is white space not using locale.
 *
 * \param ch - character to test`
 * \return true if the character ch is a whitespace
 */
static inline bool isspaceex(const char ch) noexcept
{
    return (ch == 0x20) || (ch >= 0x09 && ch <= 0x0D);
}

/**
 * trim string in-place from start (left trim).
 *
 * \param s - string to ltrim
 */
static inline void ltrim(std::string &s)
{
    s.erase(s.begin(), std::find_if(s.cbegin(), s.cend(), [](const auto ch) { return !isspaceex(ch); }));
}

/**
 * trim string in-place from end (right trim).
 *
 * \param s - string to rtrim
 */
static inline void rtrim(std::string& s)
{
    s.erase(std::find_if(s.crbegin(), s.crend(), [](const auto ch) { return !isspaceex(ch); }).base(), s.end());
}

// trim string in-place (both left & right trim)
static inline void trim(std::string& s)
{
    ltrim(s);
    rtrim(s);
}

// returns empty string if szStr is nullptr
static inline const char* SAFE_SZ(const char* szStr) noexcept
{
    return szStr ? szStr : "";
}

/**
 * Check if string s starts with strStart.
 *
 * \param s - string to check
 * \param strStart - prefix
 * \return true if s starts with strStart
 */
static inline bool str_starts_with(const std::string& s, const char* strStart)
{
    if (!strStart || s.empty())
        return false;
    const size_t nLength = strlen(strStart);
    if (nLength > s.size())
        return false;
    return s.compare(0, nLength, strStart) == 0;
}

/**
 * Split string s by delimiter into vector v.
 * Empty tokens are skipped, tokens are trimmed.
 *
 * \param v - output vector of tokens
 * \param s - string to split
 * \param chDelimiter - delimiter character
 */
static inline void str_split(v_strings &v, const std::string &s, const char chDelimiter)
{
    v.clear();
    std::string sToken;
    size_t nStart = 0;
    while (nStart <= s.size())
    {
        size_t nPos = s.find(chDelimiter, nStart);
        if (nPos == std::string::npos)
            nPos = s.size();
        sToken = s.substr(nStart, nPos - nStart);
        trim(sToken);
        if (!sToken.empty())
            v.push_back(sToken);
        nStart = nPos + 1;
    }
}

static inline std::string str_join(const v_strings& v, const char* szDelimiter)
{
    std::string s;
    for (const auto& sItem : v)
    {
        if (!s.empty())
            s += szDelimiter;
        s += sItem;
    }
    return s;
}

/**
 * Convert string to bool value.
 * Supported values: true/false, 1/0, yes/no, on/off (case insensitive).
 *
 * \param str - string to convert
 * \param bValue - output value
 * \return true if the conversion was successful
 */
static inline bool str_tobool(const std::string &str, bool &bValue)
{
    const std::string s = lowercase(str);
    if (s == "1" || s == "true" || s == "yes" || s == "on")
    {
        bValue = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off")
    {
        bValue = false;
        return true;
    }
    return false;
}

/**
 * Encode byte buffer to lowercase hex string.
 *
 * \param p - pointer to the data
 * \param nSize - data size in bytes
 * \return hex-encoded string
 */
static inline std::string HexStr(const unsigned char* p, const size_t nSize)
{
    static constexpr char HEX_DIGITS[] = "0123456789abcdef";
    std::string s;
    s.reserve(nSize * 2);
    for (size_t i = 0; i < nSize; ++i)
    {
        s.push_back(HEX_DIGITS[p[i] >> 4]);
        s.push_back(HEX_DIGITS[p[i] & 0x0F]);
    }
    return s;
}
