#pragma once
// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

/**
 * Environment: argument handling, config file parsing, logging helpers.
 */
#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

#include <tinyformat.h>

#include <utils/container_types.h>
#include <utils/utiltime.h>
#include <utils/logmanager.h>

#ifndef strprintf
#define strprintf tfm::format
#endif

namespace fs = std::filesystem;

extern m_strings mapArgs;
extern std::map<std::string, v_strings> mapMultiArgs;
extern bool fDebug;

/**
* Extract method name from __PRETTY_FUNCTION__.
* Sample input:
*      int  a::sub (int)
*
* \param s - __PRETTY_FUNCTION__
* \return extracted method name (class_name::method_name)
*/
constexpr std::string_view method_name(const char* s)
{
    std::string_view prettyFunction(s);
    // trim function parameters
    const size_t bracket = prettyFunction.rfind("(");
    // find the start of the method name
    const size_t space = prettyFunction.rfind(" ", bracket) + 1;
    return prettyFunction.substr(space, bracket - space);
}

#if defined(__GNUC__) || defined(__GNUG__) || defined(__CLANG__)
// __PRETTY_FUNCTION__ is defined in gcc and clang
#define __METHOD_NAME__ std::string(method_name(__PRETTY_FUNCTION__)).c_str()
#elif defined(_MSC_VER)
#define __METHOD_NAME__ __FUNCTION__
#else
#define __METHOD_NAME__ __func__
#endif

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    std::string log_msg;
    try
    {
        log_msg = tfm::format(fmt, args...);
    }
    catch (const tfm::format_error &e)
    {
        /* Original format string will have newline so don't add one here */
        log_msg = "Error \"" + std::string(e.what()) + "\" while formatting log message: " + fmt;
    }
    if (gl_LogMgr)
        gl_LogMgr->LogPrintStr(log_msg);
}

#define LogFnPrintf(fmt, ...) \
    LogPrintf(tfm::format("[%s] %s\n", __METHOD_NAME__, fmt).c_str(), ##__VA_ARGS__)

#define LogPrint(category, ...) do {        \
    if (LogAcceptCategory((category))) {    \
        LogPrintf(__VA_ARGS__);             \
    }                                       \
} while(false)

#define LogFnPrint(category, fmt, ...) do { \
    if (LogAcceptCategory((category))) {    \
        LogFnPrintf(fmt, ##__VA_ARGS__);    \
    }                                       \
} while(false)

template<typename... Args>
bool error(const char* fmt, const Args&... args)
{
    if (gl_LogMgr)
        gl_LogMgr->LogPrintStr("ERROR: " + tfm::format(fmt, args...) + "\n");
    return false;
}

/** Return readable error string for a system error code */
std::string GetErrorString(const int err);

void PrintExceptionContinue(const std::exception *pex, const char* pszThread);
void ParseParameters(int argc, const char*const argv[]);

/**
 * Return string argument or default value.
 *
 * \param strArg - argument to get (e.g. "-foo")
 * \param strDefault - value to return if the argument is not defined
 * \return command-line argument or default value
 */
std::string GetArg(const std::string& strArg, const std::string& strDefault);
int64_t GetArg(const std::string& strArg, const int64_t nDefault);
int32_t GetIntArg(const std::string& strArg, const int32_t nDefaultValue);

/**
 * Return boolean argument or default value.
 *
 * \param strArg - argument to get (e.g. "-foo")
 * \param fDefault - value to return if the argument is not defined
 * \return command-line argument (0 if invalid number) or default value
 */
bool GetBoolArg(const std::string& strArg, const bool fDefault);
bool IsParamDefined(const std::string& strArg) noexcept;

std::string HelpMessageGroup(const std::string& message);
std::string HelpMessageOpt(const std::string& option, const std::string& message);

fs::path GetConfigFile();

class missing_eventix_conf : public std::runtime_error
{
public:
    explicit missing_eventix_conf(const std::string& sPath) :
        std::runtime_error(tfm::format("Missing configuration file [%s]", sPath))
    {}
};

void ReadConfigFile(m_strings& mapSettingsRet, std::map<std::string, v_strings>& mapMultiSettingsRet);
