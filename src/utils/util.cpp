// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <typeinfo>

#include <boost/program_options/detail/config_file.hpp>
#include <boost/program_options/parsers.hpp>

#include <utils/str_utils.h>
#include <utils/util.h>

using namespace std;

m_strings mapArgs;
map<string, v_strings> mapMultiArgs;
bool fDebug = false;

static int64_t atoi64(const string& str)
{
    return strtoll(str.c_str(), nullptr, 10);
}

static int32_t atoi32(const string& str)
{
    return static_cast<int32_t>(strtol(str.c_str(), nullptr, 10));
}

static void InterpretNegativeSetting(const string &name, m_strings& mapSettingsRet)
{
    // interpret -nofoo as -foo=0 (and -nofoo=0 as -foo=1) as long as -foo not set
    if (name.find("-no") == 0)
    {
        string positive("-");
        positive.append(name.begin() + 3, name.end());
        if (mapSettingsRet.count(positive) == 0)
        {
            bool value = true;
            const auto it = mapSettingsRet.find(name);
            if (it != mapSettingsRet.cend())
                value = it->second.empty() || (atoi32(it->second) != 0);
            mapSettingsRet[positive] = (value ? "0" : "1");
        }
    }
}

void ParseParameters(int argc, const char* const argv[])
{
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        string str(argv[i]);
        string strValue;
        size_t is_index = str.find('=');
        if (is_index != string::npos)
        {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }
        if (str.empty() || str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }

    // copy the keys: InterpretNegativeSetting may insert into mapArgs
    v_strings vKeys;
    for (const auto &entry : mapArgs)
        vKeys.push_back(entry.first);
    for (const auto &sKey : vKeys)
        InterpretNegativeSetting(sKey, mapArgs);
    fDebug = !mapMultiArgs["-debug"].empty();
}

string GetArg(const string& strArg, const string& strDefault)
{
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.cend())
        return it->second;
    return strDefault;
}

int32_t GetIntArg(const string& strArg, const int32_t nDefaultValue)
{
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.cend())
        return atoi32(it->second);
    return nDefaultValue;
}

int64_t GetArg(const string& strArg, const int64_t nDefault)
{
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.cend())
        return atoi64(it->second);
    return nDefault;
}

bool GetBoolArg(const string& strArg, const bool fDefault)
{
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.cend())
    {
        if (it->second.empty())
            return true;
        return (atoi32(it->second) != 0);
    }
    return fDefault;
}

bool IsParamDefined(const string& strArg) noexcept
{
    return mapArgs.count(strArg) > 0;
}

static constexpr int optIndent = 2;
static constexpr int msgIndent = 7;

string HelpMessageGroup(const string &message)
{
    return message + string("\n\n");
}

string HelpMessageOpt(const string &option, const string &message)
{
    return string(optIndent, ' ') + option +
           string("\n") + string(msgIndent, ' ') + message +
           string("\n\n");
}

string GetErrorString(const int err)
{
    char buf[256];
    const char *s = buf;
    buf[0] = 0;
    /* Too bad there are two incompatible implementations of the
     * thread-safe strerror. */
#ifdef STRERROR_R_CHAR_P /* GNU variant can return a pointer outside the passed buffer */
    s = strerror_r(err, buf, sizeof(buf));
#else /* POSIX variant always returns message in buffer */
    if (strerror_r(err, buf, sizeof(buf)))
        buf[0] = 0;
#endif
    return strprintf("%s (%d)", s, err);
}

static string FormatException(const exception* pex, const char* pszThread)
{
    const char* pszModule = "Eventix";
    if (pex)
        return strprintf(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), pszModule, pszThread);
    return strprintf(
        "UNKNOWN EXCEPTION       \n%s in %s       \n", pszModule, pszThread);
}

void PrintExceptionContinue(const exception* pex, const char* pszThread)
{
    const string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

fs::path GetConfigFile()
{
    return fs::path(GetArg("-conf", "eventix.conf"));
}

/**
 * Read configuration file (-conf) in key=value format.
 * Existing settings are not overwritten, so command line settings override the file.
 *
 * \param mapSettingsRet - single-value settings
 * \param mapMultiSettingsRet - multi-value settings
 * \throw missing_eventix_conf if the file cannot be opened
 */
void ReadConfigFile(m_strings& mapSettingsRet, map<string, v_strings>& mapMultiSettingsRet)
{
    const fs::path pathConfigFile = GetConfigFile();
    ifstream streamConfig(pathConfigFile);
    if (!streamConfig.good())
        throw missing_eventix_conf(pathConfigFile.string());

    set<string> setOptions;
    setOptions.insert("*");

    for (boost::program_options::detail::config_file_iterator it(streamConfig, setOptions), end; it != end; ++it)
    {
        string strKey = string("-") + it->string_key;
        if (mapSettingsRet.count(strKey) == 0)
        {
            mapSettingsRet[strKey] = it->value[0];
            // interpret nofoo=1 as foo=0 (and nofoo=0 as foo=1) as long as foo not set)
            InterpretNegativeSetting(strKey, mapSettingsRet);
        }
        mapMultiSettingsRet[strKey].push_back(it->value[0]);
    }
    fDebug = !mapMultiSettingsRet["-debug"].empty();
}
