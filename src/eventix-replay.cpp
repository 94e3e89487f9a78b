// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>

#include <nlohmann/json.hpp>

#include <utils/str_utils.h>
#include <utils/util.h>
#include <platform/platform-error.h>
#include <platform/platform-config.h>
#include <platform/platform-context.h>
#include <platform/tx-dispatcher.h>

using json = nlohmann::json;
using namespace std;

static string HelpMessage()
{
    string strUsage = HelpMessageGroup("Usage:");
    strUsage += "  eventix-replay -script=<file> [options]   Replay platform transactions\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", "Specify configuration file (default: eventix.conf)");
    strUsage += HelpMessageOpt("-script=<file>", "JSON file with the transactions to replay");
    strUsage += HelpMessageOpt("-out=<file>", "Write the replay report to file instead of stdout");
    strUsage += HelpMessageOpt("-logfile=<file>", strprintf("Log file (default: %s)", DEFAULT_LOG_FILENAME));
    strUsage += HelpMessageOpt("-printtoconsole=<n>", "Print log to console: 0 - no, 1 - console only, 2 - console and log file (default: 0)");
    strUsage += HelpMessageOpt("-debug=<category>", "Log debug messages of the categories: platform, events, payment, replay");
    strUsage += "\n" + CPlatformConfig::GetHelpMessage();
    return strUsage;
}

static bool LoadScript(const fs::path& scriptPath, json& jScript, string &error)
{
    ifstream fileScript(scriptPath);
    if (!fileScript.is_open())
    {
        error = strprintf("failed to open script file [%s]", scriptPath.string());
        return false;
    }
    try
    {
        fileScript >> jScript;
    } catch (const json::exception& e)
    {
        error = strprintf("failed to parse script file [%s]. %s", scriptPath.string(), e.what());
        return false;
    }
    if (jScript.is_array())
        jScript = json{ { "transactions", std::move(jScript) } };
    if (!jScript.is_object() || !jScript.contains("transactions") || !jScript["transactions"].is_array())
    {
        error = strprintf("script [%s] must contain an array of transactions", scriptPath.string());
        return false;
    }
    return true;
}

static bool AppInit(int argc, char* argv[], string &error)
{
    ParseParameters(argc, argv);
    try
    {
        ReadConfigFile(mapArgs, mapMultiArgs);
    } catch (const missing_eventix_conf& e)
    {
        // the default configuration file is optional
        if (IsParamDefined("-conf"))
        {
            error = e.what();
            return false;
        }
    }

    gl_LogMgr = make_unique<CLogManager>();
    if (!gl_LogMgr->SetPrintToConsoleMode(error))
        return false;
    if (GetIntArg("-printtoconsole", 0) != 1 && !gl_LogMgr->OpenLogFile())
    {
        error = strprintf("failed to open log file [%s]", gl_LogMgr->GetLogFilePath().string());
        return false;
    }
    return true;
}

static int AppMain()
{
    CPlatformConfig config;
    string error;
    if (!config.Load(error))
    {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (config.GetMockTime())
        SetMockTime(config.GetMockTime());

    const string sScript = GetArg("-script", "");
    if (sScript.empty())
    {
        fprintf(stderr, "Error: replay script is not defined, use -script=<file>\n");
        return EXIT_FAILURE;
    }
    json jScript;
    if (!LoadScript(sScript, jScript, error))
    {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    CPlatformContext context(config);
    CTxDispatcher dispatcher(context);
    if (jScript.contains("aliases"))
    {
        for (const auto& [sAlias, jAddress] : jScript["aliases"].items())
            dispatcher.SetAlias(sAlias, jAddress.get<string>());
    }
    LogPrintf("Replaying %zu transaction(s) from [%s]\n", jScript["transactions"].size(), sScript);

    const int64_t nStartTime = GetTimeMillis();
    json jReport;
    jReport["results"] = dispatcher.ExecuteAll(jScript["transactions"]);
    jReport["events"] = context.GetEventLog().getJSON();
    jReport["state"] = context.getStateJSON();
    jReport["tokens"] = dispatcher.getTokensJSON();
    jReport["aliases"] = dispatcher.GetAliases();
    jReport["summary"] =
    {
        { "executed", dispatcher.GetExecutedCount() },
        { "failed", dispatcher.GetFailedCount() },
        { "events", context.GetEventLog().size() }
    };
    LogPrintf("Replay completed in %d ms: %zu executed, %zu failed\n", GetTimeMillis() - nStartTime,
        dispatcher.GetExecutedCount(), dispatcher.GetFailedCount());

    const string sReport = jReport.dump(4);
    const string sOut = GetArg("-out", "");
    if (sOut.empty())
        fprintf(stdout, "%s\n", sReport.c_str());
    else
    {
        ofstream fileOut(sOut);
        if (!fileOut.is_open())
        {
            fprintf(stderr, "Error: failed to create report file [%s]\n", sOut.c_str());
            return EXIT_FAILURE;
        }
        fileOut << sReport << endl;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    ParseParameters(argc, argv);
    if (IsParamDefined("-?") || IsParamDefined("-h") || IsParamDefined("-help"))
    {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    int nRet = EXIT_FAILURE;
    try
    {
        string error;
        if (!AppInit(argc, argv, error))
        {
            fprintf(stderr, "Error: %s\n", error.c_str());
            return EXIT_FAILURE;
        }
        nRet = AppMain();
    } catch (const exception& e)
    {
        PrintExceptionContinue(&e, "eventix-replay");
    }
    if (gl_LogMgr)
    {
        gl_LogMgr->LogFlush();
        gl_LogMgr->CloseLogFile();
    }
    return nRet;
}
