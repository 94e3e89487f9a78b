// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cerrno>
#include <thread>
#include <sstream>
#include <set>

#include <utils/logmanager.h>
#include <utils/util.h>
#include <utils/str_utils.h>

using namespace std;

constexpr bool DEFAULT_LOGTIMESTAMPS = true;

bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

unique_ptr<CLogManager> gl_LogMgr;

CLogManager::CLogManager() noexcept :
    m_pvStartupLogs(make_unique<list<string>>())
{}

CLogManager::~CLogManager()
{
    CloseLogFile();
}

/**
 * Set print-to-console mode.
 * Supported modes:
 *   0 - do not print anything to console (default)
 *   1 - print only to console
 *   2 - print to console and log file
 * 
 * \param error - error message if the function fails
 * \return true if the function succeeds, false otherwise
 */
bool CLogManager::SetPrintToConsoleMode(string &error)
{
    const string sPrintToConsoleMode = GetArg("-printtoconsole", "0");
    string sConversionErrorMsg;
    try
    {
        const int nPrintToConsoleMode = stoi(sPrintToConsoleMode);
        if (nPrintToConsoleMode < 0 || nPrintToConsoleMode > 2)
        {
            error = strprintf("-printtoconsole option value [%s] is invalid. Supported values are: 0, 1, or 2.",
                sPrintToConsoleMode);
            return false;
        }
        m_nPrintToConsoleMode = static_cast<uint32_t>(nPrintToConsoleMode);
        return true;
    } catch (const invalid_argument &e1)
    {
        sConversionErrorMsg = SAFE_SZ(e1.what());
    } catch (const out_of_range& e2)
    {
        sConversionErrorMsg = SAFE_SZ(e2.what());
    }
    error = strprintf("-printtoconsole option value [%s] is invalid - %s. Supported values are: 0, 1, or 2.",
        sPrintToConsoleMode, sConversionErrorMsg);
    return false;
}

static size_t FileWriteStr(const string &str, FILE *fp)
{
    return fwrite(str.data(), 1, str.size(), fp);
}

bool LogAcceptCategory(const char* category)
{
    if (category)
    {
        if (!fDebug)
            return false;

        // Give each thread quick access to -debug settings.
        static thread_local unique_ptr<set<string>> ptrCategory;
        if (!ptrCategory)
        {
            const auto &vCategories = mapMultiArgs["-debug"];
            // support multiple categories separated by comma
            set<string> setCategories;
            for (const auto& sCategory : vCategories)
            {
                if (sCategory.find(',') != string::npos)
                {
                    v_strings v;
                    str_split(v, sCategory, ',');
                    setCategories.insert(v.cbegin(), v.cend());
                }
                else
                    setCategories.insert(sCategory);
            }
            ptrCategory = make_unique<set<string>>(std::move(setCategories));
        }
        const auto& setCategories = *ptrCategory;

        // if not debugging everything and not debugging specific category, LogPrint does nothing.
        if (setCategories.count(string("")) == 0 &&
            setCategories.count(string("1")) == 0 &&
            setCategories.count(string(category)) == 0)
            return false;
    }
    return true;
}

/**
* Get thread id in hex format.
* 
* \return thread id
*/
static string get_tid_hex() noexcept
{
    ostringstream s;
    s << hex << uppercase << this_thread::get_id();
    return s.str();
}

/**
 * fStartedNewLine suppresses printing of the timestamp when multiple calls
 * are made that don't end in a newline.
 */
static string LogTimestampStr(const string &str, bool &fStartedNewLine)
{
    if (!fLogTimestamps)
        return str;

    string strStamped;
    strStamped.reserve(30 + str.size());
    strStamped = get_tid_hex() + " - ";
    if (fStartedNewLine)
        strStamped += DateTimeStrFormat("%Y-%m-%d %H:%M:%S", GetTime()) + ' ' + str;
    else
        strStamped += str;

    fStartedNewLine = !str.empty() && str.back() == '\n';
    return strStamped;
}

size_t CLogManager::LogPrintStr(const string &str)
{
    size_t nCharsWritten = 0;
    const uint32_t nPrintToConsoleMode = m_nPrintToConsoleMode;
    if (nPrintToConsoleMode > 0)
    {
        nCharsWritten = fwrite(str.data(), 1, str.size(), stdout);
        fflush(stdout);
    }
    if (nPrintToConsoleMode == 1)
        return nCharsWritten;

    scoped_lock lock(m_mutexLog);
    string strTimestamped = LogTimestampStr(str, m_fStartedNewLine);

    // buffer if we haven't opened the log yet
    if (!m_LogFileHandle)
    {
        nCharsWritten = strTimestamped.length();
        if (m_pvStartupLogs)
            m_pvStartupLogs->push_back(std::move(strTimestamped));
    }
    else
        nCharsWritten = FileWriteStr(strTimestamped, m_LogFileHandle);
    return nCharsWritten;
}

void CLogManager::LogFlush()
{
    scoped_lock lock(m_mutexLog);
    if (m_LogFileHandle)
        fflush(m_LogFileHandle);
}

size_t CLogManager::GetBufferedLogCount() const
{
    scoped_lock lock(m_mutexLog);
    return m_pvStartupLogs ? m_pvStartupLogs->size() : 0;
}

bool CLogManager::OpenLogFile()
{
    scoped_lock lock(m_mutexLog);
    if (m_LogFileHandle)
        return true;
    m_LogFilePath = GetArg("-logfile", DEFAULT_LOG_FILENAME);

    m_LogFileHandle = fopen(m_LogFilePath.string().c_str(), "a");
    if (!m_LogFileHandle)
    {
        const int err = errno;
        fprintf(stderr, "ERROR: failed to open log file [%s]. %s\n", m_LogFilePath.string().c_str(), GetErrorString(err).c_str());
        return false;
    }
    setvbuf(m_LogFileHandle, nullptr, _IONBF, 0); // unbuffered

    // dump buffered messages from before we opened the log
    if (m_pvStartupLogs)
    {
        for (const auto &s : *m_pvStartupLogs)
            FileWriteStr(s, m_LogFileHandle);
        m_pvStartupLogs.reset();
    }
    return true;
}

void CLogManager::CloseLogFile()
{
    scoped_lock lock(m_mutexLog);
    if (!m_LogFileHandle)
        return;

    // re-enable startup logs buffering
    if (!m_pvStartupLogs)
        m_pvStartupLogs = make_unique<list<string>>();

    fflush(m_LogFileHandle);
    fclose(m_LogFileHandle);
    m_LogFileHandle = nullptr;
}
