#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <cstdint>
#include <cstdio>
#include <string>
#include <list>
#include <memory>
#include <atomic>
#include <mutex>
#include <filesystem>

constexpr auto DEFAULT_LOG_FILENAME = "eventix.log";

class CLogManager final
{
public:
    CLogManager() noexcept;
    ~CLogManager();

    // open log file (-logfile), flush messages buffered before that
    bool OpenLogFile();
    void CloseLogFile();

    // Set print-to-console mode.
    bool SetPrintToConsoleMode(std::string& error);
    void LogFlush();

    // Send a string to the log/stdout output
    size_t LogPrintStr(const std::string& str);

    bool IsPrintToConsole() const noexcept { return m_nPrintToConsoleMode > 0; }
    bool IsLogFileOpen() const noexcept { return m_LogFileHandle != nullptr; }
    const std::filesystem::path& GetLogFilePath() const noexcept { return m_LogFilePath; }
    size_t GetBufferedLogCount() const;

private:
    std::filesystem::path m_LogFilePath;
    mutable std::mutex m_mutexLog;
    std::unique_ptr<std::list<std::string>> m_pvStartupLogs;

    /**
    * Print to console modes:
    * 0 - do not print anything to console
    * 1 - print only to console
    * 2 - print to console and log file
    */
    std::atomic_uint32_t m_nPrintToConsoleMode = 0;
    FILE* m_LogFileHandle = nullptr;
    bool m_fStartedNewLine = true;
};

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

extern bool fLogTimestamps;
extern std::unique_ptr<CLogManager> gl_LogMgr;
