#pragma once
// Copyright (c) 2018-2024 The Pastel Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.
#include <atomic>
#include <mutex>

/*
CCriticalSection cs;       recursive, held by the outermost platform operation
LOCK(cs);                  std::unique_lock<std::recursive_mutex>

CWaitableCriticalSection cs;   non-recursive, guards leaf containers (token balances, event log)
SIMPLE_LOCK(cs);               std::unique_lock<std::mutex>
*/

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 * Nested cross-component calls re-enter the section already held by the outermost operation.
 */
typedef std::recursive_mutex CCriticalSection;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex CWaitableCriticalSection;

template <typename Mutex>
class CMutexLock
{
public:
    CMutexLock(Mutex& mutexIn, const char* szLockName, const char* szFile, const size_t nLine) :
        m_lock(mutexIn),
        m_szLockName(szLockName),
        m_szFile(szFile),
        m_nLine(nLine)
    {}

    CMutexLock(const CMutexLock&) = delete;
    CMutexLock& operator=(const CMutexLock&) = delete;

    operator bool() const noexcept { return m_lock.owns_lock(); }

    // lock origin, useful when inspecting a deadlock in the debugger
    const char* GetLockName() const noexcept { return m_szLockName; }
    const char* GetFile() const noexcept { return m_szFile; }
    size_t GetLine() const noexcept { return m_nLine; }

private:
    std::unique_lock<Mutex> m_lock;
    const char* m_szLockName;
    const char* m_szFile;
    size_t m_nLine;
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;
typedef CMutexLock<CWaitableCriticalSection> CWaitableCriticalBlock;

#define LOCK(cs) CCriticalBlock criticalblock(cs, #cs, __FILE__, __LINE__)
#define SIMPLE_LOCK(cs) CWaitableCriticalBlock criticalblock(cs, #cs, __FILE__, __LINE__)

/**
 * RAII flag guard.
 * Raises the flag on construction if it was not raised yet, clears it on destruction.
 * IsAcquired() returns false when the flag was already raised up the stack (re-entrant call).
 */
class CFlagGuard
{
public:
    explicit CFlagGuard(std::atomic_bool& flag) noexcept :
        m_flag(flag)
    {
        bool bExpected = false;
        m_bAcquired = m_flag.compare_exchange_strong(bExpected, true);
    }

    CFlagGuard(const CFlagGuard&) = delete;
    CFlagGuard& operator=(const CFlagGuard&) = delete;

    ~CFlagGuard()
    {
        if (m_bAcquired)
            m_flag = false;
    }

    bool IsAcquired() const noexcept { return m_bAcquired; }

private:
    std::atomic_bool& m_flag;
    bool m_bAcquired = false;
};
