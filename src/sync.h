// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_SYNC_H
#define QOBI_SYNC_H

#include <condition_variable>
#include <mutex>
#include <string>
#include <type_traits>

/////////////////////////////////////////////////
//                                             //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                             //
/////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

LOCK2(mutex1, mutex2);
    std::unique_lock<std::recursive_mutex> criticalblock1(mutex1);
    std::unique_lock<std::recursive_mutex> criticalblock2(mutex2);

TRY_LOCK(mutex, name);
    std::unique_lock<std::recursive_mutex> name(mutex, std::try_to_lock_t);
 */

/**
 * Template mixin that adds -Wthread-safety locking annotations and lock order
 * checking to a subset of the mutex API.
 */
template <typename PARENT>
class AnnotatedMixin : public PARENT
{
public:
    ~AnnotatedMixin() {}

    void lock()
    {
        PARENT::lock();
    }

    void unlock()
    {
        PARENT::unlock();
    }

    bool try_lock()
    {
        return PARENT::try_lock();
    }

    using UniqueLock = std::unique_lock<PARENT>;
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting
 */
using RecursiveMutex = AnnotatedMixin<std::recursive_mutex>;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename Mutex, typename Base = typename Mutex::UniqueLock>
class UniqueLock : public Base
{
public:
    UniqueLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine, bool fTry = false) : Base(mutexIn, std::defer_lock)
    {
        if (fTry)
            Base::try_lock();
        else
            Base::lock();
    }

    ~UniqueLock()
    {
    }

    operator bool()
    {
        return Base::owns_lock();
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)
#define LOCK2(cs1, cs2)                                                                                     \
    UniqueLock<typename std::remove_reference<decltype(cs1)>::type> criticalblock1(cs1, #cs1, __FILE__, __LINE__); \
    UniqueLock<typename std::remove_reference<decltype(cs2)>::type> criticalblock2(cs2, #cs2, __FILE__, __LINE__);
#define TRY_LOCK(cs, name) UniqueLock<typename std::remove_reference<decltype(cs)>::type> name(cs, #cs, __FILE__, __LINE__, true)
#define WAIT_LOCK(cs, name) UniqueLock<typename std::remove_reference<decltype(cs)>::type> name(cs, #cs, __FILE__, __LINE__)

#endif // QOBI_SYNC_H
