// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef BITCOIN_SYNC_H
#define BITCOIN_SYNC_H

#include <boost/thread/locks.hpp>
#include <boost/thread/recursive_mutex.hpp>

/** Wrapped boost mutex: supports recursive locking */
class CCriticalSection: public boost::recursive_mutex
{
};

/** Wrapper around boost::unique_lock<CCriticalSection> */
class CCriticalBlock
{
private:
    boost::unique_lock<CCriticalSection> lock;

public:
    CCriticalBlock(CCriticalSection& mutexIn, const char* pszName, const char* pszFile, int nLine)
        : lock(mutexIn)
    {
    }
};

#define PASTE(x, y) x##y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)

#endif // BITCOIN_SYNC_H
