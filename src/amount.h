// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_AMOUNT_H
#define QOBI_AMOUNT_H

#include <stdint.h>

/**
 * Amount in base units (10^-18 QOBI).
 *
 * QOBI uses 18 decimals. The largest daily cap (11.95 QOBI) does not fit in
 * an int64_t, so amounts are unsigned and every sum is overflow-checked.
 */
typedef uint64_t CAmount;

static const CAmount COIN = 1000000000000000000ULL;
static const CAmount CENT = 10000000000000000ULL;

/** Number of decimal places of one COIN */
static const int COIN_DECIMALS = 18;

/** a + b without wrapping. Returns false on overflow, leaving nSum untouched. */
inline bool CheckedAdd(CAmount a, CAmount b, CAmount& nSum)
{
    if (a > UINT64_MAX - b) return false;
    nSum = a + b;
    return true;
}

#endif // QOBI_AMOUNT_H
