// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef QOBI_UTILMONEYSTR_H
#define QOBI_UTILMONEYSTR_H

#include "amount.h"

#include <string>

/** "1.49" style rendering of an 18 decimal amount, trailing zeros trimmed to two places */
std::string FormatMoney(const CAmount& n, bool fPlus = false);
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // QOBI_UTILMONEYSTR_H
