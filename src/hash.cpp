// Copyright (c) 2013-2014 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

uint256 HashString(const std::string& str)
{
    return Hash(str.begin(), str.end());
}
