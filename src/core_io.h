// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CORE_IO_H
#define QOBI_CORE_IO_H

#include "amount.h"

#include <string>

class CKeyID;
class UniValue;
struct CClaimBundle;
struct CClaimRecord;
struct CClaimTicket;
struct CDistributionRecord;
struct CDistributionSlot;

// core_read.cpp
/** Parse a 0x-prefixed (or bare) 40 hex digit address, byte order as written. */
bool DecodeAddress(const std::string& str, CKeyID& addressOut);
/** Base-unit integer string, e.g. "500000000000000000". */
bool ParseAmountString(const std::string& str, CAmount& nAmountOut);
bool ClaimBundleFromJSON(const UniValue& obj, CClaimBundle& bundle, std::string& strError);
bool DecodeClaimBundle(const std::string& strJSON, CClaimBundle& bundle, std::string& strError);

// core_write.cpp
std::string EncodeAddress(const CKeyID& address);
UniValue SlotToJSON(const CDistributionSlot& slot);
UniValue DistributionRecordToJSON(const CDistributionRecord& record);
UniValue ClaimRecordToJSON(const CClaimRecord& claim);
UniValue ClaimTicketToJSON(const CClaimTicket& ticket);
UniValue ClaimBundleToJSON(const CClaimBundle& bundle);
std::string EncodeClaimBundle(const CClaimBundle& bundle, unsigned int nIndent = 0);

#endif // QOBI_CORE_IO_H
