// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "distribution/distribution.h"
#include "logging.h"
#include <univalue.h>
#include "utilstrencodings.h"

#include <limits>

bool DecodeAddress(const std::string& str, CKeyID& addressOut)
{
    const std::string strHex = IsHexPrefixed(str) ? str.substr(2) : str;
    if (strHex.size() != 40 || !IsHex(strHex)) {
        return false;
    }
    addressOut = CKeyID(uint160(ParseHex(strHex)));
    return true;
}

bool ParseAmountString(const std::string& str, CAmount& nAmountOut)
{
    uint64_t n;
    if (!ParseUInt64(str, &n)) {
        return false;
    }
    nAmountOut = n;
    return true;
}

static bool ParseHash(const UniValue& v, uint256& hashOut)
{
    if (!v.isStr()) return false;
    const std::string& str = v.get_str();
    if (str.size() != 64 || !IsHex(str)) return false;
    hashOut = uint256S(str);
    return true;
}

/** Unsigned integer given as JSON number or decimal string. */
static bool ParseUnsigned(const UniValue& v, uint64_t nMax, uint64_t& nOut)
{
    if (v.isNum()) {
        int64_t n;
        if (!ParseInt64(v.getValStr(), &n) || n < 0 || (uint64_t)n > nMax) return false;
        nOut = (uint64_t)n;
        return true;
    }
    if (v.isStr()) {
        uint64_t n;
        if (!ParseUInt64(v.get_str(), &n) || n > nMax) return false;
        nOut = n;
        return true;
    }
    return false;
}

bool ClaimBundleFromJSON(const UniValue& obj, CClaimBundle& bundle, std::string& strError)
{
    if (!obj.isObject()) {
        strError = "bundle is not an object";
        return false;
    }

    uint64_t nDay, nCategory, nSubBatch;
    if (!ParseUnsigned(find_value(obj, "day"), std::numeric_limits<uint32_t>::max(), nDay) ||
        !ParseUnsigned(find_value(obj, "category"), Consensus::MAX_REWARD_CATEGORIES - 1, nCategory) ||
        !ParseUnsigned(find_value(obj, "subBatch"), std::numeric_limits<uint16_t>::max(), nSubBatch)) {
        strError = "bad day, category or subBatch";
        return false;
    }
    bundle.slot = CDistributionSlot((uint32_t)nDay, (uint8_t)nCategory, (uint16_t)nSubBatch);

    if (!ParseHash(find_value(obj, "root"), bundle.root)) {
        strError = "bad root";
        return false;
    }

    const UniValue& claims = find_value(obj, "claims");
    if (!claims.isArray()) {
        strError = "claims is not an array";
        return false;
    }

    bundle.vClaims.clear();
    for (size_t i = 0; i < claims.size(); i++) {
        const UniValue& claimObj = claims[i];
        if (!claimObj.isObject()) {
            strError = strprintf("claim %u is not an object", i);
            return false;
        }

        CClaimTicket ticket;
        const UniValue& userVal = find_value(claimObj, "user");
        if (!userVal.isStr() || !DecodeAddress(userVal.get_str(), ticket.user)) {
            strError = strprintf("claim %u: bad user", i);
            return false;
        }
        uint64_t nIndex;
        if (!ParseUnsigned(find_value(claimObj, "points"), std::numeric_limits<uint64_t>::max(), ticket.nPoints) ||
            !ParseUnsigned(find_value(claimObj, "amount"), std::numeric_limits<uint64_t>::max(), ticket.nAmount) ||
            !ParseUnsigned(find_value(claimObj, "index"), std::numeric_limits<uint32_t>::max(), nIndex)) {
            strError = strprintf("claim %u: bad points, amount or index", i);
            return false;
        }
        ticket.nIndex = (uint32_t)nIndex;

        const UniValue& proof = find_value(claimObj, "proof");
        if (!proof.isArray() || proof.size() > MAX_MERKLE_DEPTH) {
            strError = strprintf("claim %u: bad proof", i);
            return false;
        }
        for (size_t j = 0; j < proof.size(); j++) {
            uint256 hash;
            if (!ParseHash(proof[j], hash)) {
                strError = strprintf("claim %u: bad proof element %u", i, j);
                return false;
            }
            ticket.vProof.push_back(hash);
        }
        bundle.vClaims.push_back(ticket);
    }
    return true;
}

bool DecodeClaimBundle(const std::string& strJSON, CClaimBundle& bundle, std::string& strError)
{
    UniValue obj;
    if (!obj.read(strJSON)) {
        strError = "invalid JSON";
        return false;
    }
    return ClaimBundleFromJSON(obj, bundle, strError);
}
