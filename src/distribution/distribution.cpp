// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/distribution.h"

#include "hash.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

static const char* const CATEGORY_NAMES[Consensus::MAX_REWARD_CATEGORIES] = {
    "create",
    "likes",
    "comments",
    "tipping",
    "crypto",
    "referrals",
};

std::string GetCategoryName(uint8_t nCategory)
{
    if (nCategory >= Consensus::MAX_REWARD_CATEGORIES) {
        return "unknown";
    }
    return CATEGORY_NAMES[nCategory];
}

bool ParseCategory(const std::string& str, uint8_t& nCategoryOut)
{
    const std::string strLower = ToLower(str);
    for (uint8_t n = 0; n < Consensus::MAX_REWARD_CATEGORIES; n++) {
        if (strLower == CATEGORY_NAMES[n]) {
            nCategoryOut = n;
            return true;
        }
    }
    int64_t nValue;
    if (ParseInt64(str, &nValue) && nValue >= 0 && nValue < Consensus::MAX_REWARD_CATEGORIES) {
        nCategoryOut = (uint8_t)nValue;
        return true;
    }
    return false;
}

std::string CDistributionSlot::ToString() const
{
    return strprintf("%d/%s/%d", nDay, GetCategoryName(nCategory), nSubBatch);
}

uint256 ComputeRewardLeaf(const CKeyID& user, uint64_t nPoints, CAmount nAmount)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << user << nPoints << nAmount;
    return ss.GetHash();
}

std::string CDistributionRecord::ToString() const
{
    return strprintf("CDistributionRecord(slot=%s, root=%s, users=%d, total=%s, signer=%s, nonce=%d, created=%d)",
                     slot.ToString(), root.ToString(), nUserCount, FormatMoney(nTotalReward),
                     HexStr(signer.begin(), signer.end()), nNonce, nCreatedAt);
}
