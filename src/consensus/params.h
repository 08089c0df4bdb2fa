// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CONSENSUS_PARAMS_H
#define QOBI_CONSENSUS_PARAMS_H

#include "amount.h"
#include "uint256.h"

#include <array>
#include <stdint.h>
#include <string>

namespace Consensus {

/**
 * Interaction categories a reward batch is scored under.
 *
 * Being array indices (nDailyCap), these MUST be numbered consecutively.
 * The numeric value is part of the signed typed data and of the DB keys.
 */
enum RewardCategory : uint8_t {
    CATEGORY_CREATE,
    CATEGORY_LIKES,
    CATEGORY_COMMENTS,
    CATEGORY_TIPPING,
    CATEGORY_CRYPTO,
    CATEGORY_REFERRALS,
    MAX_REWARD_CATEGORIES
};

/**
 * Typed-data signing domain. Relayer signatures made for one domain never
 * verify under another (network, contract or version change).
 */
struct SigningDomain {
    std::string strName;
    std::string strVersion;
    uint64_t nChainId;
    uint160 verifyingContract;
};

/**
 * Parameters that influence admission of reward batches.
 */
struct Params {
    SigningDomain domain;

    // Merkle tree
    int nMerkleTreeDepth;           // 2^depth leaves per batch tree
    unsigned int nMaxBatchSize;     // users per submitted batch (<= tree capacity)

    // Per-category daily emission caps, indexed by RewardCategory
    std::array<CAmount, MAX_REWARD_CATEGORIES> nDailyCap;

    // Relayer submission deadline = now + nSubmissionWindow (seconds)
    int64_t nSubmissionWindow;
    int64_t nDaySeconds;

    uint64_t MerkleTreeCapacity() const { return uint64_t(1) << nMerkleTreeDepth; }
    bool IsValidCategory(uint8_t nCategory) const { return nCategory < MAX_REWARD_CATEGORIES; }
    CAmount DailyCap(uint8_t nCategory) const { return IsValidCategory(nCategory) ? nDailyCap[nCategory] : 0; }
};

} // namespace Consensus

#endif // QOBI_CONSENSUS_PARAMS_H
