// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_DISTRIBUTION_H
#define QOBI_DISTRIBUTION_H

#include "amount.h"
#include "consensus/params.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <string>
#include <tuple>
#include <vector>

/**
 * Reward distribution
 *
 * A relayer scores one day of interactions per category, commits the
 * (user, points, amount) triples of a cohort to a single Merkle root and
 * submits it. Users later claim their entry with a Merkle proof.
 *
 *   entries -> CBatchBuilder (root + proofs)
 *           -> typed-data digest, signed by the relayer
 *           -> CSubmissionValidator (admission checks)
 *           -> CDistributionLedger (write-once record)
 *           -> CClaimProcessor (proof + exactly-once release)
 */

static const int64_t DISTRIBUTION_DAY_SECONDS = 24 * 60 * 60;

/** Longest proof VerifyProof accepts (tree depth). */
static const size_t MAX_MERKLE_DEPTH = 32;

/** Day index of a unix time. */
inline uint32_t GetDayIndex(int64_t nTime)
{
    return nTime < 0 ? 0 : (uint32_t)(nTime / DISTRIBUTION_DAY_SECONDS);
}

/** Lower-case category name ("create", "likes", ...), "unknown" when out of range. */
std::string GetCategoryName(uint8_t nCategory);

/** Parse a category name or its numeric value. */
bool ParseCategory(const std::string& str, uint8_t& nCategoryOut);

//==============================================================================
// Slot
//==============================================================================

/**
 * One distribution slot. nSubBatch is only non-zero when a cohort does not
 * fit in one tree and was split.
 */
struct CDistributionSlot {
    uint32_t nDay;
    uint8_t nCategory;
    uint16_t nSubBatch;

    CDistributionSlot() : nDay(0), nCategory(0), nSubBatch(0) {}
    CDistributionSlot(uint32_t nDayIn, uint8_t nCategoryIn, uint16_t nSubBatchIn = 0)
        : nDay(nDayIn), nCategory(nCategoryIn), nSubBatch(nSubBatchIn) {}

    SERIALIZE_METHODS(CDistributionSlot, obj)
    {
        READWRITE(obj.nDay, obj.nCategory, obj.nSubBatch);
    }

    friend bool operator==(const CDistributionSlot& a, const CDistributionSlot& b)
    {
        return a.nDay == b.nDay && a.nCategory == b.nCategory && a.nSubBatch == b.nSubBatch;
    }
    friend bool operator!=(const CDistributionSlot& a, const CDistributionSlot& b) { return !(a == b); }
    friend bool operator<(const CDistributionSlot& a, const CDistributionSlot& b)
    {
        return std::tie(a.nDay, a.nCategory, a.nSubBatch) < std::tie(b.nDay, b.nCategory, b.nSubBatch);
    }

    std::string ToString() const;
};

//==============================================================================
// Batch entries
//==============================================================================

/** One scored user of a cohort. */
struct CRewardEntry {
    CKeyID user;
    uint64_t nPoints;
    CAmount nAmount;

    CRewardEntry() : nPoints(0), nAmount(0) {}
    CRewardEntry(const CKeyID& userIn, uint64_t nPointsIn, CAmount nAmountIn)
        : user(userIn), nPoints(nPointsIn), nAmount(nAmountIn) {}

    SERIALIZE_METHODS(CRewardEntry, obj)
    {
        READWRITE(obj.user, obj.nPoints, obj.nAmount);
    }
};

/**
 * Merkle leaf of an entry: double SHA-256 of the serialized
 * (user, points, amount) triple.
 */
uint256 ComputeRewardLeaf(const CKeyID& user, uint64_t nPoints, CAmount nAmount);

inline uint256 ComputeRewardLeaf(const CRewardEntry& entry)
{
    return ComputeRewardLeaf(entry.user, entry.nPoints, entry.nAmount);
}

//==============================================================================
// Ledger records
//==============================================================================

/**
 * Finalized distribution of a slot.
 *
 * Stored with key: 'r' || slot. Written once, never updated.
 */
struct CDistributionRecord {
    CDistributionSlot slot;
    uint256 root;
    uint32_t nUserCount;
    CAmount nTotalReward;
    bool fFinalized;
    int64_t nCreatedAt;
    CKeyID signer;             // relayer that signed the batch
    uint64_t nNonce;

    CDistributionRecord() : nUserCount(0), nTotalReward(0), fFinalized(false), nCreatedAt(0), nNonce(0) {}

    SERIALIZE_METHODS(CDistributionRecord, obj)
    {
        READWRITE(obj.slot, obj.root, obj.nUserCount, obj.nTotalReward,
                  obj.fFinalized, obj.nCreatedAt, obj.signer, obj.nNonce);
    }

    std::string ToString() const;
};

/**
 * A successful claim.
 *
 * Stored with key: 'c' || (slot, user). Presence means claimed.
 */
struct CClaimRecord {
    CDistributionSlot slot;
    CKeyID user;
    uint64_t nPoints;
    CAmount nAmount;
    uint32_t nIndex;
    int64_t nClaimedAt;

    CClaimRecord() : nPoints(0), nAmount(0), nIndex(0), nClaimedAt(0) {}

    SERIALIZE_METHODS(CClaimRecord, obj)
    {
        READWRITE(obj.slot, obj.user, obj.nPoints, obj.nAmount, obj.nIndex, obj.nClaimedAt);
    }
};

/** Running claim totals of a slot. nReleased never exceeds the record's nTotalReward. */
struct CSlotClaimStats {
    uint32_t nClaims;
    CAmount nReleased;

    CSlotClaimStats() : nClaims(0), nReleased(0) {}

    SERIALIZE_METHODS(CSlotClaimStats, obj)
    {
        READWRITE(obj.nClaims, obj.nReleased);
    }
};

//==============================================================================
// Claim bundles
//==============================================================================

/** Everything a user needs to claim one entry. */
struct CClaimTicket {
    CKeyID user;
    uint64_t nPoints;
    CAmount nAmount;
    uint32_t nIndex;
    std::vector<uint256> vProof;

    CClaimTicket() : nPoints(0), nAmount(0), nIndex(0) {}
};

/** Claim tickets of one submitted batch, exported by the relayer. */
struct CClaimBundle {
    CDistributionSlot slot;
    uint256 root;
    std::vector<CClaimTicket> vClaims;
};

#endif // QOBI_DISTRIBUTION_H
