// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_BATCHBUILDER_H
#define QOBI_BATCHBUILDER_H

/**
 * Reward batch builders
 *
 * Pure, deterministic construction of the static Merkle tree of one cohort.
 * The same functions are used by the relayer to produce a root and by the
 * submission validator to re-derive it:
 * - BuildRewardBatch: root + per-user claim tickets
 * - ComputeBatchRoot: root only
 * - SplitRewardCohort: oversized cohort -> consecutive sub-batches
 * - Users/Points/Amounts digests and the checked total, which are signed
 */

#include "amount.h"
#include "distribution/distribution.h"
#include "uint256.h"

#include <string>
#include <vector>

/**
 * BatchResult - Result from BuildRewardBatch
 */
struct BatchResult
{
    bool success;
    std::string error;
    CDistributionSlot slot;
    uint256 root;
    int nDepth;                         // depth of the padded static tree
    CAmount nTotalReward;
    std::vector<CClaimTicket> vTickets; // one per entry, in input order

    BatchResult() : success(false), nDepth(0), nTotalReward(0) {}

    /** Claim bundle of this batch, as exported to users. */
    CClaimBundle GetBundle() const;
};

/** Smallest depth whose capacity holds nLeaves (1 leaf -> depth 0). */
int DepthForSize(size_t nLeaves);

/**
 * BuildRewardBatch - Build the static tree of one slot
 *
 * The tree is padded to the next power of two with empty subtree hashes.
 * A single entry yields root == leaf and an empty proof.
 *
 * @param slot slot the batch is built for
 * @param entries ordered (user, points, amount) triples
 * @param nCapacity largest accepted batch (tree capacity of the network)
 * @return BatchResult, success=false with error on empty, oversized or overflowing input
 */
BatchResult BuildRewardBatch(const CDistributionSlot& slot,
                             const std::vector<CRewardEntry>& entries,
                             uint64_t nCapacity);

/**
 * ComputeBatchRoot - Root of a cohort given as parallel lists
 *
 * Same root BuildRewardBatch returns. Fails when the lists are empty, differ
 * in length or exceed nCapacity.
 */
bool ComputeBatchRoot(const std::vector<CKeyID>& users,
                      const std::vector<uint64_t>& points,
                      const std::vector<CAmount>& amounts,
                      uint64_t nCapacity,
                      uint256& rootOut,
                      std::string& strError);

/** Static root of a fixed-depth tree; equals the accumulator root for the same ordered leaves. */
bool ComputeBatchRoot(const std::vector<uint256>& vLeaves, int nDepth, uint256& rootOut);

/**
 * SplitRewardCohort - Ordered split of a cohort into chunks of at most nMaxBatchSize.
 * Chunk i becomes sub-batch i. An empty cohort yields no chunks.
 */
std::vector<std::vector<CRewardEntry>> SplitRewardCohort(const std::vector<CRewardEntry>& entries,
                                                         size_t nMaxBatchSize);

uint256 ComputeUsersDigest(const std::vector<CKeyID>& users);
uint256 ComputePointsDigest(const std::vector<uint64_t>& points);
uint256 ComputeAmountsDigest(const std::vector<CAmount>& amounts);

/** Sum of amounts. False on overflow. */
bool ComputeTotalReward(const std::vector<CAmount>& amounts, CAmount& nTotalOut);

/** Split entries into the parallel lists a submission carries. */
void UnzipRewardEntries(const std::vector<CRewardEntry>& entries,
                        std::vector<CKeyID>& users,
                        std::vector<uint64_t>& points,
                        std::vector<CAmount>& amounts);

#endif // QOBI_BATCHBUILDER_H
