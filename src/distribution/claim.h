// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CLAIM_H
#define QOBI_CLAIM_H

#include "amount.h"
#include "distribution/distribution.h"
#include "sync.h"
#include "uint256.h"

#include <vector>

class CDistributionDB;
class CValidationState;
class CValueTransfer;

/**
 * Exactly-once redemption of reward leaves.
 *
 * A claim is checked against the finalized record of its slot, then the
 * claim record and slot totals are written in a DB transaction that stays
 * open across the value transfer: a failed transfer rolls the claim back.
 * Claims that re-enter Claim() from inside the transfer are refused.
 */
class CClaimProcessor
{
private:
    mutable RecursiveMutex cs_claim;
    CDistributionDB& db;
    CValueTransfer& transfer;

    // Set while a claim is between its DB write and its commit
    bool fClaimInProgress;

public:
    CClaimProcessor(CDistributionDB& dbIn, CValueTransfer& transferIn);

    /**
     * Claim (caller, nPoints, nAmount) of a slot.
     *
     * Fails with, in check order: NO_DISTRIBUTION, ALREADY_CLAIMED,
     * UNAUTHORIZED (re-entrant claim), PROOF_INVALID, CAP_EXCEEDED,
     * TRANSFER_FAILED.
     *
     * @param[out] pClaimOut the committed claim, when not null
     */
    bool Claim(const CDistributionSlot& slot, uint64_t nPoints, CAmount nAmount, uint32_t nIndex,
               const std::vector<uint256>& vProof, const CKeyID& caller, CValidationState& state,
               CClaimRecord* pClaimOut = nullptr);

    /** Claim with a ticket from a relayer bundle. */
    bool Claim(const CDistributionSlot& slot, const CClaimTicket& ticket, CValidationState& state,
               CClaimRecord* pClaimOut = nullptr);

    bool HasClaimed(const CDistributionSlot& slot, const CKeyID& user) const;
    bool GetClaim(const CDistributionSlot& slot, const CKeyID& user, CClaimRecord& claim) const;
    CSlotClaimStats GetClaimStats(const CDistributionSlot& slot) const;
};

#endif // QOBI_CLAIM_H
