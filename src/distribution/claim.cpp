// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/claim.h"

#include "consensus/validation.h"
#include "distribution/distributiondb.h"
#include "distribution/distributioninterface.h"
#include "distribution/escrow.h"
#include "distribution/merkleaccumulator.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

namespace {

/** Marks a claim in progress for the lifetime of the guard. */
class ClaimGuard
{
    bool& fFlag;

public:
    explicit ClaimGuard(bool& fFlagIn) : fFlag(fFlagIn) { fFlag = true; }
    ~ClaimGuard() { fFlag = false; }
};

} // namespace

CClaimProcessor::CClaimProcessor(CDistributionDB& dbIn, CValueTransfer& transferIn)
    : db(dbIn), transfer(transferIn), fClaimInProgress(false)
{
}

bool CClaimProcessor::Claim(const CDistributionSlot& slot, uint64_t nPoints, CAmount nAmount, uint32_t nIndex,
                            const std::vector<uint256>& vProof, const CKeyID& caller, CValidationState& state,
                            CClaimRecord* pClaimOut)
{
    LOCK(cs_claim);

    const std::string strCaller = HexStr(caller.begin(), caller.end());

    CDistributionRecord record;
    if (!db.ReadDistribution(slot, record) || !record.fFinalized) {
        return state.Invalid(DistributionError::NO_DISTRIBUTION, false, REJECT_INVALID, "no-distribution",
                             slot.ToString());
    }

    if (db.ExistsClaim(slot, caller)) {
        return state.Invalid(DistributionError::ALREADY_CLAIMED, false, REJECT_DUPLICATE, "already-claimed",
                             strprintf("%s by %s", slot.ToString(), strCaller));
    }

    if (fClaimInProgress) {
        return state.Invalid(DistributionError::UNAUTHORIZED, false, REJECT_INVALID, "reentrant-claim",
                             strprintf("%s by %s", slot.ToString(), strCaller));
    }

    const uint256 leaf = ComputeRewardLeaf(caller, nPoints, nAmount);
    if (!CMerkleAccumulator::VerifyProof(record.root, leaf, nIndex, vProof)) {
        return state.Invalid(DistributionError::PROOF_INVALID, false, REJECT_INVALID, "bad-proof",
                             strprintf("%s index %d by %s", slot.ToString(), nIndex, strCaller));
    }

    CSlotClaimStats stats = db.GetClaimStats(slot);
    CAmount nReleased = 0;
    if (!CheckedAdd(stats.nReleased, nAmount, nReleased) || nReleased > record.nTotalReward) {
        return state.Invalid(DistributionError::CAP_EXCEEDED, false, REJECT_INVALID, "slot-total-exceeded",
                             strprintf("%s released of %s", FormatMoney(stats.nReleased), FormatMoney(record.nTotalReward)));
    }
    stats.nReleased = nReleased;
    stats.nClaims++;

    CClaimRecord claim;
    claim.slot = slot;
    claim.user = caller;
    claim.nPoints = nPoints;
    claim.nAmount = nAmount;
    claim.nIndex = nIndex;
    claim.nClaimedAt = GetTime();

    {
        ClaimGuard guard(fClaimInProgress);
        CDistributionDB::Batch batch(db);
        if (!batch.IsOpen() || !batch.WriteClaim(claim) || !batch.WriteClaimStats(slot, stats)) {
            return state.Error(strprintf("failed to store claim %s/%s", slot.ToString(), strCaller));
        }

        // Claim is recorded (uncommitted) before value leaves the escrow
        std::string strError;
        if (!transfer.Transfer(caller, nAmount, strError)) {
            batch.Abort();
            return state.Invalid(DistributionError::TRANSFER_FAILED, false, REJECT_INVALID, "transfer-failed", strError);
        }

        if (!batch.Commit()) {
            // The claim is not on record, so the value must go back to the escrow
            if (!transfer.Reverse(caller, nAmount, strError)) {
                LogPrintf("ERROR: %s: claim %s/%s not stored and %s not reversed: %s\n", __func__,
                          slot.ToString(), strCaller, FormatMoney(nAmount), strError);
            }
            return state.Error(strprintf("failed to commit claim %s/%s", slot.ToString(), strCaller));
        }
    }

    LogPrint(BCLog::CLAIM, "%s: %s claimed %s from %s (index %d)\n", __func__, strCaller,
             FormatMoney(nAmount), slot.ToString(), nIndex);
    GetDistributionSignals().RewardClaimed(claim);

    if (pClaimOut) *pClaimOut = claim;
    return true;
}

bool CClaimProcessor::Claim(const CDistributionSlot& slot, const CClaimTicket& ticket, CValidationState& state,
                            CClaimRecord* pClaimOut)
{
    return Claim(slot, ticket.nPoints, ticket.nAmount, ticket.nIndex, ticket.vProof, ticket.user, state, pClaimOut);
}

bool CClaimProcessor::HasClaimed(const CDistributionSlot& slot, const CKeyID& user) const
{
    return db.ExistsClaim(slot, user);
}

bool CClaimProcessor::GetClaim(const CDistributionSlot& slot, const CKeyID& user, CClaimRecord& claim) const
{
    return db.ReadClaim(slot, user, claim);
}

CSlotClaimStats CClaimProcessor::GetClaimStats(const CDistributionSlot& slot) const
{
    return db.GetClaimStats(slot);
}
