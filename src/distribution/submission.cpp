// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/submission.h"

#include "consensus/validation.h"
#include "distribution/authority.h"
#include "distribution/batchbuilder.h"
#include "distribution/distributiondb.h"
#include "distribution/distributioninterface.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

bool ParseRootPolicy(const std::string& str, RootPolicy& policyOut)
{
    const std::string strLower = ToLower(str);
    if (strLower == "rederive") {
        policyOut = RootPolicy::REDERIVE;
        return true;
    }
    if (strLower == "trusted") {
        policyOut = RootPolicy::TRUST_SIGNED;
        return true;
    }
    return false;
}

std::string GetRootPolicyName(RootPolicy policy)
{
    switch (policy) {
    case RootPolicy::REDERIVE: return "rederive";
    case RootPolicy::TRUST_SIGNED: return "trusted";
    }
    return "unknown";
}

CSubmissionMessage CBatchSubmission::GetMessage() const
{
    CSubmissionMessage msg;
    msg.slot = slot;
    msg.root = root;
    msg.usersDigest = ComputeUsersDigest(vUsers);
    msg.pointsDigest = ComputePointsDigest(vPoints);
    msg.amountsDigest = ComputeAmountsDigest(vAmounts);
    msg.nNonce = nNonce;
    msg.nDeadline = nDeadline;
    return msg;
}

CSubmissionValidator::CSubmissionValidator(CDistributionDB& dbIn, const CRelayerAuthority& authorityIn,
                                           const Consensus::Params& consensusIn, RootPolicy policyIn)
    : db(dbIn), authority(authorityIn), consensus(consensusIn), nDailyCap(consensusIn.nDailyCap), policy(policyIn)
{
}

bool CSubmissionValidator::Submit(const CBatchSubmission& submission, CValidationState& state,
                                  CDistributionRecord* pRecordOut)
{
    LOCK(cs_submit);

    const CDistributionSlot& slot = submission.slot;

    if (!consensus.IsValidCategory(slot.nCategory)) {
        return state.Invalid(DistributionError::INVALID_CATEGORY, false, REJECT_INVALID, "bad-category",
                             strprintf("category %d", slot.nCategory));
    }

    if (db.ExistsDistribution(slot)) {
        return state.Invalid(DistributionError::ALREADY_SUBMITTED, false, REJECT_DUPLICATE, "slot-finalized",
                             slot.ToString());
    }

    const size_t nUsers = submission.vUsers.size();
    if (nUsers == 0 || nUsers != submission.vAmounts.size() || nUsers > consensus.nMaxBatchSize) {
        return state.Invalid(DistributionError::BATCH_TOO_LARGE, false, REJECT_INVALID, "bad-batch-size",
                             strprintf("users=%u, amounts=%u, max=%u", nUsers, submission.vAmounts.size(),
                                       consensus.nMaxBatchSize));
    }

    const CAmount nCap = nDailyCap[slot.nCategory];
    const CAmount nAllocated = db.GetAllocated(slot.nDay, slot.nCategory);
    CAmount nTotal = 0;
    CAmount nNewAllocated = 0;
    if (!ComputeTotalReward(submission.vAmounts, nTotal) ||
        !CheckedAdd(nAllocated, nTotal, nNewAllocated) ||
        nNewAllocated > nCap) {
        return state.Invalid(DistributionError::CAP_EXCEEDED, false, REJECT_INVALID, "daily-cap-exceeded",
                             strprintf("%s allocated, cap %s", FormatMoney(nAllocated), FormatMoney(nCap)));
    }

    const int64_t nNow = GetTime();
    if (nNow > submission.nDeadline) {
        return state.Invalid(DistributionError::DEADLINE_EXPIRED, false, REJECT_INVALID, "deadline-expired",
                             strprintf("now %d > deadline %d", nNow, submission.nDeadline));
    }

    CKeyID signer;
    if (!RecoverSubmissionSigner(consensus.domain, submission.GetMessage(), submission.vchSig, signer)) {
        return state.Invalid(DistributionError::INVALID_SIGNATURE, false, REJECT_INVALID, "bad-signature",
                             "signer not recoverable");
    }
    if (!authority.HasRelayerRole(signer)) {
        return state.Invalid(DistributionError::INVALID_SIGNATURE, false, REJECT_INVALID, "signer-not-relayer",
                             HexStr(signer.begin(), signer.end()));
    }
    if (db.IsNonceUsed(submission.nNonce)) {
        return state.Invalid(DistributionError::NONCE_REPLAY, false, REJECT_DUPLICATE, "nonce-used",
                             strprintf("nonce %d", submission.nNonce));
    }

    if (policy == RootPolicy::REDERIVE) {
        uint256 root;
        std::string strError;
        if (!ComputeBatchRoot(submission.vUsers, submission.vPoints, submission.vAmounts,
                              consensus.MerkleTreeCapacity(), root, strError)) {
            return state.Invalid(DistributionError::ROOT_MISMATCH, false, REJECT_INVALID, "root-not-derivable", strError);
        }
        if (root != submission.root) {
            return state.Invalid(DistributionError::ROOT_MISMATCH, false, REJECT_INVALID, "root-mismatch",
                                 strprintf("submitted %s, derived %s", submission.root.ToString(), root.ToString()));
        }
    }

    CDistributionRecord record;
    record.slot = slot;
    record.root = submission.root;
    record.nUserCount = (uint32_t)nUsers;
    record.nTotalReward = nTotal;
    record.fFinalized = true;
    record.nCreatedAt = nNow;
    record.signer = signer;
    record.nNonce = submission.nNonce;

    {
        CDistributionDB::Batch batch(db);
        if (!batch.IsOpen() ||
            !batch.WriteDistribution(record) ||
            !batch.WriteNonce(submission.nNonce, nNow) ||
            !batch.WriteAllocated(slot.nDay, slot.nCategory, nNewAllocated) ||
            !batch.Commit()) {
            return state.Error(strprintf("failed to store distribution %s", slot.ToString()));
        }
    }

    LogPrint(BCLog::DISTRIBUTION, "%s: finalized %s\n", __func__, record.ToString());
    GetDistributionSignals().DistributionFinalized(record);

    if (pRecordOut) *pRecordOut = record;
    return true;
}

bool CSubmissionValidator::SetDailyCap(const CKeyID& caller, uint8_t nCategory, CAmount nCap, CValidationState& state)
{
    if (!authority.IsAdmin(caller)) {
        return state.Invalid(DistributionError::UNAUTHORIZED, false, REJECT_INVALID, "not-admin",
                             HexStr(caller.begin(), caller.end()));
    }
    if (!consensus.IsValidCategory(nCategory)) {
        return state.Invalid(DistributionError::INVALID_CATEGORY, false, REJECT_INVALID, "bad-category",
                             strprintf("category %d", nCategory));
    }

    LOCK(cs_submit);
    LogPrintf("Daily cap of %s: %s -> %s\n", GetCategoryName(nCategory),
              FormatMoney(nDailyCap[nCategory]), FormatMoney(nCap));
    nDailyCap[nCategory] = nCap;
    return true;
}

CAmount CSubmissionValidator::GetDailyCap(uint8_t nCategory) const
{
    LOCK(cs_submit);
    return consensus.IsValidCategory(nCategory) ? nDailyCap[nCategory] : 0;
}

RootPolicy CSubmissionValidator::GetRootPolicy() const
{
    LOCK(cs_submit);
    return policy;
}

void CSubmissionValidator::SetRootPolicy(RootPolicy policyIn)
{
    LOCK(cs_submit);
    policy = policyIn;
}
