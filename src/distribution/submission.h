// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_SUBMISSION_H
#define QOBI_SUBMISSION_H

/**
 * Batch admission
 *
 * A slot moves Empty -> Finalized exactly once. Submit() runs the checks
 * below in order and stops at the first failure; a rejected submission
 * writes nothing.
 *   1. category in range                      INVALID_CATEGORY
 *   2. slot not finalized                     ALREADY_SUBMITTED
 *   3. 0 < users == amounts <= max batch      BATCH_TOO_LARGE
 *   4. allocated + total <= daily cap         CAP_EXCEEDED
 *   5. now <= deadline                        DEADLINE_EXPIRED
 *   6. signer holds the relayer role          INVALID_SIGNATURE
 *      nonce not consumed                     NONCE_REPLAY
 *   7. REDERIVE: root rebuilt from entries    ROOT_MISMATCH
 * The record, the nonce and the new allocation are then committed in one
 * transaction and DistributionFinalized is signalled.
 */

#include "amount.h"
#include "consensus/params.h"
#include "distribution/distribution.h"
#include "distribution/typeddata.h"
#include "sync.h"
#include "uint256.h"

#include <array>
#include <string>
#include <vector>

class CDistributionDB;
class CRelayerAuthority;
class CValidationState;

/** Whether the submitted root is trusted or rebuilt from the entries */
enum class RootPolicy {
    REDERIVE,
    TRUST_SIGNED,
};

/** "rederive" or "trusted" */
bool ParseRootPolicy(const std::string& str, RootPolicy& policyOut);
std::string GetRootPolicyName(RootPolicy policy);

/** A signed batch as sent by a relayer. */
struct CBatchSubmission {
    CDistributionSlot slot;
    uint256 root;
    std::vector<CKeyID> vUsers;
    std::vector<uint64_t> vPoints;
    std::vector<CAmount> vAmounts;
    std::vector<unsigned char> vchSig;
    uint64_t nNonce;
    int64_t nDeadline;

    CBatchSubmission() : nNonce(0), nDeadline(0) {}

    /** The typed-data message the signature covers. */
    CSubmissionMessage GetMessage() const;
};

class CSubmissionValidator
{
private:
    mutable RecursiveMutex cs_submit;
    CDistributionDB& db;
    const CRelayerAuthority& authority;
    const Consensus::Params consensus;
    std::array<CAmount, Consensus::MAX_REWARD_CATEGORIES> nDailyCap;
    RootPolicy policy;

public:
    CSubmissionValidator(CDistributionDB& dbIn, const CRelayerAuthority& authorityIn,
                         const Consensus::Params& consensusIn, RootPolicy policyIn = RootPolicy::REDERIVE);

    /**
     * Admit a signed batch.
     * @param[out] pRecordOut the committed record, when not null
     */
    bool Submit(const CBatchSubmission& submission, CValidationState& state,
                CDistributionRecord* pRecordOut = nullptr);

    /** Admin only. Takes effect for later submissions; allocations are kept. */
    bool SetDailyCap(const CKeyID& caller, uint8_t nCategory, CAmount nCap, CValidationState& state);
    CAmount GetDailyCap(uint8_t nCategory) const;

    RootPolicy GetRootPolicy() const;
    void SetRootPolicy(RootPolicy policyIn);

    const Consensus::Params& GetConsensus() const { return consensus; }
};

#endif // QOBI_SUBMISSION_H
