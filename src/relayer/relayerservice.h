// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_RELAYERSERVICE_H
#define QOBI_RELAYERSERVICE_H

/**
 * Relayer Service
 *
 * Off-chain batch scheduler run by a relayer operator. For one
 * (day, category) cohort it:
 *   1. refuses to start when the same cohort is already in flight
 *   2. splits the cohort into sub-batches of -maxbatchsize entries
 *   3. skips each sub-batch already on the ledger
 *   4. builds each remaining tree, signs the submission digest and submits it
 *   5. returns the claim bundles of every admitted sub-batch
 *
 * Running a cohort again after a rejection resumes at the first sub-batch
 * not on the ledger, so the cohort must be passed in the same order. A
 * sub-batch rejected as ALREADY_SUBMITTED lost a race with another relayer
 * and is discarded, never retried.
 */

#include "consensus/validation.h"
#include "distribution/batchbuilder.h"
#include "distribution/distribution.h"
#include "distribution/submission.h"
#include "key.h"
#include "sync.h"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

class CDistributionLedger;

/**
 * RelayedBatch - One sub-batch handled by the relayer
 */
struct RelayedBatch
{
    BatchResult batch;
    CBatchSubmission submission;
    bool fAdmitted;             // false when discarded (lost race)
    CValidationState state;     // submission outcome

    RelayedBatch() : fAdmitted(false) {}
};

/**
 * SlotProcessResult - Result from CRelayerService::ProcessSlot
 */
struct SlotProcessResult
{
    uint32_t nDay;
    uint8_t nCategory;
    bool fSkipped;              // in flight, empty, or every sub-batch already on the ledger
    std::string strReason;
    std::vector<RelayedBatch> vBatches;

    SlotProcessResult() : nDay(0), nCategory(0), fSkipped(false) {}

    /** Bundles of the admitted sub-batches */
    std::vector<CClaimBundle> GetBundles() const;
};

class CRelayerService
{
private:
    mutable Mutex cs_inflight;
    std::set<std::pair<uint32_t, uint8_t>> setInFlight;

    const CKey key;
    CSubmissionValidator& validator;
    const CDistributionLedger& ledger;

    class InFlightGuard;

    bool MarkInFlight(uint32_t nDay, uint8_t nCategory);
    void ClearInFlight(uint32_t nDay, uint8_t nCategory);

    bool SignAndSubmit(RelayedBatch& relayed, const Consensus::Params& consensus);

public:
    CRelayerService(const CKey& keyIn, CSubmissionValidator& validatorIn, const CDistributionLedger& ledgerIn);

    CKeyID GetRelayerID() const;

    /**
     * Build, sign and submit the batches of one cohort.
     *
     * @return false with state set when a sub-batch was rejected for another
     *         reason than ALREADY_SUBMITTED; sub-batches before it stay admitted
     */
    bool ProcessSlot(uint32_t nDay, uint8_t nCategory, const std::vector<CRewardEntry>& entries,
                     SlotProcessResult& result, CValidationState& state);

    /**
     * ProcessSlot for every cohort of a day, in category order.
     * Stops at the first failing category.
     */
    bool ProcessDay(uint32_t nDay, const std::map<uint8_t, std::vector<CRewardEntry>>& cohorts,
                    std::vector<SlotProcessResult>& results, CValidationState& state);

    bool SlotInFlight(uint32_t nDay, uint8_t nCategory) const;
};

#endif // QOBI_RELAYERSERVICE_H
