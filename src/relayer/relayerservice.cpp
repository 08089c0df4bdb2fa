// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "relayer/relayerservice.h"

#include "distribution/ledger.h"
#include "distribution/typeddata.h"
#include "logging.h"
#include "random.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <limits>

std::vector<CClaimBundle> SlotProcessResult::GetBundles() const
{
    std::vector<CClaimBundle> vBundles;
    for (const RelayedBatch& relayed : vBatches) {
        if (relayed.fAdmitted) {
            vBundles.push_back(relayed.batch.GetBundle());
        }
    }
    return vBundles;
}

CRelayerService::CRelayerService(const CKey& keyIn, CSubmissionValidator& validatorIn, const CDistributionLedger& ledgerIn)
    : key(keyIn), validator(validatorIn), ledger(ledgerIn)
{
}

CKeyID CRelayerService::GetRelayerID() const
{
    return key.GetPubKey().GetID();
}

/** Releases a (day, category) marked in flight when ProcessSlot returns. */
class CRelayerService::InFlightGuard
{
    CRelayerService& service;
    const uint32_t nDay;
    const uint8_t nCategory;

public:
    InFlightGuard(CRelayerService& serviceIn, uint32_t nDayIn, uint8_t nCategoryIn)
        : service(serviceIn), nDay(nDayIn), nCategory(nCategoryIn) {}
    ~InFlightGuard() { service.ClearInFlight(nDay, nCategory); }
};

bool CRelayerService::MarkInFlight(uint32_t nDay, uint8_t nCategory)
{
    LOCK(cs_inflight);
    return setInFlight.insert(std::make_pair(nDay, nCategory)).second;
}

void CRelayerService::ClearInFlight(uint32_t nDay, uint8_t nCategory)
{
    LOCK(cs_inflight);
    setInFlight.erase(std::make_pair(nDay, nCategory));
}

bool CRelayerService::SlotInFlight(uint32_t nDay, uint8_t nCategory) const
{
    LOCK(cs_inflight);
    return setInFlight.count(std::make_pair(nDay, nCategory)) > 0;
}

bool CRelayerService::SignAndSubmit(RelayedBatch& relayed, const Consensus::Params& consensus)
{
    CBatchSubmission& submission = relayed.submission;
    submission.slot = relayed.batch.slot;
    submission.root = relayed.batch.root;
    std::vector<CRewardEntry> entries;
    entries.reserve(relayed.batch.vTickets.size());
    for (const CClaimTicket& ticket : relayed.batch.vTickets) {
        entries.emplace_back(ticket.user, ticket.nPoints, ticket.nAmount);
    }
    UnzipRewardEntries(entries, submission.vUsers, submission.vPoints, submission.vAmounts);
    submission.nNonce = GetRand(std::numeric_limits<uint64_t>::max());
    submission.nDeadline = GetTime() + consensus.nSubmissionWindow;

    if (!SignSubmission(key, consensus.domain, submission.GetMessage(), submission.vchSig)) {
        return relayed.state.Error("signing failed");
    }

    relayed.fAdmitted = validator.Submit(submission, relayed.state);
    return relayed.fAdmitted;
}

bool CRelayerService::ProcessSlot(uint32_t nDay, uint8_t nCategory, const std::vector<CRewardEntry>& entries,
                                  SlotProcessResult& result, CValidationState& state)
{
    result = SlotProcessResult();
    result.nDay = nDay;
    result.nCategory = nCategory;

    const Consensus::Params& consensus = validator.GetConsensus();
    if (!consensus.IsValidCategory(nCategory)) {
        return state.Invalid(DistributionError::INVALID_CATEGORY, false, REJECT_INVALID, "bad-category",
                             strprintf("category %d", nCategory));
    }

    if (!MarkInFlight(nDay, nCategory)) {
        result.fSkipped = true;
        result.strReason = "in-flight";
        LogPrint(BCLog::RELAYER, "%s: day %d %s already in flight\n", __func__, nDay, GetCategoryName(nCategory));
        return true;
    }
    InFlightGuard inflight(*this, nDay, nCategory);

    if (entries.empty()) {
        result.fSkipped = true;
        result.strReason = "no-entries";
        return true;
    }

    const std::vector<std::vector<CRewardEntry>> vChunks = SplitRewardCohort(entries, consensus.nMaxBatchSize);
    if (vChunks.size() > std::numeric_limits<uint16_t>::max()) {
        return state.Invalid(DistributionError::BATCH_TOO_LARGE, false, REJECT_INVALID, "too-many-sub-batches",
                             strprintf("%u sub-batches", vChunks.size()));
    }

    size_t nOnLedger = 0;
    for (size_t i = 0; i < vChunks.size(); i++) {
        const CDistributionSlot slot(nDay, nCategory, (uint16_t)i);
        // Finalized by an earlier run or another relayer
        if (ledger.HasDistribution(slot)) {
            LogPrint(BCLog::RELAYER, "%s: %s already on the ledger\n", __func__, slot.ToString());
            nOnLedger++;
            continue;
        }

        RelayedBatch relayed;
        relayed.batch = BuildRewardBatch(slot, vChunks[i], consensus.nMaxBatchSize);
        if (!relayed.batch.success) {
            return state.Invalid(DistributionError::BATCH_TOO_LARGE, false, REJECT_INVALID, "batch-build-failed",
                                 relayed.batch.error);
        }

        const bool fAdmitted = SignAndSubmit(relayed, consensus);
        const CValidationState submitState = relayed.state;
        result.vBatches.push_back(std::move(relayed));

        if (fAdmitted) {
            LogPrint(BCLog::RELAYER, "%s: %s admitted\n", __func__, slot.ToString());
        } else if (submitState.GetError() == DistributionError::ALREADY_SUBMITTED) {
            LogPrint(BCLog::RELAYER, "%s: %s submitted by another relayer, discarding\n", __func__, slot.ToString());
        } else {
            LogPrintf("Relayer: %s rejected: %s\n", slot.ToString(), FormatStateMessage(submitState));
            state = submitState;
            return false;
        }
    }

    if (nOnLedger == vChunks.size()) {
        result.fSkipped = true;
        result.strReason = "already-on-ledger";
    }
    return true;
}

bool CRelayerService::ProcessDay(uint32_t nDay, const std::map<uint8_t, std::vector<CRewardEntry>>& cohorts,
                                 std::vector<SlotProcessResult>& results, CValidationState& state)
{
    results.clear();
    for (const auto& cohort : cohorts) {
        SlotProcessResult result;
        const bool fOk = ProcessSlot(nDay, cohort.first, cohort.second, result, state);
        results.push_back(std::move(result));
        if (!fOk) {
            return false;
        }
    }
    return true;
}
