// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_TEST_TEST_QOBI_H
#define QOBI_TEST_TEST_QOBI_H

#include "amount.h"
#include "chainparamsbase.h"
#include "distribution/distribution.h"
#include "distribution/submission.h"
#include "fs.h"
#include "key.h"
#include "pubkey.h"

#include <memory>
#include <vector>

class CClaimProcessor;
class CDistributionLedger;
class CEscrowVault;
class CRoleRegistry;

/** Mock time the fixtures start at: day 100, one hour in. */
static const int64_t TEST_START_TIME = 100 * DISTRIBUTION_DAY_SECONDS + 60 * 60;

/** Basic testing setup.
 * Configures chain parameters, a scratch data directory and mock time.
 */
struct BasicTestingSetup {
    ECCVerifyHandle globalVerifyHandle;
    fs::path pathTemp;

    explicit BasicTestingSetup(const std::string& chainName = CBaseChainParams::REGTEST);
    ~BasicTestingSetup();
};

/** Testing setup with an in-memory distribution DB and every component
 * wired together: one admin, one granted relayer and a funded escrow.
 */
struct DistributionTestingSetup : public BasicTestingSetup {
    CKey adminKey;
    CKey relayerKey;
    std::unique_ptr<CRoleRegistry> roles;
    std::unique_ptr<CEscrowVault> escrow;
    std::unique_ptr<CDistributionLedger> ledger;
    std::unique_ptr<CSubmissionValidator> validator;
    std::unique_ptr<CClaimProcessor> claims;

    explicit DistributionTestingSetup(RootPolicy policy = RootPolicy::REDERIVE);
    ~DistributionTestingSetup();

    /** Submission for entries of one slot, signed by key, root built from the entries. */
    CBatchSubmission MakeSubmission(const CDistributionSlot& slot, const std::vector<CRewardEntry>& entries,
                                    const CKey& key, uint64_t nNonce);
    CBatchSubmission MakeSubmission(const CDistributionSlot& slot, const std::vector<CRewardEntry>& entries,
                                    uint64_t nNonce)
    {
        return MakeSubmission(slot, entries, relayerKey, nNonce);
    }

    /** Re-sign a submission after a field was changed. */
    void Resign(CBatchSubmission& submission, const CKey& key);
};

/** Fresh compressed key. */
CKey GenerateKey();

/** n entries of distinct random users, points i+1 and amount nEach. */
std::vector<CRewardEntry> MakeRewardEntries(size_t n, CAmount nEach);

#endif // QOBI_TEST_TEST_QOBI_H
