// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Claim tests
 *
 * Tests:
 *   1. Single entry day: root == leaf, empty proof
 *   2. Exactly-once claims and proof checks
 *   3. Release bounded by the slot total
 *   4. Transfer failure rolls the claim back
 *   5. Claims re-entering from the transfer are refused
 *   6. A claim that cannot be stored gives the value back
 */

#include "consensus/validation.h"
#include "distribution/batchbuilder.h"
#include "distribution/claim.h"
#include "distribution/distributiondb.h"
#include "distribution/distributioninterface.h"
#include "distribution/escrow.h"
#include "distribution/ledger.h"
#include "distribution/submission.h"
#include "test/test_qobi.h"

#include <boost/test/unit_test.hpp>

#include <functional>

BOOST_FIXTURE_TEST_SUITE(claim_tests, DistributionTestingSetup)

namespace {

struct ClaimCounter : public CDistributionInterface {
    std::vector<CClaimRecord> vClaims;
    void RewardClaimed(const CClaimRecord& claim) override { vClaims.push_back(claim); }
};

/** Pays from an escrow, running a callback first. */
class HookedTransfer : public CValueTransfer
{
public:
    CEscrowVault vault;
    std::function<void()> hook;

    explicit HookedTransfer(CAmount nFunding) : vault(nFunding) {}

    bool Transfer(const CKeyID& to, CAmount nAmount, std::string& strError) override
    {
        if (hook) hook();
        return vault.Transfer(to, nAmount, strError);
    }

    bool Reverse(const CKeyID& to, CAmount nAmount, std::string& strError) override
    {
        return vault.Reverse(to, nAmount, strError);
    }
};

} // namespace

// Finalize entries as one slot and return the built batch
static BatchResult Finalize(DistributionTestingSetup& setup, const CDistributionSlot& slot,
                            const std::vector<CRewardEntry>& entries, uint64_t nNonce)
{
    BatchResult batch = BuildRewardBatch(slot, entries, 512);
    BOOST_REQUIRE(batch.success);
    CValidationState state;
    BOOST_REQUIRE_MESSAGE(setup.validator->Submit(setup.MakeSubmission(slot, entries, nNonce), state),
                          FormatStateMessage(state));
    return batch;
}

// =============================================================================
// Test 1: Single entry
// =============================================================================
BOOST_AUTO_TEST_CASE(single_entry_day)
{
    ClaimCounter listener;
    RegisterDistributionInterface(&listener);

    const CDistributionSlot slot(100, Consensus::CATEGORY_CREATE);
    const CKeyID user = GenerateKey().GetPubKey().GetID();
    const CAmount nAmount = 500000000000000000ULL; // 0.5
    Finalize(*this, slot, {CRewardEntry(user, 10, nAmount)}, 1);

    CDistributionRecord record;
    BOOST_REQUIRE(ledger->Get(slot, record));
    BOOST_CHECK(record.root == ComputeRewardLeaf(user, 10, nAmount));

    CValidationState state;
    CClaimRecord claim;
    BOOST_CHECK(claims->Claim(slot, 10, nAmount, 0, {}, user, state, &claim));
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK_EQUAL(claim.nAmount, nAmount);
    BOOST_CHECK_EQUAL(claim.nClaimedAt, TEST_START_TIME);
    BOOST_CHECK(claims->HasClaimed(slot, user));
    BOOST_CHECK_EQUAL(escrow->GetCredited(user), nAmount);
    BOOST_CHECK_EQUAL(escrow->GetBalance(), 10 * COIN - nAmount);

    const CSlotClaimStats stats = claims->GetClaimStats(slot);
    BOOST_CHECK_EQUAL(stats.nClaims, 1U);
    BOOST_CHECK_EQUAL(stats.nReleased, nAmount);

    BOOST_REQUIRE_EQUAL(listener.vClaims.size(), 1U);
    BOOST_CHECK(listener.vClaims[0].user == user);

    // Second claim of the same entry
    CValidationState state2;
    BOOST_CHECK(!claims->Claim(slot, 10, nAmount, 0, {}, user, state2));
    BOOST_CHECK(state2.GetError() == DistributionError::ALREADY_CLAIMED);
    BOOST_CHECK_EQUAL(escrow->GetCredited(user), nAmount);
    BOOST_CHECK_EQUAL(listener.vClaims.size(), 1U);

    UnregisterDistributionInterface(&listener);
}

// =============================================================================
// Test 2: Exactly once, proofs
// =============================================================================
BOOST_AUTO_TEST_CASE(claim_every_entry_once)
{
    const CDistributionSlot slot(100, Consensus::CATEGORY_TIPPING);
    const std::vector<CRewardEntry> entries = MakeRewardEntries(7, CENT);
    const BatchResult batch = Finalize(*this, slot, entries, 1);

    for (const CClaimTicket& ticket : batch.vTickets) {
        CValidationState state;
        BOOST_CHECK_MESSAGE(claims->Claim(slot, ticket, state), FormatStateMessage(state));
    }
    for (const CClaimTicket& ticket : batch.vTickets) {
        CValidationState state;
        BOOST_CHECK(!claims->Claim(slot, ticket, state));
        BOOST_CHECK(state.GetError() == DistributionError::ALREADY_CLAIMED);
    }

    BOOST_CHECK_EQUAL(claims->GetClaimStats(slot).nReleased, 7 * CENT);
    BOOST_CHECK_EQUAL(escrow->GetReleased(), 7 * CENT);
    BOOST_CHECK_EQUAL(g_distributiondb->GetStats().nClaims, 7U);
}

BOOST_AUTO_TEST_CASE(claim_rejections)
{
    const CDistributionSlot slot(100, Consensus::CATEGORY_COMMENTS);
    const std::vector<CRewardEntry> entries = MakeRewardEntries(4, 2 * CENT);
    const BatchResult batch = Finalize(*this, slot, entries, 1);
    const CClaimTicket& a = batch.vTickets[0];
    const CClaimTicket& b = batch.vTickets[1];

    // No distribution for the slot
    CValidationState state;
    BOOST_CHECK(!claims->Claim(CDistributionSlot(101, Consensus::CATEGORY_COMMENTS), a, state));
    BOOST_CHECK(state.GetError() == DistributionError::NO_DISTRIBUTION);
    BOOST_CHECK(!claims->Claim(CDistributionSlot(100, Consensus::CATEGORY_COMMENTS, 1), a, state));
    BOOST_CHECK(state.GetError() == DistributionError::NO_DISTRIBUTION);

    // Someone else's ticket
    CValidationState state2;
    BOOST_CHECK(!claims->Claim(slot, a.nPoints, a.nAmount, a.nIndex, a.vProof, b.user, state2));
    BOOST_CHECK(state2.GetError() == DistributionError::PROOF_INVALID);

    // Inflated amount, wrong points, wrong index, truncated proof
    CValidationState state3;
    BOOST_CHECK(!claims->Claim(slot, a.nPoints, a.nAmount + 1, a.nIndex, a.vProof, a.user, state3));
    BOOST_CHECK(state3.GetError() == DistributionError::PROOF_INVALID);
    BOOST_CHECK(!claims->Claim(slot, a.nPoints + 1, a.nAmount, a.nIndex, a.vProof, a.user, state3));
    BOOST_CHECK(state3.GetError() == DistributionError::PROOF_INVALID);
    BOOST_CHECK(!claims->Claim(slot, a.nPoints, a.nAmount, b.nIndex, a.vProof, a.user, state3));
    BOOST_CHECK(state3.GetError() == DistributionError::PROOF_INVALID);
    std::vector<uint256> vShort(a.vProof.begin(), a.vProof.end() - 1);
    BOOST_CHECK(!claims->Claim(slot, a.nPoints, a.nAmount, a.nIndex, vShort, a.user, state3));
    BOOST_CHECK(state3.GetError() == DistributionError::PROOF_INVALID);

    // Nothing was released by the failures
    BOOST_CHECK_EQUAL(escrow->GetReleased(), 0U);
    BOOST_CHECK(!claims->HasClaimed(slot, a.user));

    // The real ticket still works, A's proof never works for B
    CValidationState state4;
    BOOST_CHECK(claims->Claim(slot, a, state4));
    CValidationState state5;
    BOOST_CHECK(!claims->Claim(slot, b.nPoints, b.nAmount, b.nIndex, a.vProof, b.user, state5));
    BOOST_CHECK(state5.GetError() == DistributionError::PROOF_INVALID);
}

BOOST_AUTO_TEST_CASE(same_user_in_two_slots)
{
    const CKeyID user = GenerateKey().GetPubKey().GetID();
    const CDistributionSlot slot1(100, Consensus::CATEGORY_CRYPTO);
    const CDistributionSlot slot2(100, Consensus::CATEGORY_REFERRALS);
    Finalize(*this, slot1, {CRewardEntry(user, 3, CENT)}, 1);
    Finalize(*this, slot2, {CRewardEntry(user, 4, 2 * CENT)}, 2);

    CValidationState state;
    BOOST_CHECK(claims->Claim(slot1, 3, CENT, 0, {}, user, state));
    BOOST_CHECK(claims->Claim(slot2, 4, 2 * CENT, 0, {}, user, state));
    BOOST_CHECK_EQUAL(escrow->GetCredited(user), 3 * CENT);
}

// =============================================================================
// Test 3: Slot total
// =============================================================================
BOOST_AUTO_TEST_CASE(release_bounded_by_total)
{
    // A trusted root may commit to more than the signed amounts add up to
    validator->SetRootPolicy(RootPolicy::TRUST_SIGNED);

    const CDistributionSlot slot(100, Consensus::CATEGORY_CREATE);
    const std::vector<CRewardEntry> signedEntries = MakeRewardEntries(1, CENT);
    std::vector<CRewardEntry> treeEntries = signedEntries;
    treeEntries[0].nAmount = 2 * CENT;
    const BatchResult tree = BuildRewardBatch(slot, treeEntries, 512);
    BOOST_REQUIRE(tree.success);

    CBatchSubmission submission = MakeSubmission(slot, signedEntries, 1);
    submission.root = tree.root;
    Resign(submission, relayerKey);
    CValidationState state;
    BOOST_REQUIRE(validator->Submit(submission, state));

    CValidationState state2;
    BOOST_CHECK(!claims->Claim(slot, tree.vTickets[0], state2));
    BOOST_CHECK(state2.GetError() == DistributionError::CAP_EXCEEDED);
    BOOST_CHECK_EQUAL(escrow->GetReleased(), 0U);
    BOOST_CHECK(!claims->HasClaimed(slot, treeEntries[0].user));
}

// =============================================================================
// Test 4: Transfer failure
// =============================================================================
BOOST_AUTO_TEST_CASE(transfer_failure_rolls_back)
{
    CEscrowVault poor(CENT / 2);
    CClaimProcessor processor(*g_distributiondb, poor);

    const CDistributionSlot slot(100, Consensus::CATEGORY_TIPPING);
    const BatchResult batch = Finalize(*this, slot, MakeRewardEntries(2, CENT), 1);
    const CClaimTicket& ticket = batch.vTickets[0];

    CValidationState state;
    BOOST_CHECK(!processor.Claim(slot, ticket, state));
    BOOST_CHECK(state.GetError() == DistributionError::TRANSFER_FAILED);
    BOOST_CHECK(!processor.HasClaimed(slot, ticket.user));
    BOOST_CHECK_EQUAL(processor.GetClaimStats(slot).nClaims, 0U);
    BOOST_CHECK_EQUAL(processor.GetClaimStats(slot).nReleased, 0U);
    BOOST_CHECK_EQUAL(poor.GetBalance(), CENT / 2);

    // Funded later, the same ticket goes through
    BOOST_REQUIRE(poor.Fund(CENT));
    CValidationState state2;
    BOOST_CHECK(processor.Claim(slot, ticket, state2));
    BOOST_CHECK_EQUAL(poor.GetCredited(ticket.user), CENT);
}

// =============================================================================
// Test 5: Re-entrancy
// =============================================================================
BOOST_AUTO_TEST_CASE(reentrant_claims_refused)
{
    HookedTransfer transfer(COIN);
    CClaimProcessor processor(*g_distributiondb, transfer);

    const CDistributionSlot slot(100, Consensus::CATEGORY_CRYPTO);
    const BatchResult batch = Finalize(*this, slot, MakeRewardEntries(2, CENT), 1);
    const CClaimTicket& a = batch.vTickets[0];
    const CClaimTicket& b = batch.vTickets[1];

    CValidationState stateSame, stateOther;
    bool fSame = true, fOther = true, fFired = false;
    transfer.hook = [&]() {
        if (fFired) return;
        fFired = true;
        fSame = processor.Claim(slot, a, stateSame);
        fOther = processor.Claim(slot, b, stateOther);
    };

    CValidationState state;
    BOOST_CHECK(processor.Claim(slot, a, state));
    BOOST_CHECK(!fSame);
    BOOST_CHECK(stateSame.GetError() == DistributionError::ALREADY_CLAIMED);
    BOOST_CHECK(!fOther);
    BOOST_CHECK(stateOther.GetError() == DistributionError::UNAUTHORIZED);
    BOOST_CHECK_EQUAL(stateOther.GetRejectReason(), "reentrant-claim");

    // Paid once, and B can still claim normally afterwards
    BOOST_CHECK_EQUAL(transfer.vault.GetCredited(a.user), CENT);
    BOOST_CHECK(!processor.HasClaimed(slot, b.user));
    CValidationState state2;
    BOOST_CHECK(processor.Claim(slot, b, state2));
    BOOST_CHECK_EQUAL(processor.GetClaimStats(slot).nClaims, 2U);
}

// =============================================================================
// Test 6: Storage failure after the transfer
// =============================================================================
BOOST_AUTO_TEST_CASE(failed_commit_reverses_transfer)
{
    ClaimCounter listener;
    RegisterDistributionInterface(&listener);

    HookedTransfer transfer(COIN);
    CClaimProcessor processor(*g_distributiondb, transfer);

    const CDistributionSlot slot(100, Consensus::CATEGORY_TIPPING);
    const BatchResult batch = Finalize(*this, slot, MakeRewardEntries(2, CENT), 1);
    const CClaimTicket& ticket = batch.vTickets[0];

    // Veto every commit once value has left the escrow
    bool fVeto = false;
    g_distributiondb->SetCommitCheck([&]() { return !fVeto; });
    transfer.hook = [&]() { fVeto = true; };

    CValidationState state;
    BOOST_CHECK(!processor.Claim(slot, ticket, state));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK(state.GetError() == DistributionError::STORAGE_FAILURE);

    // Neither the claim nor the payment survived
    BOOST_CHECK(!processor.HasClaimed(slot, ticket.user));
    BOOST_CHECK_EQUAL(processor.GetClaimStats(slot).nClaims, 0U);
    BOOST_CHECK_EQUAL(processor.GetClaimStats(slot).nReleased, 0U);
    BOOST_CHECK_EQUAL(transfer.vault.GetBalance(), COIN);
    BOOST_CHECK_EQUAL(transfer.vault.GetReleased(), 0U);
    BOOST_CHECK_EQUAL(transfer.vault.GetCredited(ticket.user), 0U);
    BOOST_CHECK(listener.vClaims.empty());

    // Once storage works again the ticket pays exactly once
    g_distributiondb->SetCommitCheck(nullptr);
    transfer.hook = nullptr;
    CValidationState state2;
    BOOST_CHECK_MESSAGE(processor.Claim(slot, ticket, state2), FormatStateMessage(state2));
    CValidationState state3;
    BOOST_CHECK(!processor.Claim(slot, ticket, state3));
    BOOST_CHECK(state3.GetError() == DistributionError::ALREADY_CLAIMED);
    BOOST_CHECK_EQUAL(transfer.vault.GetCredited(ticket.user), CENT);
    BOOST_CHECK_EQUAL(transfer.vault.GetBalance(), COIN - CENT);
    BOOST_CHECK_EQUAL(listener.vClaims.size(), 1U);

    UnregisterDistributionInterface(&listener);
}

BOOST_AUTO_TEST_CASE(escrow_reverse)
{
    const CKeyID a = GenerateKey().GetPubKey().GetID();
    const CKeyID b = GenerateKey().GetPubKey().GetID();
    CEscrowVault vault(COIN);
    std::string strError;

    BOOST_REQUIRE(vault.Transfer(a, CENT, strError));
    BOOST_CHECK(!vault.Reverse(b, CENT, strError));
    BOOST_CHECK(!vault.Reverse(a, 2 * CENT, strError));
    BOOST_CHECK_EQUAL(vault.GetBalance(), COIN - CENT);

    BOOST_CHECK(vault.Reverse(a, CENT, strError));
    BOOST_CHECK_EQUAL(vault.GetBalance(), COIN);
    BOOST_CHECK_EQUAL(vault.GetReleased(), 0U);
    BOOST_CHECK_EQUAL(vault.GetCredited(a), 0U);
    BOOST_CHECK(!vault.Reverse(a, CENT, strError));
}

BOOST_AUTO_TEST_SUITE_END()
