// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Distribution DB tests
 *
 * Tests:
 *   1. Records, claims and nonces are write-once
 *   2. Uncommitted and vetoed batches roll back
 *   3. Range reads per day
 *   4. Data survives a reopen from disk
 *   5. Statistics
 */

#include "distribution/distributiondb.h"
#include "random.h"
#include "test/test_qobi.h"

#include <boost/test/unit_test.hpp>

#include <limits>

BOOST_FIXTURE_TEST_SUITE(distributiondb_tests, BasicTestingSetup)

static CDistributionRecord MakeRecord(const CDistributionSlot& slot, CAmount nTotal)
{
    CDistributionRecord record;
    record.slot = slot;
    record.root = GetRandHash();
    record.nUserCount = 3;
    record.nTotalReward = nTotal;
    record.fFinalized = true;
    record.nCreatedAt = TEST_START_TIME;
    record.signer = GenerateKey().GetPubKey().GetID();
    record.nNonce = GetRand(1000000);
    return record;
}

static CClaimRecord MakeClaim(const CDistributionSlot& slot, CAmount nAmount)
{
    CClaimRecord claim;
    claim.slot = slot;
    claim.user = GenerateKey().GetPubKey().GetID();
    claim.nPoints = 10;
    claim.nAmount = nAmount;
    claim.nIndex = 2;
    claim.nClaimedAt = TEST_START_TIME;
    return claim;
}

// =============================================================================
// Test 1: Write-once keys
// =============================================================================
BOOST_AUTO_TEST_CASE(records_are_write_once)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;
    BOOST_CHECK(db.IsMemory());

    const CDistributionSlot slot(100, Consensus::CATEGORY_CREATE);
    const CDistributionRecord record = MakeRecord(slot, CENT);
    BOOST_CHECK(!db.ExistsDistribution(slot));
    {
        CDistributionDB::Batch batch(db);
        BOOST_REQUIRE(batch.IsOpen());
        BOOST_CHECK(batch.WriteDistribution(record));
        BOOST_CHECK(batch.Commit());
    }
    BOOST_CHECK(db.ExistsDistribution(slot));

    CDistributionRecord read;
    BOOST_REQUIRE(db.ReadDistribution(slot, read));
    BOOST_CHECK(read.root == record.root);
    BOOST_CHECK_EQUAL(read.nTotalReward, CENT);
    BOOST_CHECK(read.signer == record.signer);
    BOOST_CHECK(read.fFinalized);

    // A second write of the same slot is refused and leaves the first intact
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(!batch.WriteDistribution(MakeRecord(slot, 2 * CENT)));
    }
    BOOST_REQUIRE(db.ReadDistribution(slot, read));
    BOOST_CHECK(read.root == record.root);

    // Other sub-batches of the cohort are independent keys
    BOOST_CHECK(!db.ExistsDistribution(CDistributionSlot(100, Consensus::CATEGORY_CREATE, 1)));
}

BOOST_AUTO_TEST_CASE(claims_and_nonces_are_write_once)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    const CDistributionSlot slot(100, Consensus::CATEGORY_TIPPING);
    const CClaimRecord claim = MakeClaim(slot, CENT);
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteClaim(claim));
        BOOST_CHECK(batch.WriteNonce(42, TEST_START_TIME));
        BOOST_CHECK(batch.Commit());
    }
    BOOST_CHECK(db.ExistsClaim(slot, claim.user));
    BOOST_CHECK(!db.ExistsClaim(slot, GenerateKey().GetPubKey().GetID()));
    BOOST_CHECK(!db.ExistsClaim(CDistributionSlot(101, Consensus::CATEGORY_TIPPING), claim.user));
    BOOST_CHECK(db.IsNonceUsed(42));
    BOOST_CHECK(!db.IsNonceUsed(43));

    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(!batch.WriteClaim(claim));
        BOOST_CHECK(!batch.WriteNonce(42, TEST_START_TIME + 1));
    }

    CClaimRecord read;
    BOOST_REQUIRE(db.ReadClaim(slot, claim.user, read));
    BOOST_CHECK_EQUAL(read.nAmount, CENT);
    BOOST_CHECK_EQUAL(read.nIndex, 2U);
}

// =============================================================================
// Test 2: Rollback
// =============================================================================
BOOST_AUTO_TEST_CASE(uncommitted_batch_rolls_back)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    const CDistributionSlot slot(100, Consensus::CATEGORY_LIKES);
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(slot, CENT)));
        BOOST_CHECK(batch.WriteNonce(7, TEST_START_TIME));
        BOOST_CHECK(batch.WriteAllocated(100, Consensus::CATEGORY_LIKES, CENT));
    }
    BOOST_CHECK(!db.ExistsDistribution(slot));
    BOOST_CHECK(!db.IsNonceUsed(7));
    BOOST_CHECK_EQUAL(db.GetAllocated(100, Consensus::CATEGORY_LIKES), 0U);

    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteNonce(7, TEST_START_TIME));
        batch.Abort();
        BOOST_CHECK(!batch.IsOpen());
        BOOST_CHECK(!batch.WriteNonce(8, TEST_START_TIME));
        BOOST_CHECK(!batch.Commit());
    }
    BOOST_CHECK(!db.IsNonceUsed(7));
}

BOOST_AUTO_TEST_CASE(vetoed_commit_rolls_back)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    const CDistributionSlot slot(100, Consensus::CATEGORY_CRYPTO);
    db.SetCommitCheck([]() { return false; });
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(slot, CENT)));
        BOOST_CHECK(batch.WriteNonce(9, TEST_START_TIME));
        BOOST_CHECK(!batch.Commit());
        BOOST_CHECK(!batch.IsOpen());
    }
    BOOST_CHECK(!db.ExistsDistribution(slot));
    BOOST_CHECK(!db.IsNonceUsed(9));

    // The connection is usable again once the check is lifted
    db.SetCommitCheck(nullptr);
    {
        CDistributionDB::Batch batch(db);
        BOOST_REQUIRE(batch.IsOpen());
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(slot, CENT)));
        BOOST_CHECK(batch.Commit());
    }
    BOOST_CHECK(db.ExistsDistribution(slot));
}

// =============================================================================
// Test 3: Range reads
// =============================================================================
BOOST_AUTO_TEST_CASE(for_each_distribution_of_day)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(99, Consensus::CATEGORY_CREATE), 1)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(100, Consensus::CATEGORY_CREATE), 2)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(100, Consensus::CATEGORY_LIKES, 0), 3)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(100, Consensus::CATEGORY_LIKES, 1), 4)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(101, Consensus::CATEGORY_REFERRALS), 5)));
        BOOST_CHECK(batch.Commit());
    }

    std::vector<CDistributionRecord> vDay;
    db.ForEachDistribution(100, [&](const CDistributionRecord& record) {
        vDay.push_back(record);
        return true;
    });
    BOOST_REQUIRE_EQUAL(vDay.size(), 3U);
    for (const CDistributionRecord& record : vDay) {
        BOOST_CHECK_EQUAL(record.slot.nDay, 100U);
    }

    size_t nAll = 0;
    db.ForEachDistribution([&](const CDistributionRecord&) {
        nAll++;
        return true;
    });
    BOOST_CHECK_EQUAL(nAll, 5U);

    // Early stop
    size_t nSeen = 0;
    db.ForEachDistribution([&](const CDistributionRecord&) {
        nSeen++;
        return false;
    });
    BOOST_CHECK_EQUAL(nSeen, 1U);
}

BOOST_AUTO_TEST_CASE(last_day_range_stays_inside_records)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    const uint32_t nLastDay = std::numeric_limits<uint32_t>::max();
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(nLastDay, Consensus::CATEGORY_CREATE), 1)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(nLastDay, Consensus::CATEGORY_REFERRALS, 3), 2)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(255, Consensus::CATEGORY_CREATE), 3)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(CDistributionSlot(256, Consensus::CATEGORY_CREATE), 4)));
        // Keys right after the record range
        CSlotClaimStats stats;
        stats.nClaims = 1;
        stats.nReleased = 1;
        BOOST_CHECK(batch.WriteClaimStats(CDistributionSlot(0, Consensus::CATEGORY_CREATE), stats));
        BOOST_CHECK(batch.Commit());
    }

    size_t nLast = 0;
    db.ForEachDistribution(nLastDay, [&](const CDistributionRecord& record) {
        BOOST_CHECK_EQUAL(record.slot.nDay, nLastDay);
        nLast++;
        return true;
    });
    BOOST_CHECK_EQUAL(nLast, 2U);

    size_t n255 = 0;
    db.ForEachDistribution(255, [&](const CDistributionRecord& record) {
        BOOST_CHECK_EQUAL(record.slot.nDay, 255U);
        n255++;
        return true;
    });
    BOOST_CHECK_EQUAL(n255, 1U);
}

// =============================================================================
// Test 4: Persistence
// =============================================================================
BOOST_AUTO_TEST_CASE(survives_reopen)
{
    const CDistributionSlot slot(100, Consensus::CATEGORY_CRYPTO);
    const CDistributionRecord record = MakeRecord(slot, 3 * CENT);

    BOOST_REQUIRE(InitDistributionDB(1 << 20, false));
    BOOST_CHECK(!g_distributiondb->IsMemory());
    {
        CDistributionDB::Batch batch(*g_distributiondb);
        BOOST_CHECK(batch.WriteDistribution(record));
        BOOST_CHECK(batch.WriteNonce(record.nNonce, TEST_START_TIME));
        BOOST_CHECK(batch.WriteAllocated(slot.nDay, slot.nCategory, 3 * CENT));
        BOOST_CHECK(batch.Commit());
    }
    BOOST_CHECK(g_distributiondb->Sync());

    BOOST_REQUIRE(InitDistributionDB(1 << 20, false));
    CDistributionRecord read;
    BOOST_REQUIRE(g_distributiondb->ReadDistribution(slot, read));
    BOOST_CHECK(read.root == record.root);
    BOOST_CHECK(g_distributiondb->IsNonceUsed(record.nNonce));
    BOOST_CHECK_EQUAL(g_distributiondb->GetAllocated(slot.nDay, slot.nCategory), 3 * CENT);

    // Wipe starts over
    BOOST_REQUIRE(InitDistributionDB(1 << 20, false, true));
    BOOST_CHECK(!g_distributiondb->ExistsDistribution(slot));
    BOOST_CHECK(!g_distributiondb->IsNonceUsed(record.nNonce));
}

// =============================================================================
// Test 5: Statistics
// =============================================================================
BOOST_AUTO_TEST_CASE(stats)
{
    BOOST_REQUIRE(InitDistributionDB(1 << 20, true));
    CDistributionDB& db = *g_distributiondb;

    const CDistributionSlot slotA(100, Consensus::CATEGORY_CREATE);
    const CDistributionSlot slotB(100, Consensus::CATEGORY_COMMENTS);
    CSlotClaimStats claimStats;
    claimStats.nClaims = 1;
    claimStats.nReleased = CENT / 2;
    {
        CDistributionDB::Batch batch(db);
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(slotA, CENT)));
        BOOST_CHECK(batch.WriteDistribution(MakeRecord(slotB, 2 * CENT)));
        BOOST_CHECK(batch.WriteNonce(1, TEST_START_TIME));
        BOOST_CHECK(batch.WriteNonce(2, TEST_START_TIME));
        BOOST_CHECK(batch.WriteClaim(MakeClaim(slotA, CENT / 2)));
        BOOST_CHECK(batch.WriteClaimStats(slotA, claimStats));
        BOOST_CHECK(batch.Commit());
    }

    const CDistributionDB::Stats stats = db.GetStats();
    BOOST_CHECK_EQUAL(stats.nRecords, 2U);
    BOOST_CHECK_EQUAL(stats.nClaims, 1U);
    BOOST_CHECK_EQUAL(stats.nNonces, 2U);
    BOOST_CHECK_EQUAL(stats.nDistributed, 3 * CENT);
    BOOST_CHECK_EQUAL(stats.nReleased, CENT / 2);

    const CSlotClaimStats read = db.GetClaimStats(slotA);
    BOOST_CHECK_EQUAL(read.nClaims, 1U);
    BOOST_CHECK_EQUAL(read.nReleased, CENT / 2);
    BOOST_CHECK_EQUAL(db.GetClaimStats(slotB).nClaims, 0U);
}

BOOST_AUTO_TEST_SUITE_END()
