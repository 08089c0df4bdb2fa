// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_DISTRIBUTIONDB_H
#define QOBI_DISTRIBUTIONDB_H

/**
 * Distribution Database
 *
 * SQLite key/value storage for finalized distributions and claims.
 *
 * Key Prefixes (serialized pair of prefix char and key):
 *   'r' || slot              -> CDistributionRecord (write-once)
 *   'c' || (slot, user)      -> CClaimRecord (write-once)
 *   's' || slot              -> CSlotClaimStats
 *   'n' || nonce             -> int64_t consume time (write-once)
 *   'a' || (day, category)   -> CAmount allocated to the day's sub-batches
 *
 * Write-once keys are written with SQLiteDatabase::Insert, so a second write
 * of the same key fails inside SQLite and the enclosing Batch is rolled back.
 */

#include "amount.h"
#include "distribution/distribution.h"
#include "sqlitedb.h"
#include "sync.h"

#include <functional>
#include <memory>

class CDistributionDB
{
private:
    mutable RecursiveMutex cs_db;
    std::unique_ptr<SQLiteDatabase> m_database;

    bool CheckVersion();

public:
    /**
     * Open GetDataDir()/distribution.sqlite, or an in-memory database.
     * @throws std::runtime_error when the database cannot be opened or has a newer schema
     */
    explicit CDistributionDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);
    ~CDistributionDB();

    CDistributionDB(const CDistributionDB&) = delete;
    CDistributionDB& operator=(const CDistributionDB&) = delete;

    //==========================================================================
    // Distribution Records
    //==========================================================================

    bool ReadDistribution(const CDistributionSlot& slot, CDistributionRecord& record) const;
    bool ExistsDistribution(const CDistributionSlot& slot) const;

    /**
     * Iterate over the records of one day, in key order.
     *
     * @param func Callback (return false to stop)
     */
    void ForEachDistribution(uint32_t nDay, std::function<bool(const CDistributionRecord&)> func) const;

    /** Iterate over all records. */
    void ForEachDistribution(std::function<bool(const CDistributionRecord&)> func) const;

    //==========================================================================
    // Claims
    //==========================================================================

    bool ReadClaim(const CDistributionSlot& slot, const CKeyID& user, CClaimRecord& claim) const;
    bool ExistsClaim(const CDistributionSlot& slot, const CKeyID& user) const;

    /** Claim totals of a slot; zero stats when nothing was claimed yet. */
    CSlotClaimStats GetClaimStats(const CDistributionSlot& slot) const;

    //==========================================================================
    // Admission state
    //==========================================================================

    bool IsNonceUsed(uint64_t nNonce) const;

    /** Sum of totalReward over the finalized sub-batches of (day, category). */
    CAmount GetAllocated(uint32_t nDay, uint8_t nCategory) const;

    //==========================================================================
    // Batch Operations
    //==========================================================================

    /**
     * Atomic write set. Holds the database lock and an open SQLite transaction
     * from construction until Commit(); destroying an uncommitted Batch rolls
     * every write back.
     */
    class Batch
    {
    private:
        CDistributionDB& parent;
        RecursiveMutex::UniqueLock lock;
        bool fOpen;

    public:
        explicit Batch(CDistributionDB& db);
        ~Batch();

        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;

        /** False when the transaction could not be started. */
        bool IsOpen() const { return fOpen; }

        bool WriteDistribution(const CDistributionRecord& record);
        bool WriteClaim(const CClaimRecord& claim);
        bool WriteClaimStats(const CDistributionSlot& slot, const CSlotClaimStats& stats);
        bool WriteNonce(uint64_t nNonce, int64_t nTime);
        bool WriteAllocated(uint32_t nDay, uint8_t nCategory, CAmount nAmount);

        bool Commit();
        void Abort();
    };

    //==========================================================================
    // Statistics
    //==========================================================================

    struct Stats {
        size_t nRecords;
        size_t nClaims;
        size_t nNonces;
        CAmount nDistributed;   // sum of record totals
        CAmount nReleased;      // sum of claimed amounts
    };

    Stats GetStats() const;

    // Sync to disk
    bool Sync();

    bool IsMemory() const { return m_database->IsMock(); }

    /** Veto commits while check returns false (fault injection). */
    void SetCommitCheck(std::function<bool()> check);
};

// Global distribution DB instance
extern std::unique_ptr<CDistributionDB> g_distributiondb;

/**
 * Initialize the distribution database.
 *
 * @param nCacheSize DB cache size in bytes
 * @param fMemory If true, use in-memory database (for tests)
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitDistributionDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

#endif // QOBI_DISTRIBUTIONDB_H
