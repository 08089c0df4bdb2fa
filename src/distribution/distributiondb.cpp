// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/distributiondb.h"

#include "logging.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

// Global instance
std::unique_ptr<CDistributionDB> g_distributiondb;

// DB key prefixes
static const char DB_RECORD = 'r';
static const char DB_CLAIM = 'c';
static const char DB_CLAIM_STATS = 's';
static const char DB_NONCE = 'n';
static const char DB_ALLOCATED = 'a';
static const std::string DB_VERSION = "version";

//==============================================================================
// Key construction helpers
//==============================================================================

static std::pair<char, CDistributionSlot> RecordKey(const CDistributionSlot& slot)
{
    return std::make_pair(DB_RECORD, slot);
}

static std::pair<char, std::pair<CDistributionSlot, CKeyID>> ClaimKey(const CDistributionSlot& slot, const CKeyID& user)
{
    return std::make_pair(DB_CLAIM, std::make_pair(slot, user));
}

static std::pair<char, CDistributionSlot> ClaimStatsKey(const CDistributionSlot& slot)
{
    return std::make_pair(DB_CLAIM_STATS, slot);
}

static std::pair<char, uint64_t> NonceKey(uint64_t nNonce)
{
    return std::make_pair(DB_NONCE, nNonce);
}

static std::pair<char, std::pair<uint32_t, uint8_t>> AllocatedKey(uint32_t nDay, uint8_t nCategory)
{
    return std::make_pair(DB_ALLOCATED, std::make_pair(nDay, nCategory));
}

//==============================================================================
// CDistributionDB Implementation
//==============================================================================

CDistributionDB::CDistributionDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    if (fMemory) {
        m_database = std::make_unique<SQLiteDatabase>("", nCacheSize, true /* mock */);
    } else {
        m_database = std::make_unique<SQLiteDatabase>(GetDataDir() / "distribution.sqlite", nCacheSize, false, fWipe);
    }

    if (!CheckVersion()) {
        throw std::runtime_error("CDistributionDB: unsupported database version");
    }
}

CDistributionDB::~CDistributionDB()
{
    LOCK(cs_db);
    m_database.reset();
}

bool CDistributionDB::CheckVersion()
{
    LOCK(cs_db);
    int nVersion = 0;
    if (!m_database->Read(DB_VERSION, nVersion)) {
        LogPrint(BCLog::DB, "%s: new database, writing version %d\n", __func__, DISTRIBUTION_DB_VERSION);
        return m_database->Write(DB_VERSION, DISTRIBUTION_DB_VERSION);
    }
    if (nVersion > DISTRIBUTION_DB_VERSION) {
        return error("%s: database version %d is newer than supported %d", __func__, nVersion, DISTRIBUTION_DB_VERSION);
    }
    if (nVersion < DISTRIBUTION_DB_VERSION) {
        // Version 1 records have no sub-batch or signer field
        return error("%s: database version %d predates sub-batch slots, restart with -wipedistribution", __func__, nVersion);
    }
    return true;
}

bool CDistributionDB::ReadDistribution(const CDistributionSlot& slot, CDistributionRecord& record) const
{
    LOCK(cs_db);
    return m_database->Read(RecordKey(slot), record);
}

bool CDistributionDB::ExistsDistribution(const CDistributionSlot& slot) const
{
    LOCK(cs_db);
    return m_database->Exists(RecordKey(slot));
}

template <typename K>
static std::vector<CDistributionRecord> ReadRecordRange(SQLiteDatabase& database, const K& prefix)
{
    std::vector<CDistributionRecord> vRecords;
    SQLiteCursor cursor = SQLiteCursor::ForPrefix(database, prefix);
    CDataStream ssKey(SER_DISK, CLIENT_VERSION);
    CDataStream ssValue(SER_DISK, CLIENT_VERSION);
    while (cursor.Next(ssKey, ssValue)) {
        try {
            CDistributionRecord record;
            ssValue >> record;
            vRecords.push_back(record);
        } catch (const std::exception& e) {
            LogPrintf("ReadRecordRange: skipping undecodable record: %s\n", e.what());
        }
    }
    return vRecords;
}

void CDistributionDB::ForEachDistribution(uint32_t nDay, std::function<bool(const CDistributionRecord&)> func) const
{
    std::vector<CDistributionRecord> vRecords;
    {
        LOCK(cs_db);
        vRecords = ReadRecordRange(*m_database, std::make_pair(DB_RECORD, nDay));
    }
    for (const CDistributionRecord& record : vRecords) {
        if (!func(record)) break;
    }
}

void CDistributionDB::ForEachDistribution(std::function<bool(const CDistributionRecord&)> func) const
{
    std::vector<CDistributionRecord> vRecords;
    {
        LOCK(cs_db);
        vRecords = ReadRecordRange(*m_database, DB_RECORD);
    }
    for (const CDistributionRecord& record : vRecords) {
        if (!func(record)) break;
    }
}

bool CDistributionDB::ReadClaim(const CDistributionSlot& slot, const CKeyID& user, CClaimRecord& claim) const
{
    LOCK(cs_db);
    return m_database->Read(ClaimKey(slot, user), claim);
}

bool CDistributionDB::ExistsClaim(const CDistributionSlot& slot, const CKeyID& user) const
{
    LOCK(cs_db);
    return m_database->Exists(ClaimKey(slot, user));
}

CSlotClaimStats CDistributionDB::GetClaimStats(const CDistributionSlot& slot) const
{
    LOCK(cs_db);
    CSlotClaimStats stats;
    if (!m_database->Read(ClaimStatsKey(slot), stats)) {
        return CSlotClaimStats();
    }
    return stats;
}

bool CDistributionDB::IsNonceUsed(uint64_t nNonce) const
{
    LOCK(cs_db);
    return m_database->Exists(NonceKey(nNonce));
}

CAmount CDistributionDB::GetAllocated(uint32_t nDay, uint8_t nCategory) const
{
    LOCK(cs_db);
    CAmount nAllocated = 0;
    if (!m_database->Read(AllocatedKey(nDay, nCategory), nAllocated)) {
        return 0;
    }
    return nAllocated;
}

CDistributionDB::Stats CDistributionDB::GetStats() const
{
    LOCK(cs_db);
    Stats stats{0, 0, 0, 0, 0};

    SQLiteCursor cursor(*m_database, {});
    CDataStream ssKey(SER_DISK, CLIENT_VERSION);
    CDataStream ssValue(SER_DISK, CLIENT_VERSION);
    while (cursor.Next(ssKey, ssValue)) {
        if (ssKey.empty()) continue;
        try {
            switch (ssKey[0]) {
            case DB_RECORD: {
                CDistributionRecord record;
                ssValue >> record;
                stats.nRecords++;
                if (!CheckedAdd(stats.nDistributed, record.nTotalReward, stats.nDistributed)) {
                    LogPrintf("CDistributionDB::%s: distributed total overflows\n", __func__);
                }
                break;
            }
            case DB_CLAIM: {
                CClaimRecord claim;
                ssValue >> claim;
                stats.nClaims++;
                if (!CheckedAdd(stats.nReleased, claim.nAmount, stats.nReleased)) {
                    LogPrintf("CDistributionDB::%s: released total overflows\n", __func__);
                }
                break;
            }
            case DB_NONCE:
                stats.nNonces++;
                break;
            default:
                break;
            }
        } catch (const std::exception& e) {
            LogPrintf("CDistributionDB::%s: undecodable value: %s\n", __func__, e.what());
        }
    }
    return stats;
}

bool CDistributionDB::Sync()
{
    LOCK(cs_db);
    m_database->Flush(false);
    return true;
}

void CDistributionDB::SetCommitCheck(std::function<bool()> check)
{
    LOCK(cs_db);
    m_database->SetCommitCheck(std::move(check));
}

//==============================================================================
// Batch Implementation
//==============================================================================

CDistributionDB::Batch::Batch(CDistributionDB& db)
    : parent(db), lock(db.cs_db), fOpen(false)
{
    fOpen = parent.m_database->TxnBegin();
    if (!fOpen) {
        LogPrintf("CDistributionDB::Batch: cannot begin transaction\n");
    }
}

CDistributionDB::Batch::~Batch()
{
    if (fOpen) {
        Abort();
    }
}

bool CDistributionDB::Batch::WriteDistribution(const CDistributionRecord& record)
{
    if (!fOpen) return false;
    if (!parent.m_database->Insert(RecordKey(record.slot), record)) {
        return error("%s: record for %s not written", __func__, record.slot.ToString());
    }
    return true;
}

bool CDistributionDB::Batch::WriteClaim(const CClaimRecord& claim)
{
    if (!fOpen) return false;
    if (!parent.m_database->Insert(ClaimKey(claim.slot, claim.user), claim)) {
        return error("%s: claim %s/%s not written", __func__, claim.slot.ToString(), HexStr(claim.user.begin(), claim.user.end()));
    }
    return true;
}

bool CDistributionDB::Batch::WriteClaimStats(const CDistributionSlot& slot, const CSlotClaimStats& stats)
{
    if (!fOpen) return false;
    return parent.m_database->Write(ClaimStatsKey(slot), stats);
}

bool CDistributionDB::Batch::WriteNonce(uint64_t nNonce, int64_t nTime)
{
    if (!fOpen) return false;
    if (!parent.m_database->Insert(NonceKey(nNonce), nTime)) {
        return error("%s: nonce %d not written", __func__, nNonce);
    }
    return true;
}

bool CDistributionDB::Batch::WriteAllocated(uint32_t nDay, uint8_t nCategory, CAmount nAmount)
{
    if (!fOpen) return false;
    return parent.m_database->Write(AllocatedKey(nDay, nCategory), nAmount);
}

bool CDistributionDB::Batch::Commit()
{
    if (!fOpen) return false;
    fOpen = false;
    if (!parent.m_database->TxnCommit()) {
        if (parent.m_database->InTxn()) parent.m_database->TxnAbort();
        return error("CDistributionDB::Batch::%s: commit failed", __func__);
    }
    return true;
}

void CDistributionDB::Batch::Abort()
{
    if (!fOpen) return;
    fOpen = false;
    if (!parent.m_database->TxnAbort()) {
        LogPrintf("CDistributionDB::Batch::%s: rollback failed\n", __func__);
    }
}

//==============================================================================
// Initialization
//==============================================================================

bool InitDistributionDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    try {
        g_distributiondb.reset();
        g_distributiondb = std::make_unique<CDistributionDB>(nCacheSize, fMemory, fWipe);
        LogPrintf("Distribution DB initialized (%s)\n", fMemory ? "memory" : "disk");
        return true;
    } catch (const std::exception& e) {
        return error("%s: failed to open distribution DB: %s", __func__, e.what());
    }
}
