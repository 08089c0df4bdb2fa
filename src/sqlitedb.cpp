// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2019-2021 The PIVX Core developers
// Copyright (c) 2025 The BATHRON developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitedb.h"

#include "util/system.h"

#include <stdexcept>

//
// SQLiteStatement
//

SQLiteStatement::SQLiteStatement(sqlite3* db, const char* sql) : m_db(db)
{
    if (sqlite3_prepare_v2(m_db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        std::string strErr = sqlite3_errmsg(m_db);
        sqlite3_finalize(m_stmt);
        throw std::runtime_error(strprintf("SQLiteStatement: cannot prepare \"%s\": %s", sql, strErr));
    }
}

SQLiteStatement::~SQLiteStatement()
{
    sqlite3_finalize(m_stmt);
}

bool SQLiteStatement::Bind(int nParam, const char* data, size_t nSize)
{
    // A null pointer would bind NULL instead of an empty blob
    static const char empty = 0;
    if (sqlite3_bind_blob(m_stmt, nParam, nSize ? data : &empty, (int)nSize, SQLITE_TRANSIENT) != SQLITE_OK) {
        return error("SQLiteStatement::%s: %s", __func__, sqlite3_errmsg(m_db));
    }
    return true;
}

int SQLiteStatement::Step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        LogPrint(BCLog::DB, "SQLiteStatement::%s: %s\n", __func__, sqlite3_errmsg(m_db));
    }
    return rc;
}

void SQLiteStatement::Reset()
{
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

void SQLiteStatement::ReadColumn(int nCol, CDataStream& ss) const
{
    const char* data = (const char*)sqlite3_column_blob(m_stmt, nCol);
    int nSize = sqlite3_column_bytes(m_stmt, nCol);
    ss.SetType(SER_DISK);
    ss.clear();
    if (data && nSize > 0) {
        ss.write(data, nSize);
    }
}

//
// SQLiteDatabase
//

SQLiteDatabase::SQLiteDatabase(const fs::path& path, size_t nCacheSize, bool mock, bool fWipe)
    : m_path(path), m_mock(mock)
{
    if (!m_mock) {
        TryCreateDirectories(m_path.parent_path());
        if (fWipe && fs::exists(m_path)) {
            LogPrintf("Wiping SQLite database %s\n", m_path.string());
            fs::remove(m_path);
            fs::remove(m_path.string() + "-wal");
            fs::remove(m_path.string() + "-shm");
        }
    }

    try {
        Open(nCacheSize);
    } catch (...) {
        m_select.reset();
        m_insert.reset();
        m_replace.reset();
        m_exists.reset();
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
}

void SQLiteDatabase::Open(size_t nCacheSize)
{
    const std::string strName = m_mock ? ":memory:" : m_path.string();
    int rc = sqlite3_open(strName.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string strErr = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        throw std::runtime_error(strprintf("SQLiteDatabase: cannot open %s: %s", strName, strErr));
    }
    if (!m_mock) {
        LogPrintf("Using SQLite database %s (SQLite %s)\n", strName, sqlite3_libversion());
    }

    std::string pragmas = "PRAGMA synchronous = NORMAL; PRAGMA busy_timeout = 5000;";
    if (!m_mock) {
        pragmas += "PRAGMA journal_mode = WAL;";
    }
    if (nCacheSize > 0) {
        // negative cache_size is in KiB
        pragmas += strprintf("PRAGMA cache_size = -%d;", nCacheSize / 1024);
    }
    if (!Exec(pragmas, "pragmas") ||
        !Exec("CREATE TABLE IF NOT EXISTS main (key BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID;", "schema")) {
        throw std::runtime_error("SQLiteDatabase: cannot set up " + strName);
    }

    m_select = std::make_unique<SQLiteStatement>(m_db, "SELECT value FROM main WHERE key = ?1");
    m_insert = std::make_unique<SQLiteStatement>(m_db, "INSERT INTO main (key, value) VALUES (?1, ?2)");
    m_replace = std::make_unique<SQLiteStatement>(m_db, "INSERT OR REPLACE INTO main (key, value) VALUES (?1, ?2)");
    m_exists = std::make_unique<SQLiteStatement>(m_db, "SELECT EXISTS(SELECT 1 FROM main WHERE key = ?1)");
}

SQLiteDatabase::~SQLiteDatabase()
{
    if (m_in_txn) {
        LogPrint(BCLog::DB, "SQLiteDatabase: rolling back open transaction at close\n");
        TxnAbort();
    }
    Flush(true);
    m_select.reset();
    m_insert.reset();
    m_replace.reset();
    m_exists.reset();
    sqlite3_close(m_db);
    m_db = nullptr;
}

bool SQLiteDatabase::Exec(const std::string& sql, const char* pszWhat)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: %s failed: %s\n", pszWhat, errMsg ? errMsg : sqlite3_errstr(rc));
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void SQLiteDatabase::Flush(bool shutdown)
{
    if (!m_db || m_mock) return;
    sqlite3_wal_checkpoint_v2(m_db, nullptr, shutdown ? SQLITE_CHECKPOINT_TRUNCATE : SQLITE_CHECKPOINT_PASSIVE,
                              nullptr, nullptr);
}

bool SQLiteDatabase::ReadRaw(const CDataStream& ssKey, CDataStream& ssValue)
{
    bool fFound = false;
    if (m_select->Bind(1, ssKey) && m_select->Step() == SQLITE_ROW) {
        m_select->ReadColumn(0, ssValue);
        fFound = true;
    }
    m_select->Reset();
    return fFound;
}

bool SQLiteDatabase::WriteRaw(const CDataStream& ssKey, const CDataStream& ssValue, bool fOverwrite)
{
    SQLiteStatement& stmt = fOverwrite ? *m_replace : *m_insert;
    const bool fOk = stmt.Bind(1, ssKey) && stmt.Bind(2, ssValue) && stmt.Step() == SQLITE_DONE;
    stmt.Reset();
    return fOk;
}

bool SQLiteDatabase::ExistsRaw(const CDataStream& ssKey)
{
    const bool fExists = m_exists->Bind(1, ssKey) && m_exists->Step() == SQLITE_ROW && m_exists->ColumnInt(0) != 0;
    m_exists->Reset();
    return fExists;
}

bool SQLiteDatabase::TxnBegin()
{
    if (m_in_txn || !Exec("BEGIN TRANSACTION", "begin")) return false;
    m_in_txn = true;
    return true;
}

bool SQLiteDatabase::TxnCommit()
{
    if (!m_in_txn) return false;
    if (!Exec("COMMIT", "commit")) {
        // A vetoed commit is rolled back by SQLite itself
        m_in_txn = !sqlite3_get_autocommit(m_db);
        return false;
    }
    m_in_txn = false;
    return true;
}

bool SQLiteDatabase::TxnAbort()
{
    if (!m_in_txn) return false;
    m_in_txn = false;
    return Exec("ROLLBACK", "rollback");
}

int SQLiteDatabase::CommitHook(void* pArg)
{
    const SQLiteDatabase* database = static_cast<const SQLiteDatabase*>(pArg);
    return database->m_commit_check() ? 0 : 1;
}

void SQLiteDatabase::SetCommitCheck(std::function<bool()> check)
{
    m_commit_check = std::move(check);
    sqlite3_commit_hook(m_db, m_commit_check ? &SQLiteDatabase::CommitHook : nullptr, this);
}

//
// SQLiteCursor
//

SQLiteCursor::SQLiteCursor(SQLiteDatabase& database, std::vector<char> vchPrefix) : m_lower(std::move(vchPrefix))
{
    // Smallest key above every key with the prefix: drop trailing 0xff bytes, bump the last one
    m_upper = m_lower;
    while (!m_upper.empty() && (unsigned char)m_upper.back() == 0xff) {
        m_upper.pop_back();
    }
    if (!m_upper.empty()) {
        m_upper.back() = (char)((unsigned char)m_upper.back() + 1);
        m_stmt = std::make_unique<SQLiteStatement>(database.GetDb(),
            "SELECT key, value FROM main WHERE key >= ?1 AND key < ?2 ORDER BY key");
        m_fBound = m_stmt->Bind(1, m_lower) && m_stmt->Bind(2, m_upper);
    } else {
        m_stmt = std::make_unique<SQLiteStatement>(database.GetDb(),
            "SELECT key, value FROM main WHERE key >= ?1 ORDER BY key");
        m_fBound = m_stmt->Bind(1, m_lower);
    }
}

bool SQLiteCursor::Next(CDataStream& ssKey, CDataStream& ssValue)
{
    if (!m_fBound || m_stmt->Step() != SQLITE_ROW) {
        return false;
    }
    m_stmt->ReadColumn(0, ssKey);
    m_stmt->ReadColumn(1, ssValue);
    return true;
}
