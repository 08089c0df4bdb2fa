// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2019-2021 The PIVX Core developers
// Copyright (c) 2025 The BATHRON developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_SQLITEDB_H
#define QOBI_SQLITEDB_H

/**
 * SQLite key/value store
 *
 * One `main` table of serialized keys and values on a single connection.
 * Keys compare bytewise, so every key sharing a serialized prefix lies in
 * one contiguous range that SQLiteCursor walks in order. Values are written
 * either once (Insert: fails when the key exists) or freely (Write).
 */

#include "fs.h"
#include "logging.h"
#include "serialize.h"
#include "streams.h"
#include "version.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <sqlite3.h>

/** Default page cache handed to SQLite (-dbcache, MiB) */
static const int64_t DEFAULT_DB_CACHE = 16;

/** A prepared statement, finalized on destruction. */
class SQLiteStatement
{
private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt{nullptr};

public:
    /** @throws std::runtime_error when sql does not compile */
    SQLiteStatement(sqlite3* db, const char* sql);
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    bool Bind(int nParam, const char* data, size_t nSize);
    bool Bind(int nParam, const CDataStream& ss) { return Bind(nParam, ss.data(), ss.size()); }
    bool Bind(int nParam, const std::vector<char>& vch) { return Bind(nParam, vch.data(), vch.size()); }

    /** SQLITE_ROW, SQLITE_DONE or an error code (logged). */
    int Step();
    /** Ready for new bindings. */
    void Reset();

    /** Copy a blob column of the current row into ss. */
    void ReadColumn(int nCol, CDataStream& ss) const;
    int ColumnInt(int nCol) const { return sqlite3_column_int(m_stmt, nCol); }
};

/** Serialize an object the way keys and values are stored. */
template <typename T>
CDataStream SerializeForDB(const T& obj)
{
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << obj;
    return ss;
}

class SQLiteDatabase
{
private:
    sqlite3* m_db{nullptr};
    fs::path m_path;
    bool m_mock{false};
    bool m_in_txn{false};
    std::function<bool()> m_commit_check;

    std::unique_ptr<SQLiteStatement> m_select;
    std::unique_ptr<SQLiteStatement> m_insert;
    std::unique_ptr<SQLiteStatement> m_replace;
    std::unique_ptr<SQLiteStatement> m_exists;

    void Open(size_t nCacheSize);
    bool Exec(const std::string& sql, const char* pszWhat);

    static int CommitHook(void* pArg);

    bool ReadRaw(const CDataStream& ssKey, CDataStream& ssValue);
    bool WriteRaw(const CDataStream& ssKey, const CDataStream& ssValue, bool fOverwrite);
    bool ExistsRaw(const CDataStream& ssKey);

public:
    /**
     * Open (creating if needed) the database at path.
     * @param nCacheSize page cache size in bytes
     * @param mock       in-memory database, path is ignored
     * @param fWipe      delete any existing file first
     * @throws std::runtime_error when the file cannot be opened or set up
     */
    SQLiteDatabase(const fs::path& path, size_t nCacheSize, bool mock = false, bool fWipe = false);
    ~SQLiteDatabase();

    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    bool IsMock() const { return m_mock; }
    sqlite3* GetDb() const { return m_db; }

    /** Checkpoint the WAL; truncates it at shutdown. */
    void Flush(bool shutdown);

    template <typename K, typename T>
    bool Read(const K& key, T& value)
    {
        CDataStream ssValue(SER_DISK, CLIENT_VERSION);
        if (!ReadRaw(SerializeForDB(key), ssValue)) {
            return false;
        }
        try {
            ssValue >> value;
        } catch (const std::exception& e) {
            return error("%s: deserialize error: %s", __func__, e.what());
        }
        return true;
    }

    /** Store a value that must not exist yet. */
    template <typename K, typename T>
    bool Insert(const K& key, const T& value)
    {
        return WriteRaw(SerializeForDB(key), SerializeForDB(value), false);
    }

    /** Store a value, replacing any previous one. */
    template <typename K, typename T>
    bool Write(const K& key, const T& value)
    {
        return WriteRaw(SerializeForDB(key), SerializeForDB(value), true);
    }

    template <typename K>
    bool Exists(const K& key)
    {
        return ExistsRaw(SerializeForDB(key));
    }

    bool TxnBegin();
    /** On failure the transaction is gone: SQLite rolled it back or TxnAbort() must. */
    bool TxnCommit();
    bool TxnAbort();
    bool InTxn() const { return m_in_txn; }

    /**
     * Consulted before every commit; returning false turns the commit into a
     * rollback. An empty function removes the check.
     */
    void SetCommitCheck(std::function<bool()> check);
};

/**
 * Ordered walk over the keys starting with one serialized prefix (or over
 * the whole table for an empty prefix).
 */
class SQLiteCursor
{
private:
    std::vector<char> m_lower;
    std::vector<char> m_upper;
    std::unique_ptr<SQLiteStatement> m_stmt;
    bool m_fBound{false};

public:
    SQLiteCursor(SQLiteDatabase& database, std::vector<char> vchPrefix);

    template <typename K>
    static SQLiteCursor ForPrefix(SQLiteDatabase& database, const K& prefix)
    {
        CDataStream ss = SerializeForDB(prefix);
        return SQLiteCursor(database, std::vector<char>(ss.begin(), ss.end()));
    }

    /** False at the end of the range or on error. */
    bool Next(CDataStream& ssKey, CDataStream& ssValue);
};

#endif // QOBI_SQLITEDB_H
