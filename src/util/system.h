// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory resolution.
 */
#ifndef QOBI_UTIL_SYSTEM_H
#define QOBI_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const QOBI_CONF_FILENAME;

const fs::path& GetDataDir(bool fNetSpecific = true);
/** Drop the cached data directory so the next GetDataDir() re-reads -datadir / -network. */
void ClearDatadirCache();
fs::path GetDefaultDataDir();
fs::path GetConfigFile(const std::string& confPath);
bool TryCreateDirectories(const fs::path& p);
bool CheckDataDirOption();

/**
 * Most paths passed as configuration arguments are treated as relative to
 * the datadir if they are not absolute.
 *
 * @param path The path to be conditionally prefixed with datadir.
 * @param net_specific Forwarded to GetDataDir().
 * @return The normalized path.
 */
fs::path AbsPathForConfigVal(const fs::path& path, bool net_specific = true);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;
    std::set<std::string> m_negated_args;

    bool ReadConfigStream(std::istream& stream, std::string& error);
    /** Most recent value set for strArg, command line first, then config file. */
    bool GetValue(const std::string& strArg, std::string& strValue) const;

public:
    bool ParseParameters(int argc, const char* const argv[], std::string& error);
    bool ReadConfigFiles(std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-debug")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument was passed negated
     */
    bool IsArgNegated(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArg(const std::string& strArg);
    void ClearArgs();

    /**
     * Looks for -regtest, -testnet or -network=<name> and returns the
     * appropriate network name. Throws std::runtime_error on conflicting flags.
     */
    std::string GetChainName() const;
};

extern ArgsManager gArgs;

#endif // QOBI_UTIL_SYSTEM_H
