// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2019 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "chainparamsbase.h"
#include "logging.h"
#include "utilstrencodings.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <boost/filesystem/fstream.hpp>

const char * const QOBI_CONF_FILENAME = "qobi.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/**
 * Turn -noX into -X=0 and report whether the option was negated.
 */
static bool InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
            val = "1";
            return false;
        }
        val = "0";
        return true;
    }
    return false;
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();
    m_negated_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        if (InterpretNegatedOption(key, val)) {
            m_negated_args.insert(key);
        } else {
            m_negated_args.erase(key);
        }
        m_override_args[key].push_back(val);
    }
    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        const static std::string pattern = " \t\r\n";
        str.erase(0, str.find_first_not_of(pattern));
        str.erase(str.find_last_not_of(pattern) + 1);
        if (!str.empty()) {
            if ((pos = str.find('=')) == std::string::npos) {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
            std::string key = "-" + str.substr(0, pos);
            std::string val = str.substr(pos + 1);
            key.erase(key.find_last_not_of(pattern) + 1);
            val.erase(0, val.find_first_not_of(pattern));
            if (InterpretNegatedOption(key, val)) {
                m_negated_args.insert(key);
            }
            m_config_args[key].push_back(val);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFiles(std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    const std::string confPath = GetArg("-conf", QOBI_CONF_FILENAME);
    fs::ifstream stream(GetConfigFile(confPath));

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    }

    // If datadir is changed in .conf file:
    ClearDatadirCache();
    if (!CheckDataDirOption()) {
        error = strprintf("specified data directory \"%s\" does not exist.", GetArg("-datadir", ""));
        return false;
    }
    return true;
}

bool ArgsManager::GetValue(const std::string& strArg, std::string& strValue) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string strValue;
    return GetValue(strArg, strValue);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_negated_args.find(strArg) != m_negated_args.end();
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    if (IsArgNegated(strArg)) return "0";
    std::string strValue;
    if (GetValue(strArg, strValue)) return strValue;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    if (IsArgNegated(strArg)) return 0;
    std::string strValue;
    if (GetValue(strArg, strValue)) return atoi64(strValue);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    if (IsArgNegated(strArg)) return false;
    std::string strValue;
    if (GetValue(strArg, strValue)) return InterpretBool(strValue);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
    m_negated_args.erase(strArg);
}

void ArgsManager::ClearArg(const std::string& strArg)
{
    LOCK(cs_args);
    m_override_args.erase(strArg);
    m_config_args.erase(strArg);
    m_negated_args.erase(strArg);
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
    m_negated_args.clear();
}

std::string ArgsManager::GetChainName() const
{
    const bool fRegTest = GetBoolArg("-regtest", false);
    const bool fTestNet = GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return CBaseChainParams::REGTEST;
    if (fTestNet)
        return CBaseChainParams::TESTNET;
    return GetArg("-network", CBaseChainParams::MAIN);
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.qobi
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".qobi";
}

static fs::path pathCached;
static fs::path pathCachedNetSpecific;
static RecursiveMutex csPathCached;

const fs::path& GetDataDir(bool fNetSpecific)
{
    LOCK(csPathCached);

    fs::path& path = fNetSpecific ? pathCachedNetSpecific : pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    std::string datadir = gArgs.GetArg("-datadir", "");
    if (!datadir.empty()) {
        path = fs::system_complete(datadir);
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }
    if (fNetSpecific)
        path /= BaseParams().DataDir();

    fs::create_directories(path);

    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);

    pathCached = fs::path();
    pathCachedNetSpecific = fs::path();
}

bool CheckDataDirOption()
{
    std::string datadir = gArgs.GetArg("-datadir", "");
    return datadir.empty() || fs::is_directory(fs::system_complete(datadir));
}

fs::path GetConfigFile(const std::string& confPath)
{
    return AbsPathForConfigVal(fs::path(confPath), false);
}

bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}

fs::path AbsPathForConfigVal(const fs::path& path, bool net_specific)
{
    return fs::absolute(path, GetDataDir(net_specific));
}
