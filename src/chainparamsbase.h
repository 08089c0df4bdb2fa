// Copyright (c) 2014-2015 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CHAINPARAMSBASE_H
#define QOBI_CHAINPARAMSBASE_H

#include <memory>
#include <string>

/**
 * CBaseChainParams defines the base parameters (shared between the core
 * library and its tools) of a given instance of the distribution network.
 */
class CBaseChainParams
{
public:
    /** Network names, also the data directory suffix for non-main networks. */
    static const std::string MAIN;
    static const std::string TESTNET;
    static const std::string REGTEST;

    const std::string& DataDir() const { return strDataDir; }

    CBaseChainParams() = delete;
    explicit CBaseChainParams(const std::string& data_dir) : strDataDir(data_dir) {}

private:
    std::string strDataDir;
};

/**
 * Creates and returns a std::unique_ptr<CBaseChainParams> of the chosen chain.
 * @returns a CBaseChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CBaseChainParams> CreateBaseChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CBaseChainParams& BaseParams();

/** Sets the params returned by Params() to those for the given network. */
void SelectBaseParams(const std::string& chain);

#endif // QOBI_CHAINPARAMSBASE_H
