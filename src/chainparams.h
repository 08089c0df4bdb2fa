// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CHAINPARAMS_H
#define QOBI_CHAINPARAMS_H

#include "chainparamsbase.h"
#include "consensus/params.h"

#include <memory>
#include <string>

/**
 * CChainParams defines various tweakable parameters of a given instance of the
 * distribution network. There are three: the main network on which rewards are
 * paid out, a public test network that gets reset from time to time and a
 * regression test mode which is intended for private networks only.
 */
class CChainParams
{
public:
    const Consensus::Params& GetConsensus() const { return consensus; }

    /** Return the network string */
    const std::string& NetworkIDString() const { return strNetworkID; }
    bool IsRegTestNet() const { return NetworkIDString() == CBaseChainParams::REGTEST; }
    bool IsTestnet() const { return NetworkIDString() == CBaseChainParams::TESTNET; }

    /** Default -rootpolicy for this network */
    const std::string& DefaultRootPolicy() const { return strDefaultRootPolicy; }

    /** Apply -cap<category>, -maxbatchsize and -submissionwindow overrides */
    void UpdateAdmissionParameters();

protected:
    CChainParams() {}

    std::string strNetworkID;
    std::string strDefaultRootPolicy;
    Consensus::Params consensus;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 * Admission overrides from gArgs are applied on top.
 */
void SelectParams(const std::string& chain);

#endif // QOBI_CHAINPARAMS_H
