// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2020 The PIVX developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "distribution/distribution.h"
#include "logging.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

#include <assert.h>

/** Contract address as written (big-endian hex, optional 0x prefix). */
static uint160 ContractAddress(const std::string& strHex)
{
    std::vector<unsigned char> vch = ParseHex(IsHexPrefixed(strHex) ? strHex.substr(2) : strHex);
    assert(vch.size() == 20);
    return uint160(vch);
}

static void SetDefaultDailyCaps(Consensus::Params& consensus)
{
    consensus.nDailyCap[Consensus::CATEGORY_CREATE]    = 149 * CENT;    // 1.49 QOBI
    consensus.nDailyCap[Consensus::CATEGORY_LIKES]     = 5 * CENT;      // 0.05 QOBI
    consensus.nDailyCap[Consensus::CATEGORY_COMMENTS]  = 60 * CENT;     // 0.60 QOBI
    consensus.nDailyCap[Consensus::CATEGORY_TIPPING]   = 796 * CENT;    // 7.96 QOBI
    consensus.nDailyCap[Consensus::CATEGORY_CRYPTO]    = 995 * CENT;    // 9.95 QOBI
    consensus.nDailyCap[Consensus::CATEGORY_REFERRALS] = 1195 * CENT;   // 11.95 QOBI
}

/** Longest accepted -submissionwindow */
static const int64_t MAX_SUBMISSION_WINDOW = 7 * DISTRIBUTION_DAY_SECONDS;

void CChainParams::UpdateAdmissionParameters()
{
    for (uint8_t n = 0; n < Consensus::MAX_REWARD_CATEGORIES; n++) {
        const std::string strArg = "-cap" + GetCategoryName(n);
        if (!gArgs.IsArgSet(strArg)) continue;
        CAmount nCap;
        if (!ParseMoney(gArgs.GetArg(strArg, ""), nCap)) {
            throw std::runtime_error(strprintf("Invalid amount for %s=<amount>: '%s'", strArg, gArgs.GetArg(strArg, "")));
        }
        consensus.nDailyCap[n] = nCap;
    }

    if (gArgs.IsArgSet("-maxbatchsize")) {
        const int64_t nMax = gArgs.GetArg("-maxbatchsize", (int64_t)consensus.nMaxBatchSize);
        if (nMax <= 0 || (uint64_t)nMax > consensus.MerkleTreeCapacity()) {
            throw std::runtime_error(strprintf("-maxbatchsize must be between 1 and %d", consensus.MerkleTreeCapacity()));
        }
        consensus.nMaxBatchSize = (unsigned int)nMax;
    }

    if (gArgs.IsArgSet("-submissionwindow")) {
        const int64_t nWindow = gArgs.GetArg("-submissionwindow", consensus.nSubmissionWindow);
        if (nWindow <= 0 || nWindow > MAX_SUBMISSION_WINDOW) {
            throw std::runtime_error(strprintf("-submissionwindow must be between 1 and %d", MAX_SUBMISSION_WINDOW));
        }
        consensus.nSubmissionWindow = nWindow;
    }
}

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = CBaseChainParams::MAIN;
        strDefaultRootPolicy = "rederive";

        consensus.domain.strName = "QOBI TreeProcessor";
        consensus.domain.strVersion = "1";
        consensus.domain.nChainId = 202102;
        consensus.domain.verifyingContract = ContractAddress("0xb85ca4471AE6ab8d9b7f0a21C707c9866805745f");

        consensus.nMerkleTreeDepth = 9;             // 512 leaves
        consensus.nMaxBatchSize = 500;
        SetDefaultDailyCaps(consensus);
        consensus.nSubmissionWindow = 60 * 60;      // 1 hour
        consensus.nDaySeconds = 24 * 60 * 60;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = CBaseChainParams::TESTNET;
        strDefaultRootPolicy = "rederive";

        consensus.domain.strName = "QOBI TreeProcessor";
        consensus.domain.strVersion = "1";
        consensus.domain.nChainId = 43113;
        consensus.domain.verifyingContract = ContractAddress("0x9e30Ef6651338A20e9E795e60bE08946c7FcAeBA");

        consensus.nMerkleTreeDepth = 9;
        consensus.nMaxBatchSize = 500;
        SetDefaultDailyCaps(consensus);
        consensus.nSubmissionWindow = 60 * 60;
        consensus.nDaySeconds = 24 * 60 * 60;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = CBaseChainParams::REGTEST;
        strDefaultRootPolicy = "rederive";

        consensus.domain.strName = "QOBI TreeProcessor";
        consensus.domain.strVersion = "1";
        consensus.domain.nChainId = 31337;          // local dev chain
        consensus.domain.verifyingContract = ContractAddress("0x5FC8d32690cc91D4c39d9d3abcBD16989F875707");

        consensus.nMerkleTreeDepth = 9;
        consensus.nMaxBatchSize = 500;
        SetDefaultDailyCaps(consensus);
        consensus.nSubmissionWindow = 60 * 60;
        consensus.nDaySeconds = 24 * 60 * 60;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    SelectBaseParams(network);
    globalChainParams = CreateChainParams(network);
    globalChainParams->UpdateAdmissionParameters();
}
