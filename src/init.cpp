// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "core_io.h"
#include "distribution/authority.h"
#include "distribution/claim.h"
#include "distribution/distributiondb.h"
#include "distribution/distributioninterface.h"
#include "distribution/escrow.h"
#include "distribution/ledger.h"
#include "distribution/submission.h"
#include "key.h"
#include "logging.h"
#include "sqlitedb.h"
#include "util/system.h"
#include "utilmoneystr.h"

std::unique_ptr<CRoleRegistry> g_role_registry;
std::unique_ptr<CEscrowVault> g_escrow;
std::unique_ptr<CDistributionLedger> g_ledger;
std::unique_ptr<CSubmissionValidator> g_submission_validator;
std::unique_ptr<CClaimProcessor> g_claim_processor;

static bool fECCStarted = false;

static bool InitError(const std::string& str, std::string& strError)
{
    LogPrintf("Error: %s\n", str);
    strError = str;
    return false;
}

bool AppInitParameterInteraction(std::string& strError)
{
    if (!CheckDataDirOption()) {
        return InitError(strprintf("Specified data directory \"%s\" does not exist.", gArgs.GetArg("-datadir", "")), strError);
    }

    try {
        SelectParams(gArgs.GetChainName());
    } catch (const std::exception& e) {
        return InitError(e.what(), strError);
    }

    RootPolicy policy;
    const std::string strPolicy = gArgs.GetArg("-rootpolicy", Params().DefaultRootPolicy());
    if (!ParseRootPolicy(strPolicy, policy)) {
        return InitError(strprintf("Unknown -rootpolicy '%s' (rederive or trusted)", strPolicy), strError);
    }

    if (gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE) <= 0) {
        return InitError("-dbcache must be positive", strError);
    }
    return true;
}

bool AppInitSanityChecks(std::string& strError)
{
    if (!fECCStarted) {
        ECC_Start();
        fECCStarted = true;
    }
    if (!ECC_InitSanityCheck()) {
        return InitError("Elliptic curve cryptography sanity check failure. Aborting.", strError);
    }
    return true;
}

bool AppInitDistribution(std::string& strError, bool fMemoryDB)
{
    const Consensus::Params& consensus = Params().GetConsensus();

    RootPolicy policy;
    if (!ParseRootPolicy(gArgs.GetArg("-rootpolicy", Params().DefaultRootPolicy()), policy)) {
        return InitError("Unknown -rootpolicy", strError);
    }

    CKeyID admin;
    if (!DecodeAddress(gArgs.GetArg("-admin", ""), admin)) {
        return InitError("-admin=<address> is required", strError);
    }
    g_role_registry = std::make_unique<CRoleRegistry>(admin);
    for (const std::string& strRelayer : gArgs.GetArgs("-relayer")) {
        CKeyID relayer;
        CValidationState state;
        if (!DecodeAddress(strRelayer, relayer)) {
            return InitError(strprintf("Invalid -relayer address '%s'", strRelayer), strError);
        }
        if (!g_role_registry->GrantRelayer(admin, relayer, state)) {
            return InitError(FormatStateMessage(state), strError);
        }
    }

    CAmount nFunding = 0;
    if (gArgs.IsArgSet("-escrowfunding") && !ParseMoney(gArgs.GetArg("-escrowfunding", ""), nFunding)) {
        return InitError(strprintf("Invalid -escrowfunding '%s'", gArgs.GetArg("-escrowfunding", "")), strError);
    }
    g_escrow = std::make_unique<CEscrowVault>(nFunding);

    const size_t nCacheSize = (size_t)gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE) << 20;
    if (!InitDistributionDB(nCacheSize, fMemoryDB, gArgs.GetBoolArg("-wipedistribution", false))) {
        return InitError("Error opening distribution database", strError);
    }

    g_ledger = std::make_unique<CDistributionLedger>(*g_distributiondb);
    g_submission_validator = std::make_unique<CSubmissionValidator>(*g_distributiondb, *g_role_registry, consensus, policy);
    g_claim_processor = std::make_unique<CClaimProcessor>(*g_distributiondb, *g_escrow);

    LogPrintf("Distribution: network %s, chain id %d, root policy %s, %d relayer(s), escrow %s\n",
              Params().NetworkIDString(), consensus.domain.nChainId, GetRootPolicyName(policy),
              g_role_registry->RelayerCount(), FormatMoney(nFunding));
    return true;
}

void Shutdown()
{
    LogPrintf("%s: In progress...\n", __func__);
    UnregisterAllDistributionInterfaces();

    g_claim_processor.reset();
    g_submission_validator.reset();
    g_ledger.reset();
    if (g_distributiondb) {
        g_distributiondb->Sync();
        g_distributiondb.reset();
    }
    g_escrow.reset();
    g_role_registry.reset();

    if (fECCStarted) {
        ECC_Stop();
        fECCStarted = false;
    }
    LogPrintf("%s: done\n", __func__);
}
