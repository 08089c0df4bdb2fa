// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_INIT_H
#define QOBI_INIT_H

#include <memory>
#include <string>

class CClaimProcessor;
class CDistributionLedger;
class CEscrowVault;
class CRoleRegistry;
class CSubmissionValidator;

extern std::unique_ptr<CRoleRegistry> g_role_registry;
extern std::unique_ptr<CEscrowVault> g_escrow;
extern std::unique_ptr<CDistributionLedger> g_ledger;
extern std::unique_ptr<CSubmissionValidator> g_submission_validator;
extern std::unique_ptr<CClaimProcessor> g_claim_processor;

/** Select the network and check option values. Call after gArgs is populated. */
bool AppInitParameterInteraction(std::string& strError);

/** Start ECC and run its sanity check. */
bool AppInitSanityChecks(std::string& strError);

/**
 * Open the distribution DB and create the components from gArgs:
 * -admin, -relayer, -escrowfunding, -rootpolicy, -dbcache, -wipedistribution.
 */
bool AppInitDistribution(std::string& strError, bool fMemoryDB = false);

/** Tear down in reverse order. Safe after a partial init. */
void Shutdown();

#endif // QOBI_INIT_H
