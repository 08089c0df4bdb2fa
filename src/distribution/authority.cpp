// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/authority.h"

#include "consensus/validation.h"
#include "logging.h"
#include "utilstrencodings.h"

CRoleRegistry::CRoleRegistry(const CKeyID& admin) : m_admin(admin) {}

bool CRoleRegistry::GrantRelayer(const CKeyID& caller, const CKeyID& relayer, CValidationState& state)
{
    if (!IsAdmin(caller)) {
        return state.Invalid(DistributionError::UNAUTHORIZED, false, REJECT_INVALID, "not-admin",
                             strprintf("%s cannot grant roles", HexStr(caller.begin(), caller.end())));
    }
    LOCK(cs_roles);
    if (m_relayers.insert(relayer).second) {
        LogPrint(BCLog::DISTRIBUTION, "%s: relayer %s granted\n", __func__, HexStr(relayer.begin(), relayer.end()));
    }
    return true;
}

bool CRoleRegistry::RevokeRelayer(const CKeyID& caller, const CKeyID& relayer, CValidationState& state)
{
    if (!IsAdmin(caller)) {
        return state.Invalid(DistributionError::UNAUTHORIZED, false, REJECT_INVALID, "not-admin",
                             strprintf("%s cannot revoke roles", HexStr(caller.begin(), caller.end())));
    }
    LOCK(cs_roles);
    if (m_relayers.erase(relayer)) {
        LogPrint(BCLog::DISTRIBUTION, "%s: relayer %s revoked\n", __func__, HexStr(relayer.begin(), relayer.end()));
    }
    return true;
}

bool CRoleRegistry::HasRelayerRole(const CKeyID& address) const
{
    LOCK(cs_roles);
    return m_relayers.count(address) > 0;
}

size_t CRoleRegistry::RelayerCount() const
{
    LOCK(cs_roles);
    return m_relayers.size();
}
