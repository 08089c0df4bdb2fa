// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_AUTHORITY_H
#define QOBI_AUTHORITY_H

#include "pubkey.h"
#include "sync.h"

#include <set>

class CValidationState;

/** Answers whether an address may sign reward batches or administer caps. */
class CRelayerAuthority
{
public:
    virtual ~CRelayerAuthority() {}
    virtual bool HasRelayerRole(const CKeyID& address) const = 0;
    virtual bool IsAdmin(const CKeyID& address) const = 0;
};

/**
 * Role registry with a single admin. The admin grants and revokes the
 * relayer role and administers the daily caps; it is not a relayer itself
 * unless granted.
 */
class CRoleRegistry : public CRelayerAuthority
{
private:
    mutable RecursiveMutex cs_roles;
    const CKeyID m_admin;
    std::set<CKeyID> m_relayers;

public:
    explicit CRoleRegistry(const CKeyID& admin);

    const CKeyID& GetAdmin() const { return m_admin; }
    bool IsAdmin(const CKeyID& address) const override { return address == m_admin; }

    /** @return false with UNAUTHORIZED when caller is not the admin */
    bool GrantRelayer(const CKeyID& caller, const CKeyID& relayer, CValidationState& state);
    bool RevokeRelayer(const CKeyID& caller, const CKeyID& relayer, CValidationState& state);

    bool HasRelayerRole(const CKeyID& address) const override;
    size_t RelayerCount() const;
};

#endif // QOBI_AUTHORITY_H
