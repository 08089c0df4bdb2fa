// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_ESCROW_H
#define QOBI_ESCROW_H

#include "amount.h"
#include "pubkey.h"
#include "sync.h"

#include <map>
#include <string>

/** Releases reward value to a claimant. */
class CValueTransfer
{
public:
    virtual ~CValueTransfer() {}

    /** @return false with strError set when nothing was transferred */
    virtual bool Transfer(const CKeyID& to, CAmount nAmount, std::string& strError) = 0;

    /** Undo a completed Transfer(to, nAmount) whose claim could not be stored. */
    virtual bool Reverse(const CKeyID& to, CAmount nAmount, std::string& strError) = 0;
};

/**
 * Escrow funded up front with the rewards of all distributions. Claims are
 * paid from its balance; whatever is never claimed stays locked here.
 */
class CEscrowVault : public CValueTransfer
{
private:
    mutable RecursiveMutex cs_vault;
    CAmount nBalance;
    CAmount nReleased;
    std::map<CKeyID, CAmount> mapCredited;

public:
    explicit CEscrowVault(CAmount nFunding = 0);

    /** Add to the balance. False on overflow. */
    bool Fund(CAmount nAmount);

    bool Transfer(const CKeyID& to, CAmount nAmount, std::string& strError) override;
    bool Reverse(const CKeyID& to, CAmount nAmount, std::string& strError) override;

    CAmount GetBalance() const;
    CAmount GetReleased() const;
    /** Total credited to an address, 0 when never paid. */
    CAmount GetCredited(const CKeyID& address) const;
};

#endif // QOBI_ESCROW_H
