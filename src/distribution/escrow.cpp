// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/escrow.h"

#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

CEscrowVault::CEscrowVault(CAmount nFunding) : nBalance(nFunding), nReleased(0) {}

bool CEscrowVault::Fund(CAmount nAmount)
{
    LOCK(cs_vault);
    if (!CheckedAdd(nBalance, nAmount, nBalance)) {
        return error("%s: funding %s overflows balance %s", __func__, FormatMoney(nAmount), FormatMoney(nBalance));
    }
    LogPrint(BCLog::ESCROW, "%s: funded %s, balance %s\n", __func__, FormatMoney(nAmount), FormatMoney(nBalance));
    return true;
}

bool CEscrowVault::Transfer(const CKeyID& to, CAmount nAmount, std::string& strError)
{
    LOCK(cs_vault);
    if (nAmount > nBalance) {
        strError = strprintf("insufficient escrow balance (%s < %s)", FormatMoney(nBalance), FormatMoney(nAmount));
        LogPrint(BCLog::ESCROW, "%s: %s\n", __func__, strError);
        return false;
    }
    CAmount& nCredited = mapCredited[to];
    if (!CheckedAdd(nCredited, nAmount, nCredited)) {
        strError = "recipient balance overflows";
        return false;
    }
    nBalance -= nAmount;
    nReleased += nAmount;
    LogPrint(BCLog::ESCROW, "%s: %s -> %s, balance %s\n", __func__, FormatMoney(nAmount),
             HexStr(to.begin(), to.end()), FormatMoney(nBalance));
    return true;
}

bool CEscrowVault::Reverse(const CKeyID& to, CAmount nAmount, std::string& strError)
{
    LOCK(cs_vault);
    auto it = mapCredited.find(to);
    if (it == mapCredited.end() || it->second < nAmount || nReleased < nAmount) {
        strError = strprintf("nothing to reverse for %s", HexStr(to.begin(), to.end()));
        return false;
    }
    CAmount nNewBalance = 0;
    if (!CheckedAdd(nBalance, nAmount, nNewBalance)) {
        strError = "escrow balance overflows";
        return false;
    }
    it->second -= nAmount;
    if (it->second == 0) mapCredited.erase(it);
    nBalance = nNewBalance;
    nReleased -= nAmount;
    LogPrint(BCLog::ESCROW, "%s: %s <- %s, balance %s\n", __func__, FormatMoney(nAmount),
             HexStr(to.begin(), to.end()), FormatMoney(nBalance));
    return true;
}

CAmount CEscrowVault::GetBalance() const
{
    LOCK(cs_vault);
    return nBalance;
}

CAmount CEscrowVault::GetReleased() const
{
    LOCK(cs_vault);
    return nReleased;
}

CAmount CEscrowVault::GetCredited(const CKeyID& address) const
{
    LOCK(cs_vault);
    auto it = mapCredited.find(address);
    return it == mapCredited.end() ? 0 : it->second;
}
