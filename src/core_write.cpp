// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "distribution/distribution.h"
#include <univalue.h>
#include "utilmoneystr.h"
#include "utilstrencodings.h"

std::string EncodeAddress(const CKeyID& address)
{
    return "0x" + HexStr(address.begin(), address.end());
}

UniValue SlotToJSON(const CDistributionSlot& slot)
{
    UniValue entry(UniValue::VOBJ);
    entry.pushKV("day", (int64_t)slot.nDay);
    entry.pushKV("category", (int)slot.nCategory);
    entry.pushKV("categoryname", GetCategoryName(slot.nCategory));
    entry.pushKV("subBatch", (int)slot.nSubBatch);
    return entry;
}

UniValue DistributionRecordToJSON(const CDistributionRecord& record)
{
    UniValue entry = SlotToJSON(record.slot);
    entry.pushKV("root", record.root.GetHex());
    entry.pushKV("userCount", (int64_t)record.nUserCount);
    entry.pushKV("totalReward", std::to_string(record.nTotalReward));
    entry.pushKV("totalRewardFormatted", FormatMoney(record.nTotalReward));
    entry.pushKV("finalized", record.fFinalized);
    entry.pushKV("createdAt", record.nCreatedAt);
    entry.pushKV("signer", EncodeAddress(record.signer));
    entry.pushKV("nonce", std::to_string(record.nNonce));
    return entry;
}

UniValue ClaimRecordToJSON(const CClaimRecord& claim)
{
    UniValue entry = SlotToJSON(claim.slot);
    entry.pushKV("user", EncodeAddress(claim.user));
    entry.pushKV("points", std::to_string(claim.nPoints));
    entry.pushKV("amount", std::to_string(claim.nAmount));
    entry.pushKV("index", (int64_t)claim.nIndex);
    entry.pushKV("claimedAt", claim.nClaimedAt);
    return entry;
}

UniValue ClaimTicketToJSON(const CClaimTicket& ticket)
{
    UniValue entry(UniValue::VOBJ);
    entry.pushKV("user", EncodeAddress(ticket.user));
    entry.pushKV("points", std::to_string(ticket.nPoints));
    entry.pushKV("amount", std::to_string(ticket.nAmount));
    entry.pushKV("index", (int64_t)ticket.nIndex);
    UniValue proof(UniValue::VARR);
    for (const uint256& hash : ticket.vProof) {
        proof.push_back(hash.GetHex());
    }
    entry.pushKV("proof", proof);
    return entry;
}

UniValue ClaimBundleToJSON(const CClaimBundle& bundle)
{
    UniValue entry(UniValue::VOBJ);
    entry.pushKV("day", (int64_t)bundle.slot.nDay);
    entry.pushKV("category", (int)bundle.slot.nCategory);
    entry.pushKV("subBatch", (int)bundle.slot.nSubBatch);
    entry.pushKV("root", bundle.root.GetHex());
    UniValue claims(UniValue::VARR);
    for (const CClaimTicket& ticket : bundle.vClaims) {
        claims.push_back(ClaimTicketToJSON(ticket));
    }
    entry.pushKV("claims", claims);
    return entry;
}

std::string EncodeClaimBundle(const CClaimBundle& bundle, unsigned int nIndent)
{
    return ClaimBundleToJSON(bundle).write(nIndent);
}
