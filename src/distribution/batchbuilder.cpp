// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/batchbuilder.h"

#include "distribution/merkleaccumulator.h"
#include "hash.h"
#include "logging.h"
#include "utilmoneystr.h"

#include <algorithm>

CClaimBundle BatchResult::GetBundle() const
{
    CClaimBundle bundle;
    bundle.slot = slot;
    bundle.root = root;
    bundle.vClaims = vTickets;
    return bundle;
}

int DepthForSize(size_t nLeaves)
{
    int nDepth = 0;
    while ((uint64_t(1) << nDepth) < nLeaves) {
        nDepth++;
    }
    return nDepth;
}

// Levels of the padded static tree, leaves first. The last level holds the root.
static std::vector<std::vector<uint256>> BuildLevels(const std::vector<uint256>& vLeaves, int nDepth)
{
    std::vector<std::vector<uint256>> vLevels;
    vLevels.reserve(nDepth + 1);
    vLevels.push_back(vLeaves);
    for (int l = 0; l < nDepth; l++) {
        const std::vector<uint256>& level = vLevels.back();
        std::vector<uint256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            const uint256& right = i + 1 < level.size() ? level[i + 1] : CMerkleAccumulator::EmptyHash(l);
            next.push_back(CMerkleAccumulator::HashNodes(level[i], right));
        }
        vLevels.push_back(std::move(next));
    }
    return vLevels;
}

BatchResult BuildRewardBatch(const CDistributionSlot& slot,
                             const std::vector<CRewardEntry>& entries,
                             uint64_t nCapacity)
{
    BatchResult result;
    result.slot = slot;

    if (entries.empty()) {
        result.error = "empty batch";
        return result;
    }
    if (entries.size() > nCapacity) {
        result.error = strprintf("batch of %u entries exceeds capacity %d", entries.size(), nCapacity);
        return result;
    }

    std::vector<uint256> vLeaves;
    vLeaves.reserve(entries.size());
    CAmount nTotal = 0;
    for (const CRewardEntry& entry : entries) {
        if (!CheckedAdd(nTotal, entry.nAmount, nTotal)) {
            result.error = "total reward overflows";
            return result;
        }
        vLeaves.push_back(ComputeRewardLeaf(entry));
    }

    const int nDepth = DepthForSize(entries.size());
    const std::vector<std::vector<uint256>> vLevels = BuildLevels(vLeaves, nDepth);

    result.vTickets.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); i++) {
        CClaimTicket ticket;
        ticket.user = entries[i].user;
        ticket.nPoints = entries[i].nPoints;
        ticket.nAmount = entries[i].nAmount;
        ticket.nIndex = (uint32_t)i;

        size_t nPos = i;
        for (int l = 0; l < nDepth; l++) {
            const size_t nSibling = nPos ^ 1;
            const std::vector<uint256>& level = vLevels[l];
            ticket.vProof.push_back(nSibling < level.size() ? level[nSibling] : CMerkleAccumulator::EmptyHash(l));
            nPos >>= 1;
        }
        result.vTickets.push_back(std::move(ticket));
    }

    result.root = vLevels.back()[0];
    result.nDepth = nDepth;
    result.nTotalReward = nTotal;
    result.success = true;

    LogPrint(BCLog::MERKLE, "%s: slot %s, %u entries, depth %d, total %s, root %s\n",
             __func__, slot.ToString(), entries.size(), nDepth, FormatMoney(nTotal), result.root.ToString());
    return result;
}

bool ComputeBatchRoot(const std::vector<CKeyID>& users,
                      const std::vector<uint64_t>& points,
                      const std::vector<CAmount>& amounts,
                      uint64_t nCapacity,
                      uint256& rootOut,
                      std::string& strError)
{
    if (users.empty()) {
        strError = "empty batch";
        return false;
    }
    if (users.size() != points.size() || users.size() != amounts.size()) {
        strError = strprintf("length mismatch (users=%u, points=%u, amounts=%u)",
                             users.size(), points.size(), amounts.size());
        return false;
    }
    if (users.size() > nCapacity) {
        strError = strprintf("batch of %u entries exceeds capacity %d", users.size(), nCapacity);
        return false;
    }

    std::vector<uint256> vLeaves;
    vLeaves.reserve(users.size());
    for (size_t i = 0; i < users.size(); i++) {
        vLeaves.push_back(ComputeRewardLeaf(users[i], points[i], amounts[i]));
    }
    return ComputeBatchRoot(vLeaves, DepthForSize(vLeaves.size()), rootOut);
}

bool ComputeBatchRoot(const std::vector<uint256>& vLeaves, int nDepth, uint256& rootOut)
{
    return CMerkleAccumulator::ComputeStaticRoot(vLeaves, nDepth, rootOut);
}

std::vector<std::vector<CRewardEntry>> SplitRewardCohort(const std::vector<CRewardEntry>& entries,
                                                         size_t nMaxBatchSize)
{
    std::vector<std::vector<CRewardEntry>> vChunks;
    if (nMaxBatchSize == 0) return vChunks;
    for (size_t nStart = 0; nStart < entries.size(); nStart += nMaxBatchSize) {
        const size_t nEnd = std::min(entries.size(), nStart + nMaxBatchSize);
        vChunks.emplace_back(entries.begin() + nStart, entries.begin() + nEnd);
    }
    return vChunks;
}

uint256 ComputeUsersDigest(const std::vector<CKeyID>& users)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << users;
    return ss.GetHash();
}

uint256 ComputePointsDigest(const std::vector<uint64_t>& points)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << points;
    return ss.GetHash();
}

uint256 ComputeAmountsDigest(const std::vector<CAmount>& amounts)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << amounts;
    return ss.GetHash();
}

bool ComputeTotalReward(const std::vector<CAmount>& amounts, CAmount& nTotalOut)
{
    CAmount nTotal = 0;
    for (const CAmount& nAmount : amounts) {
        if (!CheckedAdd(nTotal, nAmount, nTotal)) return false;
    }
    nTotalOut = nTotal;
    return true;
}

void UnzipRewardEntries(const std::vector<CRewardEntry>& entries,
                        std::vector<CKeyID>& users,
                        std::vector<uint64_t>& points,
                        std::vector<CAmount>& amounts)
{
    users.clear();
    points.clear();
    amounts.clear();
    users.reserve(entries.size());
    points.reserve(entries.size());
    amounts.reserve(entries.size());
    for (const CRewardEntry& entry : entries) {
        users.push_back(entry.user);
        points.push_back(entry.nPoints);
        amounts.push_back(entry.nAmount);
    }
}
