// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/merkleaccumulator.h"

#include "consensus/validation.h"
#include "distribution/distribution.h"
#include "hash.h"
#include "logging.h"

#include <stdexcept>

static std::vector<uint256> BuildEmptyHashes()
{
    std::vector<uint256> vEmpty(MAX_MERKLE_DEPTH + 1);
    // vEmpty[0] is the null leaf
    for (size_t i = 1; i <= MAX_MERKLE_DEPTH; i++) {
        vEmpty[i] = CMerkleAccumulator::HashNodes(vEmpty[i - 1], vEmpty[i - 1]);
    }
    return vEmpty;
}

const uint256& CMerkleAccumulator::EmptyHash(int nLevel)
{
    static const std::vector<uint256> vEmpty = BuildEmptyHashes();
    if (nLevel < 0 || (size_t)nLevel > MAX_MERKLE_DEPTH) {
        throw std::out_of_range("CMerkleAccumulator::EmptyHash: level out of range");
    }
    return vEmpty[nLevel];
}

uint256 CMerkleAccumulator::HashNodes(const uint256& left, const uint256& right)
{
    return Hash(left.begin(), left.end(), right.begin(), right.end());
}

CMerkleAccumulator::CMerkleAccumulator(int nDepth)
    : m_depth(nDepth), m_next_index(0)
{
    if (nDepth < 0 || (size_t)nDepth > MAX_MERKLE_DEPTH) {
        throw std::invalid_argument(strprintf("CMerkleAccumulator: depth %d out of range", nDepth));
    }
    m_root = EmptyHash(m_depth);
    m_filled_subtrees.resize(m_depth);
    for (int l = 0; l < m_depth; l++) {
        m_filled_subtrees[l] = EmptyHash(l);
    }
    m_levels.resize(m_depth + 1);
}

bool CMerkleAccumulator::Insert(const uint256& leaf, uint64_t& nIndexOut, CValidationState& state)
{
    if (IsFull()) {
        return state.Invalid(DistributionError::TREE_FULL, false, REJECT_INVALID, "tree-full",
                             strprintf("capacity %d reached", Capacity()));
    }

    const uint64_t nIndex = m_next_index;
    uint64_t nPos = nIndex;
    uint256 current = leaf;
    m_levels[0].push_back(leaf);

    for (int l = 0; l < m_depth; l++) {
        uint256 left, right;
        if ((nPos & 1) == 0) {
            // Right sibling is still empty; cache this node as the left subtree
            left = current;
            right = EmptyHash(l);
            m_filled_subtrees[l] = current;
        } else {
            left = m_filled_subtrees[l];
            right = current;
        }
        current = HashNodes(left, right);
        nPos >>= 1;

        std::vector<uint256>& level = m_levels[l + 1];
        if (nPos < level.size()) {
            level[nPos] = current;
        } else {
            level.push_back(current);
        }
    }

    m_root = current;
    m_next_index++;
    nIndexOut = nIndex;

    LogPrint(BCLog::MERKLE, "%s: leaf %d -> root %s\n", __func__, nIndex, m_root.ToString());
    return true;
}

bool CMerkleAccumulator::GenerateProof(uint64_t nIndex, std::vector<uint256>& vProof, CValidationState& state) const
{
    if (nIndex >= m_next_index) {
        return state.Invalid(DistributionError::PROOF_INVALID, false, REJECT_INVALID, "proof-index-unset",
                             strprintf("index %d, size %d", nIndex, m_next_index));
    }

    vProof.clear();
    vProof.reserve(m_depth);
    uint64_t nPos = nIndex;
    for (int l = 0; l < m_depth; l++) {
        const uint64_t nSibling = nPos ^ 1;
        const std::vector<uint256>& level = m_levels[l];
        vProof.push_back(nSibling < level.size() ? level[nSibling] : EmptyHash(l));
        nPos >>= 1;
    }
    return true;
}

bool CMerkleAccumulator::VerifyProof(const uint256& root, const uint256& leaf, uint64_t nIndex,
                                     const std::vector<uint256>& vProof)
{
    if (vProof.size() > MAX_MERKLE_DEPTH) {
        LogPrint(BCLog::MERKLE, "VerifyProof: proof too long (%u > %u)\n", vProof.size(), MAX_MERKLE_DEPTH);
        return false;
    }
    if ((nIndex >> vProof.size()) != 0) {
        LogPrint(BCLog::MERKLE, "VerifyProof: index %d out of range for proof size %u\n", nIndex, vProof.size());
        return false;
    }

    uint256 current = leaf;
    uint64_t idx = nIndex;
    for (const uint256& sibling : vProof) {
        if (idx & 1) {
            // Current is right child - hash(sibling, current)
            current = HashNodes(sibling, current);
        } else {
            // Current is left child - hash(current, sibling)
            current = HashNodes(current, sibling);
        }
        idx >>= 1;
    }

    return current == root;
}

bool CMerkleAccumulator::ComputeStaticRoot(const std::vector<uint256>& vLeaves, int nDepth, uint256& rootOut)
{
    if (nDepth < 0 || (size_t)nDepth > MAX_MERKLE_DEPTH || vLeaves.size() > (uint64_t(1) << nDepth)) {
        return false;
    }

    std::vector<uint256> level = vLeaves;
    for (int l = 0; l < nDepth && !level.empty(); l++) {
        std::vector<uint256> next;
        next.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            const uint256& right = i + 1 < level.size() ? level[i + 1] : EmptyHash(l);
            next.push_back(HashNodes(level[i], right));
        }
        level.swap(next);
    }

    rootOut = level.empty() ? EmptyHash(nDepth) : level[0];
    return true;
}
