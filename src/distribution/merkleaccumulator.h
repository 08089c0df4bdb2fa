// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_MERKLEACCUMULATOR_H
#define QOBI_MERKLEACCUMULATOR_H

#include "uint256.h"

#include <stdint.h>
#include <vector>

class CValidationState;

/**
 * Append-only, fixed-depth binary Merkle tree.
 *
 * Leaves are filled left to right. Unset positions hold the canonical empty
 * subtree hash of their level (level 0 = null leaf, level i = H(e[i-1] || e[i-1])),
 * so the root after n inserts equals the static root of those n leaves padded
 * to 2^depth. Parent = double SHA-256 of (left || right).
 *
 * Insert, Root and proof generation are O(depth). The tree also keeps the
 * nodes set so far on every level, which is what GenerateProof reads.
 */
class CMerkleAccumulator
{
private:
    int m_depth;
    uint64_t m_next_index;
    uint256 m_root;

    // Last left child seen on each level (Tornado style frontier)
    std::vector<uint256> m_filled_subtrees;
    // m_levels[l][i] = current value of node i on level l, for every i set so far
    std::vector<std::vector<uint256>> m_levels;

public:
    /** @throws std::invalid_argument when nDepth is outside [0, MAX_MERKLE_DEPTH] */
    explicit CMerkleAccumulator(int nDepth);

    int Depth() const { return m_depth; }
    uint64_t Capacity() const { return uint64_t(1) << m_depth; }
    uint64_t Size() const { return m_next_index; }
    bool IsFull() const { return m_next_index == Capacity(); }

    /** Root of leaves [0, Size()), O(1). */
    const uint256& Root() const { return m_root; }

    /**
     * Append a leaf.
     * @param[out] nIndexOut zero-based position of the leaf
     * @return false with TREE_FULL when Size() == Capacity()
     */
    bool Insert(const uint256& leaf, uint64_t& nIndexOut, CValidationState& state);

    /**
     * Sibling hashes from leaf level to the root for an inserted index.
     * Unset siblings are the empty hash of their level.
     * @return false with PROOF_INVALID when nIndex >= Size()
     */
    bool GenerateProof(uint64_t nIndex, std::vector<uint256>& vProof, CValidationState& state) const;

    /**
     * Fold vProof over leaf, taking the bits of nIndex (low bit first) as the
     * left/right position on each level, and compare with root.
     *
     * Rejects proofs longer than MAX_MERKLE_DEPTH and indices that do not fit
     * in vProof.size() bits.
     */
    static bool VerifyProof(const uint256& root, const uint256& leaf, uint64_t nIndex,
                            const std::vector<uint256>& vProof);

    /**
     * Root of a static tree of depth nDepth holding vLeaves from position 0.
     * Equal to the incremental root after inserting the same leaves in order.
     * @return false when vLeaves does not fit
     */
    static bool ComputeStaticRoot(const std::vector<uint256>& vLeaves, int nDepth, uint256& rootOut);

    /** Empty subtree hash of a level, 0 <= nLevel <= MAX_MERKLE_DEPTH. */
    static const uint256& EmptyHash(int nLevel);

    /** H(left || right) */
    static uint256 HashNodes(const uint256& left, const uint256& right);
};

#endif // QOBI_MERKLEACCUMULATOR_H
