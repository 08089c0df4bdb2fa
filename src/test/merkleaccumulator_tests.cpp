// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Merkle accumulator tests
 *
 * Tests:
 *   1. Empty tree roots and depth bounds
 *   2. Incremental root matches the static root after every insert
 *   3. Proofs of every leaf verify, wrong index/leaf/sibling do not
 *   4. Capacity exhaustion
 */

#include "consensus/validation.h"
#include "distribution/distribution.h"
#include "distribution/merkleaccumulator.h"
#include "random.h"
#include "test/test_qobi.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_FIXTURE_TEST_SUITE(merkleaccumulator_tests, BasicTestingSetup)

static std::vector<uint256> RandomLeaves(size_t n)
{
    std::vector<uint256> vLeaves;
    for (size_t i = 0; i < n; i++) {
        vLeaves.push_back(GetRandHash());
    }
    return vLeaves;
}

// =============================================================================
// Test 1: Empty tree
// =============================================================================
BOOST_AUTO_TEST_CASE(empty_tree)
{
    BOOST_CHECK(CMerkleAccumulator::EmptyHash(0).IsNull());
    BOOST_CHECK(CMerkleAccumulator::EmptyHash(1) ==
                CMerkleAccumulator::HashNodes(uint256(), uint256()));

    CMerkleAccumulator tree(9);
    BOOST_CHECK_EQUAL(tree.Depth(), 9);
    BOOST_CHECK_EQUAL(tree.Capacity(), 512U);
    BOOST_CHECK_EQUAL(tree.Size(), 0U);
    BOOST_CHECK(!tree.IsFull());
    BOOST_CHECK(tree.Root() == CMerkleAccumulator::EmptyHash(9));

    uint256 root;
    BOOST_CHECK(CMerkleAccumulator::ComputeStaticRoot({}, 9, root));
    BOOST_CHECK(root == tree.Root());

    BOOST_CHECK_THROW(CMerkleAccumulator(-1), std::invalid_argument);
    BOOST_CHECK_THROW(CMerkleAccumulator((int)MAX_MERKLE_DEPTH + 1), std::invalid_argument);
    BOOST_CHECK_NO_THROW(CMerkleAccumulator((int)MAX_MERKLE_DEPTH));
}

// =============================================================================
// Test 2: Incremental root == static root
// =============================================================================
BOOST_AUTO_TEST_CASE(incremental_matches_static)
{
    const int nDepth = 5;
    const std::vector<uint256> vLeaves = RandomLeaves(32);

    CMerkleAccumulator tree(nDepth);
    std::vector<uint256> vInserted;
    for (const uint256& leaf : vLeaves) {
        uint64_t nIndex;
        CValidationState state;
        BOOST_REQUIRE(tree.Insert(leaf, nIndex, state));
        BOOST_CHECK_EQUAL(nIndex, vInserted.size());
        vInserted.push_back(leaf);

        uint256 root;
        BOOST_REQUIRE(CMerkleAccumulator::ComputeStaticRoot(vInserted, nDepth, root));
        BOOST_CHECK(tree.Root() == root);
    }
    BOOST_CHECK(tree.IsFull());
}

BOOST_AUTO_TEST_CASE(single_leaf_depth_zero)
{
    const uint256 leaf = GetRandHash();
    CMerkleAccumulator tree(0);
    uint64_t nIndex;
    CValidationState state;
    BOOST_REQUIRE(tree.Insert(leaf, nIndex, state));
    BOOST_CHECK(tree.Root() == leaf);

    std::vector<uint256> vProof;
    BOOST_REQUIRE(tree.GenerateProof(0, vProof, state));
    BOOST_CHECK(vProof.empty());
    BOOST_CHECK(CMerkleAccumulator::VerifyProof(leaf, leaf, 0, vProof));
    BOOST_CHECK(!CMerkleAccumulator::VerifyProof(leaf, leaf, 1, vProof));
}

// =============================================================================
// Test 3: Proofs
// =============================================================================
BOOST_AUTO_TEST_CASE(proofs_verify)
{
    const std::vector<uint256> vLeaves = RandomLeaves(13);
    CMerkleAccumulator tree(4);
    for (const uint256& leaf : vLeaves) {
        uint64_t nIndex;
        CValidationState state;
        BOOST_REQUIRE(tree.Insert(leaf, nIndex, state));
    }

    for (size_t i = 0; i < vLeaves.size(); i++) {
        std::vector<uint256> vProof;
        CValidationState state;
        BOOST_REQUIRE(tree.GenerateProof(i, vProof, state));
        BOOST_CHECK_EQUAL(vProof.size(), 4U);
        BOOST_CHECK(CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[i], i, vProof));

        // Wrong index, wrong leaf
        BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[i], i ^ 1, vProof));
        BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), GetRandHash(), i, vProof));
    }
}

BOOST_AUTO_TEST_CASE(proofs_reject_tampering)
{
    const std::vector<uint256> vLeaves = RandomLeaves(8);
    CMerkleAccumulator tree(3);
    for (const uint256& leaf : vLeaves) {
        uint64_t nIndex;
        CValidationState state;
        BOOST_REQUIRE(tree.Insert(leaf, nIndex, state));
    }

    std::vector<uint256> vProof;
    CValidationState state;
    BOOST_REQUIRE(tree.GenerateProof(5, vProof, state));
    BOOST_REQUIRE(CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[5], 5, vProof));

    for (size_t i = 0; i < vProof.size(); i++) {
        std::vector<uint256> vBad = vProof;
        *vBad[i].begin() ^= 0x01;
        BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[5], 5, vBad));
    }

    std::vector<uint256> vShort(vProof.begin(), vProof.end() - 1);
    BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[5], 5, vShort));

    // Index bits beyond the proof length
    BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[5], 5 + 8, vProof));

    std::vector<uint256> vLong(MAX_MERKLE_DEPTH + 1);
    BOOST_CHECK(!CMerkleAccumulator::VerifyProof(tree.Root(), vLeaves[5], 0, vLong));
}

BOOST_AUTO_TEST_CASE(proof_of_unset_index)
{
    CMerkleAccumulator tree(3);
    uint64_t nIndex;
    CValidationState state;
    BOOST_REQUIRE(tree.Insert(GetRandHash(), nIndex, state));

    std::vector<uint256> vProof;
    BOOST_CHECK(!tree.GenerateProof(1, vProof, state));
    BOOST_CHECK(state.GetError() == DistributionError::PROOF_INVALID);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "proof-index-unset");
}

BOOST_AUTO_TEST_CASE(proofs_stay_valid_for_partial_tree)
{
    // Proofs taken before later inserts verify against the root at that time
    CMerkleAccumulator tree(4);
    std::vector<uint256> vRoots;
    std::vector<std::vector<uint256>> vProofs;
    const std::vector<uint256> vLeaves = RandomLeaves(6);
    for (const uint256& leaf : vLeaves) {
        uint64_t nIndex;
        CValidationState state;
        BOOST_REQUIRE(tree.Insert(leaf, nIndex, state));
        std::vector<uint256> vProof;
        BOOST_REQUIRE(tree.GenerateProof(nIndex, vProof, state));
        vRoots.push_back(tree.Root());
        vProofs.push_back(vProof);
    }
    for (size_t i = 0; i < vLeaves.size(); i++) {
        BOOST_CHECK(CMerkleAccumulator::VerifyProof(vRoots[i], vLeaves[i], i, vProofs[i]));
    }
}

// =============================================================================
// Test 4: Capacity
// =============================================================================
BOOST_AUTO_TEST_CASE(tree_full)
{
    CMerkleAccumulator tree(2);
    for (int i = 0; i < 4; i++) {
        uint64_t nIndex;
        CValidationState state;
        BOOST_REQUIRE(tree.Insert(GetRandHash(), nIndex, state));
    }
    BOOST_CHECK(tree.IsFull());

    const uint256 rootBefore = tree.Root();
    uint64_t nIndex = 99;
    CValidationState state;
    BOOST_CHECK(!tree.Insert(GetRandHash(), nIndex, state));
    BOOST_CHECK(state.GetError() == DistributionError::TREE_FULL);
    BOOST_CHECK_EQUAL(nIndex, 99U);
    BOOST_CHECK_EQUAL(tree.Size(), 4U);
    BOOST_CHECK(tree.Root() == rootBefore);

    uint256 root;
    BOOST_CHECK(!CMerkleAccumulator::ComputeStaticRoot(RandomLeaves(5), 2, root));
}

BOOST_AUTO_TEST_SUITE_END()
