// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "distribution/batchbuilder.h"
#include "distribution/typeddata.h"
#include "hash.h"
#include "key.h"
#include "random.h"
#include "test/test_qobi.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(typeddata_tests, BasicTestingSetup)

static CSubmissionMessage RandomMessage()
{
    CSubmissionMessage msg;
    msg.slot = CDistributionSlot(100, Consensus::CATEGORY_COMMENTS, 1);
    msg.root = GetRandHash();
    msg.usersDigest = GetRandHash();
    msg.pointsDigest = GetRandHash();
    msg.amountsDigest = GetRandHash();
    msg.nNonce = GetRand(1000000);
    msg.nDeadline = TEST_START_TIME + 3600;
    return msg;
}

BOOST_AUTO_TEST_CASE(ecc_sanity)
{
    BOOST_CHECK(ECC_InitSanityCheck());
}

BOOST_AUTO_TEST_CASE(domain_separator_per_network)
{
    const uint256 main = GetDomainSeparator(CreateChainParams(CBaseChainParams::MAIN)->GetConsensus().domain);
    const uint256 test = GetDomainSeparator(CreateChainParams(CBaseChainParams::TESTNET)->GetConsensus().domain);
    const uint256 regtest = GetDomainSeparator(Params().GetConsensus().domain);
    BOOST_CHECK(main != test);
    BOOST_CHECK(main != regtest);
    BOOST_CHECK(test != regtest);

    Consensus::SigningDomain domain = Params().GetConsensus().domain;
    BOOST_CHECK(GetDomainSeparator(domain) == regtest);
    domain.strVersion = "2";
    BOOST_CHECK(GetDomainSeparator(domain) != regtest);
}

BOOST_AUTO_TEST_CASE(domain_separator_uses_own_type_strings)
{
    // Double SHA-256 digests must not pass for keccak256 typed data
    BOOST_CHECK_EQUAL(DOMAIN_TYPE.compare(0, 11, "QOBIDomain("), 0);
    BOOST_CHECK_EQUAL(SUBMISSION_TYPE.compare(0, 16, "QOBISubmitBatch("), 0);
    BOOST_CHECK(DOMAIN_TYPE.find("EIP712") == std::string::npos);

    const Consensus::SigningDomain& domain = Params().GetConsensus().domain;
    CHashWriter ss(SER_GETHASH, 0);
    ss << HashString(DOMAIN_TYPE) << HashString(domain.strName) << HashString(domain.strVersion)
       << domain.nChainId << domain.verifyingContract;
    BOOST_CHECK(GetDomainSeparator(domain) == ss.GetHash());
}

BOOST_AUTO_TEST_CASE(digest_binds_every_field)
{
    const Consensus::SigningDomain& domain = Params().GetConsensus().domain;
    const CSubmissionMessage msg = RandomMessage();
    const uint256 digest = GetSubmissionDigest(domain, msg);
    BOOST_CHECK(digest == GetSubmissionDigest(domain, msg));

    // 0x19 0x01 || domain separator || struct hash
    const uint256 domainSeparator = GetDomainSeparator(domain);
    const uint256 structHash = GetSubmissionStructHash(msg);
    std::vector<unsigned char> vch = {0x19, 0x01};
    vch.insert(vch.end(), domainSeparator.begin(), domainSeparator.end());
    vch.insert(vch.end(), structHash.begin(), structHash.end());
    BOOST_CHECK(digest == Hash(vch.begin(), vch.end()));

    CSubmissionMessage m = msg;
    m.slot.nDay++;
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.slot.nCategory++;
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.slot.nSubBatch++;
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.root = GetRandHash();
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.usersDigest = GetRandHash();
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.pointsDigest = GetRandHash();
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.amountsDigest = GetRandHash();
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.nNonce++;
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
    m = msg;
    m.nDeadline++;
    BOOST_CHECK(GetSubmissionDigest(domain, m) != digest);
}

BOOST_AUTO_TEST_CASE(sign_and_recover)
{
    const Consensus::SigningDomain& domain = Params().GetConsensus().domain;
    const CKey key = GenerateKey();
    const CSubmissionMessage msg = RandomMessage();

    std::vector<unsigned char> vchSig;
    BOOST_REQUIRE(SignSubmission(key, domain, msg, vchSig));
    BOOST_CHECK_EQUAL(vchSig.size(), 65U);

    CKeyID signer;
    BOOST_REQUIRE(RecoverSubmissionSigner(domain, msg, vchSig, signer));
    BOOST_CHECK(signer == key.GetPubKey().GetID());

    // Another message recovers another key
    CSubmissionMessage other = msg;
    other.nNonce++;
    CKeyID otherSigner;
    if (RecoverSubmissionSigner(domain, other, vchSig, otherSigner)) {
        BOOST_CHECK(otherSigner != signer);
    }

    std::vector<unsigned char> vchShort(vchSig.begin(), vchSig.end() - 1);
    BOOST_CHECK(!RecoverSubmissionSigner(domain, msg, vchShort, signer));
    BOOST_CHECK(!RecoverSubmissionSigner(domain, msg, {}, signer));
}

BOOST_AUTO_TEST_CASE(message_commits_to_entry_lists)
{
    const std::vector<CRewardEntry> entries = MakeRewardEntries(3, CENT);
    std::vector<CKeyID> users;
    std::vector<uint64_t> points;
    std::vector<CAmount> amounts;
    UnzipRewardEntries(entries, users, points, amounts);

    CBatchSubmission submission;
    submission.slot = CDistributionSlot(100, Consensus::CATEGORY_CREATE);
    submission.vUsers = users;
    submission.vPoints = points;
    submission.vAmounts = amounts;
    const CSubmissionMessage msg = submission.GetMessage();
    BOOST_CHECK(msg.usersDigest == ComputeUsersDigest(users));
    BOOST_CHECK(msg.pointsDigest == ComputePointsDigest(points));
    BOOST_CHECK(msg.amountsDigest == ComputeAmountsDigest(amounts));

    submission.vAmounts[2]++;
    BOOST_CHECK(submission.GetMessage().amountsDigest != msg.amountsDigest);
}

BOOST_AUTO_TEST_SUITE_END()
