// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "core_io.h"
#include "distribution/distribution.h"
#include "util/system.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include "test/test_qobi.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

// =============================================================================
// Money
// =============================================================================
BOOST_AUTO_TEST_CASE(util_FormatMoney)
{
    BOOST_CHECK_EQUAL(FormatMoney(0), "0.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN), "1.00");
    BOOST_CHECK_EQUAL(FormatMoney(149 * CENT), "1.49");
    BOOST_CHECK_EQUAL(FormatMoney(5 * CENT), "0.05");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 2), "0.50");
    BOOST_CHECK_EQUAL(FormatMoney(1), "0.000000000000000001");
    BOOST_CHECK_EQUAL(FormatMoney(1195 * CENT, true), "+11.95");
}

BOOST_AUTO_TEST_CASE(util_ParseMoney)
{
    CAmount ret = 0;
    BOOST_CHECK(ParseMoney("1.49", ret));
    BOOST_CHECK_EQUAL(ret, 149 * CENT);
    BOOST_CHECK(ParseMoney("0.05", ret));
    BOOST_CHECK_EQUAL(ret, 5 * CENT);
    BOOST_CHECK(ParseMoney("11.95", ret));
    BOOST_CHECK_EQUAL(ret, 1195 * CENT);
    BOOST_CHECK(ParseMoney("0.000000000000000001", ret));
    BOOST_CHECK_EQUAL(ret, 1U);
    BOOST_CHECK(ParseMoney(" 2 ", ret));
    BOOST_CHECK_EQUAL(ret, 2 * COIN);
    BOOST_CHECK(ParseMoney("18.44", ret));

    // Above 2^64 base units
    BOOST_CHECK(!ParseMoney("18.45", ret));
    BOOST_CHECK(!ParseMoney("100", ret));
    BOOST_CHECK(!ParseMoney("", ret));
    BOOST_CHECK(!ParseMoney("1.0x", ret));
    BOOST_CHECK(!ParseMoney("-1", ret));
    BOOST_CHECK(!ParseMoney("01", ret));

    CAmount n;
    BOOST_CHECK(ParseAmountString("500000000000000000", n));
    BOOST_CHECK_EQUAL(n, COIN / 2);
    BOOST_CHECK(!ParseAmountString("0.5", n));
}

BOOST_AUTO_TEST_CASE(checked_add)
{
    CAmount nSum = 7;
    BOOST_CHECK(CheckedAdd(COIN, COIN, nSum));
    BOOST_CHECK_EQUAL(nSum, 2 * COIN);
    BOOST_CHECK(!CheckedAdd(UINT64_MAX, 1, nSum));
    BOOST_CHECK_EQUAL(nSum, 2 * COIN);
}

// =============================================================================
// Categories and days
// =============================================================================
BOOST_AUTO_TEST_CASE(categories)
{
    BOOST_CHECK_EQUAL(GetCategoryName(Consensus::CATEGORY_CREATE), "create");
    BOOST_CHECK_EQUAL(GetCategoryName(Consensus::CATEGORY_REFERRALS), "referrals");
    BOOST_CHECK_EQUAL(GetCategoryName(Consensus::MAX_REWARD_CATEGORIES), "unknown");

    uint8_t n = 0;
    BOOST_CHECK(ParseCategory("Tipping", n));
    BOOST_CHECK_EQUAL(n, Consensus::CATEGORY_TIPPING);
    BOOST_CHECK(ParseCategory("5", n));
    BOOST_CHECK_EQUAL(n, Consensus::CATEGORY_REFERRALS);
    BOOST_CHECK(!ParseCategory("6", n));
    BOOST_CHECK(!ParseCategory("shares", n));

    BOOST_CHECK_EQUAL(CDistributionSlot(100, Consensus::CATEGORY_LIKES, 2).ToString(), "100/likes/2");
    BOOST_CHECK(CDistributionSlot(100, 5, 0) < CDistributionSlot(100, 5, 1));
    BOOST_CHECK(CDistributionSlot(99, 5, 9) < CDistributionSlot(100, 0, 0));
}

BOOST_AUTO_TEST_CASE(day_index)
{
    BOOST_CHECK_EQUAL(GetDayIndex(0), 0U);
    BOOST_CHECK_EQUAL(GetDayIndex(DISTRIBUTION_DAY_SECONDS - 1), 0U);
    BOOST_CHECK_EQUAL(GetDayIndex(DISTRIBUTION_DAY_SECONDS), 1U);
    BOOST_CHECK_EQUAL(GetDayIndex(-5), 0U);
    BOOST_CHECK_EQUAL(GetDayIndex(GetTime()), 100U);
}

// =============================================================================
// Arguments
// =============================================================================
BOOST_AUTO_TEST_CASE(parse_parameters)
{
    ArgsManager args;
    const char* argv[] = {"qobid", "-rootpolicy=trusted", "--relayer=0xaa", "-relayer=0xbb", "-noprinttoconsole", "-regtest"};
    std::string strError;
    BOOST_REQUIRE(args.ParseParameters(6, argv, strError));

    BOOST_CHECK_EQUAL(args.GetArg("-rootpolicy", "rederive"), "trusted");
    BOOST_CHECK_EQUAL(args.GetArgs("-relayer").size(), 2U);
    BOOST_CHECK_EQUAL(args.GetArg("-relayer", ""), "0xbb");
    BOOST_CHECK(args.IsArgNegated("-printtoconsole"));
    BOOST_CHECK(!args.GetBoolArg("-printtoconsole", true));
    BOOST_CHECK_EQUAL(args.GetChainName(), CBaseChainParams::REGTEST);
    BOOST_CHECK_EQUAL(args.GetArg("-dbcache", 8), 8);

    const char* bad[] = {"qobid", "rootpolicy=trusted"};
    BOOST_CHECK(!args.ParseParameters(2, bad, strError));

    const char* both[] = {"qobid", "-regtest", "-testnet"};
    BOOST_REQUIRE(args.ParseParameters(3, both, strError));
    BOOST_CHECK_THROW(args.GetChainName(), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(config_file)
{
    {
        fs::ofstream file(pathTemp / QOBI_CONF_FILENAME);
        file << "# relayer node\n";
        file << "rootpolicy = trusted\n";
        file << "capcreate=2.5\n";
        file << "relayer=0x01\n";
        file << "relayer=0x02\n";
    }

    ArgsManager args;
    const char* argv[] = {"qobid", "-capcreate=3"};
    std::string strError;
    BOOST_REQUIRE(args.ParseParameters(2, argv, strError));
    BOOST_REQUIRE_MESSAGE(args.ReadConfigFiles(strError), strError);

    BOOST_CHECK_EQUAL(args.GetArg("-rootpolicy", ""), "trusted");
    // Command line wins over the file
    BOOST_CHECK_EQUAL(args.GetArg("-capcreate", ""), "3");
    BOOST_CHECK_EQUAL(args.GetArgs("-relayer").size(), 2U);

    {
        fs::ofstream file(pathTemp / QOBI_CONF_FILENAME);
        file << "novalue\n";
    }
    BOOST_CHECK(!args.ReadConfigFiles(strError));
}

// =============================================================================
// Chain parameters
// =============================================================================
BOOST_AUTO_TEST_CASE(network_domains)
{
    const std::unique_ptr<CChainParams> main = CreateChainParams(CBaseChainParams::MAIN);
    const std::unique_ptr<CChainParams> test = CreateChainParams(CBaseChainParams::TESTNET);
    const std::unique_ptr<CChainParams> regtest = CreateChainParams(CBaseChainParams::REGTEST);

    BOOST_CHECK_EQUAL(main->GetConsensus().domain.nChainId, 202102U);
    BOOST_CHECK_EQUAL(test->GetConsensus().domain.nChainId, 43113U);
    BOOST_CHECK_EQUAL(regtest->GetConsensus().domain.nChainId, 31337U);
    BOOST_CHECK_EQUAL(EncodeAddress(CKeyID(main->GetConsensus().domain.verifyingContract)),
                      "0xb85ca4471ae6ab8d9b7f0a21c707c9866805745f");
    BOOST_CHECK_EQUAL(main->GetConsensus().domain.strName, "QOBI TreeProcessor");

    const Consensus::Params& consensus = main->GetConsensus();
    BOOST_CHECK_EQUAL(consensus.nMerkleTreeDepth, 9);
    BOOST_CHECK_EQUAL(consensus.MerkleTreeCapacity(), 512U);
    BOOST_CHECK_EQUAL(consensus.nMaxBatchSize, 500U);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_CREATE), 149 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_LIKES), 5 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_COMMENTS), 60 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_TIPPING), 796 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_CRYPTO), 995 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::CATEGORY_REFERRALS), 1195 * CENT);
    BOOST_CHECK_EQUAL(consensus.DailyCap(Consensus::MAX_REWARD_CATEGORIES), 0U);

    BOOST_CHECK_THROW(CreateChainParams("moon"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(admission_overrides)
{
    gArgs.ForceSetArg("-caplikes", "0.5");
    gArgs.ForceSetArg("-maxbatchsize", "100");
    gArgs.ForceSetArg("-submissionwindow", "60");
    SelectParams(CBaseChainParams::REGTEST);
    BOOST_CHECK_EQUAL(Params().GetConsensus().DailyCap(Consensus::CATEGORY_LIKES), 50 * CENT);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nMaxBatchSize, 100U);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nSubmissionWindow, 60);

    gArgs.ForceSetArg("-maxbatchsize", "513");
    BOOST_CHECK_THROW(SelectParams(CBaseChainParams::REGTEST), std::runtime_error);
    gArgs.ForceSetArg("-maxbatchsize", "100");
    gArgs.ForceSetArg("-caplikes", "lots");
    BOOST_CHECK_THROW(SelectParams(CBaseChainParams::REGTEST), std::runtime_error);
    gArgs.ForceSetArg("-caplikes", "0.5");

    // Windows are capped at a week
    gArgs.ForceSetArg("-submissionwindow", "9223372036854775807");
    BOOST_CHECK_THROW(SelectParams(CBaseChainParams::REGTEST), std::runtime_error);
    gArgs.ForceSetArg("-submissionwindow", "604801");
    BOOST_CHECK_THROW(SelectParams(CBaseChainParams::REGTEST), std::runtime_error);
    gArgs.ForceSetArg("-submissionwindow", "0");
    BOOST_CHECK_THROW(SelectParams(CBaseChainParams::REGTEST), std::runtime_error);
    gArgs.ForceSetArg("-submissionwindow", "604800");
    SelectParams(CBaseChainParams::REGTEST);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nSubmissionWindow, 604800);

    gArgs.ClearArg("-caplikes");
    gArgs.ClearArg("-maxbatchsize");
    gArgs.ClearArg("-submissionwindow");
    SelectParams(CBaseChainParams::REGTEST);
    BOOST_CHECK_EQUAL(Params().GetConsensus().nMaxBatchSize, 500U);
}

BOOST_AUTO_TEST_SUITE_END()
