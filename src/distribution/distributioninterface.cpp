// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/distributioninterface.h"

#include <boost/bind/bind.hpp>

using namespace boost::placeholders;

static CDistributionSignals g_signals;

CDistributionSignals& GetDistributionSignals()
{
    return g_signals;
}

void RegisterDistributionInterface(CDistributionInterface* pListenerIn) {
    g_signals.DistributionFinalized.connect(boost::bind(&CDistributionInterface::DistributionFinalized, pListenerIn, _1));
    g_signals.RewardClaimed.connect(boost::bind(&CDistributionInterface::RewardClaimed, pListenerIn, _1));
}

void UnregisterDistributionInterface(CDistributionInterface* pListenerIn) {
    g_signals.RewardClaimed.disconnect(boost::bind(&CDistributionInterface::RewardClaimed, pListenerIn, _1));
    g_signals.DistributionFinalized.disconnect(boost::bind(&CDistributionInterface::DistributionFinalized, pListenerIn, _1));
}

void UnregisterAllDistributionInterfaces() {
    g_signals.RewardClaimed.disconnect_all_slots();
    g_signals.DistributionFinalized.disconnect_all_slots();
}
