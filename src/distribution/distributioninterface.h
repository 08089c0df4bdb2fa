// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_DISTRIBUTIONINTERFACE_H
#define QOBI_DISTRIBUTIONINTERFACE_H

#include <boost/signals2/signal.hpp>

struct CClaimRecord;
struct CDistributionRecord;
class CDistributionInterface;

// These functions dispatch to one or all registered listeners

/** Register a listener to receive distribution events */
void RegisterDistributionInterface(CDistributionInterface* pListenerIn);
/** Unregister a listener */
void UnregisterDistributionInterface(CDistributionInterface* pListenerIn);
/** Unregister all listeners */
void UnregisterAllDistributionInterfaces();

class CDistributionInterface {
protected:
    virtual ~CDistributionInterface() {}
    virtual void DistributionFinalized(const CDistributionRecord& record) {}
    virtual void RewardClaimed(const CClaimRecord& claim) {}
    friend void ::RegisterDistributionInterface(CDistributionInterface*);
    friend void ::UnregisterDistributionInterface(CDistributionInterface*);
    friend void ::UnregisterAllDistributionInterfaces();
};

struct CDistributionSignals {
    /** A slot was admitted and its record committed */
    boost::signals2::signal<void (const CDistributionRecord&)> DistributionFinalized;
    /** A claim was committed and its value released */
    boost::signals2::signal<void (const CClaimRecord&)> RewardClaimed;
};

CDistributionSignals& GetDistributionSignals();

#endif // QOBI_DISTRIBUTIONINTERFACE_H
