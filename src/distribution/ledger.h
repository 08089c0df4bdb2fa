// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_LEDGER_H
#define QOBI_LEDGER_H

#include "amount.h"
#include "distribution/distribution.h"

#include <functional>
#include <vector>

class CDistributionDB;

/**
 * Read side of the finalized distributions. Records are written only by
 * CSubmissionValidator and are never updated; no leaf data is kept.
 */
class CDistributionLedger
{
private:
    const CDistributionDB& db;

public:
    explicit CDistributionLedger(const CDistributionDB& dbIn);

    /** @return false when the slot has no record */
    bool Get(const CDistributionSlot& slot, CDistributionRecord& record) const;
    bool HasDistribution(const CDistributionSlot& slot) const;

    /** Day index of the (mockable) current time */
    uint32_t CurrentDay() const;

    /** Reward already admitted for (day, category), over all sub-batches */
    CAmount Allocated(uint32_t nDay, uint8_t nCategory) const;

    /** Records of a day ordered by (category, sub-batch) */
    std::vector<CDistributionRecord> GetDistributions(uint32_t nDay) const;

    /** @param func Callback (return false to stop) */
    void ForEachDistribution(uint32_t nDay, std::function<bool(const CDistributionRecord&)> func) const;
};

#endif // QOBI_LEDGER_H
