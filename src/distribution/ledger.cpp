// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/ledger.h"

#include "distribution/distributiondb.h"
#include "utiltime.h"

#include <algorithm>

CDistributionLedger::CDistributionLedger(const CDistributionDB& dbIn) : db(dbIn) {}

bool CDistributionLedger::Get(const CDistributionSlot& slot, CDistributionRecord& record) const
{
    return db.ReadDistribution(slot, record);
}

bool CDistributionLedger::HasDistribution(const CDistributionSlot& slot) const
{
    return db.ExistsDistribution(slot);
}

uint32_t CDistributionLedger::CurrentDay() const
{
    return GetDayIndex(GetTime());
}

CAmount CDistributionLedger::Allocated(uint32_t nDay, uint8_t nCategory) const
{
    return db.GetAllocated(nDay, nCategory);
}

std::vector<CDistributionRecord> CDistributionLedger::GetDistributions(uint32_t nDay) const
{
    std::vector<CDistributionRecord> vRecords;
    db.ForEachDistribution(nDay, [&vRecords](const CDistributionRecord& record) {
        vRecords.push_back(record);
        return true;
    });
    // Sub-batch numbers are little-endian in the keys
    std::sort(vRecords.begin(), vRecords.end(), [](const CDistributionRecord& a, const CDistributionRecord& b) {
        return a.slot < b.slot;
    });
    return vRecords;
}

void CDistributionLedger::ForEachDistribution(uint32_t nDay, std::function<bool(const CDistributionRecord&)> func) const
{
    for (const CDistributionRecord& record : GetDistributions(nDay)) {
        if (!func(record)) break;
    }
}
