// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2019 The PIVX Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <cstring>

std::string FormatMoney(const CAmount& n, bool fPlus)
{
    const CAmount quotient = n / COIN;
    const CAmount remainder = n % COIN;
    std::string str = strprintf("%d.%018d", quotient, remainder);

    // Right-trim excess zeros before the decimal point:
    int nTrim = 0;
    for (int i = str.size() - 1; (str[i] == '0' && IsDigit(str[i - 2])); --i)
        ++nTrim;
    if (nTrim)
        str.erase(str.size() - nTrim, nTrim);

    if (fPlus && n > 0)
        str.insert((unsigned int)0, 1, '+');
    return str;
}


bool ParseMoney(const std::string& str, CAmount& nRet)
{
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strWhole;
    CAmount nUnits = 0;
    const char* p = pszIn;
    while (IsSpace(*p))
        p++;
    for (; *p; p++) {
        if (*p == '.') {
            p++;
            CAmount nMult = COIN / 10;
            while (IsDigit(*p) && (nMult > 0)) {
                nUnits += nMult * (*p++ - '0');
                nMult /= 10;
            }
            break;
        }
        if (IsSpace(*p))
            break;
        if (!IsDigit(*p))
            return false;
        strWhole.insert(strWhole.end(), *p);
    }
    for (; *p; p++)
        if (!IsSpace(*p))
            return false;
    if (strWhole.size() > 1 && strWhole[0] == '0') // no leading zeros
        return false;
    if (strWhole.size() > 2) // 18 decimals leave room for at most 18.44 QOBI
        return false;
    if (strWhole.empty() && nUnits == 0 && *pszIn != '0' && strchr(pszIn, '.') == nullptr)
        return false;

    const CAmount nWhole = strWhole.empty() ? 0 : (CAmount)atoi64(strWhole);
    if (nWhole > UINT64_MAX / COIN)
        return false;
    CAmount nValue;
    if (!CheckedAdd(nWhole * COIN, nUnits, nValue))
        return false;

    nRet = nValue;
    return true;
}
