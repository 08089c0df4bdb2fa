// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "distribution/typeddata.h"

#include "hash.h"
#include "key.h"
#include "logging.h"
#include "pubkey.h"

const std::string DOMAIN_TYPE =
    "QOBIDomain(string name,string version,uint256 chainId,bytes20 verifyingContract)";

const std::string SUBMISSION_TYPE =
    "QOBISubmitBatch(uint32 day,uint8 category,uint16 subBatch,bytes32 root,bytes32 usersDigest,"
    "bytes32 pointsDigest,bytes32 amountsDigest,uint64 nonce,int64 deadline)";

static const unsigned char TYPED_DATA_PREFIX[2] = {0x19, 0x01};

std::string CSubmissionMessage::ToString() const
{
    return strprintf("CSubmissionMessage(slot=%s, root=%s, nonce=%d, deadline=%d)",
                     slot.ToString(), root.ToString(), nNonce, nDeadline);
}

uint256 GetDomainSeparator(const Consensus::SigningDomain& domain)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << HashString(DOMAIN_TYPE)
       << HashString(domain.strName)
       << HashString(domain.strVersion)
       << domain.nChainId
       << domain.verifyingContract;
    return ss.GetHash();
}

uint256 GetSubmissionStructHash(const CSubmissionMessage& msg)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << HashString(SUBMISSION_TYPE)
       << msg.slot.nDay << msg.slot.nCategory << msg.slot.nSubBatch
       << msg.root
       << msg.usersDigest << msg.pointsDigest << msg.amountsDigest
       << msg.nNonce << msg.nDeadline;
    return ss.GetHash();
}

uint256 GetSubmissionDigest(const Consensus::SigningDomain& domain, const CSubmissionMessage& msg)
{
    const uint256 domainSeparator = GetDomainSeparator(domain);
    const uint256 structHash = GetSubmissionStructHash(msg);

    uint256 digest;
    CHash256()
        .Write(TYPED_DATA_PREFIX, sizeof(TYPED_DATA_PREFIX))
        .Write(domainSeparator.begin(), domainSeparator.size())
        .Write(structHash.begin(), structHash.size())
        .Finalize(digest.begin());
    return digest;
}

bool SignSubmission(const CKey& key, const Consensus::SigningDomain& domain,
                    const CSubmissionMessage& msg, std::vector<unsigned char>& vchSig)
{
    if (!key.SignCompact(GetSubmissionDigest(domain, msg), vchSig)) {
        return error("%s: signing failed for %s", __func__, msg.ToString());
    }
    return true;
}

bool RecoverSubmissionSigner(const Consensus::SigningDomain& domain, const CSubmissionMessage& msg,
                             const std::vector<unsigned char>& vchSig, CKeyID& signerOut)
{
    if (vchSig.size() != CPubKey::COMPACT_SIGNATURE_SIZE) {
        LogPrint(BCLog::DISTRIBUTION, "%s: bad signature size %u\n", __func__, vchSig.size());
        return false;
    }
    CPubKey pubkey;
    if (!pubkey.RecoverCompact(GetSubmissionDigest(domain, msg), vchSig)) {
        LogPrint(BCLog::DISTRIBUTION, "%s: recovery failed for %s\n", __func__, msg.ToString());
        return false;
    }
    signerOut = pubkey.GetID();
    return true;
}
