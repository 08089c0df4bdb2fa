// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_TYPEDDATA_H
#define QOBI_TYPEDDATA_H

#include "consensus/params.h"
#include "distribution/distribution.h"
#include "uint256.h"

#include <string>
#include <vector>

/**
 * Domain-separated signing of batch submissions
 *
 * The digest layout follows the usual typed-data scheme (domain separator,
 * struct hash, 0x1901 prefix) but every hash is the double SHA-256 of the
 * serialized fields. Digests are not interchangeable with keccak256/ABI
 * encoded typed data, and the type strings are named to keep them apart.
 */

class CKey;

/** Type string of the signing domain. */
extern const std::string DOMAIN_TYPE;
/** Type string of a batch submission. */
extern const std::string SUBMISSION_TYPE;

/**
 * The fields of a batch submission a relayer signs. The entry lists are
 * committed through their digests only.
 */
struct CSubmissionMessage {
    CDistributionSlot slot;
    uint256 root;
    uint256 usersDigest;
    uint256 pointsDigest;
    uint256 amountsDigest;
    uint64_t nNonce;
    int64_t nDeadline;

    CSubmissionMessage() : nNonce(0), nDeadline(0) {}

    std::string ToString() const;
};

/** H(H(DOMAIN_TYPE), H(name), H(version), chainId, verifyingContract) */
uint256 GetDomainSeparator(const Consensus::SigningDomain& domain);

/** H(H(SUBMISSION_TYPE), day, category, subBatch, root, digests..., nonce, deadline) */
uint256 GetSubmissionStructHash(const CSubmissionMessage& msg);

/** H("\x19\x01" || domainSeparator || structHash), the hash that is signed */
uint256 GetSubmissionDigest(const Consensus::SigningDomain& domain, const CSubmissionMessage& msg);

/** Sign the submission digest with a 65-byte recoverable compact signature. */
bool SignSubmission(const CKey& key, const Consensus::SigningDomain& domain,
                    const CSubmissionMessage& msg, std::vector<unsigned char>& vchSig);

/**
 * Recover the signer of a submission.
 * @return false when the signature is malformed or does not recover a key
 */
bool RecoverSubmissionSigner(const Consensus::SigningDomain& domain, const CSubmissionMessage& msg,
                             const std::vector<unsigned char>& vchSig, CKeyID& signerOut);

#endif // QOBI_TYPEDDATA_H
