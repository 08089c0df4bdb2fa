// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_CONSENSUS_VALIDATION_H
#define QOBI_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" message codes */
static const unsigned char REJECT_MALFORMED = 0x01;
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DUPLICATE = 0x12;
/** Reject codes greater or equal to this are storage failures, not invalid input. */
static const unsigned int REJECT_INTERNAL = 0x100;

/**
 * Why a distribution operation was refused.
 *
 * Terminal for their key: TREE_FULL (tree), ALREADY_SUBMITTED (slot),
 * ALREADY_CLAIMED (slot, user).
 */
enum class DistributionError {
    NONE,
    TREE_FULL,
    PROOF_INVALID,
    INVALID_CATEGORY,
    ALREADY_SUBMITTED,
    BATCH_TOO_LARGE,
    CAP_EXCEEDED,
    DEADLINE_EXPIRED,
    INVALID_SIGNATURE,
    NONCE_REPLAY,
    ROOT_MISMATCH,
    NO_DISTRIBUTION,
    ALREADY_CLAIMED,
    UNAUTHORIZED,
    TRANSFER_FAILED,
    STORAGE_FAILURE,
};

/** Stable name of an error code, for logs and JSON. */
inline const char* DistributionErrorString(DistributionError err)
{
    switch (err) {
    case DistributionError::NONE: return "none";
    case DistributionError::TREE_FULL: return "tree-full";
    case DistributionError::PROOF_INVALID: return "proof-invalid";
    case DistributionError::INVALID_CATEGORY: return "invalid-category";
    case DistributionError::ALREADY_SUBMITTED: return "already-submitted";
    case DistributionError::BATCH_TOO_LARGE: return "batch-too-large";
    case DistributionError::CAP_EXCEEDED: return "cap-exceeded";
    case DistributionError::DEADLINE_EXPIRED: return "deadline-expired";
    case DistributionError::INVALID_SIGNATURE: return "invalid-signature";
    case DistributionError::NONCE_REPLAY: return "nonce-replay";
    case DistributionError::ROOT_MISMATCH: return "root-mismatch";
    case DistributionError::NO_DISTRIBUTION: return "no-distribution";
    case DistributionError::ALREADY_CLAIMED: return "already-claimed";
    case DistributionError::UNAUTHORIZED: return "unauthorized";
    case DistributionError::TRANSFER_FAILED: return "transfer-failed";
    case DistributionError::STORAGE_FAILURE: return "storage-failure";
    }
    return "unknown";
}

/** Capture information about distribution validation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //! everything ok
        MODE_INVALID, //! input rejected
        MODE_ERROR,   //! run-time error
    } mode;
    DistributionError m_error;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), m_error(DistributionError::NONE), chRejectCode(0) {}
    bool Invalid(DistributionError err, bool ret = false,
                 unsigned int chRejectCodeIn = 0, const std::string& strRejectReasonIn = "",
                 const std::string& strDebugMessageIn = "")
    {
        m_error = err;
        chRejectCode = chRejectCodeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        m_error = DistributionError::STORAGE_FAILURE;
        chRejectCode = REJECT_INTERNAL;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }
    DistributionError GetError() const { return m_error; }
    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CValidationState to a human-readable message for logging */
inline std::string FormatStateMessage(const CValidationState& state)
{
    std::string str = state.GetRejectReason();
    if (!state.GetDebugMessage().empty())
        str += ", " + state.GetDebugMessage();
    str += " (code " + std::to_string(state.GetRejectCode()) + ")";
    return str;
}

#endif // QOBI_CONSENSUS_VALIDATION_H
