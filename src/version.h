// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2015-2022 The PIVX Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QOBI_VERSION_H
#define QOBI_VERSION_H

/**
 * client versioning
 */
static const int CLIENT_VERSION_MAJOR = 1;
static const int CLIENT_VERSION_MINOR = 2;
static const int CLIENT_VERSION_REVISION = 0;

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR +
    10000 * CLIENT_VERSION_MINOR +
    100 * CLIENT_VERSION_REVISION;

/**
 * serialization version passed to hash writers; leaf and digest encodings do not depend on it
 */
static const int PROTOCOL_VERSION = 10200;

/**
 * distribution database schema version
 *
 * History:
 *   1 = Initial slot records (day, category)
 *   2 = Sub-batch slots, claim stats, signer + nonce on records
 */
static const int DISTRIBUTION_DB_VERSION = 2;

#endif // QOBI_VERSION_H
