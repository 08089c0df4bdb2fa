// Copyright (c) 2014-2016 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new())
{
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CSHA256: failed to initialize digest context");
    }
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: digest update failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int nLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &nLen) != 1 || nLen != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: digest finalization failed");
    }
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: digest reset failed");
    }
    return *this;
}
