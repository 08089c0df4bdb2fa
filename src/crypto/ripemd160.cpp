// Copyright (c) 2014-2016 The Bitcoin Core developers
// Copyright (c) 2026 The QOBI developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/ripemd160.h"

#include <openssl/evp.h>

#include <stdexcept>

CRIPEMD160::CRIPEMD160() : ctx(EVP_MD_CTX_new())
{
    if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_ripemd160(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("CRIPEMD160: failed to initialize digest context");
    }
}

CRIPEMD160::~CRIPEMD160()
{
    EVP_MD_CTX_free(ctx);
}

CRIPEMD160& CRIPEMD160::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CRIPEMD160: digest update failed");
    }
    return *this;
}

void CRIPEMD160::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int nLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &nLen) != 1 || nLen != OUTPUT_SIZE) {
        throw std::runtime_error("CRIPEMD160: digest finalization failed");
    }
}

CRIPEMD160& CRIPEMD160::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_ripemd160(), nullptr) != 1) {
        throw std::runtime_error("CRIPEMD160: digest reset failed");
    }
    return *this;
}
