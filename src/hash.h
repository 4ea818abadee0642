// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HASH_H
#define HASH_H

#include <uint256.h>

#include <stdint.h>
#include <string>
#include <vector>

typedef struct evp_mac_ctx_st EVP_MAC_CTX;

/** A writer stream that computes a keyed 256-bit BLAKE2b hash.
 *  The key is the domain separator of the hashed object (e.g. "TransactionID").
 *  Integers are written little-endian and byte strings are length-prefixed
 *  with a 64-bit length. */
class CHashWriter
{
private:
    EVP_MAC_CTX* ctx_;

    CHashWriter(const CHashWriter&) = delete;
    CHashWriter& operator=(const CHashWriter&) = delete;

public:
    explicit CHashWriter(const std::string& domain);
    ~CHashWriter();

    CHashWriter& write(const unsigned char* pch, size_t size);
    CHashWriter& WriteU8(uint8_t value);
    CHashWriter& WriteU16(uint16_t value);
    CHashWriter& WriteU32(uint32_t value);
    CHashWriter& WriteU64(uint64_t value);
    CHashWriter& WriteVarBytes(const std::vector<unsigned char>& bytes);

    /** Finalizes the stream. The writer must not be used afterwards. */
    uint256 GetHash();
};

#endif // HASH_H
