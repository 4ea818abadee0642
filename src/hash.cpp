// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include <stdexcept>

namespace
{
template <typename Integer>
void WriteLittleEndian(CHashWriter& writer, Integer value)
{
    unsigned char buffer[sizeof(Integer)];
    for (unsigned i = 0; i < sizeof(Integer); ++i)
    {
        buffer[i] = static_cast<unsigned char>(value >> (8 * i));
    }
    writer.write(buffer, sizeof(buffer));
}
} // anonymous namespace

CHashWriter::CHashWriter(const std::string& domain): ctx_(nullptr)
{
    EVP_MAC* mac = EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_BLAKE2BMAC, nullptr);
    if (mac == nullptr)
        throw std::runtime_error("CHashWriter : BLAKE2BMAC is not available");
    ctx_ = EVP_MAC_CTX_new(mac);
    EVP_MAC_free(mac);
    if (ctx_ == nullptr)
        throw std::runtime_error("CHashWriter : unable to allocate hashing context");

    size_t digestSize = uint256::WIDTH;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &digestSize),
        OSSL_PARAM_construct_end()};
    if (EVP_MAC_init(ctx_, reinterpret_cast<const unsigned char*>(domain.data()), domain.size(), params) != 1)
    {
        EVP_MAC_CTX_free(ctx_);
        throw std::runtime_error("CHashWriter : unable to initialize hashing context");
    }
}

CHashWriter::~CHashWriter()
{
    EVP_MAC_CTX_free(ctx_);
}

CHashWriter& CHashWriter::write(const unsigned char* pch, size_t size)
{
    if (size > 0 && EVP_MAC_update(ctx_, pch, size) != 1)
        throw std::runtime_error("CHashWriter::write : hashing failed");
    return *this;
}

CHashWriter& CHashWriter::WriteU8(uint8_t value)
{
    return write(&value, 1);
}

CHashWriter& CHashWriter::WriteU16(uint16_t value)
{
    WriteLittleEndian(*this, value);
    return *this;
}

CHashWriter& CHashWriter::WriteU32(uint32_t value)
{
    WriteLittleEndian(*this, value);
    return *this;
}

CHashWriter& CHashWriter::WriteU64(uint64_t value)
{
    WriteLittleEndian(*this, value);
    return *this;
}

CHashWriter& CHashWriter::WriteVarBytes(const std::vector<unsigned char>& bytes)
{
    WriteU64(bytes.size());
    if (!bytes.empty())
        write(&bytes[0], bytes.size());
    return *this;
}

uint256 CHashWriter::GetHash()
{
    std::vector<unsigned char> digest(uint256::WIDTH, 0u);
    size_t written = 0;
    if (EVP_MAC_final(ctx_, &digest[0], &written, digest.size()) != 1 || written != digest.size())
        throw std::runtime_error("CHashWriter::GetHash : hashing failed");
    return uint256(digest);
}
