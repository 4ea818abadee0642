// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef UINT256_H
#define UINT256_H

#include <stdint.h>
#include <string.h>
#include <string>
#include <vector>

/** Opaque 256-bit blob, used for transaction ids. Ordered by byte value. */
class uint256
{
public:
    static constexpr unsigned WIDTH = 32;

private:
    uint8_t data[WIDTH];

public:
    uint256()
    {
        memset(data, 0, sizeof(data));
    }
    explicit uint256(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (unsigned i = 0; i < WIDTH; i++)
            if (data[i] != 0)
                return false;
        return true;
    }

    void SetNull()
    {
        memset(data, 0, sizeof(data));
    }

    int Compare(const uint256& other) const { return memcmp(data, other.data, sizeof(data)); }

    friend inline bool operator==(const uint256& a, const uint256& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const uint256& a, const uint256& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const uint256& a, const uint256& b) { return a.Compare(b) < 0; }

    std::string GetHex() const;
    void SetHex(const char* psz);
    void SetHex(const std::string& str);
    std::string ToString() const;

    unsigned char* begin() { return &data[0]; }
    unsigned char* end() { return &data[WIDTH]; }
    const unsigned char* begin() const { return &data[0]; }
    const unsigned char* end() const { return &data[WIDTH]; }
    unsigned int size() const { return sizeof(data); }

    /** A cheap hash function that just returns 64 bits from the result, it can be
     *  used when the contents are considered uniformly random. */
    uint64_t GetCheapHash() const
    {
        uint64_t result = 0;
        for (unsigned i = 0; i < 8; i++)
            result |= static_cast<uint64_t>(data[i]) << (8 * i);
        return result;
    }
};

/* uint256 from const char *.
 * This is a separate function because the constructor uint256(const char*) can result
 * in dangerously catching uint256(0).
 */
inline uint256 uint256S(const char* str)
{
    uint256 rv;
    rv.SetHex(str);
    return rv;
}
inline uint256 uint256S(const std::string& str)
{
    return uint256S(str.c_str());
}

#endif // UINT256_H
