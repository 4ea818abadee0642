#ifndef OUTPOINT_H
#define OUTPOINT_H
#include <uint256.h>

#include <stddef.h>
#include <stdint.h>
#include <string>

/** An outpoint - a combination of a transaction id and an index n into its outputs */
class COutPoint
{
public:
    uint256 hash;
    uint32_t n;

    COutPoint();
    COutPoint(const uint256& hashIn, uint32_t nIn);

    void SetNull();
    bool IsNull() const;
    friend bool operator<(const COutPoint& a, const COutPoint& b);
    friend bool operator==(const COutPoint& a, const COutPoint& b);
    friend bool operator!=(const COutPoint& a, const COutPoint& b);
    std::string ToString() const;
    std::string ToStringShort() const;
};

struct OutPointHasher
{
    size_t operator()(const COutPoint& outpoint) const
    {
        return static_cast<size_t>(outpoint.hash.GetCheapHash() ^ (static_cast<uint64_t>(outpoint.n) * 0x9E3779B97F4A7C15ULL));
    }
};
#endif // OUTPOINT_H
