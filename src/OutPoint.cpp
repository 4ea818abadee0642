#include <OutPoint.h>

#include <tinyformat.h>

COutPoint::COutPoint() { SetNull(); }
COutPoint::COutPoint(const uint256& hashIn, uint32_t nIn)
  : hash(hashIn), n(nIn)
{}

void COutPoint::SetNull() { hash.SetNull(); n = (uint32_t) -1; }
bool COutPoint::IsNull() const { return (hash.IsNull() && n == (uint32_t) -1); }
bool operator<(const COutPoint& a, const COutPoint& b)
{
    return (a.hash < b.hash || (a.hash == b.hash && a.n < b.n));
}

bool operator==(const COutPoint& a, const COutPoint& b)
{
    return (a.hash == b.hash && a.n == b.n);
}

bool operator!=(const COutPoint& a, const COutPoint& b)
{
    return !(a == b);
}

std::string COutPoint::ToString() const
{
    return tfm::format("COutPoint(%s, %u)", hash.ToString(), n);
}

std::string COutPoint::ToStringShort() const
{
    return tfm::format("%s-%u", hash.ToString(), n);
}
