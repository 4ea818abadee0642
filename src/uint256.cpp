// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <uint256.h>

#include <utilstrencodings.h>

#include <cassert>
#include <ctype.h>

constexpr unsigned uint256::WIDTH;

uint256::uint256(const std::vector<unsigned char>& vch)
{
    assert(vch.size() == sizeof(data));
    memcpy(data, &vch[0], sizeof(data));
}

std::string uint256::GetHex() const
{
    return HexStr(begin(), end());
}

void uint256::SetHex(const char* psz)
{
    memset(data, 0, sizeof(data));

    // skip leading spaces
    while (isspace(*psz))
        psz++;

    // skip 0x
    if (psz[0] == '0' && tolower(psz[1]) == 'x')
        psz += 2;

    unsigned char* p1 = begin();
    unsigned char* pend = end();
    while (p1 < pend && HexDigit(psz[0]) != -1 && HexDigit(psz[1]) != -1) {
        *p1 = (HexDigit(psz[0]) << 4) | HexDigit(psz[1]);
        psz += 2;
        p1++;
    }
}

void uint256::SetHex(const std::string& str)
{
    SetHex(str.c_str());
}

std::string uint256::ToString() const
{
    return GetHex();
}
