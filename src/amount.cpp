// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <amount.h>

#include <tinyformat.h>

std::string FormatMoney(const CAmount& n)
{
    return tfm::format("%d.%08d", n / SOMPI_PER_KASPA, n % SOMPI_PER_KASPA);
}
