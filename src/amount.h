// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AMOUNT_H
#define AMOUNT_H

#include <stdint.h>
#include <string>

/** Amount in sompi. Values are never negative on this chain. */
typedef uint64_t CAmount;

static const CAmount SOMPI_PER_KASPA = 100000000;
std::string FormatMoney(const CAmount& n);

#endif // AMOUNT_H
