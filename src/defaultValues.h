// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef _DEFAULTVALUES_H
#define _DEFAULTVALUES_H

#include <amount.h>

/** The maximum mass of a transaction the node will relay or mine (network rule) */
constexpr uint64_t MAXIMUM_STANDARD_TRANSACTION_MASS = 100000;
//! Mass charged per serialized transaction byte
constexpr uint64_t MASS_PER_TX_BYTE = 1;
//! Mass charged per byte of an output's locking script
constexpr uint64_t MASS_PER_SCRIPT_PUB_KEY_BYTE = 10;
//! Mass charged per signature operation
constexpr uint64_t MASS_PER_SIG_OP = 1000;

/** Minimum relay fee rate, in sompi per 1000 grams */
constexpr CAmount MINIMUM_RELAY_FEE_PER_KILOGRAM = 1000;
//! -maxfee default: cap applied when no fee policy is given
constexpr CAmount DEFAULT_TRANSACTION_MAXFEE = 1 * SOMPI_PER_KASPA;
/** Leftover below this is not worth stopping the input walk for */
constexpr CAmount MINIMUM_CHANGE_TARGET = 10 * SOMPI_PER_KASPA;

/** Coinbase outputs can only be spent after this DAA score distance (network rule) */
constexpr uint64_t DEFAULT_COINBASE_MATURITY = 1000;
/** Block DAA score assigned to outputs no block has accepted yet */
constexpr uint64_t UNACCEPTED_DAA_SCORE = UINT64_MAX;

//! -syncinterval default (seconds)
constexpr int64_t DEFAULT_SYNC_INTERVAL = 10;

constexpr uint16_t DEFAULT_TRANSACTION_VERSION = 0;
constexpr uint64_t DEFAULT_INPUT_SEQUENCE = 0;
constexpr uint16_t DEFAULT_SCRIPT_PUBLIC_KEY_VERSION = 0;

#endif
