// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2024 The kaswallet developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <FeeRate.h>

#include <Logging.h>
#include <tinyformat.h>

#include <cmath>
#include <limits>

const unsigned CFeeRate::FEE_INCREMENT_STEPSIZE = 1000u;
CFeeRate::CFeeRate() : nSompiPerKiloGram(0), maxTransactionFee(std::numeric_limits<CAmount>::max())
{
}

CFeeRate::CFeeRate(const CAmount& _nSompiPerKiloGram) : nSompiPerKiloGram(_nSompiPerKiloGram), maxTransactionFee(std::numeric_limits<CAmount>::max())
{
}

CFeeRate::CFeeRate(const CAmount& nFeePaid, uint64_t mass) : nSompiPerKiloGram(0), maxTransactionFee(std::numeric_limits<CAmount>::max())
{
    if (mass > 0)
        nSompiPerKiloGram = nFeePaid * FEE_INCREMENT_STEPSIZE / mass;
}

CFeeRate CFeeRate::FromSompiPerGram(double feeRate)
{
    if (!(feeRate > 0.0))
        return CFeeRate(0);
    return CFeeRate(static_cast<CAmount>(std::ceil(feeRate * FEE_INCREMENT_STEPSIZE)));
}

CAmount CFeeRate::GetFee(uint64_t mass) const
{
    const CAmount nFee = (nSompiPerKiloGram * mass + FEE_INCREMENT_STEPSIZE - 1) / FEE_INCREMENT_STEPSIZE;
    return nFee < maxTransactionFee ? nFee : maxTransactionFee;
}

std::string CFeeRate::ToString() const
{
    return tfm::format("%d.%03d sompi/gram", nSompiPerKiloGram / FEE_INCREMENT_STEPSIZE, nSompiPerKiloGram % FEE_INCREMENT_STEPSIZE);
}

const CAmount& CFeeRate::GetMaxTxFee() const
{
    return maxTransactionFee;
}

void CFeeRate::SetMaxFee(CAmount maximumTxFee)
{
    maxTransactionFee = maximumTxFee;
}

LOG_FORMAT_WITH_TOSTRING(CFeeRate)
