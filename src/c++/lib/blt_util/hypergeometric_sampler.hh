//
// Propella - Two-Sample Win Rate Comparison
// Copyright (c) 2017-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief Tabulated hypergeometric distribution supporting random variate draws
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/random/uniform_01.hpp"

#include "blt_util/thirdparty_pop.h"

#include <algorithm>
#include <vector>


/// The number of successes X in 'draws' samples taken without replacement
/// from a population of size 'population' containing 'successes' successes.
///
/// The probability mass is tabulated once at construction over the full
/// support of the distribution. Variates are drawn by inverting the tabulated
/// cdf, so a draw consumes exactly one uniform deviate from the supplied generator.
///
struct hypergeometric_sampler
{
    hypergeometric_sampler(
        const unsigned successes,
        const unsigned draws,
        const unsigned population);

    /// smallest value in the support
    unsigned
    minValue() const
    {
        return _minValue;
    }

    /// largest value in the support
    unsigned
    maxValue() const
    {
        return _minValue + static_cast<unsigned>(_pmf.size()) - 1;
    }

    /// probability of X==x, zero outside of the support
    double
    probability(const unsigned x) const
    {
        if ((x < minValue()) || (x > maxValue())) return 0.;
        return _pmf[x-_minValue];
    }

    template <typename RandomGenerator>
    unsigned
    operator()(RandomGenerator& gen) const
    {
        boost::random::uniform_01<double> uran;
        return random_cdf_variate(uran(gen));
    }

    /// map a [0,1) deviate to a variate through the tabulated cdf
    unsigned
    random_cdf_variate(const double u) const
    {
        const std::vector<double>::const_iterator lbp(std::lower_bound(_cdf.begin(),_cdf.end(),u));
        const unsigned index(static_cast<unsigned>(lbp-_cdf.begin()));
        return _minValue + std::min(index, static_cast<unsigned>(_cdf.size())-1);
    }

private:
    unsigned _minValue;
    std::vector<double> _pmf;
    std::vector<double> _cdf;
};
