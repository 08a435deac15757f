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

#include "blt_util/hypergeometric_sampler.hh"
#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/math/distributions/hypergeometric.hpp"

#include "blt_util/thirdparty_pop.h"

#include <sstream>
#include <utility>



hypergeometric_sampler::
hypergeometric_sampler(
    const unsigned successes,
    const unsigned draws,
    const unsigned population)
{
    using namespace propella::common;

    if ((successes > population) || (draws > population))
    {
        std::ostringstream oss;
        oss << "Invalid hypergeometric parameters: successes=" << successes
            << " draws=" << draws << " population=" << population;
        BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
    }

    const boost::math::hypergeometric_distribution<> hgd(successes, draws, population);
    const std::pair<unsigned,unsigned> range(boost::math::support(hgd));

    _minValue = range.first;
    _pmf.reserve(range.second - range.first + 1);
    _cdf.reserve(range.second - range.first + 1);
    double cumulative(0);
    for (unsigned x(range.first); x <= range.second; ++x)
    {
        const double p(boost::math::pdf(hgd, x));
        _pmf.push_back(p);
        cumulative += p;
        _cdf.push_back(cumulative);
    }
}
