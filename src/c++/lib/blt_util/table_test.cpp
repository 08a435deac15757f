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

#include "blt_util/table_test.hh"

#include "blt_util/thirdparty_push.h"

#include <boost/math/distributions/chi_squared.hpp>

#include "blt_util/thirdparty_pop.h"

#include <algorithm>
#include <cmath>

using boost::math::cdf;
using boost::math::chi_squared;
using boost::math::complement;



chi_sqr_result
table_chi_sqr_2x2(
    const unsigned* table,
    const bool isYatesCorrection)
{
    static const unsigned n_row(2);
    static const unsigned n_col(2);

    double sum(0);
    double rsum[n_row] = { 0, 0 };
    double csum[n_col] = { 0, 0 };

    for (unsigned r(0); r<n_row; ++r)
    {
        for (unsigned c(0); c<n_col; ++c)
        {
            const double obs(table[c+r*n_col]);
            csum[c] += obs;
            rsum[r] += obs;
            sum += obs;
        }
    }

    chi_sqr_result result;
    if (sum <= 0.) return result;

    // an empty margin produces a zero expected count:
    for (unsigned r(0); r<n_row; ++r)
    {
        if (rsum[r] <= 0.) return result;
    }
    for (unsigned c(0); c<n_col; ++c)
    {
        if (csum[c] <= 0.) return result;
    }

    double xsq(0);
    for (unsigned r(0); r<n_row; ++r)
    {
        for (unsigned c(0); c<n_col; ++c)
        {
            const double obs(table[c+r*n_col]);
            const double expect((rsum[r]*csum[c])/sum);
            double d(std::abs(obs-expect));
            if (isYatesCorrection)
            {
                d -= std::min(0.5, d);
            }
            xsq += (d*d)/expect;
        }
    }

    result.isDefined = true;
    result.xsq = xsq;
    result.df = (n_row-1)*(n_col-1);
    chi_squared dist(result.df);
    result.pval = cdf(complement(dist,xsq));
    return result;
}
