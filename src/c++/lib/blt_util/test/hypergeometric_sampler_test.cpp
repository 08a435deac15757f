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


#include "boost/test/unit_test.hpp"

#include "blt_util/hypergeometric_sampler.hh"
#include "common/Exceptions.hh"

#include "boost/math/distributions/hypergeometric.hpp"
#include "boost/random/mersenne_twister.hpp"


BOOST_AUTO_TEST_SUITE( test_hypergeometric_sampler )


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_pmf )
{
    static const double eps(0.0001);

    const hypergeometric_sampler hs(5,4,12);
    BOOST_REQUIRE_EQUAL(hs.minValue(), 0u);
    BOOST_REQUIRE_EQUAL(hs.maxValue(), 4u);

    BOOST_REQUIRE_CLOSE(hs.probability(0), 0.070707070707, eps);
    BOOST_REQUIRE_CLOSE(hs.probability(1), 0.353535353535, eps);
    BOOST_REQUIRE_CLOSE(hs.probability(2), 0.424242424242, eps);
    BOOST_REQUIRE_CLOSE(hs.probability(3), 0.141414141414, eps);
    BOOST_REQUIRE_CLOSE(hs.probability(4), 0.010101010101, eps);
    BOOST_REQUIRE_EQUAL(hs.probability(5), 0.);
}


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_support )
{
    // every draw must take at least 2 successes:
    const hypergeometric_sampler hs(8,5,10);
    BOOST_REQUIRE_EQUAL(hs.minValue(), 3u);
    BOOST_REQUIRE_EQUAL(hs.maxValue(), 5u);

    const hypergeometric_sampler noSuccess(0,5,10);
    BOOST_REQUIRE_EQUAL(noSuccess.minValue(), 0u);
    BOOST_REQUIRE_EQUAL(noSuccess.maxValue(), 0u);
    BOOST_REQUIRE_CLOSE(noSuccess.probability(0), 1., 0.0001);

    const hypergeometric_sampler allSuccess(10,4,10);
    BOOST_REQUIRE_EQUAL(allSuccess.minValue(), 4u);
    BOOST_REQUIRE_EQUAL(allSuccess.maxValue(), 4u);
}


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_large_population )
{
    const hypergeometric_sampler hs(600,1000,2000);
    BOOST_REQUIRE_EQUAL(hs.minValue(), 0u);
    BOOST_REQUIRE_EQUAL(hs.maxValue(), 600u);

    const boost::math::hypergeometric_distribution<> hgd(600,1000,2000);
    double total(0);
    for (unsigned x(hs.minValue()); x <= hs.maxValue(); ++x)
    {
        BOOST_REQUIRE_CLOSE(hs.probability(x), boost::math::pdf(hgd, x), 1e-8);
        total += hs.probability(x);
    }
    BOOST_REQUIRE_CLOSE(total, 1., 1e-6);

    // the median of a symmetric-about-300 distribution:
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.5), 300u);
}


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_cdf_variate )
{
    const hypergeometric_sampler hs(5,4,12);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.), 0u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.05), 0u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.2), 1u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.5), 2u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.9), 3u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(0.995), 4u);
    BOOST_REQUIRE_EQUAL(hs.random_cdf_variate(1.), 4u);
}


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_draw )
{
    const hypergeometric_sampler hs(5,4,12);
    boost::random::mt19937 gen(42);

    static const unsigned drawCount(100000);
    double sum(0);
    for (unsigned i(0); i<drawCount; ++i)
    {
        const unsigned x(hs(gen));
        BOOST_REQUIRE(x <= 4u);
        sum += x;
    }

    // expectation is draws*successes/population:
    BOOST_REQUIRE_CLOSE(sum/drawCount, 20./12., 1.);
}


BOOST_AUTO_TEST_CASE( test_hypergeometric_sampler_invalid )
{
    using namespace propella::common;
    BOOST_REQUIRE_THROW(hypergeometric_sampler(11,4,10), PreConditionException);
    BOOST_REQUIRE_THROW(hypergeometric_sampler(5,11,10), PreConditionException);
}


BOOST_AUTO_TEST_SUITE_END()
