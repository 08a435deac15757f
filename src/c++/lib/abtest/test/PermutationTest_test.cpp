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

#include "abtest/PermutationTest.hh"

#include <vector>


static
TrialPair
getImbalancedPair()
{
    return TrialPair("A", Trial(1000,0.52), "B", Trial(50,0.62));
}


static
double
getVariance(const std::vector<double>& values)
{
    double mean(0);
    for (const double v : values) mean += v;
    mean /= values.size();

    double ss(0);
    for (const double v : values) ss += (v-mean)*(v-mean);
    return ss / (values.size()-1);
}


BOOST_AUTO_TEST_SUITE( test_PermutationTest )


BOOST_AUTO_TEST_CASE( test_exact_permutation_pvalue )
{
    static const double eps(0.0001);

    const TrialPair pair(getImbalancedPair());
    BOOST_REQUIRE_CLOSE(exactPermutationPValue(pair, ALTERNATIVE::TWO_SIDED), 0.192295739498, eps);
    BOOST_REQUIRE_CLOSE(exactPermutationPValue(pair, ALTERNATIVE::GREATER), 0.107698760973, eps);
    BOOST_REQUIRE_CLOSE(exactPermutationPValue(pair, ALTERNATIVE::LESS), 0.937358950647, eps);
}


BOOST_AUTO_TEST_CASE( test_permutation_test )
{
    const TrialPair pair(getImbalancedPair());
    const TestOutcome outcome(permutationTest(pair, 0.05, ALTERNATIVE::GREATER, 10000, 1));

    BOOST_REQUIRE_EQUAL(outcome.method, TEST_METHOD::PERMUTATION);
    BOOST_REQUIRE_EQUAL(outcome.status, TEST_STATUS::OK);
    BOOST_REQUIRE_EQUAL(outcome.iterations, 10000u);
    BOOST_REQUIRE_CLOSE(outcome.statistic, 0.1, 0.0001);
    BOOST_REQUIRE_EQUAL(outcome.isSignificant, (outcome.pValue < outcome.alpha));

    // the standard error of the estimate is about 0.003:
    BOOST_REQUIRE_SMALL(outcome.pValue - exactPermutationPValue(pair, ALTERNATIVE::GREATER), 0.02);
}


BOOST_AUTO_TEST_CASE( test_permutation_test_determinism )
{
    const TrialPair pair(getImbalancedPair());
    const TestOutcome run1(permutationTest(pair, 0.05, ALTERNATIVE::TWO_SIDED, 2000, 7));
    const TestOutcome run2(permutationTest(pair, 0.05, ALTERNATIVE::TWO_SIDED, 2000, 7));
    BOOST_REQUIRE_EQUAL(run1.pValue, run2.pValue);
    BOOST_REQUIRE_EQUAL(run1.recommendation, run2.recommendation);
}


BOOST_AUTO_TEST_CASE( test_permutation_test_variance )
{
    const TrialPair pair(getImbalancedPair());

    static const unsigned seedCount(30);
    std::vector<double> fewDraws;
    std::vector<double> manyDraws;
    for (unsigned seed(1); seed<=seedCount; ++seed)
    {
        fewDraws.push_back(permutationTest(pair, 0.05, ALTERNATIVE::GREATER, 200, seed).pValue);
        manyDraws.push_back(permutationTest(pair, 0.05, ALTERNATIVE::GREATER, 5000, seed).pValue);
    }

    BOOST_REQUIRE(getVariance(manyDraws) < getVariance(fewDraws));
}


BOOST_AUTO_TEST_CASE( test_permutation_test_certain_outcome )
{
    // all trials won, every reassignment is as extreme as the observed one:
    const TrialPair pair("A", Trial(5,1.), "B", Trial(8,1.));
    const TestOutcome outcome(permutationTest(pair, 0.05, ALTERNATIVE::TWO_SIDED, 100, 1));
    BOOST_REQUIRE_EQUAL(outcome.pValue, 1.);
    BOOST_REQUIRE(! outcome.isSignificant);
}


BOOST_AUTO_TEST_SUITE_END()
