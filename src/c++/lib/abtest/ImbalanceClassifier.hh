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
/// \brief Sample size imbalance classification and test method recommendation
///

#pragma once

#include "abtest/ABTestShared.hh"
#include "abtest/Trial.hh"

#include <string>
#include <vector>


struct ImbalanceReport
{
    unsigned totalSize = 0;
    unsigned sizeA = 0;
    unsigned sizeB = 0;

    /// min(nA,nB)/max(nA,nB)
    double sizeRatio = 0.;
    BALANCE_LEVEL::index_t balanceLevel = BALANCE_LEVEL::BALANCED;

    /// true if either group has fewer than 30 trials
    bool isSmallSample = false;

    TEST_METHOD::index_t recommendedMethod = TEST_METHOD::Z;

    /// min(winsA, lossesA, winsB, lossesB)
    unsigned minCellCount = 0;

    /// minimum recommended size of the smaller group
    unsigned minRecommendedSampleSize = 0;

    /// human-readable advice, first line is the headline
    std::vector<std::string> advice;
};


/// lower (inclusive) ratio bounds of each balance level
const double balancedRatioThreshold(0.67);
const double mildRatioThreshold(0.33);
const double moderateRatioThreshold(0.10);

/// below this ratio the normal approximation z-test is preferred over chi-square
const double zTestRatioThreshold(0.3);

/// minimum cell count required for the chi-square and Fisher approximations
const unsigned minSufficientCellCount(5);


BALANCE_LEVEL::index_t
getBalanceLevel(const double sizeRatio);


/// \brief Recommend a test method from the sample characteristics
///
/// Evaluates an ordered rule table, the first matching rule wins:
///
/// 1. small sample or ratio < 0.1 : fisher if minCellCount >= 5, else permutation
/// 2. 0.1 <= ratio < 0.3          : z
/// 3. otherwise                   : chi2 if minCellCount >= 5, else fisher
///
TEST_METHOD::index_t
selectTestMethod(
    const double sizeRatio,
    const bool isSmallSample,
    const unsigned minCellCount);


/// max(50, round(0.3*largerGroupSize))
unsigned
getMinRecommendedSampleSize(const unsigned largerGroupSize);


ImbalanceReport
classifyImbalance(const TrialPair& pair);
