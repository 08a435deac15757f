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

#include "abtest/ImbalanceClassifier.hh"
#include "abtest/TrialValidator.hh"

#include <algorithm>
#include <cmath>

#include <iomanip>
#include <sstream>



BALANCE_LEVEL::index_t
getBalanceLevel(const double sizeRatio)
{
    if (sizeRatio >= balancedRatioThreshold) return BALANCE_LEVEL::BALANCED;
    if (sizeRatio >= mildRatioThreshold) return BALANCE_LEVEL::MILD;
    if (sizeRatio >= moderateRatioThreshold) return BALANCE_LEVEL::MODERATE;
    return BALANCE_LEVEL::SEVERE;
}



namespace
{

struct MethodSelectionRule
{
    bool (*isMatch)(const double sizeRatio, const bool isSmallSample);

    /// method chosen when the smallest cell count is at least minSufficientCellCount
    TEST_METHOD::index_t sufficientCountMethod;

    /// method chosen otherwise
    TEST_METHOD::index_t sparseCountMethod;
};

bool
isSmallOrSevere(const double sizeRatio, const bool isSmallSample)
{
    return (isSmallSample || (sizeRatio < moderateRatioThreshold));
}

bool
isStronglyImbalanced(const double sizeRatio, const bool /*isSmallSample*/)
{
    return ((sizeRatio >= moderateRatioThreshold) && (sizeRatio < zTestRatioThreshold));
}

bool
isAnySample(const double /*sizeRatio*/, const bool /*isSmallSample*/)
{
    return true;
}

const MethodSelectionRule methodSelectionRules[] =
{
    { isSmallOrSevere, TEST_METHOD::FISHER, TEST_METHOD::PERMUTATION },
    { isStronglyImbalanced, TEST_METHOD::Z, TEST_METHOD::Z },
    { isAnySample, TEST_METHOD::CHI2, TEST_METHOD::FISHER }
};

}



TEST_METHOD::index_t
selectTestMethod(
    const double sizeRatio,
    const bool isSmallSample,
    const unsigned minCellCount)
{
    const bool isSufficientCount(minCellCount >= minSufficientCellCount);
    for (const MethodSelectionRule& rule : methodSelectionRules)
    {
        if (! rule.isMatch(sizeRatio, isSmallSample)) continue;
        return (isSufficientCount ? rule.sufficientCountMethod : rule.sparseCountMethod);
    }

    // the final rule always matches
    return TEST_METHOD::CHI2;
}



unsigned
getMinRecommendedSampleSize(const unsigned largerGroupSize)
{
    static const unsigned minSampleSizeFloor(50);
    static const double largerGroupFraction(0.3);
    const unsigned scaled(static_cast<unsigned>(std::nearbyint(largerGroupFraction*largerGroupSize)));
    return std::max(minSampleSizeFloor, scaled);
}



static
void
addAdvice(ImbalanceReport& report)
{
    const char* levelLabel(BALANCE_LEVEL::get_label(report.balanceLevel));
    const char* methodLabel(TEST_METHOD::get_display_label(report.recommendedMethod));

    std::vector<std::string>& advice(report.advice);
    if (report.balanceLevel == BALANCE_LEVEL::SEVERE)
    {
        advice.push_back(std::string("Sample sizes are severely imbalanced (") + levelLabel + ")");
        advice.push_back("statistical power may be seriously insufficient");
        advice.push_back("results for the smaller group carry large uncertainty");
        advice.push_back(std::string("recommended method: ") + methodLabel);
        std::ostringstream oss;
        oss << "collect at least " << report.minRecommendedSampleSize << " samples for the smaller group";
        advice.push_back(oss.str());
    }
    else if (report.isSmallSample)
    {
        advice.push_back(std::string("Small sample problem (") + levelLabel + ")");
        std::ostringstream oss;
        oss << "at least one group has fewer than " << smallSampleThreshold << " trials";
        advice.push_back(oss.str());
        advice.push_back("the normal approximation may not hold");
        advice.push_back(std::string("recommended method: ") + methodLabel);
        advice.push_back("confidence intervals may be wide, interpret with care");
    }
    else
    {
        advice.push_back(std::string("Sample sizes are acceptable (") + levelLabel + ")");
        std::ostringstream oss;
        oss << "sample size ratio: " << std::fixed << std::setprecision(2) << (report.sizeRatio*100.) << "%";
        advice.push_back(oss.str());
        advice.push_back(std::string("recommended method: ") + methodLabel);
        advice.push_back("most test methods are applicable");
    }
}



ImbalanceReport
classifyImbalance(const TrialPair& pair)
{
    ImbalanceReport report;
    report.sizeA = pair.a.size();
    report.sizeB = pair.b.size();
    report.totalSize = pair.totalSize();
    report.sizeRatio = static_cast<double>(pair.minSize()) / static_cast<double>(pair.maxSize());
    report.balanceLevel = getBalanceLevel(report.sizeRatio);
    report.isSmallSample = (pair.minSize() < smallSampleThreshold);
    report.minCellCount = ContingencyTable(pair).minCellCount();
    report.recommendedMethod = selectTestMethod(report.sizeRatio, report.isSmallSample, report.minCellCount);
    report.minRecommendedSampleSize = getMinRecommendedSampleSize(pair.maxSize());
    addAdvice(report);
    return report;
}
