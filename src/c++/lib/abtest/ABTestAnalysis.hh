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
/// \brief Complete win-rate comparison of two groups
///

#pragma once

#include "abtest/ABTestShared.hh"
#include "abtest/BasicStats.hh"
#include "abtest/HypothesisTests.hh"
#include "abtest/ImbalanceClassifier.hh"
#include "abtest/PowerAnalyzer.hh"
#include "abtest/RecommendationComposer.hh"
#include "abtest/SampleSizePlanner.hh"
#include "abtest/TrialValidator.hh"

#include <map>
#include <string>
#include <vector>


/// the method name which selects the classifier's recommended test
const char* const autoMethodLabel = "auto";


struct AnalysisOptions
{
    double alpha = 0.05;
    double targetPower = 0.8;
    ALTERNATIVE::index_t alternative = ALTERNATIVE::TWO_SIDED;

    /// one of auto, z, chi2, fisher, permutation
    std::string method = autoMethodLabel;

    /// run all four test methods in addition to the primary method
    bool isRunAllMethods = false;

    unsigned permutationIterations = 10000;
    unsigned randomSeed = 1;
};


/// Everything computed for one comparison
struct AnalysisReport
{
    explicit
    AnalysisReport(const TrialValidationResult& validation)
        : pair(validation.pair)
        , warnings(validation.warnings)
    {}

    const TrialPair pair;
    std::vector<AdvisoryWarning> warnings;

    BasicStats basicStats;
    ImbalanceReport imbalance;

    /// the requested method, or the recommended method in auto mode
    TEST_METHOD::index_t primaryMethod = TEST_METHOD::Z;
    std::map<TEST_METHOD::index_t, TestOutcome> outcomes;

    PowerReport power;
    std::vector<PowerCurvePoint> powerCurve;

    /// the sample plan is undefined when the observed effect size is zero
    bool hasSamplePlan = false;
    SamplePlan samplePlan;

    /// decision derived from the primary method outcome
    Recommendation recommendation;

    const TestOutcome&
    primaryOutcome() const
    {
        return outcomes.at(primaryMethod);
    }
};


/// \brief Resolve the configured method name
///
/// throws UnsupportedMethodException for names other than auto and the four test families
///
TEST_METHOD::index_t
resolveTestMethod(
    const std::string& methodName,
    const ImbalanceReport& imbalance);


/// \brief Validate the input groups and run the complete comparison
///
/// Any invalid input or option raises before a report is produced.
///
AnalysisReport
runAnalysis(
    const GroupInput& groupA,
    const GroupInput& groupB,
    const AnalysisOptions& opt);
