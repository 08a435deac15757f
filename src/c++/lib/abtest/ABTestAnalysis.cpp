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

#include "abtest/ABTestAnalysis.hh"

#include <utility>



TEST_METHOD::index_t
resolveTestMethod(
    const std::string& methodName,
    const ImbalanceReport& imbalance)
{
    if (methodName == autoMethodLabel) return imbalance.recommendedMethod;
    return TEST_METHOD::parse_label(methodName);
}



static
HypothesisTestOptions
getHypothesisTestOptions(const AnalysisOptions& opt)
{
    HypothesisTestOptions testOpt;
    testOpt.alpha = opt.alpha;
    testOpt.alternative = opt.alternative;
    testOpt.permutationIterations = opt.permutationIterations;
    testOpt.randomSeed = opt.randomSeed;
    return testOpt;
}



AnalysisReport
runAnalysis(
    const GroupInput& groupA,
    const GroupInput& groupB,
    const AnalysisOptions& opt)
{
    AnalysisReport report(validateTrials(groupA, groupB));
    const TrialPair& pair(report.pair);

    const HypothesisTestOptions testOpt(getHypothesisTestOptions(opt));
    validateHypothesisTestOptions(testOpt);

    report.basicStats = getBasicStats(pair);
    report.imbalance = classifyImbalance(pair);
    report.primaryMethod = resolveTestMethod(opt.method, report.imbalance);

    report.outcomes.insert(std::make_pair(report.primaryMethod, runHypothesisTest(pair, report.primaryMethod, testOpt)));
    if (opt.isRunAllMethods)
    {
        for (unsigned methodIndex(0); methodIndex<TEST_METHOD::SIZE; ++methodIndex)
        {
            const TEST_METHOD::index_t method(static_cast<TEST_METHOD::index_t>(methodIndex));
            if (report.outcomes.count(method)) continue;
            report.outcomes.insert(std::make_pair(method, runHypothesisTest(pair, method, testOpt)));
        }
    }

    report.power = analyzePower(pair, opt.alpha, opt.targetPower);
    report.powerCurve = powerCurve(pair, opt.alpha, getDefaultPowerCurveEffectSizes());

    report.hasSamplePlan = report.power.isRequiredSampleSizeDefined;
    if (report.hasSamplePlan)
    {
        report.samplePlan = planSampleSize(pair, opt.alpha, opt.targetPower);
    }

    report.recommendation = composeRecommendation(report.primaryOutcome(), pair, report.imbalance);
    return report;
}
