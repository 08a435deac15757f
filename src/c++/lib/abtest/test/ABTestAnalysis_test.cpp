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

#include "abtest/ABTestAnalysis.hh"
#include "abtest/AnalysisReportWriter.hh"
#include "common/Exceptions.hh"

#include <sstream>


static
AnalysisOptions
getAllMethodsOptions()
{
    AnalysisOptions opt;
    opt.isRunAllMethods = true;
    opt.permutationIterations = 2000;
    opt.randomSeed = 11;
    return opt;
}


static
std::string
getReportText(const AnalysisReport& report)
{
    std::ostringstream oss;
    writeAnalysisReport(report, oss);
    return oss.str();
}


BOOST_AUTO_TEST_SUITE( test_ABTestAnalysis )


BOOST_AUTO_TEST_CASE( test_auto_method )
{
    const AnalysisReport report(runAnalysis(GroupInput("A",1000,0.52), GroupInput("B",50,0.62), AnalysisOptions()));

    BOOST_REQUIRE(report.warnings.empty());
    BOOST_REQUIRE_EQUAL(report.imbalance.balanceLevel, BALANCE_LEVEL::SEVERE);
    BOOST_REQUIRE_EQUAL(report.primaryMethod, TEST_METHOD::FISHER);
    BOOST_REQUIRE_EQUAL(report.outcomes.size(), 1u);
    BOOST_REQUIRE_CLOSE(report.primaryOutcome().pValue, 0.192295739498, 0.0001);

    BOOST_REQUIRE_EQUAL(report.basicStats.a.wins, 520);
    BOOST_REQUIRE_EQUAL(report.basicStats.delta.size, -950);
    BOOST_REQUIRE_CLOSE(report.basicStats.delta.winRate, 0.1, 0.0001);
    BOOST_REQUIRE_CLOSE(report.basicStats.a.sampleSharePercent, 100.*1000./1050., 0.0001);

    BOOST_REQUIRE_EQUAL(report.power.requiredSampleSizePerGroup, 4026u);
    BOOST_REQUIRE(report.hasSamplePlan);
    BOOST_REQUIRE_EQUAL(report.samplePlan.suggestedSizeB, 4026u);
    BOOST_REQUIRE_EQUAL(report.powerCurve.size(), 10u);

    BOOST_REQUIRE_EQUAL(report.recommendation.decision, DECISION::KEEP_TESTING);
}


BOOST_AUTO_TEST_CASE( test_explicit_method )
{
    AnalysisOptions opt;
    opt.method = "z";
    opt.alternative = ALTERNATIVE::GREATER;
    const AnalysisReport report(runAnalysis(GroupInput("A",1000,0.52), GroupInput("B",50,0.62), opt));
    BOOST_REQUIRE_EQUAL(report.primaryMethod, TEST_METHOD::Z);
    BOOST_REQUIRE_CLOSE(report.primaryOutcome().pValue, 0.0835124596399, 0.0001);
}


BOOST_AUTO_TEST_CASE( test_all_methods )
{
    const AnalysisReport report(runAnalysis(GroupInput("A",1000,0.52), GroupInput("B",50,0.62), getAllMethodsOptions()));
    BOOST_REQUIRE_EQUAL(report.outcomes.size(), static_cast<size_t>(TEST_METHOD::SIZE));
    BOOST_REQUIRE_EQUAL(report.primaryMethod, TEST_METHOD::FISHER);
    BOOST_REQUIRE_EQUAL(report.outcomes.at(TEST_METHOD::PERMUTATION).iterations, 2000u);

    const std::string text(getReportText(report));
    BOOST_REQUIRE(text.find("#TestOutcomes\n") != std::string::npos);
    BOOST_REQUIRE(text.find("#Recommendation\n") != std::string::npos);
    BOOST_REQUIRE(text.find("decision\tKeepTesting\n") != std::string::npos);
}


BOOST_AUTO_TEST_CASE( test_idempotence )
{
    const GroupInput groupA("A",1000,0.52);
    const GroupInput groupB("B",50,0.62);
    const AnalysisReport report1(runAnalysis(groupA, groupB, getAllMethodsOptions()));
    const AnalysisReport report2(runAnalysis(groupA, groupB, getAllMethodsOptions()));

    for (const auto& value : report1.outcomes)
    {
        const TestOutcome& outcome2(report2.outcomes.at(value.first));
        BOOST_REQUIRE_EQUAL(value.second.statistic, outcome2.statistic);
        BOOST_REQUIRE_EQUAL(value.second.pValue, outcome2.pValue);
    }
    BOOST_REQUIRE_EQUAL(getReportText(report1), getReportText(report2));
}


BOOST_AUTO_TEST_CASE( test_boundary )
{
    const AnalysisReport report(runAnalysis(GroupInput("A",1,1.), GroupInput("B",1,0.), getAllMethodsOptions()));
    BOOST_REQUIRE_EQUAL(report.outcomes.size(), static_cast<size_t>(TEST_METHOD::SIZE));
    BOOST_REQUIRE_EQUAL(report.warnings.size(), 2u);
    BOOST_REQUIRE_EQUAL(report.warnings[0].type, ADVISORY::SMALL_SAMPLE);
    BOOST_REQUIRE(report.power.isRequiredSampleSizeDefined);

    // pooled win rate of 1 leaves the z and chi-square statistics undefined:
    const AnalysisReport degenerate(runAnalysis(GroupInput("A",1,1.), GroupInput("B",1,1.), getAllMethodsOptions()));
    BOOST_REQUIRE_EQUAL(degenerate.outcomes.at(TEST_METHOD::Z).status, TEST_STATUS::DEGENERATE);
    BOOST_REQUIRE_EQUAL(degenerate.outcomes.at(TEST_METHOD::CHI2).status, TEST_STATUS::DEGENERATE);
    BOOST_REQUIRE_EQUAL(degenerate.outcomes.at(TEST_METHOD::FISHER).status, TEST_STATUS::DEGENERATE);
    BOOST_REQUIRE(! degenerate.power.isRequiredSampleSizeDefined);
    BOOST_REQUIRE(! degenerate.hasSamplePlan);
    BOOST_REQUIRE_EQUAL(degenerate.recommendation.decision, DECISION::SIMILAR);

    const std::string text(getReportText(degenerate));
    BOOST_REQUIRE(text.find("required_sample_size_per_group\tNA\n") != std::string::npos);
}


BOOST_AUTO_TEST_CASE( test_undetectable_effect )
{
    // a rate difference far too small to reach the target power at any
    // practical sample size still yields a complete report:
    const AnalysisReport report(runAnalysis(GroupInput("A",1000,0.5), GroupInput("B",1000,0.5+1e-12), AnalysisOptions()));
    BOOST_REQUIRE_EQUAL(report.outcomes.size(), 1u);
    BOOST_REQUIRE(! report.primaryOutcome().isSignificant);
    BOOST_REQUIRE_CLOSE(report.power.currentPower, 0.05, 0.001);
    BOOST_REQUIRE(! report.power.isRequiredSampleSizeDefined);
    BOOST_REQUIRE(! report.hasSamplePlan);

    const std::string text(getReportText(report));
    BOOST_REQUIRE(text.find("required_sample_size_per_group\tNA\n") != std::string::npos);
}


BOOST_AUTO_TEST_CASE( test_errors )
{
    using namespace propella::common;

    AnalysisOptions opt;
    BOOST_REQUIRE_THROW(runAnalysis(GroupInput("A",0,0.5), GroupInput("B",10,0.5), opt), InvalidSampleSizeException);
    BOOST_REQUIRE_THROW(runAnalysis(GroupInput("A",10,0.5), GroupInput("B",10,1.01), opt), InvalidRateException);

    opt.method = "bayes";
    BOOST_REQUIRE_THROW(runAnalysis(GroupInput("A",10,0.5), GroupInput("B",10,0.5), opt), UnsupportedMethodException);

    opt.method = autoMethodLabel;
    opt.alpha = 1.5;
    BOOST_REQUIRE_THROW(runAnalysis(GroupInput("A",10,0.5), GroupInput("B",10,0.5), opt), InvalidParameterException);
}


BOOST_AUTO_TEST_SUITE_END()
