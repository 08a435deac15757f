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

#include "abtest/AnalysisReportWriter.hh"

#include <iomanip>
#include <iostream>
#include <string>


static const char sep('\t');



static
void
reportGroupStats(
    const std::string& name,
    const GroupStats& gs,
    std::ostream& os)
{
    os << name << sep << gs.size << sep << gs.wins << sep << gs.losses << sep
       << gs.winRate << sep << gs.lossRate << sep << gs.sampleSharePercent << "\n";
}



static
void
reportBasicStats(
    const AnalysisReport& report,
    std::ostream& os)
{
    const BasicStats& stats(report.basicStats);

    os << "#BasicStats\n";
    os << "group\tsize\twins\tlosses\twin_rate\tloss_rate\tsample_share_percent\n";

    reportGroupStats(report.pair.nameA, stats.a, os);
    reportGroupStats(report.pair.nameB, stats.b, os);
    reportGroupStats("delta_B_minus_A", stats.delta, os);
}



static
void
reportWarnings(
    const AnalysisReport& report,
    std::ostream& os)
{
    os << "#Warnings\n";
    os << "type\tgroup\tmessage\n";
    for (const AdvisoryWarning& warning : report.warnings)
    {
        os << ADVISORY::get_label(warning.type) << sep << warning.groupName << sep << warning.message << "\n";
    }
}



static
void
reportImbalance(
    const ImbalanceReport& imbalance,
    std::ostream& os)
{
    os << "#Imbalance\n";
    os << "total_size" << sep << imbalance.totalSize << "\n";
    os << "size_A" << sep << imbalance.sizeA << "\n";
    os << "size_B" << sep << imbalance.sizeB << "\n";
    os << "size_ratio" << sep << imbalance.sizeRatio << "\n";
    os << "balance_level" << sep << BALANCE_LEVEL::get_label(imbalance.balanceLevel) << "\n";
    os << "small_sample" << sep << imbalance.isSmallSample << "\n";
    os << "min_cell_count" << sep << imbalance.minCellCount << "\n";
    os << "recommended_method" << sep << TEST_METHOD::get_label(imbalance.recommendedMethod) << "\n";
    os << "recommended_method_name" << sep << TEST_METHOD::get_display_label(imbalance.recommendedMethod) << "\n";
    os << "min_recommended_sample_size" << sep << imbalance.minRecommendedSampleSize << "\n";
    for (const std::string& line : imbalance.advice)
    {
        os << "advice" << sep << line << "\n";
    }
}



static
void
reportOutcomes(
    const AnalysisReport& report,
    std::ostream& os)
{
    os << "#TestOutcomes\n";
    os << "method\tprimary\tstatus\talternative\tstatistic_name\tstatistic\tp_value\talpha\tsignificant"
       << "\tci_lower\tci_upper\tdf\teffect_size\tobserved_diff\titerations\trecommendation\n";
    for (const auto& value : report.outcomes)
    {
        const TestOutcome& outcome(value.second);
        os << TEST_METHOD::get_label(outcome.method) << sep
           << (outcome.method == report.primaryMethod) << sep
           << TEST_STATUS::get_label(outcome.status) << sep
           << ALTERNATIVE::get_label(outcome.alternative) << sep
           << getStatisticLabel(outcome.method) << sep
           << outcome.statistic << sep
           << outcome.pValue << sep
           << outcome.alpha << sep
           << outcome.isSignificant << sep;
        if (outcome.hasConfidenceInterval)
        {
            os << outcome.ciLower << sep << outcome.ciUpper << sep;
        }
        else
        {
            os << "NA" << sep << "NA" << sep;
        }
        if (outcome.hasDegreesOfFreedom)
        {
            os << outcome.degreesOfFreedom << sep;
        }
        else
        {
            os << "NA" << sep;
        }
        os << outcome.effectSize << sep
           << outcome.observedDifference << sep
           << outcome.iterations << sep
           << outcome.recommendation << "\n";
    }
}



static
void
reportPower(
    const AnalysisReport& report,
    std::ostream& os)
{
    const PowerReport& power(report.power);

    os << "#Power\n";
    os << "cohens_h" << sep << power.cohensH << "\n";
    os << "effect_size" << sep << power.effectSize << "\n";
    os << "alpha" << sep << power.alpha << "\n";
    os << "target_power" << sep << power.targetPower << "\n";
    os << "current_power" << sep << power.currentPower << "\n";
    os << "power_level" << sep << POWER_LEVEL::get_label(power.powerLevel) << "\n";
    os << "interpretation" << sep << power.interpretation() << "\n";
    os << "current_total_samples" << sep << power.currentTotalSamples << "\n";
    if (power.isRequiredSampleSizeDefined)
    {
        os << "required_sample_size_per_group" << sep << power.requiredSampleSizePerGroup << "\n";
        os << "required_total_samples" << sep << power.requiredTotalSamples << "\n";
    }
    else
    {
        os << "required_sample_size_per_group" << sep << "NA" << "\n";
        os << "required_total_samples" << sep << "NA" << "\n";
    }

    os << "#PowerCurve\n";
    os << "effect_size\tpower\n";
    for (const PowerCurvePoint& point : report.powerCurve)
    {
        os << point.effectSize << sep << point.power << "\n";
    }
}



static
void
reportSamplePlan(
    const AnalysisReport& report,
    std::ostream& os)
{
    os << "#SamplePlan\n";
    if (! report.hasSamplePlan)
    {
        os << "advice" << sep << "Observed effect size is zero, no sample size reaches the target power\n";
        return;
    }

    const SamplePlan& plan(report.samplePlan);
    os << "effect_size" << sep << plan.effectSize << "\n";
    os << "current_ratio" << sep << plan.currentRatio << "\n";
    os << "imbalance_ratio" << sep << plan.imbalanceRatio << "\n";
    os << "required_sample_size_per_group" << sep << plan.requiredSampleSizePerGroup << "\n";
    os << "optimal_ratio" << sep << plan.optimalRatio << "\n";
    os << "suggested_size_" << report.pair.nameA << sep << plan.suggestedSizeA << "\n";
    os << "suggested_size_" << report.pair.nameB << sep << plan.suggestedSizeB << "\n";
    os << "suggested_total_size" << sep << plan.suggestedTotalSize << "\n";
    os << "advice" << sep << plan.advice << "\n";
}



static
void
reportRecommendation(
    const Recommendation& rec,
    std::ostream& os)
{
    os << "#Recommendation\n";
    os << "decision" << sep << DECISION::get_label(rec.decision) << "\n";
    os << "headline" << sep << rec.headline << "\n";
    os << "reason" << sep << rec.reason << "\n";
    for (const std::string& action : rec.followUpActions)
    {
        os << "action" << sep << action << "\n";
    }
}



void
writeAnalysisReport(
    const AnalysisReport& report,
    std::ostream& os)
{
    const std::streamsize oldPrecision(os.precision());
    os << std::setprecision(10);

    os << "#WinRateComparisonReport\n";
    os << "group_A" << sep << report.pair.nameA << "\n";
    os << "group_B" << sep << report.pair.nameB << "\n";

    reportBasicStats(report, os);
    reportWarnings(report, os);
    reportImbalance(report.imbalance, os);
    reportOutcomes(report, os);
    reportPower(report, os);
    reportSamplePlan(report, os);
    reportRecommendation(report.recommendation, os);

    os.precision(oldPrecision);
}
