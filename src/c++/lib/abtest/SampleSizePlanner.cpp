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

#include "abtest/SampleSizePlanner.hh"
#include "abtest/PowerAnalyzer.hh"

#include <cmath>

#include <sstream>



SamplePlan
planSampleSize(
    const TrialPair& pair,
    const double alpha,
    const double targetPower)
{
    const double h(cohensH(pair.a.winRate(), pair.b.winRate()));
    return planSampleSize(pair, std::abs(h), alpha, targetPower);
}



SamplePlan
planSampleSize(
    const TrialPair& pair,
    const double effectSize,
    const double alpha,
    const double targetPower)
{
    SamplePlan plan;
    plan.effectSize = std::abs(effectSize);
    plan.alpha = alpha;
    plan.targetPower = targetPower;
    plan.currentRatio = static_cast<double>(pair.b.size()) / static_cast<double>(pair.a.size());
    plan.imbalanceRatio = static_cast<double>(pair.minSize()) / static_cast<double>(pair.maxSize());

    const uint64_t required(requiredSampleSize(plan.effectSize, plan.currentRatio, alpha, targetPower));
    plan.requiredSampleSizePerGroup = required;

    std::ostringstream oss;
    if (plan.imbalanceRatio < balancedDesignRatioThreshold)
    {
        plan.optimalRatio = 1.;
        oss << "Groups are severely imbalanced, collect data with a balanced design of "
            << required << ":" << required;
    }
    else if (plan.imbalanceRatio < moderateDesignRatioThreshold)
    {
        plan.optimalRatio = moderateDesignRatio;
        oss << "Groups are moderately imbalanced, collect data in the proportion "
            << required << ":" << static_cast<uint64_t>(std::floor(required*moderateDesignRatio));
    }
    else
    {
        plan.optimalRatio = plan.currentRatio;
        oss << "Groups are relatively balanced, collect data in the proportion "
            << required << ":" << static_cast<uint64_t>(std::floor(required*plan.currentRatio));
    }
    plan.advice = oss.str();

    plan.suggestedSizeA = required;
    plan.suggestedSizeB = static_cast<uint64_t>(std::floor(required*plan.optimalRatio));
    plan.suggestedTotalSize = plan.suggestedSizeA + plan.suggestedSizeB;
    return plan;
}
