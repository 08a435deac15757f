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
/// \brief Sample size planning for a follow-up run of the comparison
///

#pragma once

#include "abtest/Trial.hh"

#include <cstdint>
#include <string>


struct SamplePlan
{
    /// effect size (Cohen's h) the plan is designed to detect
    double effectSize = 0.;
    double alpha = 0.05;
    double targetPower = 0.8;

    /// nB/nA
    double currentRatio = 1.;

    /// min(nA,nB)/max(nA,nB)
    double imbalanceRatio = 1.;

    /// required size of group A at the current ratio
    uint64_t requiredSampleSizePerGroup = 0;

    /// suggested group B to group A size ratio for the follow-up design
    double optimalRatio = 1.;

    uint64_t suggestedSizeA = 0;
    uint64_t suggestedSizeB = 0;
    uint64_t suggestedTotalSize = 0;

    std::string advice;
};


/// designs below this imbalance ratio are replaced by a balanced design
const double balancedDesignRatioThreshold(0.2);

/// designs below this imbalance ratio are moved to the moderate design ratio
const double moderateDesignRatioThreshold(0.5);
const double moderateDesignRatio(0.7);


/// \brief Plan the group sizes needed to detect the observed effect size |h|
///
/// throws UndefinedPowerException if the observed effect size is zero
///
SamplePlan
planSampleSize(
    const TrialPair& pair,
    const double alpha = 0.05,
    const double targetPower = 0.8);

/// \brief Plan the group sizes needed to detect an explicit effect size
///
/// throws UndefinedPowerException if the effect size is zero
///
SamplePlan
planSampleSize(
    const TrialPair& pair,
    const double effectSize,
    const double alpha,
    const double targetPower);
