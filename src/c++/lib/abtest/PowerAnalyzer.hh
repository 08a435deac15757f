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
/// \brief Statistical power and required sample size of the two-proportion comparison
///

#pragma once

#include "abtest/Trial.hh"

#include <cstdint>
#include <string>
#include <vector>


/// Power bands used to interpret the current power
namespace POWER_LEVEL
{
enum index_t
{
    VERY_LOW,     ///< power < 0.5
    INSUFFICIENT, ///< 0.5 <= power < 0.8
    SUFFICIENT,   ///< power >= 0.8
    SIZE
};

const char*
get_label(const index_t i);

/// human-readable interpretation of each band
const char*
get_interpretation(const index_t i);
}


struct PowerReport
{
    /// signed Cohen's h, 2*asin(sqrt(rateB)) - 2*asin(sqrt(rateA))
    double cohensH = 0.;

    /// |h|, the effect size used for all power calculations
    double effectSize = 0.;

    double alpha = 0.05;
    double targetPower = 0.8;

    double currentPower = 0.;
    POWER_LEVEL::index_t powerLevel = POWER_LEVEL::VERY_LOW;

    /// false when no group size up to maxRequiredSampleSize reaches the target power,
    /// which includes a zero effect size
    bool isRequiredSampleSizeDefined = false;

    /// smallest size of group A reaching the target power at the current ratio nB/nA
    uint64_t requiredSampleSizePerGroup = 0;

    uint64_t currentTotalSamples = 0;

    /// ceil(requiredSampleSizePerGroup * (1 + nB/nA))
    uint64_t requiredTotalSamples = 0;

    const char*
    interpretation() const
    {
        return POWER_LEVEL::get_interpretation(powerLevel);
    }
};


struct PowerCurvePoint
{
    double effectSize = 0.;
    double power = 0.;
};


/// 2*asin(sqrt(rateB)) - 2*asin(sqrt(rateA))
double
cohensH(
    const double rateA,
    const double rateB);


POWER_LEVEL::index_t
getPowerLevel(const double power);


/// \brief Power of the two-sided two-proportion normal approximation test
///
/// \param effectSize Cohen's h, the sign is ignored
/// \param sizeA size of group A
/// \param ratio nB/nA
///
/// throws UndefinedPowerException if sizeA or ratio is not positive
///
double
twoProportionPower(
    const double effectSize,
    const double sizeA,
    const double ratio,
    const double alpha);


/// largest size of group A searched for the target power
const double maxRequiredSampleSize(1e18);


/// true if a group A size of at most maxRequiredSampleSize reaches targetPower
bool
isRequiredSampleSizeReachable(
    const double effectSize,
    const double ratio,
    const double alpha,
    const double targetPower);


/// \brief Smallest size of group A for which the power reaches targetPower
///
/// throws UndefinedPowerException if the effect size is zero or the ratio is not positive
/// throws UndefinedPowerException if isRequiredSampleSizeReachable is false
/// throws InvalidParameterException if targetPower is not in (alpha,1)
///
uint64_t
requiredSampleSize(
    const double effectSize,
    const double ratio,
    const double alpha,
    const double targetPower);


/// throws InvalidParameterException if alpha is not in (0,1) or targetPower is not in (alpha,1)
PowerReport
analyzePower(
    const TrialPair& pair,
    const double alpha = 0.05,
    const double targetPower = 0.8);


/// effect sizes 0.05, 0.10, ... 0.50
std::vector<double>
getDefaultPowerCurveEffectSizes();

/// power at the current group sizes for each effect size
std::vector<PowerCurvePoint>
powerCurve(
    const TrialPair& pair,
    const double alpha,
    const std::vector<double>& effectSizes);
