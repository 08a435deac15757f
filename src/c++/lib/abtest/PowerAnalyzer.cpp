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

#include "abtest/PowerAnalyzer.hh"
#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/math/distributions/normal.hpp"
#include "boost/math/tools/toms748_solve.hpp"

#include "blt_util/thirdparty_pop.h"

#include <algorithm>
#include <cassert>
#include <cmath>

#include <sstream>
#include <utility>



namespace POWER_LEVEL
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case VERY_LOW:
        return "VeryLow";
    case INSUFFICIENT:
        return "Insufficient";
    case SUFFICIENT:
        return "Sufficient";
    default:
        assert(false && "Unknown power level");
        return "unknown";
    }
}

const char*
get_interpretation(const index_t i)
{
    switch (i)
    {
    case VERY_LOW:
        return "Power is very low, likely to miss a true difference";
    case INSUFFICIENT:
        return "Power is insufficient, increase the sample size";
    case SUFFICIENT:
        return "Power is sufficient, the test result is reliable";
    default:
        assert(false && "Unknown power level");
        return "unknown";
    }
}

}



double
cohensH(
    const double rateA,
    const double rateB)
{
    return 2.*std::asin(std::sqrt(rateB)) - 2.*std::asin(std::sqrt(rateA));
}



POWER_LEVEL::index_t
getPowerLevel(const double power)
{
    if (power < 0.5) return POWER_LEVEL::VERY_LOW;
    if (power < 0.8) return POWER_LEVEL::INSUFFICIENT;
    return POWER_LEVEL::SUFFICIENT;
}



static
void
checkAlpha(const double alpha)
{
    using namespace propella::common;

    if (! ((alpha > 0.) && (alpha < 1.)))
    {
        std::ostringstream oss;
        oss << "Significance level alpha must be in (0,1), got: " << alpha;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }
}



static
void
checkPowerParameters(
    const double alpha,
    const double targetPower)
{
    using namespace propella::common;

    checkAlpha(alpha);
    if (! ((targetPower > alpha) && (targetPower < 1.)))
    {
        std::ostringstream oss;
        oss << "Target power must be in (alpha,1), got: " << targetPower;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }
}



double
twoProportionPower(
    const double effectSize,
    const double sizeA,
    const double ratio,
    const double alpha)
{
    using namespace propella::common;

    if (! (sizeA > 0.))
    {
        std::ostringstream oss;
        oss << "Power is undefined for group A size: " << sizeA;
        BOOST_THROW_EXCEPTION(UndefinedPowerException(oss.str()));
    }
    if (! (ratio > 0.))
    {
        std::ostringstream oss;
        oss << "Power is undefined for group size ratio: " << ratio;
        BOOST_THROW_EXCEPTION(UndefinedPowerException(oss.str()));
    }

    using boost::math::cdf;
    using boost::math::complement;
    using boost::math::quantile;

    const boost::math::normal stdNormal;

    // effective sample size of two unequal groups:
    const double nobs(1./(1./sizeA + 1./(sizeA*ratio)));
    const double shift(std::abs(effectSize)*std::sqrt(nobs));
    const double zCrit(quantile(complement(stdNormal, alpha/2.)));

    const double power(cdf(complement(stdNormal, zCrit - shift)) + cdf(stdNormal, -zCrit - shift));
    return std::min(power, 1.);
}



namespace
{

/// power minus target as a function of group A size, for root finding
struct PowerGap
{
    PowerGap(
        const double effectSize,
        const double ratio,
        const double alpha,
        const double targetPower)
        : _effectSize(effectSize)
        , _ratio(ratio)
        , _alpha(alpha)
        , _targetPower(targetPower)
    {}

    double
    operator()(const double sizeA) const
    {
        return twoProportionPower(_effectSize, sizeA, _ratio, _alpha) - _targetPower;
    }

private:
    double _effectSize;
    double _ratio;
    double _alpha;
    double _targetPower;
};

}



bool
isRequiredSampleSizeReachable(
    const double effectSize,
    const double ratio,
    const double alpha,
    const double targetPower)
{
    if ((effectSize == 0.) || (! (ratio > 0.))) return false;
    const PowerGap gap(effectSize, ratio, alpha, targetPower);
    return (gap(maxRequiredSampleSize) >= 0.);
}



uint64_t
requiredSampleSize(
    const double effectSize,
    const double ratio,
    const double alpha,
    const double targetPower)
{
    using namespace propella::common;

    checkPowerParameters(alpha, targetPower);

    if (effectSize == 0.)
    {
        BOOST_THROW_EXCEPTION(UndefinedPowerException("Required sample size is undefined for a zero effect size"));
    }
    if (! (ratio > 0.))
    {
        std::ostringstream oss;
        oss << "Required sample size is undefined for group size ratio: " << ratio;
        BOOST_THROW_EXCEPTION(UndefinedPowerException(oss.str()));
    }

    if (! isRequiredSampleSizeReachable(effectSize, ratio, alpha, targetPower))
    {
        std::ostringstream oss;
        oss << "Required sample size exceeds " << maxRequiredSampleSize << " for effect size: " << effectSize;
        BOOST_THROW_EXCEPTION(UndefinedPowerException(oss.str()));
    }

    const PowerGap gap(effectSize, ratio, alpha, targetPower);

    // power approaches alpha as the group size approaches zero, so the lower
    // bracket is always below the target:
    static const double minSize(1e-6);
    double upper(1.);
    while (gap(upper) < 0.)
    {
        upper = std::min(upper*2., maxRequiredSampleSize);
    }
    const double lower(std::min(minSize, upper/2.));

    boost::uintmax_t maxIter(200);
    const boost::math::tools::eps_tolerance<double> tol(40);
    const std::pair<double,double> bracket(
        boost::math::tools::toms748_solve(gap, lower, upper, tol, maxIter));

    uint64_t size(static_cast<uint64_t>(std::ceil(bracket.first)));
    if (size == 0) size = 1;
    while (gap(static_cast<double>(size)) < 0.) size++;
    return size;
}



PowerReport
analyzePower(
    const TrialPair& pair,
    const double alpha,
    const double targetPower)
{
    checkPowerParameters(alpha, targetPower);

    PowerReport report;
    report.alpha = alpha;
    report.targetPower = targetPower;
    report.cohensH = cohensH(pair.a.winRate(), pair.b.winRate());
    report.effectSize = std::abs(report.cohensH);

    const double sizeA(pair.a.size());
    const double ratio(static_cast<double>(pair.b.size()) / sizeA);

    report.currentPower = twoProportionPower(report.effectSize, sizeA, ratio, alpha);
    report.powerLevel = getPowerLevel(report.currentPower);
    report.currentTotalSamples = pair.totalSize();

    // an effect too small to detect below maxRequiredSampleSize leaves the
    // required size undefined, as does a zero effect:
    report.isRequiredSampleSizeDefined =
        isRequiredSampleSizeReachable(report.effectSize, ratio, alpha, targetPower);
    if (report.isRequiredSampleSizeDefined)
    {
        report.requiredSampleSizePerGroup = requiredSampleSize(report.effectSize, ratio, alpha, targetPower);
        report.requiredTotalSamples =
            static_cast<uint64_t>(std::ceil(report.requiredSampleSizePerGroup * (1. + ratio)));
    }
    return report;
}



std::vector<double>
getDefaultPowerCurveEffectSizes()
{
    std::vector<double> effectSizes;
    for (unsigned i(1); i <= 10; ++i)
    {
        effectSizes.push_back(0.05*i);
    }
    return effectSizes;
}



std::vector<PowerCurvePoint>
powerCurve(
    const TrialPair& pair,
    const double alpha,
    const std::vector<double>& effectSizes)
{
    checkAlpha(alpha);

    const double sizeA(pair.a.size());
    const double ratio(static_cast<double>(pair.b.size()) / sizeA);

    std::vector<PowerCurvePoint> curve;
    for (const double effectSize : effectSizes)
    {
        PowerCurvePoint point;
        point.effectSize = effectSize;
        point.power = twoProportionPower(effectSize, sizeA, ratio, alpha);
        curve.push_back(point);
    }
    return curve;
}
