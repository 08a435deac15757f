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

#include "abtest/TrialValidator.hh"
#include "common/Exceptions.hh"

#include <cassert>
#include <cmath>

#include <iomanip>
#include <iostream>
#include <sstream>


namespace ADVISORY
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case SMALL_SAMPLE:
        return "SmallSampleWarning";
    case NON_INTEGER_WIN_COUNT:
        return "NonIntegerWinCountWarning";
    default:
        assert(false && "Unknown advisory type");
        return "unknown";
    }
}

}



std::ostream&
operator<<(std::ostream& os, const AdvisoryWarning& warning)
{
    os << ADVISORY::get_label(warning.type) << " (" << warning.groupName << "): " << warning.message;
    return os;
}



static
void
checkSampleSize(const GroupInput& group)
{
    if (group.n > 0) return;

    using namespace propella::common;
    std::ostringstream oss;
    oss << "Trial count for group '" << group.name << "' must be a positive integer, got: " << group.n;
    BOOST_THROW_EXCEPTION(InvalidSampleSizeException(oss.str()));
}



static
void
checkRate(const GroupInput& group)
{
    if ((group.winRate >= 0.) && (group.winRate <= 1.)) return;

    using namespace propella::common;
    std::ostringstream oss;
    oss << "Win rate for group '" << group.name << "' must be in [0,1], got: " << group.winRate;
    BOOST_THROW_EXCEPTION(InvalidRateException(oss.str()));
}



static
void
addGroupAdvisories(
    const GroupInput& group,
    const Trial& trial,
    std::vector<AdvisoryWarning>& warnings)
{
    if (trial.size() < smallSampleThreshold)
    {
        std::ostringstream oss;
        oss << "sample size " << trial.size() << " is below " << smallSampleThreshold
            << ", the normal approximation may not hold and test results may be unreliable";
        warnings.emplace_back(ADVISORY::SMALL_SAMPLE, group.name, oss.str());
    }

    const double impliedWins(trial.impliedWins());
    if (std::abs(impliedWins - std::nearbyint(impliedWins)) > nonIntegerWinCountTolerance)
    {
        std::ostringstream oss;
        oss << "implied win count " << std::fixed << std::setprecision(2) << impliedWins
            << " is not an integer, rounded to " << trial.wins();
        warnings.emplace_back(ADVISORY::NON_INTEGER_WIN_COUNT, group.name, oss.str());
    }
}



TrialValidationResult
validateTrials(
    const GroupInput& groupA,
    const GroupInput& groupB)
{
    checkSampleSize(groupA);
    checkSampleSize(groupB);
    checkRate(groupA);
    checkRate(groupB);

    const Trial trialA(groupA.n, groupA.winRate);
    const Trial trialB(groupB.n, groupB.winRate);

    std::vector<AdvisoryWarning> warnings;
    addGroupAdvisories(groupA, trialA, warnings);
    addGroupAdvisories(groupB, trialB, warnings);

    return TrialValidationResult(TrialPair(groupA.name, trialA, groupB.name, trialB), warnings);
}
