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
/// \brief Validation and normalization of raw group counts into a TrialPair
///

#pragma once

#include "abtest/Trial.hh"

#include <iosfwd>
#include <string>
#include <vector>


/// Non-fatal observations made during validation
namespace ADVISORY
{
enum index_t
{
    SMALL_SAMPLE,         ///< fewer than 30 trials in a group
    NON_INTEGER_WIN_COUNT ///< n*winRate was not integral and has been rounded
};

const char*
get_label(const index_t i);
}


struct AdvisoryWarning
{
    AdvisoryWarning(
        const ADVISORY::index_t initType,
        const std::string& initGroupName,
        const std::string& initMessage)
        : type(initType)
        , groupName(initGroupName)
        , message(initMessage)
    {}

    bool
    operator==(const AdvisoryWarning& rhs) const
    {
        return ((type == rhs.type) && (groupName == rhs.groupName) && (message == rhs.message));
    }

    ADVISORY::index_t type;
    std::string groupName;
    std::string message;
};

std::ostream&
operator<<(std::ostream& os, const AdvisoryWarning& warning);


/// Raw, unvalidated description of one group
struct GroupInput
{
    GroupInput()
        : n(0)
        , winRate(0.)
    {}

    GroupInput(
        const std::string& initName,
        const int initN,
        const double initWinRate)
        : name(initName)
        , n(initN)
        , winRate(initWinRate)
    {}

    std::string name;
    int n;
    double winRate;
};


struct TrialValidationResult
{
    TrialValidationResult(
        const TrialPair& initPair,
        const std::vector<AdvisoryWarning>& initWarnings)
        : pair(initPair)
        , warnings(initWarnings)
    {}

    const TrialPair pair;
    const std::vector<AdvisoryWarning> warnings;
};


/// groups with fewer trials than this trigger a small sample warning
const unsigned smallSampleThreshold(30);

/// maximum distance of n*winRate from an integer before a rounding warning is issued
const double nonIntegerWinCountTolerance(0.001);


/// \brief Validate both groups and build their Trial records
///
/// Both trial counts are checked before either rate, so a pair with a bad count
/// and a bad rate always fails with InvalidSampleSizeException.
///
/// throws InvalidSampleSizeException if either n <= 0
/// throws InvalidRateException if either winRate is outside of [0,1]
///
TrialValidationResult
validateTrials(
    const GroupInput& groupA,
    const GroupInput& groupB);
