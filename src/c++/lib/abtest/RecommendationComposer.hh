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
/// \brief Translation of a test outcome into a structured decision
///

#pragma once

#include "abtest/HypothesisTests.hh"
#include "abtest/ImbalanceClassifier.hh"
#include "abtest/Trial.hh"

#include <string>
#include <vector>


namespace DECISION
{
enum index_t
{
    ADOPT_B,      ///< B is significantly better than A
    KEEP_A,       ///< A is significantly better than B
    KEEP_TESTING, ///< large difference without significance
    SIMILAR,      ///< small difference without significance
    SIZE
};

const char*
get_label(const index_t i);
}


struct Recommendation
{
    DECISION::index_t decision = DECISION::SIMILAR;
    std::string headline;
    std::string reason;

    /// sample collection or reliability notes depending on the group balance
    std::vector<std::string> followUpActions;
};


/// win rate differences above this are treated as practically relevant
const double relevantRateDifference(0.05);


/// \brief Decide between the groups from the test outcome and the input win rates
///
/// The margin reported in the reason is |rateB-rateA| in percentage points.
///
Recommendation
composeRecommendation(
    const TestOutcome& outcome,
    const TrialPair& pair,
    const ImbalanceReport& imbalance);
