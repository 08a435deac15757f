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

#include "abtest/RecommendationComposer.hh"

#include <cassert>
#include <cmath>

#include <iomanip>
#include <sstream>



namespace DECISION
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case ADOPT_B:
        return "AdoptB";
    case KEEP_A:
        return "KeepA";
    case KEEP_TESTING:
        return "KeepTesting";
    case SIMILAR:
        return "Similar";
    default:
        assert(false && "Unknown decision");
        return "unknown";
    }
}

}



static
std::string
formatPercentagePoints(const double rateDifference)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (std::abs(rateDifference)*100.) << " percentage points";
    return oss.str();
}



static
void
addFollowUpActions(
    const TrialPair& pair,
    const ImbalanceReport& imbalance,
    Recommendation& rec)
{
    std::vector<std::string>& actions(rec.followUpActions);
    if ((imbalance.balanceLevel == BALANCE_LEVEL::MODERATE) ||
        (imbalance.balanceLevel == BALANCE_LEVEL::SEVERE))
    {
        const std::string& smallerName((pair.b.size() < pair.a.size()) ? pair.nameB : pair.nameA);

        actions.push_back(std::string("Current imbalance: ") + BALANCE_LEVEL::get_label(imbalance.balanceLevel));
        actions.push_back(std::string("Recommended method: ") + TEST_METHOD::get_display_label(imbalance.recommendedMethod));
        actions.push_back("Collect more data for " + smallerName);
        std::ostringstream oss;
        oss << "Target: at least " << imbalance.minRecommendedSampleSize << " samples for " << smallerName;
        actions.push_back(oss.str());
    }
    else
    {
        actions.push_back(std::string("Sample balance is acceptable (") + BALANCE_LEVEL::get_label(imbalance.balanceLevel) + ")");
        actions.push_back(std::string("Test method: ") + TEST_METHOD::get_display_label(imbalance.recommendedMethod));
        actions.push_back("Keep tracking both win rates after the change");
    }
}



Recommendation
composeRecommendation(
    const TestOutcome& outcome,
    const TrialPair& pair,
    const ImbalanceReport& imbalance)
{
    Recommendation rec;

    const double rateDiff(pair.rateDifference());
    const std::string margin(formatPercentagePoints(rateDiff));

    if (outcome.isSignificant)
    {
        const bool isBBetter(rateDiff > 0.);
        const std::string& winner(isBBetter ? pair.nameB : pair.nameA);
        const std::string& loser(isBBetter ? pair.nameA : pair.nameB);
        rec.decision = (isBBetter ? DECISION::ADOPT_B : DECISION::KEEP_A);
        rec.headline = (isBBetter ? "Adopt " : "Keep ") + winner;
        rec.reason = winner + " is significantly better than " + loser + ", win rate higher by " + margin;
    }
    else if (std::abs(rateDiff) > relevantRateDifference)
    {
        rec.decision = DECISION::KEEP_TESTING;
        rec.headline = "Keep testing and collect more data";
        rec.reason = "Difference is large (" + margin + ") but not significant, the sample may be too small";
    }
    else
    {
        rec.decision = DECISION::SIMILAR;
        rec.headline = pair.nameA + " and " + pair.nameB + " perform similarly";
        rec.reason = "Difference is small (" + margin + ") and not significant, either may be chosen";
    }

    addFollowUpActions(pair, imbalance, rec);
    return rec;
}
