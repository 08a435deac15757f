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

#include "abtest/BasicStats.hh"



static
GroupStats
getGroupStats(
    const Trial& trial,
    const unsigned totalSize)
{
    GroupStats stats;
    stats.size = trial.size();
    stats.wins = trial.wins();
    stats.losses = trial.losses();
    stats.winRate = trial.winRate();
    stats.lossRate = trial.lossRate();
    stats.sampleSharePercent = 100.*static_cast<double>(trial.size())/static_cast<double>(totalSize);
    return stats;
}



BasicStats
getBasicStats(const TrialPair& pair)
{
    BasicStats stats;
    stats.a = getGroupStats(pair.a, pair.totalSize());
    stats.b = getGroupStats(pair.b, pair.totalSize());

    GroupStats& delta(stats.delta);
    delta.size = stats.b.size - stats.a.size;
    delta.wins = stats.b.wins - stats.a.wins;
    delta.losses = stats.b.losses - stats.a.losses;
    delta.winRate = stats.b.winRate - stats.a.winRate;
    delta.lossRate = stats.b.lossRate - stats.a.lossRate;
    delta.sampleSharePercent = stats.b.sampleSharePercent - stats.a.sampleSharePercent;
    return stats;
}
