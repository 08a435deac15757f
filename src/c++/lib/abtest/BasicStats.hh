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
/// \brief Descriptive statistics of the two groups
///

#pragma once

#include "abtest/Trial.hh"


struct GroupStats
{
    int size = 0;
    int wins = 0;
    int losses = 0;
    double winRate = 0.;
    double lossRate = 0.;

    /// share of all trials in percent
    double sampleSharePercent = 0.;
};


struct BasicStats
{
    GroupStats a;
    GroupStats b;

    /// B minus A for every field
    GroupStats delta;
};


BasicStats
getBasicStats(const TrialPair& pair);
