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
/// \brief Command-line options of CompareWinRates
///

#pragma once

#include "abtest/ABTestAnalysis.hh"
#include "abtest/TrialValidator.hh"
#include "common/Program.hh"

#include <string>


struct CWROptions
{
    CWROptions()
        : groupA("A", 0, 0.)
        , groupB("B", 0, 0.)
    {}

    GroupInput groupA;
    GroupInput groupB;

    AnalysisOptions analysis;

    /// "-" writes the report to stdout
    std::string outputFilename = "-";
};


void
parseCWROptions(
    const propella::Program& prog,
    int argc,
    char* argv[],
    CWROptions& opt);
