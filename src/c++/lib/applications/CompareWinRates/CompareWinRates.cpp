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

#include "CompareWinRates.hh"
#include "CWROptions.hh"

#include "abtest/ABTestAnalysis.hh"
#include "abtest/AnalysisReportWriter.hh"
#include "blt_util/log.hh"
#include "common/OutStream.hh"

#include <iostream>



static
void
compareWinRates(const CWROptions& opt)
{
    // check that we have write permission on the output file early:
    {
        OutStream outs(opt.outputFilename);
    }

    const AnalysisReport report(runAnalysis(opt.groupA, opt.groupB, opt.analysis));

    for (const AdvisoryWarning& warning : report.warnings)
    {
        log_os << "WARNING: " << warning << "\n";
    }

    OutStream outs(opt.outputFilename);
    writeAnalysisReport(report, outs.getStream());
}



void
CompareWinRates::
runInternal(int argc, char* argv[]) const
{
    CWROptions opt;

    parseCWROptions(*this, argc, argv, opt);
    compareWinRates(opt);
}
