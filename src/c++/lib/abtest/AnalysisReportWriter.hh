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
/// \brief Tab-delimited text rendering of an AnalysisReport
///

#pragma once

#include "abtest/ABTestAnalysis.hh"

#include <iosfwd>


/// \brief Write the report as a series of sections
///
/// Each section starts with a '#' header line, followed by a tab-delimited
/// column header and one tab-delimited line per record.
///
void
writeAnalysisReport(
    const AnalysisReport& report,
    std::ostream& os);
