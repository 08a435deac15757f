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
/// \brief Enumerations shared by all win-rate comparison components
///

#pragma once

#include <string>


/// The supported hypothesis test families
namespace TEST_METHOD
{
enum index_t
{
    Z,           ///< two-proportion z-test
    CHI2,        ///< chi-square test of independence with Yates correction
    FISHER,      ///< Fisher's exact test
    PERMUTATION, ///< Monte-Carlo permutation test, an approximation to Barnard's exact test
    SIZE
};

/// short identifier used on the command-line and as the report key
const char*
get_label(const index_t i);

/// display name of the test
const char*
get_display_label(const index_t i);

/// \brief parse a short identifier
///
/// throws UnsupportedMethodException for any name other than the four test families
index_t
parse_label(const std::string& label);
}


/// Alternative hypothesis, always stated for group B relative to group A
namespace ALTERNATIVE
{
enum index_t
{
    TWO_SIDED, ///< rateB != rateA
    GREATER,   ///< rateB > rateA
    LESS,      ///< rateB < rateA
    SIZE
};

const char*
get_label(const index_t i);

/// throws InvalidParameterException on an unknown label
index_t
parse_label(const std::string& label);
}


/// Sample size balance categories, from the ratio of the smaller to the larger group
namespace BALANCE_LEVEL
{
enum index_t
{
    BALANCED,
    MILD,
    MODERATE,
    SEVERE,
    SIZE
};

const char*
get_label(const index_t i);
}


/// Result state of a single hypothesis test
namespace TEST_STATUS
{
enum index_t
{
    OK,
    /// the test statistic is undefined for this table (eg. zero pooled variance)
    DEGENERATE
};

const char*
get_label(const index_t i);
}
