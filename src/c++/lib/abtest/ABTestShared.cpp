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

#include "abtest/ABTestShared.hh"
#include "common/Exceptions.hh"

#include <cassert>

#include <sstream>


namespace TEST_METHOD
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case Z:
        return "z";
    case CHI2:
        return "chi2";
    case FISHER:
        return "fisher";
    case PERMUTATION:
        return "permutation";
    default:
        assert(false && "Unknown test method");
        return "unknown";
    }
}

const char*
get_display_label(const index_t i)
{
    switch (i)
    {
    case Z:
        return "Two-proportion z-test";
    case CHI2:
        return "Chi-square test (Yates corrected)";
    case FISHER:
        return "Fisher exact test";
    case PERMUTATION:
        return "Monte-Carlo permutation test (Barnard-style approximation)";
    default:
        assert(false && "Unknown test method");
        return "unknown";
    }
}

index_t
parse_label(const std::string& label)
{
    for (unsigned methodIndex(0); methodIndex<SIZE; ++methodIndex)
    {
        const index_t method(static_cast<index_t>(methodIndex));
        if (label == get_label(method)) return method;
    }

    using namespace propella::common;
    std::ostringstream oss;
    oss << "Unsupported test method: '" << label << "'. Supported methods are {";
    for (unsigned methodIndex(0); methodIndex<SIZE; ++methodIndex)
    {
        if (methodIndex) oss << ",";
        oss << get_label(static_cast<index_t>(methodIndex));
    }
    oss << "}";
    BOOST_THROW_EXCEPTION(UnsupportedMethodException(oss.str()));
}

}



namespace ALTERNATIVE
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case TWO_SIDED:
        return "two-sided";
    case GREATER:
        return "greater";
    case LESS:
        return "less";
    default:
        assert(false && "Unknown alternative hypothesis");
        return "unknown";
    }
}

index_t
parse_label(const std::string& label)
{
    for (unsigned altIndex(0); altIndex<SIZE; ++altIndex)
    {
        const index_t alt(static_cast<index_t>(altIndex));
        if (label == get_label(alt)) return alt;
    }

    using namespace propella::common;
    std::ostringstream oss;
    oss << "Unknown alternative hypothesis: '" << label << "'. Expected one of {two-sided,greater,less}";
    BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
}

}



namespace BALANCE_LEVEL
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case BALANCED:
        return "Balanced";
    case MILD:
        return "Mild";
    case MODERATE:
        return "Moderate";
    case SEVERE:
        return "Severe";
    default:
        assert(false && "Unknown balance level");
        return "unknown";
    }
}

}



namespace TEST_STATUS
{

const char*
get_label(const index_t i)
{
    switch (i)
    {
    case OK:
        return "ok";
    case DEGENERATE:
        return "degenerate";
    default:
        assert(false && "Unknown test status");
        return "unknown";
    }
}

}
