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

#include "common/Exceptions.hh"

#include <cstring>

#include <sstream>


namespace propella
{
namespace common
{

ExceptionData::ExceptionData(int errorNumber, const std::string& message)
    : errorNumber_(errorNumber), message_(message)
{
}


std::string ExceptionData::getContext() const
{
    std::ostringstream oss;
    oss << "error " << errorNumber_ << " (" << strerror(errorNumber_) << ")";

    const char* const* file(boost::get_error_info<boost::throw_file>(*this));
    const int* line(boost::get_error_info<boost::throw_line>(*this));
    if ((file != nullptr) && (line != nullptr))
    {
        oss << " at " << *file << ":" << *line;
    }

    const char* const* function(boost::get_error_info<boost::throw_function>(*this));
    if (function != nullptr)
    {
        oss << " in " << *function;
    }
    return oss.str();
}


IoException::IoException(int errorNumber, const std::string& message)
    : std::ios_base::failure(message)
    , ExceptionData(errorNumber, message)
{
}


InvalidParameterException::InvalidParameterException(const std::string& message)
    : std::logic_error(message)
    , ExceptionData(EINVAL, message)
{
}


InvalidSampleSizeException::InvalidSampleSizeException(const std::string& message)
    : InvalidParameterException(message)
{
}


InvalidRateException::InvalidRateException(const std::string& message)
    : InvalidParameterException(message)
{
}


UnsupportedMethodException::UnsupportedMethodException(const std::string& message)
    : InvalidParameterException(message)
{
}


PreConditionException::PreConditionException(const std::string& message)
    : std::logic_error(message)
    , ExceptionData(EINVAL, message)
{
}


UndefinedPowerException::UndefinedPowerException(const std::string& message)
    : std::domain_error(message)
    , ExceptionData(EDOM, message)
{
}

}
}
