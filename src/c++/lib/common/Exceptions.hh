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

/**
 ** \file
 ** \brief Exceptions raised by the win rate comparison library and programs
 **
 ** Every exception derives from ExceptionData in addition to its standard
 ** exception base, so that the top level program can report the error
 ** number, message and throw site of any of them in the same way.
 **/

#pragma once


#include "blt_util/thirdparty_push.h"

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include "blt_util/thirdparty_pop.h"

#include <ios>
#include <stdexcept>
#include <string>

namespace propella
{
namespace common
{

/**
 ** \brief Data shared by all exceptions
 **
 ** Throw with BOOST_THROW_EXCEPTION to record the file, function and line of
 ** the throw site.
 **/
class ExceptionData : public boost::exception
{
public:
    ExceptionData(int errorNumber=0, const std::string& message="");
    ExceptionData(const ExceptionData&) = default;
    ExceptionData& operator=(const ExceptionData&) = delete;

    int getErrorNumber() const
    {
        return errorNumber_;
    }

    const std::string& getMessage() const
    {
        return message_;
    }

    /// error number description and throw site
    std::string getContext() const;

private:
    const int errorNumber_;
    const std::string message_;
};


/// An output file can't be opened or written
class IoException: public std::ios_base::failure, public ExceptionData
{
public:
    IoException(int errorNumber, const std::string& message);
};


/**
 ** \brief A caller supplied parameter is outside of its domain
 **
 ** Base of all input validation errors, eg. a significance level outside of (0,1)
 **/
class InvalidParameterException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidParameterException(const std::string& message);
};


/// A group trial count is zero or negative
class InvalidSampleSizeException: public InvalidParameterException
{
public:
    explicit
    InvalidSampleSizeException(const std::string& message);
};


/// A group win rate is outside of [0,1]
class InvalidRateException: public InvalidParameterException
{
public:
    explicit
    InvalidRateException(const std::string& message);
};


/// The requested test method is not one of z, chi2, fisher or permutation
class UnsupportedMethodException: public InvalidParameterException
{
public:
    explicit
    UnsupportedMethodException(const std::string& message);
};


/// Internal utility called outside of its supported parameter range
class PreConditionException: public std::logic_error, public ExceptionData
{
public:
    explicit
    PreConditionException(const std::string& message);
};


/// Statistical power or required sample size can't be computed
class UndefinedPowerException: public std::domain_error, public ExceptionData
{
public:
    explicit
    UndefinedPowerException(const std::string& message);
};

}
}
