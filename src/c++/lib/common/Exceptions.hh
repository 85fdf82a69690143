//
// QtlMap - QTL Mapping for Experimental Crosses
// Copyright (c) 2009-2018 Illumina, Inc.
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
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **
 ** Context about where in the dataset the failure occurred is attached
 ** with the errinfo_* tags below, e.g.:
 **
 **   catch (boost::exception& e) { e << errinfo_chromosome(chromName); throw; }
 **
 **/

#pragma once

#include "boost/cerrno.hpp"
#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include <ios>
#include <stdexcept>
#include <string>

namespace qtlmap
{
namespace common
{

/// input dataset (usually a file name) where the error was found
typedef boost::error_info<struct tag_dataset, std::string> errinfo_dataset;

/// 1-indexed line of the input dataset
typedef boost::error_info<struct tag_line_number, unsigned> errinfo_line_number;

/// chromosome being processed
typedef boost::error_info<struct tag_chromosome, std::string> errinfo_chromosome;

/// scan position (marker or pseudomarker name) being processed
typedef boost::error_info<struct tag_position, std::string> errinfo_position;

/// 0-indexed individual being processed
typedef boost::error_info<struct tag_individual, unsigned> errinfo_individual;

/// raw genotype string which could not be handled
typedef boost::error_info<struct tag_symbol, std::string> errinfo_symbol;


/**
 ** \brief Virtual base class to all the exception classes
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
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
    std::string getContext() const;
private:
    const int errorNumber_;
    const std::string message_;
};

/**
 * \brief Exception thrown when there are problems with the IO operations
 */
class IoException: public std::ios_base::failure, public ExceptionData
{
public:
    IoException(int errorNumber, const std::string& message);
};

/**
 ** \brief Exception thrown when the client supplied an invalid parameter.
 **
 **/
class InvalidParameterException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidParameterException(const std::string& message);
};

/**
 ** \brief Exception thrown when an invalid command line option was detected.
 **
 **/
class InvalidOptionException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidOptionException(const std::string& message);
};

/**
 ** \brief Exception thrown when a method invocation violates the pre-conditions.
 **
 **/
class PreConditionException: public std::logic_error, public ExceptionData
{
public:
    explicit
    PreConditionException(const std::string& message);
};

/**
 ** \brief Exception thrown when an observed genotype string cannot be matched to any
 ** registered symbol alias or true genotype.
 **
 **/
class UnresolvedSymbolException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    UnresolvedSymbolException(const std::string& message);
};

/**
 ** \brief Exception thrown when a genotype alphabet is inconsistent with the
 ** declared cross type.
 **
 **/
class IncompatibleCrossException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    IncompatibleCrossException(const std::string& message);
};

/**
 ** \brief Exception thrown when genotype, phenotype or covariate row/column
 ** counts disagree.
 **
 **/
class DimensionMismatchException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    DimensionMismatchException(const std::string& message);
};

/**
 ** \brief Exception thrown when a regression design matrix is rank deficient.
 **
 **/
class DegenerateDesignException: public std::runtime_error, public ExceptionData
{
public:
    explicit
    DegenerateDesignException(const std::string& message);
};

/// General purpose exception for runtime failures not covered above:
///
struct GeneralException: public std::runtime_error, public ExceptionData
{
    explicit
    GeneralException(const std::string& message) :
        std::runtime_error(message),
        ExceptionData(EINVAL, message)
    {}
};

/// General purpose exception for all other cases:
///
struct LogicException: public std::logic_error, public ExceptionData
{
    explicit
    LogicException(const std::string& message) :
        std::logic_error(message),
        ExceptionData(EPERM, message)
    {}
};

}
}
