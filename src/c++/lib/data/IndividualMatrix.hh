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

/// \file
/// \brief individuals x columns matrices of genotype, phenotype and covariate data
///

#pragma once

#include "common/Exceptions.hh"

#include <sstream>
#include <string>
#include <vector>


/// Row-major individuals x columns matrix with named columns
///
/// Rows are individuals in input order. A matrix with zero columns is empty regardless of its row count.
///
template <typename T>
class IndividualMatrix
{
public:
    typedef T value_type;

    IndividualMatrix() = default;

    explicit
    IndividualMatrix(const std::vector<std::string>& columnNames)
        : _columnNames(columnNames)
    {}

    /// size the matrix to \p individualCount rows, all set to \p initValue
    IndividualMatrix(
        const std::vector<std::string>& columnNames,
        const unsigned individualCount,
        const T& initValue = T())
        : _columnNames(columnNames),
          _individualCount(individualCount),
          _values(individualCount*columnNames.size(), initValue)
    {}

    unsigned
    getIndividualCount() const
    {
        return _individualCount;
    }

    unsigned
    getColumnCount() const
    {
        return _columnNames.size();
    }

    bool
    empty() const
    {
        return _columnNames.empty();
    }

    const std::vector<std::string>&
    getColumnNames() const
    {
        return _columnNames;
    }

    const std::string&
    getColumnName(const unsigned columnIndex) const
    {
        return _columnNames.at(columnIndex);
    }

    const T&
    get(
        const unsigned individualIndex,
        const unsigned columnIndex) const
    {
        return _values[getIndex(individualIndex, columnIndex)];
    }

    void
    set(
        const unsigned individualIndex,
        const unsigned columnIndex,
        const T& value)
    {
        _values[getIndex(individualIndex, columnIndex)] = value;
    }

    /// append one individual
    ///
    /// throws DimensionMismatchException if the row length differs from the column count
    void
    addIndividual(const std::vector<T>& row)
    {
        if (row.size() != _columnNames.size())
        {
            std::ostringstream oss;
            oss << "Individual row has " << row.size() << " values, expected " << _columnNames.size();
            BOOST_THROW_EXCEPTION(qtlmap::common::DimensionMismatchException(oss.str()));
        }
        _values.insert(_values.end(), row.begin(), row.end());
        _individualCount++;
    }

    /// \return a copy of one individual's row
    std::vector<T>
    getIndividual(const unsigned individualIndex) const
    {
        const auto rowBegin(_values.begin() + getIndex(individualIndex, 0));
        return std::vector<T>(rowBegin, rowBegin + _columnNames.size());
    }

private:
    size_t
    getIndex(
        const unsigned individualIndex,
        const unsigned columnIndex) const
    {
        if ((individualIndex >= _individualCount) || (columnIndex >= _columnNames.size()))
        {
            std::ostringstream oss;
            oss << "Matrix index (" << individualIndex << "," << columnIndex << ") outside of dimensions ("
                << _individualCount << "," << _columnNames.size() << ")";
            BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
        }
        return (static_cast<size_t>(individualIndex)*_columnNames.size() + columnIndex);
    }

    std::vector<std::string> _columnNames;
    unsigned _individualCount = 0;
    std::vector<T> _values;
};


/// Remove every individual flagged in \p toOmit
///
/// throws DimensionMismatchException if \p toOmit does not have one entry per individual
template <typename T>
IndividualMatrix<T>
omitIndividuals(
    const IndividualMatrix<T>& matrix,
    const std::vector<bool>& toOmit)
{
    if (toOmit.size() != matrix.getIndividualCount())
    {
        std::ostringstream oss;
        oss << "Omit flags cover " << toOmit.size() << " individuals, matrix has " << matrix.getIndividualCount();
        BOOST_THROW_EXCEPTION(qtlmap::common::DimensionMismatchException(oss.str()));
    }

    IndividualMatrix<T> result(matrix.getColumnNames());
    for (unsigned individualIndex(0); individualIndex<matrix.getIndividualCount(); ++individualIndex)
    {
        if (toOmit[individualIndex]) continue;
        result.addIndividual(matrix.getIndividual(individualIndex));
    }
    return result;
}
