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
/// \brief per-chromosome genotype probabilities of every individual at every scan position
///

#pragma once

#include <vector>


/// Dense individuals x positions x genotypes array of genotype probabilities
///
/// Each (individual, position) row holds the probability of each possible genotype of the cross model, in the
/// order of CrossModel::getPossibleGenotypes(), and sums to one.
///
class GenotypeProbabilityTensor
{
public:
    GenotypeProbabilityTensor(
        const unsigned individualCount,
        const unsigned positionCount,
        const unsigned genotypeCount)
        : _individualCount(individualCount),
          _positionCount(positionCount),
          _genotypeCount(genotypeCount),
          _probs(static_cast<size_t>(individualCount)*positionCount*genotypeCount, 0.)
    {}

    unsigned
    getIndividualCount() const
    {
        return _individualCount;
    }

    unsigned
    getPositionCount() const
    {
        return _positionCount;
    }

    unsigned
    getGenotypeCount() const
    {
        return _genotypeCount;
    }

    double
    get(
        const unsigned individualIndex,
        const unsigned positionIndex,
        const unsigned genotypeIndex) const
    {
        return _probs[getRowIndex(individualIndex, positionIndex) + genotypeIndex];
    }

    /// pointer to the getGenotypeCount() probabilities of one (individual, position) row
    const double*
    getRow(
        const unsigned individualIndex,
        const unsigned positionIndex) const
    {
        return _probs.data() + getRowIndex(individualIndex, positionIndex);
    }

    double*
    getRow(
        const unsigned individualIndex,
        const unsigned positionIndex)
    {
        return _probs.data() + getRowIndex(individualIndex, positionIndex);
    }

private:
    size_t
    getRowIndex(
        const unsigned individualIndex,
        const unsigned positionIndex) const
    {
        return ((static_cast<size_t>(individualIndex)*_positionCount + positionIndex)*_genotypeCount);
    }

    unsigned _individualCount;
    unsigned _positionCount;
    unsigned _genotypeCount;
    std::vector<double> _probs;
};
