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
/// \brief chromosome and marker positions along the genetic map
///

#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>


/// A chromosome owns no markers, markers reference it
class Chromosome
{
public:
    explicit
    Chromosome(
        const std::string& name,
        const bool isSex = false)
        : _name(name),
          _isSex(isSex)
    {}

    const std::string&
    getName() const
    {
        return _name;
    }

    /// true for a sex chromosome (X), false for an autosome
    bool
    isSex() const
    {
        return _isSex;
    }

private:
    std::string _name;
    bool _isSex;
};

typedef std::shared_ptr<const Chromosome> ChromosomeRef;


/// A genotyped marker or a synthetic pseudomarker position on the genetic map
///
struct Marker
{
    /// genotype column value used by pseudomarkers, which have no observed genotypes
    static const int PSEUDOMARKER_COLUMN = -1;

    Marker(
        const std::string& initName,
        const ChromosomeRef& initChromosome,
        const double initPosition,
        const int initGenotypeColumn = PSEUDOMARKER_COLUMN)
        : name(initName),
          chromosome(initChromosome),
          position(initPosition),
          genotypeColumn(initGenotypeColumn)
    {}

    bool
    isPseudomarker() const
    {
        return (genotypeColumn < 0);
    }

    const std::string&
    getChromosomeName() const;

    std::string name;
    ChromosomeRef chromosome;

    /// map position in centiMorgans
    double position;

    /// column of this marker in the genotype matrix
    int genotypeColumn;
};

std::ostream&
operator<<(std::ostream& os, const Marker& marker);


/// All scan positions of one chromosome, sorted by position
struct ChromosomeMarkers
{
    ChromosomeRef chromosome;
    std::vector<Marker> markers;
};

typedef std::vector<ChromosomeMarkers> MarkerMap;


/// split markers into chromosomes
///
/// Chromosomes are ordered by their first appearance in \p markers, markers within a chromosome are stably sorted
/// by position. Markers must reference a chromosome.
MarkerMap
getMarkersByChromosome(const std::vector<Marker>& markers);
