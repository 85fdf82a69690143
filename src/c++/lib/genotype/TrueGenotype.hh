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
/// \brief a single founder-allele pair
///

#pragma once

#include <iosfwd>
#include <string>


/// index of a founder line of the cross, the 2 founders of a biparental cross are 0 and 1
typedef unsigned FounderIndex;


/// One concrete diploid genotype: the pair of founder alleles at a locus
///
/// The pair is ordered (first allele, second allele), so (0,1) and (1,0) are distinct phase-known genotypes.
/// Values are immutable once constructed. Ordering is first allele major, second allele minor.
///
class TrueGenotype
{
public:
    TrueGenotype(
        const FounderIndex founder1,
        const FounderIndex founder2)
        : _founder1(founder1),
          _founder2(founder2)
    {}

    FounderIndex
    getFirst() const
    {
        return _founder1;
    }

    FounderIndex
    getSecond() const
    {
        return _founder2;
    }

    bool
    isHomozygous() const
    {
        return (_founder1 == _founder2);
    }

    /// the same genotype with allele order swapped, used when phase is unknown
    TrueGenotype
    reversed() const
    {
        return TrueGenotype(_founder2, _founder1);
    }

    /// short string form used in input files, e.g. "1,0"
    std::string
    toString() const;

    bool
    operator==(const TrueGenotype& rhs) const
    {
        return ((_founder1 == rhs._founder1) && (_founder2 == rhs._founder2));
    }

    bool
    operator!=(const TrueGenotype& rhs) const
    {
        return (! (*this == rhs));
    }

    bool
    operator<(const TrueGenotype& rhs) const
    {
        if (_founder1 != rhs._founder1) return (_founder1 < rhs._founder1);
        return (_founder2 < rhs._founder2);
    }

    /// parse a comma separated founder pair such as "0,1"
    ///
    /// surrounding whitespace is ignored
    ///
    /// \return false if str is not a well-formed founder pair, result is unchanged in this case
    static
    bool
    parse(
        const std::string& str,
        TrueGenotype& result);

private:
    FounderIndex _founder1;
    FounderIndex _founder2;
};


/// debug format, e.g. "(1,0)"
std::ostream&
operator<<(std::ostream& os, const TrueGenotype& genotype);
