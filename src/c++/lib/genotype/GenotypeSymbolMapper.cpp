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

#include "genotype/GenotypeSymbolMapper.hh"

#include <algorithm>
#include <iostream>
#include <sstream>



GenotypeSymbolMapper::
GenotypeSymbolMapper(
    const std::string& name,
    const bool isPhaseKnown)
    : _name(name),
      _isPhaseKnown(isPhaseKnown)
{
    addEncoding(name);
}



GenotypeSymbolMapper::
GenotypeSymbolMapper(
    const std::vector<std::string>& names,
    const std::vector<TrueGenotype>& genotypes,
    const bool isPhaseKnown)
    : _name(names.empty() ? std::string() : names.front()),
      _isPhaseKnown(isPhaseKnown)
{
    for (const std::string& name : names)
    {
        addEncoding(name);
    }
    for (const TrueGenotype& genotype : genotypes)
    {
        add(genotype);
    }
}



const TrueGenotype&
GenotypeSymbolMapper::
add(const TrueGenotype& genotype)
{
    const TrueGenotype& stored(*(_genotypes.insert(genotype).first));
    if (! _isPhaseKnown)
    {
        _genotypes.insert(genotype.reversed());
    }
    return stored;
}



void
GenotypeSymbolMapper::
add(const GenotypeSymbolMapper& other)
{
    for (const TrueGenotype& genotype : other.getGenotypes())
    {
        add(genotype);
    }
}



void
GenotypeSymbolMapper::
addEncoding(const std::string& encoding)
{
    if (matchEncoding(encoding)) return;
    _encodings.push_back(encoding);
}



bool
GenotypeSymbolMapper::
matchEncoding(const std::string& encoding) const
{
    return (std::find(_encodings.begin(), _encodings.end(), encoding) != _encodings.end());
}



std::ostream&
operator<<(std::ostream& os, const GenotypeSymbolMapper& symbol)
{
    if (symbol.isMissing())
    {
        os << "[NA]";
        return os;
    }

    os << '[';
    bool isFirst(true);
    for (const TrueGenotype& genotype : symbol.getGenotypes())
    {
        if (! isFirst) os << ", ";
        os << genotype;
        isFirst = false;
    }
    os << ']';
    return os;
}
