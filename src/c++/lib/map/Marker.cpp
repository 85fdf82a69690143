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

#include "map/Marker.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>



const int Marker::PSEUDOMARKER_COLUMN;



const std::string&
Marker::
getChromosomeName() const
{
    static const std::string unknownChromosome("?");
    if (! chromosome) return unknownChromosome;
    return chromosome->getName();
}



std::ostream&
operator<<(std::ostream& os, const Marker& marker)
{
    os << marker.name << " chr: " << marker.getChromosomeName() << " pos: " << marker.position;
    if (marker.isPseudomarker()) os << " (pseudomarker)";
    return os;
}



MarkerMap
getMarkersByChromosome(const std::vector<Marker>& markers)
{
    using namespace qtlmap::common;

    MarkerMap markerMap;
    std::map<const Chromosome*,unsigned> chromIndex;

    for (const Marker& marker : markers)
    {
        if (! marker.chromosome)
        {
            std::ostringstream oss;
            oss << "Marker has no chromosome: '" << marker.name << "'";
            BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
        }

        const auto iter(chromIndex.find(marker.chromosome.get()));
        unsigned index(0);
        if (iter == chromIndex.end())
        {
            index = markerMap.size();
            chromIndex[marker.chromosome.get()] = index;
            markerMap.push_back(ChromosomeMarkers());
            markerMap.back().chromosome = marker.chromosome;
        }
        else
        {
            index = iter->second;
        }
        markerMap[index].markers.push_back(marker);
    }

    for (ChromosomeMarkers& chromMarkers : markerMap)
    {
        std::stable_sort(chromMarkers.markers.begin(), chromMarkers.markers.end(),
                         [](const Marker& lhs, const Marker& rhs)
        {
            return (lhs.position < rhs.position);
        });
    }

    return markerMap;
}
