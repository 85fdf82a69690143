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

#include "map/GeneticMapFunction.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/case_conv.hpp"

#include <cmath>

#include <algorithm>
#include <iostream>
#include <sstream>



static const double centiMorgansPerMorgan(100.);



namespace MAP_FUNCTION
{

const char*
label(const index_t mapFunction)
{
    switch (mapFunction)
    {
    case HALDANE:
        return "haldane";
    case KOSAMBI:
        return "kosambi";
    case MORGAN:
        return "morgan";
    case SIZE:
        break;
    }
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unknown map function index"));
}



index_t
parse(const std::string& str)
{
    const std::string lowerStr(boost::algorithm::to_lower_copy(str));
    for (unsigned mapIndex(0); mapIndex<SIZE; ++mapIndex)
    {
        const index_t mapFunction(static_cast<index_t>(mapIndex));
        if (lowerStr == label(mapFunction)) return mapFunction;
    }

    std::ostringstream oss;
    oss << "Unknown map function: '" << str << "', expected one of: haldane kosambi morgan";
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}

}



double
mapDistanceToRecFrac(
    const double distanceCM,
    const MAP_FUNCTION::index_t mapFunction)
{
    if ((distanceCM < 0.) || std::isnan(distanceCM))
    {
        std::ostringstream oss;
        oss << "Invalid map distance: " << distanceCM << " cM";
        BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
    }

    const double morgans(distanceCM/centiMorgansPerMorgan);

    switch (mapFunction)
    {
    case MAP_FUNCTION::HALDANE:
        return 0.5*(-std::expm1(-2.*morgans));
    case MAP_FUNCTION::KOSAMBI:
        return 0.5*std::tanh(2.*morgans);
    case MAP_FUNCTION::MORGAN:
        return std::min(morgans, 0.5);
    case MAP_FUNCTION::SIZE:
        break;
    }
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unknown map function index"));
}



double
recFracToMapDistance(
    const double recFrac,
    const MAP_FUNCTION::index_t mapFunction)
{
    if ((recFrac < 0.) || (recFrac > 0.5) || std::isnan(recFrac))
    {
        std::ostringstream oss;
        oss << "Recombination fraction out of range [0,0.5]: " << recFrac;
        BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
    }

    double morgans(0.);
    switch (mapFunction)
    {
    case MAP_FUNCTION::HALDANE:
        morgans = -0.5*std::log1p(-2.*recFrac);
        break;
    case MAP_FUNCTION::KOSAMBI:
        morgans = 0.25*std::log((1.+2.*recFrac)/(1.-2.*recFrac));
        break;
    case MAP_FUNCTION::MORGAN:
        morgans = recFrac;
        break;
    case MAP_FUNCTION::SIZE:
        BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unknown map function index"));
    }
    return morgans*centiMorgansPerMorgan;
}



std::vector<double>
getRecombinationFractions(
    const std::vector<Marker>& positions,
    const MAP_FUNCTION::index_t mapFunction)
{
    std::vector<double> recFracs;
    if (positions.size() < 2) return recFracs;

    recFracs.reserve(positions.size()-1);
    for (unsigned positionIndex(1); positionIndex<positions.size(); ++positionIndex)
    {
        const Marker& left(positions[positionIndex-1]);
        const Marker& right(positions[positionIndex]);
        const double distance(right.position - left.position);
        if (distance < 0.)
        {
            std::ostringstream oss;
            oss << "Scan positions are not sorted on chromosome '" << right.getChromosomeName() << "': '"
                << left.name << "' at " << left.position << " cM precedes '" << right.name << "' at "
                << right.position << " cM";
            BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
        }
        recFracs.push_back(mapDistanceToRecFrac(distance, mapFunction));
    }
    return recFracs;
}



std::ostream&
operator<<(std::ostream& os, const MAP_FUNCTION::index_t mapFunction)
{
    os << MAP_FUNCTION::label(mapFunction);
    return os;
}
