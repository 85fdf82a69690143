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
/// \brief conversion between genetic map distance and recombination fraction
///

#pragma once

#include "map/Marker.hh"

#include <iosfwd>
#include <string>
#include <vector>


namespace MAP_FUNCTION
{
enum index_t
{
    HALDANE,
    KOSAMBI,
    MORGAN,
    SIZE
};

const char*
label(const index_t mapFunction);

/// parse a map function label, case insensitive
///
/// throws InvalidParameterException for unknown labels
index_t
parse(const std::string& str);
}


/// convert a map distance in cM to a recombination fraction
///
/// Haldane: r = (1 - exp(-2d))/2, Kosambi: r = tanh(2d)/2, Morgan: r = min(d,1/2), with d in Morgans.
///
/// throws PreConditionException for negative distances
double
mapDistanceToRecFrac(
    const double distanceCM,
    const MAP_FUNCTION::index_t mapFunction);


/// convert a recombination fraction in [0,0.5] to a map distance in cM
double
recFracToMapDistance(
    const double recFrac,
    const MAP_FUNCTION::index_t mapFunction);


/// recombination fractions between each pair of consecutive positions
///
/// \param positions scan positions of one chromosome, sorted by map position
///
/// \return a vector with one entry less than \p positions (empty for fewer than 2 positions)
std::vector<double>
getRecombinationFractions(
    const std::vector<Marker>& positions,
    const MAP_FUNCTION::index_t mapFunction);


std::ostream&
operator<<(std::ostream& os, const MAP_FUNCTION::index_t mapFunction);
