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
/// \brief insertion of pseudomarker scan positions between genotyped markers
///

#pragma once

#include "map/Marker.hh"

#include <iosfwd>
#include <string>
#include <vector>


namespace PSEUDOMARKER_POLICY
{
enum index_t
{
    /// regular grid from the first to the last marker, regardless of marker density
    STEPPED,
    /// only fill gaps between adjacent positions which exceed the spacing
    MINIMAL,
    SIZE
};

const char*
label(const index_t policy);

/// throws InvalidParameterException for unknown labels
index_t
parse(const std::string& str);
}


/// positions closer than this (in cM) are treated as the same map location
extern const double pseudomarkerPositionTolerance;


/// insert pseudomarkers on a regular grid starting at the first marker position
///
/// Grid points coinciding with an existing marker position are not inserted.
///
/// \param markers markers of one chromosome, sorted by position
/// \param spacing grid spacing in cM, must be positive
std::vector<Marker>
addSteppedMarkers(
    const std::vector<Marker>& markers,
    const double spacing);


/// insert evenly spaced pseudomarkers into every gap wider than \p spacing so that no gap exceeds it
///
/// \param markers markers of one chromosome, sorted by position
/// \param spacing maximum gap in cM, must be positive
std::vector<Marker>
addMinimalMarkers(
    const std::vector<Marker>& markers,
    const double spacing);


/// apply the selected pseudomarker policy to every chromosome
///
/// Output positions per chromosome remain sorted by map position.
MarkerMap
addPseudomarkers(
    const MarkerMap& markerMap,
    const double spacing,
    const PSEUDOMARKER_POLICY::index_t policy);


std::ostream&
operator<<(std::ostream& os, const PSEUDOMARKER_POLICY::index_t policy);
