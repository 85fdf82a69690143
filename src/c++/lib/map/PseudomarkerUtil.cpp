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

#include "map/PseudomarkerUtil.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/case_conv.hpp"

#include <cmath>

#include <iostream>
#include <sstream>



const double pseudomarkerPositionTolerance(1e-6);



namespace PSEUDOMARKER_POLICY
{

const char*
label(const index_t policy)
{
    switch (policy)
    {
    case STEPPED:
        return "stepped";
    case MINIMAL:
        return "minimal";
    case SIZE:
        break;
    }
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unknown pseudomarker policy index"));
}



index_t
parse(const std::string& str)
{
    const std::string lowerStr(boost::algorithm::to_lower_copy(str));
    for (unsigned policyIndex(0); policyIndex<SIZE; ++policyIndex)
    {
        const index_t policy(static_cast<index_t>(policyIndex));
        if (lowerStr == label(policy)) return policy;
    }

    std::ostringstream oss;
    oss << "Unknown pseudomarker policy: '" << str << "', expected one of: stepped minimal";
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}

}



static
void
checkSpacing(const double spacing)
{
    if ((spacing > 0.) && std::isfinite(spacing)) return;

    std::ostringstream oss;
    oss << "Pseudomarker spacing must be positive, found: " << spacing;
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}



static
void
checkMarkerPositions(const std::vector<Marker>& markers)
{
    for (const Marker& marker : markers)
    {
        if (std::isfinite(marker.position)) continue;

        std::ostringstream oss;
        oss << "Marker position is not finite: '" << marker << "'";
        BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
    }

    for (unsigned markerIndex(1); markerIndex<markers.size(); ++markerIndex)
    {
        if (markers[markerIndex].position >= markers[markerIndex-1].position) continue;

        std::ostringstream oss;
        oss << "Markers are not sorted by position: '" << markers[markerIndex-1] << "' precedes '"
            << markers[markerIndex] << "'";
        BOOST_THROW_EXCEPTION(qtlmap::common::PreConditionException(oss.str()));
    }
}



static
Marker
makePseudomarker(
    const ChromosomeRef& chromosome,
    const double position)
{
    std::ostringstream oss;
    oss << "c" << (chromosome ? chromosome->getName() : std::string("?")) << ".loc" << position;
    return Marker(oss.str(), chromosome, position);
}



std::vector<Marker>
addSteppedMarkers(
    const std::vector<Marker>& markers,
    const double spacing)
{
    checkSpacing(spacing);
    checkMarkerPositions(markers);

    std::vector<Marker> result;
    if (markers.empty()) return result;

    const ChromosomeRef& chromosome(markers.front().chromosome);
    const double startPosition(markers.front().position);
    const double endPosition(markers.back().position);

    // grid positions are computed from the start each time so that rounding error does not accumulate
    unsigned gridIndex(0);
    unsigned markerIndex(0);
    while (true)
    {
        const double gridPosition(startPosition + gridIndex*spacing);
        const bool isGridDone(gridPosition > (endPosition + pseudomarkerPositionTolerance));
        if (isGridDone && (markerIndex >= markers.size())) break;

        if ((markerIndex < markers.size()) &&
            (isGridDone || (markers[markerIndex].position <= (gridPosition + pseudomarkerPositionTolerance))))
        {
            result.push_back(markers[markerIndex]);
            markerIndex++;
            continue;
        }

        // the grid point is not covered by the marker just written out:
        if (result.empty() ||
            (std::abs(result.back().position - gridPosition) > pseudomarkerPositionTolerance))
        {
            result.push_back(makePseudomarker(chromosome, gridPosition));
        }
        gridIndex++;
    }

    return result;
}



std::vector<Marker>
addMinimalMarkers(
    const std::vector<Marker>& markers,
    const double spacing)
{
    checkSpacing(spacing);
    checkMarkerPositions(markers);

    std::vector<Marker> result;
    for (unsigned markerIndex(0); markerIndex<markers.size(); ++markerIndex)
    {
        if (markerIndex > 0)
        {
            const double leftPosition(markers[markerIndex-1].position);
            const double gap(markers[markerIndex].position - leftPosition);
            if (gap > (spacing + pseudomarkerPositionTolerance))
            {
                const unsigned insertCount(static_cast<unsigned>(std::ceil((gap/spacing) - pseudomarkerPositionTolerance))-1);
                const double insertSpacing(gap/(insertCount+1));
                for (unsigned insertIndex(1); insertIndex<=insertCount; ++insertIndex)
                {
                    result.push_back(makePseudomarker(markers[markerIndex].chromosome,
                                                      leftPosition + insertIndex*insertSpacing));
                }
            }
        }
        result.push_back(markers[markerIndex]);
    }
    return result;
}



MarkerMap
addPseudomarkers(
    const MarkerMap& markerMap,
    const double spacing,
    const PSEUDOMARKER_POLICY::index_t policy)
{
    MarkerMap result;
    for (const ChromosomeMarkers& chromMarkers : markerMap)
    {
        ChromosomeMarkers scanMarkers;
        scanMarkers.chromosome = chromMarkers.chromosome;
        switch (policy)
        {
        case PSEUDOMARKER_POLICY::STEPPED:
            scanMarkers.markers = addSteppedMarkers(chromMarkers.markers, spacing);
            break;
        case PSEUDOMARKER_POLICY::MINIMAL:
            scanMarkers.markers = addMinimalMarkers(chromMarkers.markers, spacing);
            break;
        case PSEUDOMARKER_POLICY::SIZE:
            BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unknown pseudomarker policy index"));
        }
        result.push_back(scanMarkers);
    }
    return result;
}



std::ostream&
operator<<(std::ostream& os, const PSEUDOMARKER_POLICY::index_t policy)
{
    os << PSEUDOMARKER_POLICY::label(policy);
    return os;
}
