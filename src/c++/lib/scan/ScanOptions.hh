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
/// \brief analysis settings of a single-QTL genome scan
///

#pragma once

#include "cross/CrossType.hh"
#include "map/GeneticMapFunction.hh"
#include "map/PseudomarkerUtil.hh"


struct ScanOptions
{
    CROSS_TYPE::index_t crossType = CROSS_TYPE::F2;
    MAP_FUNCTION::index_t mapFunction = MAP_FUNCTION::HALDANE;
    PSEUDOMARKER_POLICY::index_t pseudomarkerPolicy = PSEUDOMARKER_POLICY::MINIMAL;

    /// pseudomarker spacing in cM
    double stepSize = 2.0;

    /// genotyping error probability
    double errorProb = 0.002;

    /// peaks at or below this LOD are not reported
    double lodThreshold = 2.0;

    /// number of chromosomes scanned concurrently
    unsigned threadCount = 1;
};
