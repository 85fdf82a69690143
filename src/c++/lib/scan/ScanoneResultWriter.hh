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
/// \brief tab separated report tables of a genome scan
///

#pragma once

#include "scan/ScanoneRunner.hh"

#include <iosfwd>


/// LOD table with header "chr pos marker <phenotype...>", one row per scan position, NaN is written as NA
///
/// Skipped chromosomes are not written.
void
writeLodTable(
    const ScanoneResult& result,
    std::ostream& os);


/// peak table with header "chr phenotype marker pos lod", one row per chromosome and phenotype
void
writePeakTable(
    const ScanoneResult& result,
    std::ostream& os);
