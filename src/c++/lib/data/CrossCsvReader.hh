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
/// \brief reader for cross data in the R/qtl "csv" layout
///
/// The layout is a comma separated table:
///
///   row 1: column names
///   row 2: chromosome of each marker column, empty for phenotype columns
///   row 3: map position (cM) of each marker column, empty for phenotype columns
///   row 4+: one individual per row
///
/// Chromosome "X" (any case) is flagged as a sex chromosome.
///

#pragma once

#include "data/CrossData.hh"
#include "genotype/ObservedGenotypeRegistry.hh"

#include <iosfwd>
#include <string>


/// read a cross file, genotype strings are decoded through \p registry
///
/// throws IoException if the file can't be opened, all exceptions are tagged with the file name and, for
/// parse errors, with the line number
CrossData
readCrossCsv(
    const std::string& filename,
    const ObservedGenotypeRegistry& registry);


/// read cross data from an open stream
///
/// \param datasetName used only to tag exceptions
CrossData
readCrossCsv(
    std::istream& is,
    const std::string& datasetName,
    const ObservedGenotypeRegistry& registry);
