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
/// \brief parse run-time genotype symbol definitions
///
/// An encoding defines observed symbols in terms of founder pairs, one definition per line:
///
///   GENOTYPE NA,- as None
///   GENOTYPE A as 0,0
///   GENOTYPE B,BB as 1,1           # B and BB both represent 1,1
///   GENOTYPE AB as 1,0             # phase known
///   GENOTYPE AC,CA as 0,2 2,0      # phase unknown, both orders listed
///   GENOTYPE AorB as 0,0 1,1
///
/// The first name is the display name, further comma separated names are aliases. Each name may be defined only
/// once per registry.
///

#pragma once

#include "genotype/ObservedGenotypeRegistry.hh"

#include <string>
#include <vector>


struct GenotypeEncoding
{
    std::vector<std::string> names;
    std::vector<TrueGenotype> genotypes;
};


/// parse a single "GENOTYPE ... as ..." line
///
/// throws InvalidParameterException for malformed lines
void
parseGenotypeEncoding(
    const std::string& line,
    GenotypeEncoding& encoding);


/// parse a definition line and register the resulting symbol
GenotypeSymbolRef
addGenotypeEncoding(
    const std::string& line,
    ObservedGenotypeRegistry& registry);


/// register every definition in \p lines, blank lines and lines starting with '#' are skipped
void
addGenotypeEncodings(
    const std::vector<std::string>& lines,
    ObservedGenotypeRegistry& registry);


/// register every definition from a text file
void
readGenotypeEncodingFile(
    const std::string& filename,
    ObservedGenotypeRegistry& registry);
