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
/// \brief default observed genotype alphabets of each cross design
///

#pragma once

#include "cross/CrossType.hh"
#include "genotype/ObservedGenotypeRegistry.hh"

#include <string>


/// default genotype codes for \p crossType, e.g. "A H B D C" for F2
const char*
getDefaultGenotypeCodes(const CROSS_TYPE::index_t crossType);


/// Register the observed symbols of a standard cross alphabet
///
/// \param genotypeCodes whitespace separated codes in cross order:
///   F2: "A H B D C", where D is "not B" (AA or AB) and C is "not A" (AB or BB)
///   BC: "A H"
///   RISELF, RISIB: "A B"
///
/// \param missingCodes whitespace separated codes for a missing call, e.g. "NA -"
///
/// throws InvalidParameterException if too few codes are supplied
void
addCrossGenotypeSymbols(
    const CROSS_TYPE::index_t crossType,
    const std::string& genotypeCodes,
    const std::string& missingCodes,
    ObservedGenotypeRegistry& registry);
