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
/// \brief the genotype, phenotype and covariate matrices of one cross dataset
///

#pragma once

#include "data/IndividualMatrix.hh"
#include "genotype/GenotypeSymbolMapper.hh"
#include "genotype/ObservedGenotypeRegistry.hh"
#include "map/Marker.hh"

#include <string>
#include <vector>


typedef IndividualMatrix<GenotypeSymbolRef> GenotypeMatrix;
typedef IndividualMatrix<double> PhenotypeMatrix;
typedef IndividualMatrix<double> CovariateMatrix;


/// value of a missing phenotype, compared by equality rather than as NaN
extern const double PHENOTYPE_NA;

inline
bool
isMissingPhenotype(const double value)
{
    return (value == PHENOTYPE_NA);
}


/// parse a single phenotype value, "NA", "-" and the empty string are missing
///
/// throws InvalidParameterException for non-numeric values
double
parsePhenotypeValue(const std::string& str);


/// \return one flag per individual, set if any phenotype of the individual is missing
std::vector<bool>
getIndividualsMissingAnyPhenotype(const PhenotypeMatrix& phenotypes);


/// decode a matrix of raw genotype strings through the registry
///
/// \param columnNames marker names, one per column of \p genotypeStrings
///
/// throws UnresolvedSymbolException tagged with the individual index for undecodable strings
GenotypeMatrix
convertToGenotypeMatrix(
    const std::vector<std::string>& columnNames,
    const std::vector<std::vector<std::string>>& genotypeStrings,
    const ObservedGenotypeRegistry& registry);


/// Everything loaded from a cross input file
///
/// Marker genotypeColumn values index into the columns of genotypes.
struct CrossData
{
    std::vector<Marker> markers;
    GenotypeMatrix genotypes;
    PhenotypeMatrix phenotypes;
};
