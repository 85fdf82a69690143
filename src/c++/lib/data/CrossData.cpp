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

#include "data/CrossData.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/trim.hpp"
#include "boost/lexical_cast.hpp"

#include <cmath>
#include <limits>
#include <sstream>



const double PHENOTYPE_NA(std::numeric_limits<double>::max());



double
parsePhenotypeValue(const std::string& str)
{
    const std::string value(boost::algorithm::trim_copy(str));
    if (ObservedGenotypeRegistry::isUnknownValueString(value)) return PHENOTYPE_NA;

    double phenotype(0);
    try
    {
        phenotype = boost::lexical_cast<double>(value);
    }
    catch (const boost::bad_lexical_cast&)
    {
        std::ostringstream oss;
        oss << "Can't parse phenotype value: '" << str << "'";
        BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
    }

    if (! std::isfinite(phenotype))
    {
        std::ostringstream oss;
        oss << "Phenotype value is not finite: '" << str << "'";
        BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
    }
    return phenotype;
}



std::vector<bool>
getIndividualsMissingAnyPhenotype(const PhenotypeMatrix& phenotypes)
{
    std::vector<bool> isMissing(phenotypes.getIndividualCount(), false);
    for (unsigned individualIndex(0); individualIndex<phenotypes.getIndividualCount(); ++individualIndex)
    {
        for (unsigned phenotypeIndex(0); phenotypeIndex<phenotypes.getColumnCount(); ++phenotypeIndex)
        {
            if (! isMissingPhenotype(phenotypes.get(individualIndex, phenotypeIndex))) continue;
            isMissing[individualIndex] = true;
            break;
        }
    }
    return isMissing;
}



GenotypeMatrix
convertToGenotypeMatrix(
    const std::vector<std::string>& columnNames,
    const std::vector<std::vector<std::string>>& genotypeStrings,
    const ObservedGenotypeRegistry& registry)
{
    GenotypeMatrix genotypes(columnNames);
    std::vector<GenotypeSymbolRef> row;
    for (unsigned individualIndex(0); individualIndex<genotypeStrings.size(); ++individualIndex)
    {
        row.clear();
        try
        {
            for (const std::string& genotypeString : genotypeStrings[individualIndex])
            {
                row.push_back(registry.decode(genotypeString));
            }
            genotypes.addIndividual(row);
        }
        catch (boost::exception& e)
        {
            e << qtlmap::common::errinfo_individual(individualIndex);
            throw;
        }
    }
    return genotypes;
}
