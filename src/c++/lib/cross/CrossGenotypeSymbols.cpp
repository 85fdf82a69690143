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

#include "cross/CrossGenotypeSymbols.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string.hpp"

#include <sstream>
#include <vector>



static
void
splitCodes(
    const std::string& codes,
    std::vector<std::string>& result)
{
    result.clear();
    const std::string trimmed(boost::algorithm::trim_copy(codes));
    if (trimmed.empty()) return;
    boost::algorithm::split(result, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
}



static
void
checkCodeCount(
    const CROSS_TYPE::index_t crossType,
    const std::vector<std::string>& codes,
    const unsigned expectedCount)
{
    if (codes.size() >= expectedCount) return;

    std::ostringstream oss;
    oss << "Need to provide " << expectedCount << " genotype symbols for cross type " << crossType
        << " (eg, '" << getDefaultGenotypeCodes(crossType) << "'), found " << codes.size();
    BOOST_THROW_EXCEPTION(qtlmap::common::InvalidParameterException(oss.str()));
}



const char*
getDefaultGenotypeCodes(const CROSS_TYPE::index_t crossType)
{
    switch (crossType)
    {
    case CROSS_TYPE::F2:
        return "A H B D C";
    case CROSS_TYPE::BC:
        return "A H";
    case CROSS_TYPE::RISELF:
    case CROSS_TYPE::RISIB:
        return "A B";
    case CROSS_TYPE::SIZE:
        break;
    }
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unhandled cross type in getDefaultGenotypeCodes"));
}



void
addCrossGenotypeSymbols(
    const CROSS_TYPE::index_t crossType,
    const std::string& genotypeCodes,
    const std::string& missingCodes,
    ObservedGenotypeRegistry& registry)
{
    std::vector<std::string> codes;
    splitCodes(genotypeCodes, codes);

    std::vector<std::string> naCodes;
    splitCodes(missingCodes, naCodes);
    if (! naCodes.empty())
    {
        registry.add(GenotypeSymbolMapper(naCodes, std::vector<TrueGenotype>()));
    }

    const TrueGenotype aa(0,0);
    const TrueGenotype ab(0,1);
    const TrueGenotype ba(1,0);
    const TrueGenotype bb(1,1);

    switch (crossType)
    {
    case CROSS_TYPE::F2:
        checkCodeCount(crossType, codes, 5);
        registry.add(GenotypeSymbolMapper({codes[0]}, {aa}));
        registry.add(GenotypeSymbolMapper({codes[2]}, {bb}));
        registry.add(GenotypeSymbolMapper({codes[1]}, {ab, ba}));
        registry.add(GenotypeSymbolMapper({codes[3]}, {aa, ab, ba}));
        registry.add(GenotypeSymbolMapper({codes[4]}, {ab, ba, bb}));
        return;
    case CROSS_TYPE::BC:
        checkCodeCount(crossType, codes, 2);
        registry.add(GenotypeSymbolMapper({codes[0]}, {aa}));
        registry.add(GenotypeSymbolMapper({codes[1]}, {ab, ba}));
        return;
    case CROSS_TYPE::RISELF:
    case CROSS_TYPE::RISIB:
        checkCodeCount(crossType, codes, 2);
        registry.add(GenotypeSymbolMapper({codes[0]}, {aa}));
        registry.add(GenotypeSymbolMapper({codes[1]}, {bb}));
        return;
    case CROSS_TYPE::SIZE:
        break;
    }
    BOOST_THROW_EXCEPTION(qtlmap::common::LogicException("Unhandled cross type in addCrossGenotypeSymbols"));
}
