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

#include "genotype/ObservedGenotypeRegistry.hh"

#include "common/Exceptions.hh"

#include <iostream>
#include <sstream>



ObservedGenotypeRegistry::
ObservedGenotypeRegistry()
    : _defaultMissingSymbol(std::make_shared<GenotypeSymbolMapper>(
                                std::vector<std::string> {"NA", "-"},
                                std::vector<TrueGenotype>()))
{
}



bool
ObservedGenotypeRegistry::
isUnknownValueString(const std::string& str)
{
    return (str.empty() || (str == "NA") || (str == "-"));
}



GenotypeSymbolRef
ObservedGenotypeRegistry::
add(const GenotypeSymbolRef& symbol)
{
    using namespace qtlmap::common;

    if (! symbol)
    {
        BOOST_THROW_EXCEPTION(LogicException("Attempting to register an empty genotype symbol handle"));
    }

    // an identical symbol (same genotype set and encodings) resolves to the registered handle
    for (const GenotypeSymbolRef& registered : _symbols)
    {
        if (registered == symbol) return registered;
        if (registered->isSameGenotypeSet(*symbol) && (registered->getEncodings() == symbol->getEncodings()))
        {
            return registered;
        }
    }

    for (const std::string& encoding : symbol->getEncodings())
    {
        const auto iter(_encodingIndex.find(encoding));
        if (iter != _encodingIndex.end())
        {
            std::ostringstream oss;
            oss << "Duplicate genotype symbol alias '" << encoding << "' in symbol '" << symbol->getName()
                << "', alias is already defined by symbol '" << _symbols[iter->second]->getName() << "'";
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()) << errinfo_symbol(encoding));
        }

        if ((! symbol->isMissing()) && isUnknownValueString(encoding))
        {
            std::ostringstream oss;
            oss << "Genotype symbol '" << symbol->getName() << "' uses the unknown-value alias '" << encoding
                << "' but is not a missing symbol: " << (*symbol);
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()) << errinfo_symbol(encoding));
        }
    }

    const unsigned symbolIndex(_symbols.size());
    _symbols.push_back(symbol);
    for (const std::string& encoding : symbol->getEncodings())
    {
        _encodingIndex[encoding] = symbolIndex;
    }

    if (symbol->isMissing() && (! _firstMissingSymbol))
    {
        _firstMissingSymbol = symbol;
    }
    return symbol;
}



GenotypeSymbolRef
ObservedGenotypeRegistry::
add(const GenotypeSymbolMapper& symbol)
{
    return add(std::make_shared<const GenotypeSymbolMapper>(symbol));
}



GenotypeSymbolRef
ObservedGenotypeRegistry::
findByEncoding(const std::string& encoding) const
{
    const auto iter(_encodingIndex.find(encoding));
    if (iter == _encodingIndex.end()) return GenotypeSymbolRef();
    return _symbols[iter->second];
}



GenotypeSymbolRef
ObservedGenotypeRegistry::
getMissingSymbol() const
{
    if (_firstMissingSymbol) return _firstMissingSymbol;
    return _defaultMissingSymbol;
}



GenotypeSymbolRef
ObservedGenotypeRegistry::
decode(const std::string& str) const
{
    using namespace qtlmap::common;

    // aliases are unique across the registry, so the alias index returns the first (and only) match
    const GenotypeSymbolRef aliasMatch(findByEncoding(str));
    if (aliasMatch) return aliasMatch;

    if (isUnknownValueString(str)) return getMissingSymbol();

    TrueGenotype genotype(0,0);
    if (TrueGenotype::parse(str, genotype))
    {
        for (const GenotypeSymbolRef& symbol : _symbols)
        {
            if (symbol->isMissing()) continue;
            if (symbol->match(genotype)) return symbol;
        }
    }

    std::ostringstream oss;
    oss << "Failed to decode genotype '" << str << "'";
    BOOST_THROW_EXCEPTION(UnresolvedSymbolException(oss.str()) << errinfo_symbol(str));
}



std::ostream&
operator<<(std::ostream& os, const ObservedGenotypeRegistry& registry)
{
    bool isFirst(true);
    for (const GenotypeSymbolRef& symbol : registry.getSymbols())
    {
        if (! isFirst) os << ' ';
        os << symbol->getName() << '=' << (*symbol);
        isFirst = false;
    }
    return os;
}
