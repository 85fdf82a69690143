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
/// \brief registry of all observed genotype symbols active for a dataset or marker
///

#pragma once

#include "genotype/GenotypeSymbolMapper.hh"

#include <map>
#include <string>
#include <vector>


/// Tracks the observed genotype symbols of a dataset and decodes raw genotype strings into symbol handles
///
/// The registry is filled once while loading a dataset and is read-only afterwards, so concurrent decode() calls
/// are safe once construction has completed. Symbols are accumulated and never removed.
///
class ObservedGenotypeRegistry
{
public:
    ObservedGenotypeRegistry();

    /// register a new symbol
    ///
    /// Adding a handle which is already registered, or a symbol with the same genotype set and encodings as a
    /// registered one, returns the registered handle. A symbol with an alias already owned by
    /// another registered symbol, or a non-missing symbol using one of the unknown-value strings ("NA", "-" or
    /// the empty string) as an alias, is rejected with InvalidParameterException.
    ///
    /// \return the registered handle
    GenotypeSymbolRef
    add(const GenotypeSymbolRef& symbol);

    /// convenience overload, registers a copy of \p symbol
    GenotypeSymbolRef
    add(const GenotypeSymbolMapper& symbol);

    /// decode a raw genotype call
    ///
    /// Lookup order:
    /// 1. symbol name or alias, in registration order
    /// 2. unknown-value strings always decode to the missing symbol
    /// 3. the string parsed as a founder pair (e.g. "1,0"): the first non-missing symbol containing that pair
    ///
    /// Throws UnresolvedSymbolException if none of these succeeds.
    ///
    GenotypeSymbolRef
    decode(const std::string& str) const;

    /// \return the symbol owning alias \p encoding, or an empty handle
    GenotypeSymbolRef
    findByEncoding(const std::string& encoding) const;

    /// the first registered missing symbol, or a built-in "NA" symbol if none was registered
    GenotypeSymbolRef
    getMissingSymbol() const;

    const std::vector<GenotypeSymbolRef>&
    getSymbols() const
    {
        return _symbols;
    }

    unsigned
    size() const
    {
        return _symbols.size();
    }

    /// true for "NA", "-" and the empty string
    static
    bool
    isUnknownValueString(const std::string& str);

private:
    std::vector<GenotypeSymbolRef> _symbols;

    /// alias -> index into _symbols
    std::map<std::string,unsigned> _encodingIndex;

    GenotypeSymbolRef _defaultMissingSymbol;
    GenotypeSymbolRef _firstMissingSymbol;
};


std::ostream&
operator<<(std::ostream& os, const ObservedGenotypeRegistry& registry);
