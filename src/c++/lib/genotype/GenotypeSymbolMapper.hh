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
/// \brief observed genotype symbols and the true genotypes they stand for
///
/// The number of true genotypes at a locus is limited by the number of founders, but genotyping technologies
/// report many more observed calls, some of which are ambiguous (e.g. "not B"). Each distinct observed symbol in a
/// dataset is represented by exactly one GenotypeSymbolMapper, which every genotype matrix cell using that symbol
/// references through a shared handle.
///

#pragma once

#include "genotype/TrueGenotype.hh"

#include <iosfwd>
#include <memory>
#include <set>
#include <string>
#include <vector>


/// A named, deduplicated set of true genotypes plus all encoding strings which denote the same observed call
///
/// An empty genotype set denotes a missing (NA) observation.
///
class GenotypeSymbolMapper
{
public:
    typedef std::set<TrueGenotype> genotype_set_t;

    /// \param name display name of the symbol, this is also registered as its first encoding
    /// \param isPhaseKnown if false, every genotype added also adds its allele-reversed pair
    explicit
    GenotypeSymbolMapper(
        const std::string& name,
        const bool isPhaseKnown = true);

    /// \param names first entry is the display name, remaining entries are aliases
    GenotypeSymbolMapper(
        const std::vector<std::string>& names,
        const std::vector<TrueGenotype>& genotypes,
        const bool isPhaseKnown = true);

    /// uniquely add a true genotype to this symbol
    ///
    /// \return the stored genotype equal to \p genotype, the existing entry is returned unchanged if the pair
    /// was already present
    const TrueGenotype&
    add(const TrueGenotype& genotype);

    /// add all true genotypes of another symbol
    void
    add(const GenotypeSymbolMapper& other);

    /// add another alias for this symbol, repeated aliases are ignored
    void
    addEncoding(const std::string& encoding);

    bool
    match(const TrueGenotype& genotype) const
    {
        return (_genotypes.count(genotype) != 0);
    }

    bool
    matchEncoding(const std::string& encoding) const;

    /// the canonical alias of the symbol
    const std::string&
    getName() const
    {
        return _name;
    }

    const std::vector<std::string>&
    getEncodings() const
    {
        return _encodings;
    }

    const genotype_set_t&
    getGenotypes() const
    {
        return _genotypes;
    }

    unsigned
    size() const
    {
        return _genotypes.size();
    }

    bool
    isMissing() const
    {
        return _genotypes.empty();
    }

    bool
    isPhaseKnown() const
    {
        return _isPhaseKnown;
    }

    /// true if both symbols stand for the same set of true genotypes, names are not compared
    bool
    isSameGenotypeSet(const GenotypeSymbolMapper& rhs) const
    {
        return (_genotypes == rhs._genotypes);
    }

private:
    std::string _name;
    std::vector<std::string> _encodings;
    genotype_set_t _genotypes;
    bool _isPhaseKnown;
};


/// debug format, e.g. "[(0,1), (1,0)]" or "[NA]"
std::ostream&
operator<<(std::ostream& os, const GenotypeSymbolMapper& symbol);


/// Shared read-only handle to a registered symbol, genotype matrix cells hold these rather than copies
typedef std::shared_ptr<const GenotypeSymbolMapper> GenotypeSymbolRef;
