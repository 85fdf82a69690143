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

#include "boost/test/unit_test.hpp"

#include "common/Exceptions.hh"
#include "genotype/GenotypeEncoding.hh"
#include "genotype/ObservedGenotypeRegistry.hh"


using namespace qtlmap::common;


/// recombinant inbred alphabet with the missing symbol accepting "-" as well
static
void
addRisibSymbols(ObservedGenotypeRegistry& registry)
{
    registry.add(GenotypeSymbolMapper(std::vector<std::string> {"NA", "-"}, std::vector<TrueGenotype>()));
    registry.add(GenotypeSymbolMapper({"A", "AA"}, {TrueGenotype(0,0)}));
    registry.add(GenotypeSymbolMapper({"B", "BB"}, {TrueGenotype(1,1)}));
}



BOOST_AUTO_TEST_SUITE( ObservedGenotypeRegistryTest )

BOOST_AUTO_TEST_CASE( testDecodeByAlias )
{
    ObservedGenotypeRegistry registry;
    addRisibSymbols(registry);
    BOOST_REQUIRE_EQUAL(registry.size(), 3u);

    const GenotypeSymbolRef a(registry.decode("A"));
    BOOST_REQUIRE(a->match(TrueGenotype(0,0)));
    BOOST_REQUIRE_EQUAL(registry.decode("AA"), a);
    BOOST_REQUIRE(registry.decode("-")->isMissing());
    BOOST_REQUIRE_EQUAL(registry.decode("-"), registry.decode("NA"));
}


BOOST_AUTO_TEST_CASE( testDecodeByTrueGenotype )
{
    ObservedGenotypeRegistry registry;
    addRisibSymbols(registry);

    BOOST_REQUIRE_EQUAL(registry.decode("1,1"), registry.decode("B"));
    BOOST_REQUIRE_THROW(registry.decode("0,1"), UnresolvedSymbolException);
    BOOST_REQUIRE_THROW(registry.decode("C"), UnresolvedSymbolException);
}


BOOST_AUTO_TEST_CASE( testDecodeReturnsFirstRegisteredMatch )
{
    ObservedGenotypeRegistry registry;
    const GenotypeSymbolRef h(registry.add(GenotypeSymbolMapper({"H"}, {TrueGenotype(0,1), TrueGenotype(1,0)})));
    registry.add(GenotypeSymbolMapper({"D"}, {TrueGenotype(0,0), TrueGenotype(0,1), TrueGenotype(1,0)}));

    BOOST_REQUIRE_EQUAL(registry.decode("1,0"), h);
    BOOST_REQUIRE(registry.decode("0,0")->matchEncoding("D"));
}


BOOST_AUTO_TEST_CASE( testDecodeIsIdempotent )
{
    ObservedGenotypeRegistry registry;
    addRisibSymbols(registry);

    for (const std::string& str : {"A", "BB", "1,1", "0,0", "-", "NA"})
    {
        const GenotypeSymbolRef symbol(registry.decode(str));
        BOOST_REQUIRE_EQUAL(registry.decode(symbol->getName()), symbol);
    }
}


BOOST_AUTO_TEST_CASE( testUnknownValuesAlwaysDecode )
{
    // no missing symbol registered, the built-in missing symbol is used
    ObservedGenotypeRegistry registry;
    registry.add(GenotypeSymbolMapper({"A"}, {TrueGenotype(0,0)}));

    BOOST_REQUIRE(registry.decode("NA")->isMissing());
    BOOST_REQUIRE(registry.decode("-")->isMissing());
    BOOST_REQUIRE(registry.decode("")->isMissing());
    BOOST_REQUIRE_EQUAL(registry.decode(""), registry.getMissingSymbol());
}


BOOST_AUTO_TEST_CASE( testDuplicateAliasIsRejected )
{
    ObservedGenotypeRegistry registry;
    addRisibSymbols(registry);

    BOOST_REQUIRE_THROW(registry.add(GenotypeSymbolMapper({"AB", "BB"}, {TrueGenotype(0,1)})),
                        InvalidParameterException);

    // registering the same handle again is a no-op
    const GenotypeSymbolRef a(registry.decode("A"));
    BOOST_REQUIRE_EQUAL(registry.add(a), a);
    BOOST_REQUIRE_EQUAL(registry.size(), 3u);
}


BOOST_AUTO_TEST_CASE( testIdenticalSymbolResolvesToRegistered )
{
    ObservedGenotypeRegistry registry;
    const GenotypeSymbolRef a(registry.add(GenotypeSymbolMapper(std::vector<std::string>{"A"},
                                                                {TrueGenotype(0,0)})));

    // a distinct but identical object is not a duplicate alias
    const GenotypeSymbolRef again(registry.add(GenotypeSymbolMapper(std::vector<std::string>{"A"},
                                                                    {TrueGenotype(0,0)})));
    BOOST_REQUIRE_EQUAL(again, a);
    BOOST_REQUIRE_EQUAL(registry.size(), 1u);

    // same name, different genotypes
    BOOST_REQUIRE_THROW(registry.add(GenotypeSymbolMapper(std::vector<std::string>{"A"}, {TrueGenotype(1,1)})),
                        InvalidParameterException);

    // same genotypes, an extra alias colliding with the registered name
    BOOST_REQUIRE_THROW(registry.add(GenotypeSymbolMapper(std::vector<std::string>{"A", "AA"},
                                                          {TrueGenotype(0,0)})),
                        InvalidParameterException);
    BOOST_REQUIRE_EQUAL(registry.size(), 1u);
}


BOOST_AUTO_TEST_CASE( testUnknownValueAliasOnGenotype )
{
    ObservedGenotypeRegistry registry;
    BOOST_REQUIRE_THROW(registry.add(GenotypeSymbolMapper({"X", "-"}, {TrueGenotype(0,0)})),
                        InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( testSharedHandles )
{
    ObservedGenotypeRegistry registry;
    addRisibSymbols(registry);

    // every decode of the same call yields the same physical symbol
    std::vector<GenotypeSymbolRef> cells;
    for (unsigned cellIndex(0); cellIndex<100; ++cellIndex)
    {
        cells.push_back(registry.decode((cellIndex % 2) ? "A" : "0,0"));
    }
    for (const GenotypeSymbolRef& cell : cells)
    {
        BOOST_REQUIRE_EQUAL(cell.get(), cells.front().get());
    }
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( GenotypeEncodingTest )

BOOST_AUTO_TEST_CASE( testParseGenotypeEncoding )
{
    GenotypeEncoding encoding;
    parseGenotypeEncoding("GENOTYPE AC,CA as 0,2 2,0      # phase unknown", encoding);
    BOOST_REQUIRE_EQUAL(encoding.names.size(), 2u);
    BOOST_REQUIRE_EQUAL(encoding.names[1], "CA");
    BOOST_REQUIRE_EQUAL(encoding.genotypes.size(), 2u);
    BOOST_REQUIRE(encoding.genotypes[1] == TrueGenotype(2,0));

    parseGenotypeEncoding("GENOTYPE NA,- as None", encoding);
    BOOST_REQUIRE_EQUAL(encoding.names.size(), 2u);
    BOOST_REQUIRE(encoding.genotypes.empty());
}


BOOST_AUTO_TEST_CASE( testMalformedEncoding )
{
    GenotypeEncoding encoding;
    BOOST_REQUIRE_THROW(parseGenotypeEncoding("A as 0,0", encoding), InvalidParameterException);
    BOOST_REQUIRE_THROW(parseGenotypeEncoding("GENOTYPE A 0,0", encoding), InvalidParameterException);
    BOOST_REQUIRE_THROW(parseGenotypeEncoding("GENOTYPE A as 0:0", encoding), InvalidParameterException);
    BOOST_REQUIRE_THROW(parseGenotypeEncoding("GENOTYPE as 0,0", encoding), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( testAddGenotypeEncodings )
{
    const std::vector<std::string> lines =
    {
        "# founder pairs of a two-way cross",
        "GENOTYPE NA,- as None",
        "GENOTYPE A as 0,0",
        "",
        "GENOTYPE B,BB as 1,1",
        "GENOTYPE AB as 1,0",
        "GENOTYPE BA as 1,0",
        "GENOTYPE AorB as 0,0 1,1"
    };

    ObservedGenotypeRegistry registry;
    addGenotypeEncodings(lines, registry);
    BOOST_REQUIRE_EQUAL(registry.size(), 6u);

    // distinct names for the same genotype set are distinct symbols
    BOOST_REQUIRE(registry.decode("AB") != registry.decode("BA"));
    BOOST_REQUIRE(registry.decode("AB")->isSameGenotypeSet(*registry.decode("BA")));
    BOOST_REQUIRE_EQUAL(registry.decode("BB"), registry.decode("B"));
    BOOST_REQUIRE_EQUAL(registry.decode("AorB")->size(), 2u);

    BOOST_REQUIRE_THROW(addGenotypeEncoding("GENOTYPE C,BB as 2,2", registry), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( testRepeatedEncodingLines )
{
    const std::vector<std::string> lines =
    {
        "GENOTYPE A as 0,0",
        "GENOTYPE B as 1,1",
        "GENOTYPE B as 1,1"
    };

    ObservedGenotypeRegistry registry;
    addGenotypeEncodings(lines, registry);
    BOOST_REQUIRE_EQUAL(registry.size(), 2u);
    BOOST_REQUIRE(registry.decode("B")->match(TrueGenotype(1,1)));

    BOOST_REQUIRE_EQUAL(addGenotypeEncoding("GENOTYPE A as 0,0", registry), registry.decode("A"));
    BOOST_REQUIRE_EQUAL(registry.size(), 2u);
}

BOOST_AUTO_TEST_SUITE_END()
