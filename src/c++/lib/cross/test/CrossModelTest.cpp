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

#include "blt_util/logSumUtil.hh"
#include "common/Exceptions.hh"
#include "cross/CrossGenotypeSymbols.hh"
#include "cross/CrossModel.hh"


using namespace qtlmap::common;


static
std::vector<CROSS_TYPE::index_t>
getAllCrossTypes()
{
    return {CROSS_TYPE::BC, CROSS_TYPE::F2, CROSS_TYPE::RISELF, CROSS_TYPE::RISIB};
}



BOOST_AUTO_TEST_SUITE( CrossModelTest )

BOOST_AUTO_TEST_CASE( testCrossTypeParse )
{
    BOOST_REQUIRE(CROSS_TYPE::parse("f2") == CROSS_TYPE::F2);
    BOOST_REQUIRE(CROSS_TYPE::parse("RISIB") == CROSS_TYPE::RISIB);
    BOOST_REQUIRE_EQUAL(std::string(CROSS_TYPE::label(CROSS_TYPE::BC)), "BC");
    BOOST_REQUIRE_THROW(CROSS_TYPE::parse("F3"), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( testPossibleGenotypes )
{
    const CrossModel f2(CROSS_TYPE::F2);
    BOOST_REQUIRE_EQUAL(f2.getGenotypeCount(), 3u);
    BOOST_REQUIRE_EQUAL(f2.getGenotypeIndex(TrueGenotype(1,0)), 1u);
    BOOST_REQUIRE_EQUAL(f2.getGenotypeIndex(TrueGenotype(1,1)), 2u);

    const CrossModel bc(CROSS_TYPE::BC);
    BOOST_REQUIRE_EQUAL(bc.getGenotypeCount(), 2u);
    BOOST_REQUIRE_THROW(bc.getGenotypeIndex(TrueGenotype(1,1)), IncompatibleCrossException);

    const CrossModel ri(CROSS_TYPE::RISELF);
    BOOST_REQUIRE_EQUAL(ri.getGenotypeIndex(TrueGenotype(1,1)), 1u);
    BOOST_REQUIRE_THROW(ri.getGenotypeIndex(TrueGenotype(0,1)), IncompatibleCrossException);
}


BOOST_AUTO_TEST_CASE( testInit )
{
    static const double eps(0.00001);

    const CrossModel f2(CROSS_TYPE::F2);
    BOOST_REQUIRE_CLOSE(f2.init(TrueGenotype(0,0)), std::log(0.25), eps);
    BOOST_REQUIRE_CLOSE(f2.init(TrueGenotype(0,1)), std::log(0.5), eps);
    BOOST_REQUIRE_CLOSE(f2.init(TrueGenotype(1,1)), std::log(0.25), eps);

    for (const CROSS_TYPE::index_t crossType : getAllCrossTypes())
    {
        const CrossModel crossModel(crossType);
        std::vector<double> initLogProbs;
        for (unsigned genotypeIndex(0); genotypeIndex<crossModel.getGenotypeCount(); ++genotypeIndex)
        {
            initLogProbs.push_back(crossModel.init(genotypeIndex));
        }
        BOOST_REQUIRE_SMALL(getLogSumSequence(initLogProbs), 1e-12);
    }
}


BOOST_AUTO_TEST_CASE( testEmit )
{
    static const double eps(0.00001);
    static const double errorProb(0.01);

    const CrossModel f2(CROSS_TYPE::F2);
    const GenotypeSymbolMapper a({"A"}, {TrueGenotype(0,0)});
    const GenotypeSymbolMapper notB({"D"}, {TrueGenotype(0,0), TrueGenotype(0,1), TrueGenotype(1,0)});
    const GenotypeSymbolMapper na("NA");

    BOOST_REQUIRE_CLOSE(f2.emit(a, TrueGenotype(0,0), errorProb), std::log(0.99), eps);
    BOOST_REQUIRE_CLOSE(f2.emit(a, TrueGenotype(1,1), errorProb), std::log(0.01/2), eps);

    // the error mass is shared by the genotypes compatible with an ambiguous symbol
    BOOST_REQUIRE_CLOSE(f2.emit(notB, TrueGenotype(0,1), errorProb), std::log(1-0.01/2), eps);
    BOOST_REQUIRE_CLOSE(f2.emit(notB, TrueGenotype(1,1), errorProb), std::log(0.01/2), eps);

    BOOST_REQUIRE_EQUAL(f2.emit(na, TrueGenotype(0,1), errorProb), 0.);

    const CrossModel bc(CROSS_TYPE::BC);
    BOOST_REQUIRE_CLOSE(bc.emit(a, TrueGenotype(0,1), errorProb), std::log(0.01), eps);

    const GenotypeSymbolMapper b({"B"}, {TrueGenotype(1,1)});
    BOOST_REQUIRE_THROW(bc.emit(b, TrueGenotype(0,0), errorProb), IncompatibleCrossException);
}


BOOST_AUTO_TEST_CASE( testStepRowsSumToOne )
{
    for (const CROSS_TYPE::index_t crossType : getAllCrossTypes())
    {
        const CrossModel crossModel(crossType);
        const unsigned genotypeCount(crossModel.getGenotypeCount());
        for (const double recFrac : {0.0, 0.001, 0.1, 0.3, 0.5})
        {
            std::vector<double> transition;
            crossModel.getTransitionLogProbs(recFrac, transition);
            BOOST_REQUIRE_EQUAL(transition.size(), genotypeCount*genotypeCount);
            for (unsigned left(0); left<genotypeCount; ++left)
            {
                const auto rowBegin(transition.begin()+left*genotypeCount);
                BOOST_REQUIRE_SMALL(getLogSumSequence(rowBegin, rowBegin+genotypeCount), 1e-12);
            }
        }
    }
}


BOOST_AUTO_TEST_CASE( testStepF2 )
{
    static const double eps(0.00001);
    static const double r(0.1);

    const CrossModel f2(CROSS_TYPE::F2);
    const TrueGenotype aa(0,0);
    const TrueGenotype ab(0,1);
    const TrueGenotype bb(1,1);

    BOOST_REQUIRE_CLOSE(f2.step(aa, aa, r), std::log(0.81), eps);
    BOOST_REQUIRE_CLOSE(f2.step(aa, ab, r), std::log(0.18), eps);
    BOOST_REQUIRE_CLOSE(f2.step(aa, bb, r), std::log(0.01), eps);
    BOOST_REQUIRE_CLOSE(f2.step(ab, aa, r), std::log(0.09), eps);
    BOOST_REQUIRE_CLOSE(f2.step(ab, ab, r), std::log(0.82), eps);

    // symmetric under relabeling of the founders
    BOOST_REQUIRE_CLOSE(f2.step(bb, ab, r), f2.step(aa, ab, r), eps);
    BOOST_REQUIRE_CLOSE(f2.step(ab, bb, r), f2.step(ab, aa, r), eps);

    // no recombination keeps the genotype
    BOOST_REQUIRE_EQUAL(f2.step(ab, ab, 0.), 0.);
    BOOST_REQUIRE(std::isinf(f2.step(ab, aa, 0.)));

    BOOST_REQUIRE_THROW(f2.step(aa, aa, 0.6), PreConditionException);
    BOOST_REQUIRE_THROW(f2.step(aa, aa, -0.1), PreConditionException);
}


BOOST_AUTO_TEST_CASE( testStepInbred )
{
    static const double eps(0.00001);
    static const double r(0.1);

    const TrueGenotype aa(0,0);
    const TrueGenotype bb(1,1);

    const CrossModel bc(CROSS_TYPE::BC);
    BOOST_REQUIRE_CLOSE(bc.step(aa, TrueGenotype(0,1), r), std::log(r), eps);

    const CrossModel riself(CROSS_TYPE::RISELF);
    BOOST_REQUIRE_CLOSE(riself.step(aa, bb, r), std::log(2*r/(1+2*r)), eps);
    BOOST_REQUIRE_CLOSE(riself.step(bb, bb, r), std::log(1-2*r/(1+2*r)), eps);

    const CrossModel risib(CROSS_TYPE::RISIB);
    BOOST_REQUIRE_CLOSE(risib.step(bb, aa, r), std::log(4*r/(1+6*r)), eps);
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( CrossGenotypeSymbolsTest )

BOOST_AUTO_TEST_CASE( testF2Alphabet )
{
    ObservedGenotypeRegistry registry;
    addCrossGenotypeSymbols(CROSS_TYPE::F2, getDefaultGenotypeCodes(CROSS_TYPE::F2), "NA -", registry);
    BOOST_REQUIRE_EQUAL(registry.size(), 6u);

    BOOST_REQUIRE(registry.decode("-")->isMissing());
    BOOST_REQUIRE_EQUAL(registry.decode("H")->size(), 2u);
    BOOST_REQUIRE_EQUAL(registry.decode("D")->size(), 3u);
    BOOST_REQUIRE(! registry.decode("D")->match(TrueGenotype(1,1)));
    BOOST_REQUIRE(registry.decode("C")->match(TrueGenotype(1,1)));
    BOOST_REQUIRE_EQUAL(registry.decode("1,0"), registry.decode("H"));

    // every symbol of the alphabet is usable by the F2 model
    const CrossModel f2(CROSS_TYPE::F2);
    std::vector<double> emission;
    for (const GenotypeSymbolRef& symbol : registry.getSymbols())
    {
        BOOST_REQUIRE_NO_THROW(f2.getEmissionLogProbs(*symbol, 0.002, emission));
    }
}


BOOST_AUTO_TEST_CASE( testCustomCodes )
{
    ObservedGenotypeRegistry registry;
    addCrossGenotypeSymbols(CROSS_TYPE::RISIB, "CC DD", "?", registry);
    BOOST_REQUIRE(registry.decode("DD")->match(TrueGenotype(1,1)));
    BOOST_REQUIRE(registry.decode("?")->isMissing());
    BOOST_REQUIRE_THROW(registry.decode("A"), UnresolvedSymbolException);
}


BOOST_AUTO_TEST_CASE( testTooFewCodes )
{
    ObservedGenotypeRegistry registry;
    BOOST_REQUIRE_THROW(addCrossGenotypeSymbols(CROSS_TYPE::F2, "A H B", "NA", registry),
                        InvalidParameterException);
}

BOOST_AUTO_TEST_SUITE_END()
