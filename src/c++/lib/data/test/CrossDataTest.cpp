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
#include "cross/CrossGenotypeSymbols.hh"
#include "data/CrossCsvReader.hh"

#include "boost/filesystem.hpp"

#include <fstream>
#include <sstream>


using namespace qtlmap::common;


static
ObservedGenotypeRegistry
getF2Registry()
{
    ObservedGenotypeRegistry registry;
    addCrossGenotypeSymbols(CROSS_TYPE::F2, getDefaultGenotypeCodes(CROSS_TYPE::F2), "NA -", registry);
    return registry;
}


static const char* testCrossCsv =
    "T264,sex,D10M44,D1M3,D1M75,DXM186\n"
    ",,1,1,1,X\n"
    ",,0,0.99675,24.84773,0\n"
    "118.317,0,B,B,B,A\n"
    "264,1,H,-,H,A\n"
    "NA,0,A,C,D,H\n"
    "\n";



BOOST_AUTO_TEST_SUITE( IndividualMatrixTest )

BOOST_AUTO_TEST_CASE( testAddAndGet )
{
    PhenotypeMatrix matrix({"p1", "p2"});
    matrix.addIndividual({1., 2.});
    matrix.addIndividual({3., PHENOTYPE_NA});

    BOOST_REQUIRE_EQUAL(matrix.getIndividualCount(), 2u);
    BOOST_REQUIRE_EQUAL(matrix.getColumnCount(), 2u);
    BOOST_REQUIRE_EQUAL(matrix.get(1, 0), 3.);
    BOOST_REQUIRE(isMissingPhenotype(matrix.get(1, 1)));
    BOOST_REQUIRE(! isMissingPhenotype(matrix.get(0, 1)));

    matrix.set(1, 1, 4.);
    BOOST_REQUIRE_EQUAL(matrix.get(1, 1), 4.);

    BOOST_REQUIRE_THROW(matrix.addIndividual({1.}), DimensionMismatchException);
    BOOST_REQUIRE_THROW(matrix.get(2, 0), PreConditionException);
}


BOOST_AUTO_TEST_CASE( testOmitIndividuals )
{
    PhenotypeMatrix phenotypes({"p1", "p2"});
    phenotypes.addIndividual({1., 2.});
    phenotypes.addIndividual({PHENOTYPE_NA, 2.});
    phenotypes.addIndividual({3., 4.});
    phenotypes.addIndividual({5., PHENOTYPE_NA});

    const std::vector<bool> toOmit(getIndividualsMissingAnyPhenotype(phenotypes));
    BOOST_REQUIRE_EQUAL(toOmit.size(), 4u);
    BOOST_REQUIRE(! toOmit[0]);
    BOOST_REQUIRE(toOmit[1]);
    BOOST_REQUIRE(! toOmit[2]);
    BOOST_REQUIRE(toOmit[3]);

    const ObservedGenotypeRegistry registry(getF2Registry());
    const GenotypeMatrix genotypes(convertToGenotypeMatrix({"m1"}, {{"A"}, {"B"}, {"H"}, {"-"}}, registry));

    const PhenotypeMatrix keptPhenotypes(omitIndividuals(phenotypes, toOmit));
    const GenotypeMatrix keptGenotypes(omitIndividuals(genotypes, toOmit));

    // both matrices lose the same rows
    BOOST_REQUIRE_EQUAL(keptPhenotypes.getIndividualCount(), 2u);
    BOOST_REQUIRE_EQUAL(keptGenotypes.getIndividualCount(), 2u);
    BOOST_REQUIRE_EQUAL(keptPhenotypes.get(1, 1), 4.);
    BOOST_REQUIRE_EQUAL(keptGenotypes.get(1, 0), registry.decode("H"));

    BOOST_REQUIRE_THROW(omitIndividuals(phenotypes, std::vector<bool>(3, false)), DimensionMismatchException);
}


BOOST_AUTO_TEST_CASE( testParsePhenotypeValue )
{
    BOOST_REQUIRE_EQUAL(parsePhenotypeValue("74.417"), 74.417);
    BOOST_REQUIRE_EQUAL(parsePhenotypeValue(" 12 "), 12.);
    BOOST_REQUIRE(isMissingPhenotype(parsePhenotypeValue("NA")));
    BOOST_REQUIRE(isMissingPhenotype(parsePhenotypeValue("-")));
    BOOST_REQUIRE(isMissingPhenotype(parsePhenotypeValue("")));
    BOOST_REQUIRE_THROW(parsePhenotypeValue("tall"), InvalidParameterException);
    BOOST_REQUIRE_THROW(parsePhenotypeValue("inf"), InvalidParameterException);
    BOOST_REQUIRE_THROW(parsePhenotypeValue("-inf"), InvalidParameterException);
    BOOST_REQUIRE_THROW(parsePhenotypeValue("nan"), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( testConvertToGenotypeMatrix )
{
    const ObservedGenotypeRegistry registry(getF2Registry());
    const GenotypeMatrix genotypes(convertToGenotypeMatrix({"m1", "m2"}, {{"A", "1,1"}, {"NA", "D"}}, registry));

    BOOST_REQUIRE_EQUAL(genotypes.get(0, 1), registry.decode("B"));
    BOOST_REQUIRE(genotypes.get(1, 0)->isMissing());

    try
    {
        convertToGenotypeMatrix({"m1"}, {{"A"}, {"Q"}}, registry);
        BOOST_FAIL("expected UnresolvedSymbolException");
    }
    catch (const UnresolvedSymbolException& e)
    {
        const unsigned* individual(boost::get_error_info<errinfo_individual>(e));
        BOOST_REQUIRE(individual != nullptr);
        BOOST_REQUIRE_EQUAL(*individual, 1u);
    }
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( CrossCsvReaderTest )

BOOST_AUTO_TEST_CASE( testReadCrossCsvStream )
{
    const ObservedGenotypeRegistry registry(getF2Registry());
    std::istringstream iss(testCrossCsv);
    const CrossData crossData(readCrossCsv(iss, "test", registry));

    BOOST_REQUIRE_EQUAL(crossData.phenotypes.getColumnCount(), 2u);
    BOOST_REQUIRE_EQUAL(crossData.phenotypes.getColumnName(0), "T264");
    BOOST_REQUIRE_EQUAL(crossData.phenotypes.getIndividualCount(), 3u);
    BOOST_REQUIRE_EQUAL(crossData.phenotypes.get(0, 0), 118.317);
    BOOST_REQUIRE(isMissingPhenotype(crossData.phenotypes.get(2, 0)));

    BOOST_REQUIRE_EQUAL(crossData.markers.size(), 4u);
    BOOST_REQUIRE_EQUAL(crossData.markers[2].name, "D1M75");
    BOOST_REQUIRE_EQUAL(crossData.markers[2].position, 24.84773);
    BOOST_REQUIRE_EQUAL(crossData.markers[2].genotypeColumn, 2);
    BOOST_REQUIRE_EQUAL(crossData.markers[0].chromosome, crossData.markers[1].chromosome);
    BOOST_REQUIRE(! crossData.markers[0].chromosome->isSex());
    BOOST_REQUIRE(crossData.markers[3].chromosome->isSex());

    BOOST_REQUIRE_EQUAL(crossData.genotypes.getIndividualCount(), 3u);
    BOOST_REQUIRE_EQUAL(crossData.genotypes.get(1, 0), registry.decode("H"));
    BOOST_REQUIRE(crossData.genotypes.get(1, 1)->isMissing());
    BOOST_REQUIRE_EQUAL(crossData.genotypes.get(2, 1), registry.decode("C"));
}


BOOST_AUTO_TEST_CASE( testReadCrossCsvErrors )
{
    const ObservedGenotypeRegistry registry(getF2Registry());

    {
        // short individual row
        std::istringstream iss("p,m1\n,1\n,0\n1.0\n");
        try
        {
            readCrossCsv(iss, "short.csv", registry);
            BOOST_FAIL("expected DimensionMismatchException");
        }
        catch (const DimensionMismatchException& e)
        {
            BOOST_REQUIRE(boost::get_error_info<errinfo_dataset>(e) != nullptr);
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_dataset>(e), "short.csv");
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_line_number>(e), 4u);
        }
    }

    {
        std::istringstream iss("p,m1\n,1\n,zero\n1.0,A\n");
        BOOST_REQUIRE_THROW(readCrossCsv(iss, "test", registry), InvalidParameterException);
    }

    {
        std::istringstream iss("p,m1\n,1\n,0\n1.0,Z\n");
        BOOST_REQUIRE_THROW(readCrossCsv(iss, "test", registry), UnresolvedSymbolException);
    }

    {
        // no phenotype column
        std::istringstream iss("m1\n1\n0\nA\n");
        BOOST_REQUIRE_THROW(readCrossCsv(iss, "test", registry), InvalidParameterException);
    }
}


BOOST_AUTO_TEST_CASE( testReadCrossCsvNonFinite )
{
    const ObservedGenotypeRegistry registry(getF2Registry());

    {
        // marker position
        std::istringstream iss("p,m1,m2\n,1,1\n,0,inf\n1.0,A,H\n");
        try
        {
            readCrossCsv(iss, "position.csv", registry);
            BOOST_FAIL("expected InvalidParameterException");
        }
        catch (const InvalidParameterException& e)
        {
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_dataset>(e), "position.csv");
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_line_number>(e), 3u);
        }
    }

    {
        // phenotype value
        std::istringstream iss("p,m1\n,1\n,0\n1.0,A\nnan,H\n");
        try
        {
            readCrossCsv(iss, "phenotype.csv", registry);
            BOOST_FAIL("expected InvalidParameterException");
        }
        catch (const InvalidParameterException& e)
        {
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_dataset>(e), "phenotype.csv");
            BOOST_REQUIRE_EQUAL(*boost::get_error_info<errinfo_line_number>(e), 5u);
        }
    }
}


BOOST_AUTO_TEST_CASE( testReadCrossCsvFile )
{
    const boost::filesystem::path csvPath(boost::filesystem::temp_directory_path() /
                                          boost::filesystem::unique_path("qtlmap-%%%%-%%%%.csv"));
    {
        std::ofstream ofs(csvPath.string().c_str());
        ofs << testCrossCsv;
    }

    const ObservedGenotypeRegistry registry(getF2Registry());
    const CrossData crossData(readCrossCsv(csvPath.string(), registry));
    boost::filesystem::remove(csvPath);

    BOOST_REQUIRE_EQUAL(crossData.genotypes.getColumnCount(), 4u);
    BOOST_REQUIRE_EQUAL(crossData.genotypes.getColumnName(3), "DXM186");

    BOOST_REQUIRE_THROW(readCrossCsv(csvPath.string(), registry), IoException);
}

BOOST_AUTO_TEST_SUITE_END()
