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

#include <vector>


BOOST_AUTO_TEST_SUITE( logSumUtilTestSuite )

static
void
twoTermLogSumTest(
    const double x1,
    const double x2)
{
    static const double eps(0.00001);

    const double expect(std::log(x1+x2));

    const double logx1(std::log(x1));
    const double logx2(std::log(x2));

    std::vector<double> vec = {logx1, logx2};
    BOOST_REQUIRE_CLOSE(getLogSumSequence(vec), expect, eps);
    BOOST_REQUIRE_CLOSE(getLogSumSequence(std::begin(vec), std::end(vec)), expect, eps);
}


BOOST_AUTO_TEST_CASE( testLogSumSequence2 )
{
    twoTermLogSumTest(0.5, 0.2);
    twoTermLogSumTest(0.00001, 0.00000001);
    twoTermLogSumTest(1, 1);
}



static
void
threeTermLogSumTest(
    const double x1,
    const double x2,
    const double x3)
{
    static const double eps(0.00001);

    const double expect(std::log(x1+x2+x3));

    const double logx1(std::log(x1));
    const double logx2(std::log(x2));
    const double logx3(std::log(x3));

    std::vector<double> vec = {logx1, logx2, logx3};
    BOOST_REQUIRE_CLOSE(getLogSumSequence(vec), expect, eps);
    BOOST_REQUIRE_CLOSE(getLogSumSequence(std::begin(vec), std::end(vec)), expect, eps);
}


BOOST_AUTO_TEST_CASE( testLogSumSequence3 )
{
    threeTermLogSumTest(0.5, 0.2, 0.01);
    threeTermLogSumTest(0.00001, 0.00000001, 0.00000001);
    threeTermLogSumTest(1, 1, 1);
}


BOOST_AUTO_TEST_CASE( testLogSumNegativeInfinity )
{
    const double neginf(negativeInfinity<double>());

    const std::vector<double> oneZero = {neginf, std::log(0.3)};
    BOOST_REQUIRE_CLOSE(getLogSumSequence(oneZero), std::log(0.3), 0.00001);

    const std::vector<double> allZero = {neginf, neginf, neginf};
    BOOST_REQUIRE(std::isinf(getLogSumSequence(allZero)));

    const std::vector<double> empty;
    BOOST_REQUIRE(std::isinf(getLogSumSequence(empty)));
}


BOOST_AUTO_TEST_CASE( testNormalizeLogDistro )
{
    // values far below the double exponent range still normalize correctly in log space
    std::vector<double> distro = {-2000. + std::log(1.), -2000. + std::log(3.)};
    normalizeLogDistro(distro.begin(), distro.end());

    BOOST_REQUIRE_CLOSE(distro[0], 0.25, 0.00001);
    BOOST_REQUIRE_CLOSE(distro[1], 0.75, 0.00001);

    const double neginf(negativeInfinity<double>());
    std::vector<double> zeroMass = {neginf, neginf};
    const double logSum(normalizeLogDistro(zeroMass.begin(), zeroMass.end()));
    BOOST_REQUIRE(std::isinf(logSum));
    BOOST_REQUIRE_EQUAL(zeroMass[0], 0.);
    BOOST_REQUIRE_EQUAL(zeroMass[1], 0.);
}

BOOST_AUTO_TEST_SUITE_END()
