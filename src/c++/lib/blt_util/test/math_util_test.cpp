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

#include "blt_util/math_util.hh"


BOOST_AUTO_TEST_SUITE( math_util_test_suite )

BOOST_AUTO_TEST_CASE( test_log1m )
{
    static const double eps(0.00001);

    BOOST_REQUIRE_CLOSE(log1m(0.002), std::log(0.998), eps);
    BOOST_REQUIRE_CLOSE(log1m(0.5), std::log(0.5), eps);
    BOOST_REQUIRE_EQUAL(log1m(0.), 0.);
    BOOST_REQUIRE(std::isinf(log1m(1.)));
}


BOOST_AUTO_TEST_CASE( test_negativeInfinity )
{
    BOOST_REQUIRE(std::isinf(negativeInfinity<double>()));
    BOOST_REQUIRE(negativeInfinity<double>() < 0.);
}

BOOST_AUTO_TEST_SUITE_END()
