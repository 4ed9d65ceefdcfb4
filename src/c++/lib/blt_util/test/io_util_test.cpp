//
// ModFrac - Nanopore Per-Position Modification Fraction Statistics
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

#include "blt_util/io_util.hh"
#include "common/Exceptions.hh"

#include <fstream>
#include <limits>
#include <sstream>


BOOST_AUTO_TEST_SUITE( test_io_util )


BOOST_AUTO_TEST_CASE( test_format_shortest_double )
{
    BOOST_REQUIRE_EQUAL(format_shortest_double(0.2), "0.2");
    BOOST_REQUIRE_EQUAL(format_shortest_double(0.5), "0.5");
    BOOST_REQUIRE_EQUAL(format_shortest_double(1.), "1.0");
    BOOST_REQUIRE_EQUAL(format_shortest_double(0.), "0.0");
    BOOST_REQUIRE_EQUAL(format_shortest_double(1./3.), "0.3333333333333333");
    BOOST_REQUIRE_EQUAL(format_shortest_double(2./3.), "0.6666666666666666");
    BOOST_REQUIRE_EQUAL(format_shortest_double(1e-5), "1e-05");
}

BOOST_AUTO_TEST_CASE( test_format_shortest_double_nan )
{
    const double nan(std::numeric_limits<double>::quiet_NaN());
    BOOST_REQUIRE_EQUAL(format_shortest_double(nan), "");
    BOOST_REQUIRE_EQUAL(format_shortest_double(nan,"NaN"), "NaN");
}

BOOST_AUTO_TEST_CASE( test_write_shortest_double )
{
    std::ostringstream oss;
    write_shortest_double(oss, 0.25);
    oss << ',';
    write_shortest_double(oss, std::numeric_limits<double>::quiet_NaN());
    BOOST_REQUIRE_EQUAL(oss.str(), "0.25,");
}

BOOST_AUTO_TEST_CASE( test_open_ifstream_missing_file )
{
    std::ifstream ifs;
    BOOST_REQUIRE_THROW(open_ifstream(ifs, "/nonexistent_modfrac_dir/missing.csv"), modfrac::common::IoException);
}

BOOST_AUTO_TEST_SUITE_END()
