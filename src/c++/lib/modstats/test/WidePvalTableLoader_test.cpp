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

#include "test_config.h"

#include "modstats/WidePvalTableLoader.hh"
#include "common/Exceptions.hh"

#include <sstream>
#include <string>


BOOST_AUTO_TEST_SUITE( test_WidePvalTableLoader )


static
std::string
getTestDataPath(const char* filename)
{
    return std::string(TEST_DATA_PATH) + "/" + filename;
}


static
WidePvalTable
loadFromString(const std::string& content)
{
    std::istringstream iss(content);
    return loadWidePvalTable(iss, "test");
}


BOOST_AUTO_TEST_CASE( test_load_basic_table )
{
    const WidePvalTable table(loadWidePvalTable(getTestDataPath("three_reads_two_positions.csv")));

    BOOST_REQUIRE_EQUAL(table.getReadCount(), 3u);
    BOOST_REQUIRE_EQUAL(table.getPositionCount(), 2u);
    BOOST_REQUIRE_EQUAL(table.getPositions()[0], 0);
    BOOST_REQUIRE_EQUAL(table.getPositions()[1], 1);
    BOOST_REQUIRE_EQUAL(table.getReadId(0), "read_a");
    BOOST_REQUIRE_EQUAL(table.getReadId(2), "read_c");
    BOOST_REQUIRE_EQUAL(table.getPresentPvalCount(), 5u);

    BOOST_REQUIRE(table.getPval(0,0));
    BOOST_REQUIRE_EQUAL(*table.getPval(0,0), 0.01);
    BOOST_REQUIRE_EQUAL(*table.getPval(1,1), 0.03);

    // empty cell is absent, not zero:
    BOOST_REQUIRE(! table.getPval(2,1));
}

BOOST_AUTO_TEST_CASE( test_load_mixed_format )
{
    // CRLF line endings, blank line, quoted fields, missing value tokens and unsorted positions:
    const WidePvalTable table(loadWidePvalTable(getTestDataPath("mixed_format.csv")));

    BOOST_REQUIRE_EQUAL(table.getReadCount(), 3u);
    BOOST_REQUIRE_EQUAL(table.getPositionCount(), 3u);
    BOOST_REQUIRE_EQUAL(table.getPositions()[0], 5);
    BOOST_REQUIRE_EQUAL(table.getPositions()[1], 2);
    BOOST_REQUIRE_EQUAL(table.getPositions()[2], 9);

    BOOST_REQUIRE_EQUAL(table.getReadId(1), "read_y");
    BOOST_REQUIRE(! table.getPval(0,1));
    BOOST_REQUIRE(! table.getPval(1,0));
    BOOST_REQUIRE(! table.getPval(2,0));
    BOOST_REQUIRE(! table.getPval(2,2));
    BOOST_REQUIRE_EQUAL(*table.getPval(1,2), 0.9);
    BOOST_REQUIRE_EQUAL(table.getPresentPvalCount(), 5u);
}

BOOST_AUTO_TEST_CASE( test_load_quoted_separator )
{
    const WidePvalTable table(loadFromString(
                                  "read_id,0,1\n"
                                  "\"read,a\",0.01,0.5\n"
                                  "read_b,0.5 ,0.03\n"
                                  "\"read \"\"c\"\"\",\" 0.2\",\"NA\"\n"));

    BOOST_REQUIRE_EQUAL(table.getReadCount(), 3u);
    BOOST_REQUIRE_EQUAL(table.getReadId(0), "read,a");
    BOOST_REQUIRE_EQUAL(table.getReadId(2), "read \"c\"");
    BOOST_REQUIRE_EQUAL(*table.getPval(0,0), 0.01);
    BOOST_REQUIRE_EQUAL(*table.getPval(0,1), 0.5);
    BOOST_REQUIRE_EQUAL(*table.getPval(1,0), 0.5);
    BOOST_REQUIRE_EQUAL(*table.getPval(2,0), 0.2);
    BOOST_REQUIRE(! table.getPval(2,1));
}

BOOST_AUTO_TEST_CASE( test_load_unterminated_quote )
{
    BOOST_REQUIRE_THROW(loadFromString("id,0,1\n\"r1,0.1,0.2\n"), modfrac::common::MalformedInputException);
}

BOOST_AUTO_TEST_CASE( test_load_missing_tokens )
{
    const WidePvalTable table(loadFromString("id,0,1,2,3,4\nr1,nan,NA,,null,N/A\n"));

    BOOST_REQUIRE_EQUAL(table.getReadCount(), 1u);
    BOOST_REQUIRE_EQUAL(table.getPresentPvalCount(), 0u);

    BOOST_REQUIRE(isMissingPvalToken(""));
    BOOST_REQUIRE(isMissingPvalToken("NaN"));
    BOOST_REQUIRE(isMissingPvalToken("<NA>"));
    BOOST_REQUIRE(! isMissingPvalToken("0"));
    BOOST_REQUIRE(! isMissingPvalToken("missing"));
}

BOOST_AUTO_TEST_CASE( test_load_header_only )
{
    const WidePvalTable table(loadFromString("read_id,10,11\n"));
    BOOST_REQUIRE_EQUAL(table.getReadCount(), 0u);
    BOOST_REQUIRE_EQUAL(table.getPositionCount(), 2u);
}

BOOST_AUTO_TEST_CASE( test_load_keeps_duplicate_read_ids )
{
    // uniqueness is not the loader's concern:
    const WidePvalTable table(loadWidePvalTable(getTestDataPath("duplicate_read_id.csv")));
    BOOST_REQUIRE_EQUAL(table.getReadCount(), 3u);
}

BOOST_AUTO_TEST_CASE( test_load_malformed_header )
{
    using modfrac::common::MalformedInputException;

    BOOST_REQUIRE_THROW(loadWidePvalTable(getTestDataPath("non_integer_position.csv")), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("id,0,1.5\nr1,0.1,0.2\n"), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("id,0,0\nr1,0.1,0.2\n"), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString(""), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("\n\n"), MalformedInputException);
}

BOOST_AUTO_TEST_CASE( test_load_malformed_rows )
{
    using modfrac::common::MalformedInputException;

    BOOST_REQUIRE_THROW(loadFromString("id,0,1\nr1,0.1\n"), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("id,0,1\nr1,0.1,0.2,0.3\n"), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("id,0,1\nr1,0.1,high\n"), MalformedInputException);
    BOOST_REQUIRE_THROW(loadFromString("id,0,1\n,0.1,0.2\n"), MalformedInputException);
}

BOOST_AUTO_TEST_CASE( test_load_missing_file )
{
    BOOST_REQUIRE_THROW(loadWidePvalTable(getTestDataPath("no_such_file.csv")), modfrac::common::IoException);
}

BOOST_AUTO_TEST_SUITE_END()
