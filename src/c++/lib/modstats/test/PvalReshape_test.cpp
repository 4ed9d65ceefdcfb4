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

#include "modstats/PvalReshape.hh"
#include "common/Exceptions.hh"

#include <vector>


BOOST_AUTO_TEST_SUITE( test_PvalReshape )

typedef WidePvalTable::pval_t pval_t;


BOOST_AUTO_TEST_CASE( test_longify )
{
    WidePvalTable table(std::vector<pos_t>({0, 1}));
    table.addRead("read_a", {pval_t(0.01), pval_t(0.02)});
    table.addRead("read_b", {pval_t(0.50), pval_t(0.03)});
    table.addRead("read_c", {pval_t(0.60), pval_t()});

    const std::vector<PvalObservation> observations(longify(table));

    BOOST_REQUIRE_EQUAL(observations.size(), 5u);
    BOOST_REQUIRE_EQUAL(observations[0], PvalObservation("read_a", 0, 0.01));
    BOOST_REQUIRE_EQUAL(observations[1], PvalObservation("read_a", 1, 0.02));
    BOOST_REQUIRE_EQUAL(observations[3], PvalObservation("read_b", 1, 0.03));
    BOOST_REQUIRE_EQUAL(observations[4], PvalObservation("read_c", 0, 0.60));
}

BOOST_AUTO_TEST_CASE( test_longify_empty )
{
    BOOST_REQUIRE(longify(WidePvalTable()).empty());

    WidePvalTable table(std::vector<pos_t>({4}));
    table.addRead("read_a", {pval_t()});
    BOOST_REQUIRE(longify(table).empty());
}

BOOST_AUTO_TEST_CASE( test_widify )
{
    const std::vector<PvalObservation> observations =
    {
        PvalObservation("read_b", 12, 0.3),
        PvalObservation("read_a", 12, 0.1),
        PvalObservation("read_b", 4, 0.7)
    };

    const WidePvalTable table(widify(observations));

    // rows sorted by read id, columns by position:
    BOOST_REQUIRE_EQUAL(table.getReadCount(), 2u);
    BOOST_REQUIRE_EQUAL(table.getPositionCount(), 2u);
    BOOST_REQUIRE_EQUAL(table.getReadId(0), "read_a");
    BOOST_REQUIRE_EQUAL(table.getReadId(1), "read_b");
    BOOST_REQUIRE_EQUAL(table.getPositions()[0], 4);
    BOOST_REQUIRE_EQUAL(table.getPositions()[1], 12);

    BOOST_REQUIRE(! table.getPval(0,0));
    BOOST_REQUIRE_EQUAL(*table.getPval(0,1), 0.1);
    BOOST_REQUIRE_EQUAL(*table.getPval(1,0), 0.7);
    BOOST_REQUIRE_EQUAL(*table.getPval(1,1), 0.3);
}

BOOST_AUTO_TEST_CASE( test_widify_duplicate_observation )
{
    const std::vector<PvalObservation> observations =
    {
        PvalObservation("read_a", 12, 0.1),
        PvalObservation("read_a", 12, 0.2)
    };

    BOOST_REQUIRE_THROW(widify(observations), modfrac::common::DuplicateKeyException);
}

BOOST_AUTO_TEST_CASE( test_round_trip )
{
    // unsorted axes, an all-missing row and an all-missing column:
    WidePvalTable table(std::vector<pos_t>({9, 2, 5, 0}));
    table.addRead("r3", {pval_t(0.9), pval_t(), pval_t(0.04), pval_t()});
    table.addRead("r1", {pval_t(), pval_t(0.2), pval_t(0.05), pval_t()});
    table.addRead("r4", {pval_t(), pval_t(), pval_t(), pval_t()});
    table.addRead("r2", {pval_t(0.4), pval_t(0.41), pval_t(1.), pval_t()});

    const WidePvalTable roundTrip(widify(longify(table)));

    BOOST_REQUIRE(isEquivalentPvalTable(table, roundTrip));
    BOOST_REQUIRE_EQUAL(roundTrip.getReadCount(), 3u);
    BOOST_REQUIRE_EQUAL(roundTrip.getPositionCount(), 3u);
    BOOST_REQUIRE_EQUAL(roundTrip.getPresentPvalCount(), table.getPresentPvalCount());

    // a second round trip is exact:
    const WidePvalTable roundTrip2(widify(longify(roundTrip)));
    BOOST_REQUIRE(roundTrip2.getPositions() == roundTrip.getPositions());
    BOOST_REQUIRE(isEquivalentPvalTable(roundTrip, roundTrip2));
}

BOOST_AUTO_TEST_SUITE_END()
