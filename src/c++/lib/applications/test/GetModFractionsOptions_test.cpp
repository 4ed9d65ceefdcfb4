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

#include "applications/GetModFractions/GetModFractions.hh"
#include "applications/GetModFractions/GMFOptions.hh"
#include "applications/GetModFractionsFixedConfig/GetModFractionsFixedConfig.hh"
#include "common/config.h"

#include <string>


BOOST_AUTO_TEST_SUITE( test_GetModFractionsOptions )


BOOST_AUTO_TEST_CASE( test_parse_positional_paths )
{
    GetModFractions prog;
    char arg0[] = "GetModFractions";
    char arg1[] = "per_read_pvals.csv";
    char arg2[] = "f_and_d_values.csv";
    char* argv[] = { arg0, arg1, arg2 };

    ModStatsOptions opt;
    parseGMFOptions(prog, 3, argv, opt);

    BOOST_REQUIRE_EQUAL(opt.sourceFilename, "per_read_pvals.csv");
    BOOST_REQUIRE_EQUAL(opt.sinkFilename, "f_and_d_values.csv");
    BOOST_REQUIRE(opt.isIncludeFractionFields);
    BOOST_REQUIRE_EQUAL(opt.pvalThresholds.lower, defaultLowerPvalThreshold);
    BOOST_REQUIRE_EQUAL(opt.pvalThresholds.upper, defaultUpperPvalThreshold);
}

BOOST_AUTO_TEST_CASE( test_fixed_config_options )
{
    const ModStatsOptions opt(getFixedConfigModStatsOptions());

    BOOST_REQUIRE_EQUAL(opt.sourceFilename, MODFRAC_FIXED_SOURCE_PATH);
    BOOST_REQUIRE_EQUAL(opt.sinkFilename, MODFRAC_FIXED_SINK_PATH);
    BOOST_REQUIRE(! opt.isIncludeFractionFields);
    BOOST_REQUIRE_EQUAL(opt.pvalThresholds.lower, 0.05);
    BOOST_REQUIRE_EQUAL(opt.pvalThresholds.upper, 0.40);
}

BOOST_AUTO_TEST_CASE( test_program_names )
{
    BOOST_REQUIRE_EQUAL(std::string(GetModFractions().name()), "GetModFractions");
    BOOST_REQUIRE_EQUAL(std::string(GetModFractionsFixedConfig().name()), "GetModFractionsFixedConfig");
    BOOST_REQUIRE(! std::string(GetModFractions().version()).empty());
}

BOOST_AUTO_TEST_SUITE_END()
