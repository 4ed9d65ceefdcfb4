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

#include "GetModFractionsFixedConfig.hh"

#include "blt_util/log.hh"
#include "common/ProgramUtil.hh"
#include "common/config.h"
#include "modstats/ModStatsRun.hh"

#include "boost/program_options.hpp"

#include <iostream>



ModStatsOptions
getFixedConfigModStatsOptions()
{
    ModStatsOptions opt;
    opt.sourceFilename = MODFRAC_FIXED_SOURCE_PATH;
    opt.sinkFilename = MODFRAC_FIXED_SINK_PATH;
    opt.isIncludeFractionFields = false;
    return opt;
}



static
void
parseFixedConfigOptions(
    const modfrac::Program& prog,
    int argc,
    char* argv[])
{
    namespace po = boost::program_options;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message")
    ("version","print program version information")
    ;

    static const char friendlyName[] =
        "compute per-position modification f and d values from per-read p-values,"
        " reading '" MODFRAC_FIXED_SOURCE_PATH "' and writing '" MODFRAC_FIXED_SINK_PATH "'";

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, help), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        usage(log_os, prog, help, friendlyName, "", "Invalid command-line arguments");
    }

    if (vm.count("help"))
    {
        usage(log_os, prog, help, friendlyName, "", nullptr);
    }

    if (vm.count("version"))
    {
        printVersion(std::cout, prog);
    }
}



void
GetModFractionsFixedConfig::
runInternal(int argc, char* argv[]) const
{
    parseFixedConfigOptions(*this,argc,argv);
    runModStats(getFixedConfigModStatsOptions());
}
