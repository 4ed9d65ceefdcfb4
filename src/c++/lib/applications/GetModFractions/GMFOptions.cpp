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

#include "GMFOptions.hh"

#include "blt_util/log.hh"
#include "common/ProgramUtil.hh"

#include "boost/program_options.hpp"

#include <iostream>



static
void
usage(
    std::ostream& os,
    const modfrac::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "compute per-position modification f and d values from per-read p-values",
          " filepath_to_read filepath_to_write", msg);
}



void
parseGMFOptions(
    const modfrac::Program& prog,
    int argc,
    char* argv[],
    ModStatsOptions& opt)
{
    namespace po = boost::program_options;

    po::options_description positional("positional");
    positional.add_options()
    ("filepath_to_read", po::value(&opt.sourceFilename),
     "per-read p-value table, with one row per read id and one column per 0-based position (required)")
    ("filepath_to_write", po::value(&opt.sinkFilename),
     "per-position f and d value table (required)")
    ;

    po::positional_options_description positionalOrder;
    positionalOrder.add("filepath_to_read", 1);
    positionalOrder.add("filepath_to_write", 1);

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message")
    ("version","print program version information")
    ;

    po::options_description visible("options");
    visible.add(positional).add(help);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(visible).positional(positionalOrder).run(), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if (po_parse_fail)
    {
        usage(log_os,prog,visible,"Invalid command-line arguments");
    }

    if (vm.count("help"))
    {
        usage(log_os,prog,visible);
    }

    if (vm.count("version"))
    {
        printVersion(std::cout,prog);
    }

    if (opt.sourceFilename.empty() || opt.sinkFilename.empty())
    {
        usage(log_os,prog,visible,"Must specify both filepath_to_read and filepath_to_write");
    }

    opt.isIncludeFractionFields = true;
}
