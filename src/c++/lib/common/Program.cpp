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

#include "Program.hh"

#include "blt_util/log.hh"
#include "common/Exceptions.hh"
#include "common/config.h"

#include <cstdlib>

#include <iostream>



static
void
dump_cl(
    int argc,
    char* argv[],
    std::ostream& os)
{
    os << "cmdline:";
    for (int i(0); i<argc; ++i)
    {
        os << ' ' << argv[i];
    }
    os << std::endl;
}



namespace modfrac
{

const char*
Program::
version() const
{
    return MODFRAC_VERSION;
}



const char*
Program::
compiler() const
{
    return MODFRAC_CXX_COMPILER_NAME " " MODFRAC_CXX_COMPILER_VERSION;
}



const char*
Program::
buildTime() const
{
    return MODFRAC_BUILD_TIME;
}



int
Program::
run(int argc, char* argv[]) const
{
    try
    {
        std::ios_base::sync_with_stdio(false);

        runInternal(argc,argv);
    }
    catch (const common::ExceptionData& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << e.getContext() << ": " << e.getMessage() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc,argv,log_os);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: " << e.what() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc,argv,log_os);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}
