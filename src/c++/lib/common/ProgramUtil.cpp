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

#include "common/ProgramUtil.hh"

#include <cstdlib>

#include <iostream>



void
usage(
    std::ostream& os,
    const modfrac::Program& prog,
    const boost::program_options::options_description& visible,
    const char* friendlyName,
    const char* extendedUsage,
    const char* xmessage)
{
    os << "\n" << prog.name() << " - " << friendlyName << "\n";
    os << "\tversion: " << prog.version() << "\n";
    os << "\n";
    os << "usage: " << prog.name() << " [options]" << extendedUsage << "\n\n";
    os << visible << "\n\n";

    if (nullptr != xmessage)
    {
        os << "\n";
        os << "******** COMMAND-LINE ERROR:: " << xmessage << " ********\n";
        os << "\n";
        exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
}



void
printVersion(
    std::ostream& os,
    const modfrac::Program& prog)
{
    os << prog.name() << " " << prog.version() << "\n"
       << "compiler: " << prog.compiler() << "\n"
       << "build time: " << prog.buildTime() << "\n";
    exit(EXIT_SUCCESS);
}
