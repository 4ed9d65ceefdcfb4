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

#include "blt_util/io_util.hh"
#include "common/Exceptions.hh"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fstream>
#include <iostream>
#include <sstream>



void
open_ifstream(
    std::ifstream& ifs,
    const char* filename)
{
    errno = 0;
    ifs.open(filename);
    if (! ifs)
    {
        const int errorNumber(errno);
        std::ostringstream oss;
        oss << "Can't open file: '" << filename << "'";
        BOOST_THROW_EXCEPTION(modfrac::common::IoException(errorNumber, oss.str()));
    }
}



std::string
format_shortest_double(
    const double val,
    const char* nanRep)
{
    if (std::isnan(val)) return nanRep;

    static const int maxPrecision(17);
    static const unsigned buffSize(32);
    char buff[buffSize];

    for (int precision(1); precision<=maxPrecision; ++precision)
    {
        snprintf(buff,buffSize,"%.*g",precision,val);
        if (std::strtod(buff,nullptr) == val) break;
    }

    std::string result(buff);

    // mark integral values as floating point:
    if (std::isfinite(val) && (result.find_first_of(".e") == std::string::npos))
    {
        result += ".0";
    }
    return result;
}



void
write_shortest_double(
    std::ostream& os,
    const double val,
    const char* nanRep)
{
    os << format_shortest_double(val,nanRep);
}
