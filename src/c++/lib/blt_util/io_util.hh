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

/// \file
///
/// \brief Small file and number formatting utilities
///

#pragma once

#include <iosfwd>
#include <string>


/// open filename for reading, throws IoException on failure
void
open_ifstream(
    std::ifstream& ifs,
    const char* filename);


/// write the shortest decimal representation of val which reads back as the same double
///
/// Integral values are written with a trailing '.0' (eg. '1.0'), and NaN is
/// written as nanRep.
///
void
write_shortest_double(
    std::ostream& os,
    const double val,
    const char* nanRep = "");

std::string
format_shortest_double(
    const double val,
    const char* nanRep = "");
