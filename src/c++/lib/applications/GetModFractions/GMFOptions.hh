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

#pragma once

#include "common/Program.hh"
#include "modstats/ModStatsOptions.hh"


/// parse the command line of GetModFractions into opt
///
/// The input and output paths are the two required positional arguments, the
/// fraction fields are always included in the output and the p-value
/// thresholds keep their defaults. Any usage error prints the help text and
/// exits with a failure code.
///
void
parseGMFOptions(
    const modfrac::Program& prog,
    int argc,
    char* argv[],
    ModStatsOptions& opt);
