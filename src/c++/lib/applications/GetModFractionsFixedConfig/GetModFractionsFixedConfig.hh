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

///
/// \brief Front end for per-position modification statistics which takes its paths from the build configuration
///

#pragma once

#include "common/Program.hh"
#include "modstats/ModStatsOptions.hh"


struct GetModFractionsFixedConfig : public modfrac::Program
{
    const char*
    name() const override
    {
        return "GetModFractionsFixedConfig";
    }

    void
    runInternal(int argc, char* argv[]) const override;
};


/// options of the fixed configuration run
///
/// paths are MODFRAC_FIXED_SOURCE_PATH and MODFRAC_FIXED_SINK_PATH from the
/// build configuration, fraction fields are not written
ModStatsOptions
getFixedConfigModStatsOptions();
