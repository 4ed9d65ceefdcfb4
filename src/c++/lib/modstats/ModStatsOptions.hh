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
/// \brief Options shared by all modification statistics front ends
///

#pragma once

#include "PositionStats.hh"

#include <string>


struct ModStatsOptions
{
    /// per-read p-value table to read
    std::string sourceFilename;

    /// per-position statistics table to write
    std::string sinkFilename;

    /// if true, add the per-coverage fractions of each bucket to the output
    bool isIncludeFractionFields = false;

    PvalThresholds pvalThresholds;
};
