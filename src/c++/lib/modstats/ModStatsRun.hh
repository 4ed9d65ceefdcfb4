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
/// \brief Per-position modification statistics pipeline
///

#pragma once

#include "ModStatsOptions.hh"
#include "PositionStats.hh"
#include "WidePvalTable.hh"

#include <vector>


/// summarize a p-value table into per-position statistics
///
/// throws DuplicateKeyException if the table repeats a read id and
/// InvalidParameterException for invalid thresholds
std::vector<PositionStats>
computeModStats(
    const WidePvalTable& table,
    const PvalThresholds& thresholds);


/// load the p-value table, summarize it and write the per-position statistics
///
/// nothing is written unless every stage succeeds
void
runModStats(const ModStatsOptions& opt);
