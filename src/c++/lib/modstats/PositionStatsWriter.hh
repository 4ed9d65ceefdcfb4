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
/// \brief Write the per-position statistics table
///

#pragma once

#include "PositionStats.hh"

#include <iosfwd>
#include <string>
#include <vector>


/// write the comma-delimited header and one row per position
///
/// Columns are pos_0b, num_below_lower_thresh, num_above_upper_thresh, covg,
/// optionally frac_below_lower_thresh and frac_above_upper_thresh, then
/// f_value and d_value. Undefined ratios are written as empty fields.
///
void
writePositionStats(
    std::ostream& os,
    const std::vector<PositionStats>& posStats,
    const bool isIncludeFractionFields);

/// write the table to filename
///
/// The file is only created once the full table has been written, so a
/// failure leaves no partial output behind.
///
/// throws IoException if the file can't be written
void
writePositionStats(
    const std::string& filename,
    const std::vector<PositionStats>& posStats,
    const bool isIncludeFractionFields);
