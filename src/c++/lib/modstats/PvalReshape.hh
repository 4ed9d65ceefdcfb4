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
/// \brief Conversion between the wide p-value matrix and long-form observations
///

#pragma once

#include "PvalObservation.hh"
#include "WidePvalTable.hh"

#include <vector>


/// list every p-value in the table as an observation, skipping missing cells
///
/// observations are produced in row order, and in column order within each row
std::vector<PvalObservation>
longify(const WidePvalTable& table);


/// rebuild a wide table from observations, the inverse of longify
///
/// Rows are sorted by read id and columns by position. Any (read id, position)
/// pair without an observation is a missing cell.
///
/// throws DuplicateKeyException if a (read id, position) pair is observed more than once
WidePvalTable
widify(const std::vector<PvalObservation>& observations);
