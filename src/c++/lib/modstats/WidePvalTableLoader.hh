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
/// \brief Read a per-read p-value matrix from comma-delimited text
///

#pragma once

#include "WidePvalTable.hh"

#include <iosfwd>
#include <string>


/// parse a p-value table from a comma-delimited text stream
///
/// The first non-blank line is the header. Its first field labels the read id
/// column and may hold any text, each remaining field is the integer position
/// of that column. Each following non-blank line holds a read id and one cell
/// per position. A cell is either a floating-point p-value or one of the
/// missing value tokens (including the empty string).
///
/// Fields may be quoted CSV style, so a quoted read id can hold commas.
/// Blanks around labels and cells are ignored.
///
/// \param[in] sourceLabel name of the input used in error messages
///
/// throws MalformedInputException for non-integer or repeated position labels,
/// rows with a different number of fields than the header, unterminated quotes,
/// empty read ids and cells which are neither numeric nor a missing value token.
///
/// Read id uniqueness is not checked here, see assertUniqueReadIds()
///
WidePvalTable
loadWidePvalTable(
    std::istream& is,
    const std::string& sourceLabel);

/// file version of the above, throws IoException if the file can't be read
WidePvalTable
loadWidePvalTable(
    const std::string& filename);


/// true if a table cell with this (unquoted) text has no p-value
bool
isMissingPvalToken(const std::string& cell);
