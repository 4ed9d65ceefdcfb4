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
/// \brief Per-read, per-position p-value matrix
///

#pragma once

#include "blt_util/blt_types.hh"

#include "boost/optional.hpp"

#include <cstddef>

#include <string>
#include <vector>


/// Matrix of p-values with one row per read and one column per position
///
/// A cell without a p-value (the read was not tested at that position) is
/// represented by an empty optional, never by a numeric placeholder.
///
/// Read ids are stored as given, uniqueness is checked separately by
/// assertUniqueReadIds().
///
struct WidePvalTable
{
    typedef boost::optional<double> pval_t;

    explicit
    WidePvalTable(
        const std::vector<pos_t>& positions = std::vector<pos_t>())
        : _positions(positions)
    {}

    /// column labels, in column order
    const std::vector<pos_t>&
    getPositions() const
    {
        return _positions;
    }

    std::size_t
    getPositionCount() const
    {
        return _positions.size();
    }

    std::size_t
    getReadCount() const
    {
        return _readIds.size();
    }

    const std::string&
    getReadId(const std::size_t readIndex) const
    {
        return _readIds[readIndex];
    }

    const pval_t&
    getPval(
        const std::size_t readIndex,
        const std::size_t positionIndex) const
    {
        return _pvals[readIndex*getPositionCount() + positionIndex];
    }

    /// append one read row
    ///
    /// throws MalformedInputException unless rowPvals has one entry per position
    void
    addRead(
        const std::string& readId,
        const std::vector<pval_t>& rowPvals);

    /// total number of cells holding a p-value
    std::size_t
    getPresentPvalCount() const;

private:
    std::vector<pos_t> _positions;
    std::vector<std::string> _readIds;

    // row-major cell storage
    std::vector<pval_t> _pvals;
};


/// throws DuplicateKeyException if any read id occurs on more than one row
void
assertUniqueReadIds(const WidePvalTable& table);


/// test whether two tables hold the same p-values for the same (read id, position) pairs
///
/// row order, column order and any rows or columns without a p-value are ignored
bool
isEquivalentPvalTable(
    const WidePvalTable& table1,
    const WidePvalTable& table2);
