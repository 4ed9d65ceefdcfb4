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

#include "WidePvalTable.hh"

#include "common/Exceptions.hh"

#include <map>
#include <set>
#include <sstream>
#include <utility>



void
WidePvalTable::
addRead(
    const std::string& readId,
    const std::vector<pval_t>& rowPvals)
{
    if (rowPvals.size() != _positions.size())
    {
        std::ostringstream oss;
        oss << "Row for read id '" << readId << "' has " << rowPvals.size()
            << " p-value cells, but the table has " << _positions.size() << " positions";
        BOOST_THROW_EXCEPTION(modfrac::common::MalformedInputException(oss.str()));
    }
    _readIds.push_back(readId);
    _pvals.insert(_pvals.end(), rowPvals.begin(), rowPvals.end());
}



std::size_t
WidePvalTable::
getPresentPvalCount() const
{
    std::size_t count(0);
    for (const pval_t& pval : _pvals)
    {
        if (pval) count++;
    }
    return count;
}



void
assertUniqueReadIds(const WidePvalTable& table)
{
    std::set<std::string> readIds;
    const std::size_t readCount(table.getReadCount());
    for (std::size_t readIndex(0); readIndex<readCount; ++readIndex)
    {
        const std::string& readId(table.getReadId(readIndex));
        if (! readIds.insert(readId).second)
        {
            std::ostringstream oss;
            oss << "Read id '" << readId << "' occurs more than once in the p-value table. Read ids must be unique.";
            BOOST_THROW_EXCEPTION(modfrac::common::DuplicateKeyException(oss.str()));
        }
    }
}



typedef std::map<std::pair<std::string,pos_t>,double> pval_cell_map_t;

static
pval_cell_map_t
getPresentCells(const WidePvalTable& table)
{
    pval_cell_map_t cells;
    const std::size_t readCount(table.getReadCount());
    const std::size_t positionCount(table.getPositionCount());
    for (std::size_t readIndex(0); readIndex<readCount; ++readIndex)
    {
        for (std::size_t positionIndex(0); positionIndex<positionCount; ++positionIndex)
        {
            const WidePvalTable::pval_t& pval(table.getPval(readIndex,positionIndex));
            if (! pval) continue;
            cells[std::make_pair(table.getReadId(readIndex),table.getPositions()[positionIndex])] = *pval;
        }
    }
    return cells;
}



bool
isEquivalentPvalTable(
    const WidePvalTable& table1,
    const WidePvalTable& table2)
{
    return (getPresentCells(table1) == getPresentCells(table2));
}
