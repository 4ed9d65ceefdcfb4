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

#include "PvalReshape.hh"

#include "common/Exceptions.hh"

#include <map>
#include <sstream>



std::vector<PvalObservation>
longify(const WidePvalTable& table)
{
    std::vector<PvalObservation> observations;
    observations.reserve(table.getPresentPvalCount());

    const std::vector<pos_t>& positions(table.getPositions());
    const std::size_t readCount(table.getReadCount());
    const std::size_t positionCount(table.getPositionCount());
    for (std::size_t readIndex(0); readIndex<readCount; ++readIndex)
    {
        for (std::size_t positionIndex(0); positionIndex<positionCount; ++positionIndex)
        {
            const WidePvalTable::pval_t& pval(table.getPval(readIndex,positionIndex));
            if (! pval) continue;
            observations.emplace_back(table.getReadId(readIndex), positions[positionIndex], *pval);
        }
    }
    return observations;
}



WidePvalTable
widify(const std::vector<PvalObservation>& observations)
{
    // map each key to its row/column index, in sorted key order:
    std::map<std::string,std::size_t> readIndex;
    std::map<pos_t,std::size_t> positionIndex;
    for (const PvalObservation& obs : observations)
    {
        readIndex[obs.readId] = 0;
        positionIndex[obs.pos] = 0;
    }

    std::vector<pos_t> positions;
    for (auto& val : positionIndex)
    {
        val.second = positions.size();
        positions.push_back(val.first);
    }

    std::size_t nextReadIndex(0);
    for (auto& val : readIndex)
    {
        val.second = nextReadIndex++;
    }

    const std::size_t positionCount(positions.size());
    std::vector<WidePvalTable::pval_t> cells(readIndex.size()*positionCount);
    for (const PvalObservation& obs : observations)
    {
        WidePvalTable::pval_t& cell(cells[readIndex[obs.readId]*positionCount + positionIndex[obs.pos]]);
        if (cell)
        {
            std::ostringstream oss;
            oss << "Read id '" << obs.readId << "' has more than one p-value at position " << obs.pos;
            BOOST_THROW_EXCEPTION(modfrac::common::DuplicateKeyException(oss.str()));
        }
        cell = obs.pval;
    }

    WidePvalTable table(positions);
    for (const auto& val : readIndex)
    {
        const auto rowBegin(cells.begin() + val.second*positionCount);
        table.addRead(val.first, std::vector<WidePvalTable::pval_t>(rowBegin, rowBegin+positionCount));
    }
    return table;
}
