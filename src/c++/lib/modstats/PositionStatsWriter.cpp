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

#include "PositionStatsWriter.hh"

#include "blt_util/io_util.hh"
#include "common/OutStream.hh"

#include <iostream>



static const char sep(',');



static
void
writeHeader(
    std::ostream& os,
    const bool isIncludeFractionFields)
{
    os << "pos_0b"
       << sep << "num_below_lower_thresh"
       << sep << "num_above_upper_thresh"
       << sep << "covg";
    if (isIncludeFractionFields)
    {
        os << sep << "frac_below_lower_thresh"
           << sep << "frac_above_upper_thresh";
    }
    os << sep << "f_value"
       << sep << "d_value"
       << "\n";
}



void
writePositionStats(
    std::ostream& os,
    const std::vector<PositionStats>& posStats,
    const bool isIncludeFractionFields)
{
    writeHeader(os, isIncludeFractionFields);

    for (const PositionStats& stats : posStats)
    {
        os << stats.pos
           << sep << stats.belowLowerThreshCount
           << sep << stats.aboveUpperThreshCount
           << sep << stats.coverage;
        if (isIncludeFractionFields)
        {
            os << sep;
            write_shortest_double(os, stats.getBelowLowerThreshFrac());
            os << sep;
            write_shortest_double(os, stats.getAboveUpperThreshFrac());
        }
        os << sep;
        write_shortest_double(os, stats.getFValue());
        os << sep;
        write_shortest_double(os, stats.getDValue());
        os << "\n";
    }
}



void
writePositionStats(
    const std::string& filename,
    const std::vector<PositionStats>& posStats,
    const bool isIncludeFractionFields)
{
    OutStream outs(filename);
    writePositionStats(outs.getStream(), posStats, isIncludeFractionFields);
    outs.commit();
}
