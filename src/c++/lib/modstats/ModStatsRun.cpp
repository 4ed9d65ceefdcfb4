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

#include "ModStatsRun.hh"

#include "PositionStatsWriter.hh"
#include "PvalReshape.hh"
#include "WidePvalTableLoader.hh"

#include "blt_util/log.hh"
#include "blt_util/stream_stat.hh"



std::vector<PositionStats>
computeModStats(
    const WidePvalTable& table,
    const PvalThresholds& thresholds)
{
    thresholds.validate();
    assertUniqueReadIds(table);
    return aggregatePositionStats(longify(table), thresholds);
}



static
void
reportModStats(
    const std::vector<PositionStats>& posStats,
    std::ostream& os)
{
    stream_stat coverage;
    unsigned undefinedCount(0);
    for (const PositionStats& stats : posStats)
    {
        coverage.add(stats.coverage);
        if (! stats.isFValueDefined()) undefinedCount++;
    }

    os << "INFO: Computed statistics for " << posStats.size() << " positions\n";
    if (! coverage.empty())
    {
        os << "INFO: Position coverage " << coverage << "\n";
    }
    if (undefinedCount > 0)
    {
        os << "INFO: " << undefinedCount << " positions have no p-values outside the inconclusive range, f and d values are undefined\n";
    }
}



void
runModStats(const ModStatsOptions& opt)
{
    opt.pvalThresholds.validate();
    log_os << "INFO: Using p-value thresholds " << opt.pvalThresholds << "\n";

    std::vector<PositionStats> posStats;
    {
        const WidePvalTable table(loadWidePvalTable(opt.sourceFilename));
        log_os << "INFO: Loaded p-value table '" << opt.sourceFilename << "' with "
               << table.getReadCount() << " reads, "
               << table.getPositionCount() << " positions and "
               << table.getPresentPvalCount() << " p-values\n";

        posStats = computeModStats(table, opt.pvalThresholds);
    }

    reportModStats(posStats, log_os);

    writePositionStats(opt.sinkFilename, posStats, opt.isIncludeFractionFields);
    log_os << "INFO: Wrote per-position statistics to '" << opt.sinkFilename << "'\n";
}
