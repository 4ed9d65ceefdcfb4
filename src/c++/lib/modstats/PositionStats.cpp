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

#include "PositionStats.hh"

#include "common/Exceptions.hh"

#include <iostream>
#include <limits>
#include <map>
#include <sstream>



static
double
safeRatio(
    const unsigned numerator,
    const unsigned denominator)
{
    if (denominator == 0) return std::numeric_limits<double>::quiet_NaN();
    return static_cast<double>(numerator)/static_cast<double>(denominator);
}



void
PvalThresholds::
validate() const
{
    if ((lower >= 0.) && (lower <= upper) && (upper <= 1.)) return;

    std::ostringstream oss;
    oss << "Invalid p-value thresholds, expected 0 <= lower <= upper <= 1, got " << *this;
    BOOST_THROW_EXCEPTION(modfrac::common::InvalidParameterException(oss.str()));
}



std::ostream&
operator<<(std::ostream& os, const PvalThresholds& thresholds)
{
    os << "lower: " << thresholds.lower << " upper: " << thresholds.upper;
    return os;
}



double
PositionStats::
getBelowLowerThreshFrac() const
{
    return safeRatio(belowLowerThreshCount, coverage);
}



double
PositionStats::
getAboveUpperThreshFrac() const
{
    return safeRatio(aboveUpperThreshCount, coverage);
}



double
PositionStats::
getFValue() const
{
    return safeRatio(belowLowerThreshCount, belowLowerThreshCount+aboveUpperThreshCount);
}



double
PositionStats::
getDValue() const
{
    if (! isFValueDefined()) return std::numeric_limits<double>::quiet_NaN();

    static const unsigned pseudoCount(2);
    return safeRatio(belowLowerThreshCount, belowLowerThreshCount+aboveUpperThreshCount+pseudoCount);
}



std::ostream&
operator<<(std::ostream& os, const PositionStats& stats)
{
    os << "pos: " << stats.pos
       << " below: " << stats.belowLowerThreshCount
       << " above: " << stats.aboveUpperThreshCount
       << " coverage: " << stats.coverage
       << " f: " << stats.getFValue()
       << " d: " << stats.getDValue();
    return os;
}



std::vector<PositionStats>
aggregatePositionStats(
    const std::vector<PvalObservation>& observations,
    const PvalThresholds& thresholds)
{
    thresholds.validate();

    std::map<pos_t,PositionStats> posStats;
    for (const PvalObservation& obs : observations)
    {
        auto iter(posStats.find(obs.pos));
        if (iter == posStats.end())
        {
            iter = posStats.insert(std::make_pair(obs.pos, PositionStats(obs.pos))).first;
        }

        PositionStats& stats(iter->second);
        stats.coverage++;
        if (thresholds.isBelowLower(obs.pval))
        {
            stats.belowLowerThreshCount++;
        }
        else if (thresholds.isAboveUpper(obs.pval))
        {
            stats.aboveUpperThreshCount++;
        }
    }

    std::vector<PositionStats> result;
    result.reserve(posStats.size());
    for (const auto& val : posStats)
    {
        result.push_back(val.second);
    }
    return result;
}
