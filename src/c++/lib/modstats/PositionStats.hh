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
/// \brief Per-position modification statistics from per-read p-values
///

#pragma once

#include "PvalObservation.hh"

#include "blt_util/blt_types.hh"

#include <iosfwd>
#include <vector>


/// default thresholds, matching tombo's RNA defaults
static const double defaultLowerPvalThreshold(0.05);
static const double defaultUpperPvalThreshold(0.40);


/// p-value thresholds used to classify each observation
///
/// A p-value below lower is evidence of modification, a p-value above upper is
/// evidence of no modification, anything in [lower, upper] is inconclusive.
///
struct PvalThresholds
{
    PvalThresholds(
        const double initLower = defaultLowerPvalThreshold,
        const double initUpper = defaultUpperPvalThreshold)
        : lower(initLower),
          upper(initUpper)
    {}

    /// throws InvalidParameterException unless 0 <= lower <= upper <= 1
    void
    validate() const;

    bool
    isBelowLower(const double pval) const
    {
        return (pval < lower);
    }

    bool
    isAboveUpper(const double pval) const
    {
        return (pval > upper);
    }

    double lower;
    double upper;
};

std::ostream&
operator<<(std::ostream& os, const PvalThresholds& thresholds);



/// summary of all observations at one position
///
/// The ratios are quiet NaN when their denominator would be zero, which
/// happens for the f and d values when no observation falls outside the
/// inconclusive p-value range.
///
struct PositionStats
{
    explicit
    PositionStats(const pos_t initPos = 0)
        : pos(initPos),
          belowLowerThreshCount(0),
          aboveUpperThreshCount(0),
          coverage(0)
    {}

    double
    getBelowLowerThreshFrac() const;

    double
    getAboveUpperThreshFrac() const;

    /// fraction of conclusive observations which show modification
    double
    getFValue() const;

    /// f value dampened with a pseudo-count of 2 in the denominator, which pulls low coverage positions toward 0
    double
    getDValue() const;

    /// true if at least one observation is outside the inconclusive range, so that the f and d values are defined
    bool
    isFValueDefined() const
    {
        return ((belowLowerThreshCount+aboveUpperThreshCount) > 0);
    }

    pos_t pos;
    unsigned belowLowerThreshCount;
    unsigned aboveUpperThreshCount;

    /// all observations at this position, including inconclusive ones
    unsigned coverage;
};

std::ostream&
operator<<(std::ostream& os, const PositionStats& stats);



/// group observations by position and summarize each group
///
/// \return one entry per distinct position, sorted by position
///
/// throws InvalidParameterException for invalid thresholds
std::vector<PositionStats>
aggregatePositionStats(
    const std::vector<PvalObservation>& observations,
    const PvalThresholds& thresholds);
