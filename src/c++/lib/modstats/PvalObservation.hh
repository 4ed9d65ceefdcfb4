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
/// \brief Long-form record of a single p-value
///

#pragma once

#include "blt_util/blt_types.hh"

#include <iosfwd>
#include <string>


/// the p-value of one read at one position
struct PvalObservation
{
    PvalObservation(
        const std::string& initReadId = "",
        const pos_t initPos = 0,
        const double initPval = 0)
        : readId(initReadId),
          pos(initPos),
          pval(initPval)
    {}

    bool
    operator==(const PvalObservation& rhs) const
    {
        return ((readId == rhs.readId) && (pos == rhs.pos) && (pval == rhs.pval));
    }

    std::string readId;
    pos_t pos;
    double pval;
};

std::ostream&
operator<<(std::ostream& os, const PvalObservation& obs);
