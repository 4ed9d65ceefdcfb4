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
/// \brief Output file stream with all-or-nothing semantics
///

#pragma once

#include "boost/utility.hpp"

#include <fstream>
#include <iosfwd>
#include <string>


/// Manages an output file stream, throwing an IoException if the file can't be opened
///
/// Content is written to a temporary file next to the target filename and is only
/// moved onto the target by commit(). If the object is destroyed before commit() the
/// temporary file is removed, so the target is either completely written or untouched.
///
struct OutStream : private boost::noncopyable
{
    explicit
    OutStream(const std::string& filename);

    ~OutStream();

    std::ostream&
    getStream()
    {
        return _ofs;
    }

    const std::string&
    getFilename() const
    {
        return _filename;
    }

    /// flush all content and move it to the target filename
    ///
    /// throws IoException if any write failed or the file can't be moved into place
    void
    commit();

private:
    void
    discard();

    const std::string _filename;
    std::string _tmpFilename;
    std::ofstream _ofs;
    bool _isCommitted;
};
