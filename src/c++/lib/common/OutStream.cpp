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

#include "OutStream.hh"
#include "common/Exceptions.hh"

#include "boost/filesystem.hpp"

#include <cerrno>

#include <sstream>



static
std::string
getTmpFilename(const std::string& filename)
{
    namespace bfs = boost::filesystem;
    const bfs::path target(filename);
    bfs::path tmpPattern(target.parent_path());
    tmpPattern /= target.filename().string() + ".%%%%-%%%%-%%%%.tmp";
    return bfs::unique_path(tmpPattern).string();
}



OutStream::
OutStream(const std::string& filename)
    : _filename(filename),
      _isCommitted(false)
{
    using namespace modfrac::common;

    if (_filename.empty())
    {
        BOOST_THROW_EXCEPTION(IoException(EINVAL, "Output filename is empty"));
    }

    _tmpFilename = getTmpFilename(_filename);

    errno = 0;
    _ofs.open(_tmpFilename.c_str());
    if (! _ofs)
    {
        const int errorNumber(errno);
        std::ostringstream oss;
        oss << "Can't open output file: '" << _filename << "'";
        BOOST_THROW_EXCEPTION(IoException(errorNumber, oss.str()));
    }
}



OutStream::
~OutStream()
{
    if (! _isCommitted) discard();
}



void
OutStream::
commit()
{
    using namespace modfrac::common;

    if (_isCommitted) return;

    errno = 0;
    _ofs.flush();
    _ofs.close();
    if (! _ofs)
    {
        const int errorNumber(errno);
        std::ostringstream oss;
        oss << "Failed to write output file: '" << _filename << "'";
        BOOST_THROW_EXCEPTION(IoException(errorNumber, oss.str()));
    }

    boost::system::error_code ec;
    boost::filesystem::rename(_tmpFilename, _filename, ec);
    if (ec)
    {
        std::ostringstream oss;
        oss << "Can't move completed output to file: '" << _filename << "': " << ec.message();
        BOOST_THROW_EXCEPTION(IoException(ec.value(), oss.str()));
    }
    _isCommitted=true;
}



void
OutStream::
discard()
{
    if (_ofs.is_open()) _ofs.close();

    // called from the destructor, so a failed removal can't be reported:
    boost::system::error_code ec;
    boost::filesystem::remove(_tmpFilename, ec);
}
