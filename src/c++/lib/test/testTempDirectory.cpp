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

#include "testTempDirectory.hh"

#include <fstream>
#include <sstream>



TestTempDirectory::
TestTempDirectory()
    : _path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("modfrac_test_%%%%-%%%%-%%%%"))
{
    boost::filesystem::create_directories(_path);
}



TestTempDirectory::
~TestTempDirectory()
{
    boost::system::error_code ec;
    boost::filesystem::remove_all(_path, ec);
}



std::string
TestTempDirectory::
writeFile(
    const std::string& filename,
    const std::string& content) const
{
    const std::string filePath(getFilePath(filename));
    std::ofstream ofs(filePath.c_str());
    ofs << content;
    return filePath;
}



std::string
readTestFile(const std::string& filename)
{
    std::ifstream ifs(filename.c_str());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}
