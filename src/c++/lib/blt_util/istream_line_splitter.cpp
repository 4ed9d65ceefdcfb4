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

#include "blt_util/istream_line_splitter.hh"
#include "common/Exceptions.hh"

#include <cerrno>

#include <iostream>
#include <sstream>



void
istream_line_splitter::
dump(std::ostream& os) const
{
    os << "\tline_no: " << _line_no << "\n";
    os << "\tline: '";
    for (unsigned i(0); i<n_word(); ++i)
    {
        if (i) os << _sep;
        os << word[i];
    }
    os << "'\n";
}



bool
istream_line_splitter::
parse_line()
{
    word.clear();
    _is_unterminated_quote=false;

    if (! std::getline(_is,_buf))
    {
        if (_is.eof()) return false;

        std::ostringstream oss;
        oss << "Unexpected read failure after line_no: " << _line_no;
        BOOST_THROW_EXCEPTION(modfrac::common::IoException(errno, oss.str()));
    }
    _line_no++;

    if ((! _buf.empty()) && (_buf[_buf.size()-1] == '\r'))
    {
        _buf.resize(_buf.size()-1);
    }

    if (_is_quoted_words)
    {
        split_quoted_words();
        return true;
    }

    // do a low-level separator parse:
    char* p(&_buf[0]);
    word.push_back(p);
    for (; *p != '\0'; ++p)
    {
        if (*p == _sep)
        {
            *p = '\0';
            word.push_back(p+1);
        }
    }
    return true;
}



void
istream_line_splitter::
split_quoted_words()
{
    // words are compacted in place, the write position never passes the read position:
    const char* src(&_buf[0]);
    char* dest(&_buf[0]);
    word.push_back(dest);

    bool isInQuote(false);
    for (; *src != '\0'; ++src)
    {
        if (isInQuote)
        {
            if (*src != '"')
            {
                *dest++ = *src;
            }
            else if (*(src+1) == '"')
            {
                *dest++ = '"';
                ++src;
            }
            else
            {
                isInQuote=false;
            }
        }
        else if (*src == _sep)
        {
            *dest++ = '\0';
            word.push_back(dest);
        }
        else if ((*src == '"') && (dest == word.back()))
        {
            isInQuote=true;
        }
        else
        {
            *dest++ = *src;
        }
    }
    *dest = '\0';
    _is_unterminated_quote=isInQuote;
}
