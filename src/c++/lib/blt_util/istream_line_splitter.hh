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
/// \brief an efficient (and slightly unsafe) class for basic delimited text files
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>


/// split each line of a delimited text stream into words in place
///
/// the pointers in word are only valid until the next call to parse_line()
///
struct istream_line_splitter
{
    explicit
    istream_line_splitter(
        std::istream& is,
        const char word_separator=',',
        const bool is_quoted_words=false)
        : _is(is)
        , _line_no(0)
        , _sep(word_separator)
        , _is_quoted_words(is_quoted_words)
        , _is_unterminated_quote(false)
    {}

    unsigned
    n_word() const
    {
        return word.size();
    }

    /// line number of the most recently parsed line, starting from 1
    unsigned
    line_no() const
    {
        return _line_no;
    }

    /// true if the most recently parsed line ended inside a quoted word
    bool
    is_unterminated_quote() const
    {
        return _is_unterminated_quote;
    }

    void
    dump(std::ostream& os) const;

    /// returns false for regular end of input
    ///
    /// a trailing '\r' is removed from each line before splitting
    ///
    /// in quoted word mode, a word starting with '"' runs to the matching
    /// close quote, separators inside it are kept, the enclosing quotes are
    /// removed and each "" pair inside is reduced to a single '"'
    bool
    parse_line();

    std::vector<char*> word;

private:
    void
    split_quoted_words();

    std::istream& _is;
    unsigned _line_no;
    char _sep;
    bool _is_quoted_words;
    bool _is_unterminated_quote;
    std::string _buf;
};
