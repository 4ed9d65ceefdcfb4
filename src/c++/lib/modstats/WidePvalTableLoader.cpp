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

#include "WidePvalTableLoader.hh"

#include "blt_util/io_util.hh"
#include "blt_util/istream_line_splitter.hh"
#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include "boost/algorithm/string.hpp"

#include <cmath>

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>



bool
isMissingPvalToken(const std::string& cell)
{
    static const std::set<std::string> missingTokens =
    {
        "", "#N/A", "#N/A N/A", "#NA", "-1.#IND", "-1.#QNAN", "-NaN", "-nan",
        "1.#IND", "1.#QNAN", "<NA>", "N/A", "NA", "NULL", "NaN", "None",
        "n/a", "nan", "null"
    };
    return (missingTokens.count(cell) != 0);
}



static
bool
isBlankLine(const istream_line_splitter& splitter)
{
    return ((splitter.n_word() == 1) && (*(splitter.word[0]) == '\0'));
}



static
void
malformedInputError(
    const std::string& sourceLabel,
    const istream_line_splitter& splitter,
    const std::string& message)
{
    std::ostringstream oss;
    oss << "Malformed p-value table '" << sourceLabel << "' on line " << splitter.line_no() << ": " << message;
    BOOST_THROW_EXCEPTION(modfrac::common::MalformedInputException(oss.str()));
}



/// quoted fields may not span lines
static
void
checkQuotes(
    const std::string& sourceLabel,
    const istream_line_splitter& splitter)
{
    if (splitter.is_unterminated_quote())
    {
        malformedInputError(sourceLabel, splitter, "unterminated quoted field");
    }
}



static
std::vector<pos_t>
parseHeader(
    const std::string& sourceLabel,
    const istream_line_splitter& splitter)
{
    std::vector<pos_t> positions;
    std::set<pos_t> observedPositions;
    const unsigned wordCount(splitter.n_word());
    for (unsigned wordIndex(1); wordIndex<wordCount; ++wordIndex)
    {
        const std::string label(boost::algorithm::trim_copy(std::string(splitter.word[wordIndex])));
        pos_t pos(0);
        try
        {
            pos = modfrac::blt_util::parse_long_str(label);
        }
        catch (const modfrac::common::GeneralException&)
        {
            malformedInputError(sourceLabel, splitter, "column label '" + label + "' is not an integer position");
        }

        if (! observedPositions.insert(pos).second)
        {
            malformedInputError(sourceLabel, splitter, "position label '" + label + "' occurs more than once");
        }
        positions.push_back(pos);
    }
    return positions;
}



static
WidePvalTable::pval_t
parseCell(
    const std::string& sourceLabel,
    const istream_line_splitter& splitter,
    const unsigned wordIndex)
{
    // surrounding blanks are ignored in numeric fields, read ids are kept verbatim:
    const std::string cell(boost::algorithm::trim_copy(std::string(splitter.word[wordIndex])));
    if (isMissingPvalToken(cell)) return WidePvalTable::pval_t();

    double pval(0);
    try
    {
        pval = modfrac::blt_util::parse_double_str(cell);
    }
    catch (const modfrac::common::GeneralException&)
    {
        std::ostringstream oss;
        oss << "p-value cell " << wordIndex << " '" << cell << "' is not a number";
        malformedInputError(sourceLabel, splitter, oss.str());
    }

    // other spellings of NaN accepted by strtod are also missing values:
    if (std::isnan(pval)) return WidePvalTable::pval_t();
    return WidePvalTable::pval_t(pval);
}



WidePvalTable
loadWidePvalTable(
    std::istream& is,
    const std::string& sourceLabel)
{
    istream_line_splitter splitter(is,',',true);

    bool isHeaderFound(false);
    while (splitter.parse_line())
    {
        checkQuotes(sourceLabel, splitter);
        if (isBlankLine(splitter)) continue;
        isHeaderFound=true;
        break;
    }

    if (! isHeaderFound)
    {
        std::ostringstream oss;
        oss << "Malformed p-value table '" << sourceLabel << "': no header line found";
        BOOST_THROW_EXCEPTION(modfrac::common::MalformedInputException(oss.str()));
    }

    WidePvalTable table(parseHeader(sourceLabel, splitter));
    const std::size_t expectedWordCount(table.getPositionCount()+1);

    std::vector<WidePvalTable::pval_t> rowPvals;
    while (splitter.parse_line())
    {
        checkQuotes(sourceLabel, splitter);
        if (isBlankLine(splitter)) continue;

        if (splitter.n_word() != expectedWordCount)
        {
            std::ostringstream oss;
            oss << "row has " << splitter.n_word() << " fields, but the header has " << expectedWordCount;
            malformedInputError(sourceLabel, splitter, oss.str());
        }

        const std::string readId(splitter.word[0]);
        if (readId.empty())
        {
            malformedInputError(sourceLabel, splitter, "empty read id");
        }

        rowPvals.clear();
        for (unsigned wordIndex(1); wordIndex<expectedWordCount; ++wordIndex)
        {
            rowPvals.push_back(parseCell(sourceLabel, splitter, wordIndex));
        }
        table.addRead(readId, rowPvals);
    }

    return table;
}



WidePvalTable
loadWidePvalTable(
    const std::string& filename)
{
    std::ifstream ifs;
    open_ifstream(ifs, filename.c_str());
    return loadWidePvalTable(ifs, filename);
}
