//
// Copyright (c) 2009-2012 Illumina, Inc.
//
// Permission is hereby granted, free of charge, to any person
// obtaining a copy of this software and associated documentation
// files (the "Software"), to deal in the Software without
// restriction, including without limitation the rights to use, copy,
// modify, merge, publish, distribute, sublicense, and/or sell copies
// of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be
// included in all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
// EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
// MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
// NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS
// BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN
// ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
//

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <cerrno>
#include <cmath>
#include <climits>
#include <cstdlib>

#include <limits>
#include <sstream>



static
void
parse_exception(
    const char* type_label,
    const char* parse_str)
{
    std::ostringstream oss;
    oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
    BOOST_THROW_EXCEPTION(modfrac::common::GeneralException(oss.str()));
}



/// check that s was consumed up to its terminating null
static
void
check_complete(
    const char* type_label,
    const std::string& s,
    const char* endptr)
{
    if ((endptr-s.c_str()) != static_cast<long>(s.length()))
    {
        parse_exception(type_label,s.c_str());
    }
}



namespace modfrac
{
namespace blt_util
{

long
parse_long(const char*& s)
{
    static const int base(10);

    errno = 0;

    char* endptr;
    const long val(strtol(s, &endptr, base));
    if ((errno == ERANGE && (val == LONG_MIN || val == LONG_MAX))
        || (errno != 0 && val == 0) || (endptr == s))
    {
        parse_exception("long int",s);
    }

    s = endptr;

    return val;
}



long
parse_long_str(const std::string& s)
{
    const char* s2(s.c_str());
    const long val(parse_long(s2));
    check_complete("long int",s,s2);
    return val;
}



double
parse_double(const char*& s)
{
    errno = 0;

    char* endptr;
    const double val(strtod(s, &endptr));
    // underflow to a denormal or zero is accepted, p-values can legitimately be this small:
    if ((errno == ERANGE && std::abs(val) == HUGE_VAL) || (endptr == s))
    {
        parse_exception("double",s);
    }

    s = endptr;
    return val;
}



double
parse_double_str(const std::string& s)
{
    const char* s2(s.c_str());
    const double val(parse_double(s2));
    check_complete("double",s,s2);
    return val;
}

}
}
