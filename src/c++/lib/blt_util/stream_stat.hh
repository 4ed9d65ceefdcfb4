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

/// \file
///
/// \brief single pass summary statistics for a stream of values
///

#pragma once

#include <cmath>

#include <iosfwd>
#include <limits>


/// Accumulate min, max, mean and standard deviation in a single pass
///
/// Mean and variance use the cancellation-friendly update from Higham,
/// Accuracy & Stability of Numerical Algorithms, p.26
///
struct stream_stat
{
    stream_stat()
    {
        clear();
    }

    void
    clear()
    {
        _mean = 0;
        _sumsq = 0;
        _max = 0;
        _min = 0;
        _count = 0;
    }

    void
    add(const double x)
    {
        _count++;
        if ((_count==1) || (x>_max)) _max=x;
        if ((_count==1) || (x<_min)) _min=x;

        // _mean must be updated before _sumsq
        const double delta(x-_mean);
        _mean += delta/static_cast<double>(_count);
        _sumsq += delta*(x-_mean);
    }

    unsigned
    size() const
    {
        return _count;
    }

    bool
    empty() const
    {
        return (_count==0);
    }

    double
    min() const
    {
        return ((_count<1) ? nan() : _min);
    }

    double
    max() const
    {
        return ((_count<1) ? nan() : _max);
    }

    double
    mean() const
    {
        return ((_count<1) ? nan() : _mean);
    }

    double
    variance() const
    {
        return ((_count<2) ? nan() : _sumsq/(static_cast<double>(_count-1)));
    }

    double
    sd() const
    {
        return std::sqrt(variance());
    }

private:
    static
    double
    nan()
    {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double _mean;
    double _sumsq;
    double _max;
    double _min;
    unsigned _count;
};


/// summary line, sd is left out when it is undefined
std::ostream&
operator<<(std::ostream& os, const stream_stat& ss);
