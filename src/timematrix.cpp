/*
 * The MIT License
 *
 * Copyright 2018 Matthew Zalesak.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include "errors.hpp"
#include "geodistance.hpp"
#include "timematrix.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace timematrix
{

TimeMatrix build_base_time_matrix(vector<Stop> const & stops, double speed_kph)
{
    if (!(speed_kph > 0) || std::isinf(speed_kph))
        throw InvalidSpeed("Assumed speed must be a positive number of km/h, got " + to_string(speed_kph));

    auto n = stops.size();
    TimeMatrix m(n, vector<double>(n, 0.0));
    for (auto i = 0u; i < n; i++)
        for (auto j = 0u; j < n; j++)
        {
            if (i == j)
                continue;
            double km = geodistance::haversine_km(stops[i], stops[j]);
            m[i][j] = km / speed_kph * 60.0;
        }
    return m;
}

void check_matrix(TimeMatrix const & matrix, bool allow_infinite)
{
    auto n = matrix.size();
    for (auto i = 0u; i < n; i++)
    {
        if (matrix[i].size() != n)
            throw logic_error("Time matrix row " + to_string(i) + " has " + to_string(matrix[i].size()) +
                    " entries, expected " + to_string(n));
        for (auto j = 0u; j < n; j++)
        {
            double t = matrix[i][j];
            if (std::isnan(t) || t < 0 || (std::isinf(t) && !allow_infinite))
            {
                ostringstream ss;
                ss << "Time matrix entry (" << i << "," << j << ") is invalid: " << t;
                throw logic_error(ss.str());
            }
            if (i == j && t != 0)
                throw logic_error("Time matrix diagonal entry " + to_string(i) + " is not zero");
        }
    }
}

}
