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

#include <math.h>
#include <sstream>

namespace geodistance
{

double const PI = 3.14159265358979323846;

double radians(double degrees)
{
    return degrees * PI / 180.0;
}

void check_coordinate(double latitude, double longitude)
{
    if (!(latitude >= -90.0 && latitude <= 90.0) || !(longitude >= -180.0 && longitude <= 180.0))
    {
        std::ostringstream ss;
        ss << "Coordinate out of range: (" << latitude << ", " << longitude << ")";
        throw InvalidCoordinate(ss.str());
    }
}

double haversine_km(double lat1, double lon1, double lat2, double lon2)
{
    check_coordinate(lat1, lon1);
    check_coordinate(lat2, lon2);

    double dlat = radians(lat2 - lat1);
    double dlon = radians(lon2 - lon1);
    double a = pow(sin(dlat / 2), 2) + cos(radians(lat1)) * cos(radians(lat2)) * pow(sin(dlon / 2), 2);
    if (a > 1.0)  // Rounding near antipodes.
        a = 1.0;
    return 2 * EARTH_RADIUS_KM * asin(sqrt(a));
}

double haversine_km(Stop const & a, Stop const & b)
{
    return haversine_km(a.latitude, a.longitude, b.latitude, b.longitude);
}

}
