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

#ifndef OPENMETEO_HPP
#define OPENMETEO_HPP

#include "weather.hpp"

#include <chrono>
#include <string>
#include <vector>

/* Hourly forecasts from the Open-Meteo HTTPS API.  All queries of one lookup
   are issued concurrently on a single io_context. */
class OpenMeteoProvider : public WeatherProvider
{
public:
    OpenMeteoProvider(std::string const & host, std::chrono::seconds timeout);
    std::vector<WeatherLookup> lookup(std::vector<WeatherQuery> const & queries);

private:
    std::string const host;
    std::chrono::seconds const timeout;
};

namespace openmeteo
{

/* Request target (path and query) for one location and UTC day. */
std::string forecast_target(WeatherQuery const & query);

/* Pick the hour of the query out of a forecast response body.
   LOOKUP_RESOLVED with the sample, LOOKUP_NO_DATA if the hour is absent, LOOKUP_FAILED on malformed JSON. */
WeatherLookup parse_forecast(std::string const & body, boost::posix_time::ptime const & when);

}

#endif /* OPENMETEO_HPP */
