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

#ifndef FIXTURES_HPP
#define FIXTURES_HPP

#include "formatting.hpp"
#include "stop.hpp"
#include "weather.hpp"

#include <vector>

/* Depot and three stops around Fort Wayne, all expected between 08:00 and 08:45 EST. */
inline std::vector<Stop> example_stops()
{
    std::vector<Stop> stops;
    stops.push_back(Stop(0, "Depot", 41.1176, -85.0689, parse_timestamp("2025-11-10T08:00:00-05:00")));
    stops.push_back(Stop(1, "Stop A", 41.1802, -84.9960, parse_timestamp("2025-11-10T08:15:00-05:00")));
    stops.push_back(Stop(2, "Stop B", 41.0953, -85.1394, parse_timestamp("2025-11-10T08:30:00-05:00")));
    stops.push_back(Stop(3, "Stop C", 41.2281, -85.0111, parse_timestamp("2025-11-10T08:45:00-05:00")));
    return stops;
}

/* Answers every query with the same sample and remembers what was asked. */
class FixedWeatherProvider : public WeatherProvider
{
public:
    explicit FixedWeatherProvider(WeatherSample const & sample) : sample(sample) {}

    std::vector<WeatherLookup> lookup(std::vector<WeatherQuery> const & queries)
    {
        asked = queries;
        std::vector<WeatherLookup> results(queries.size());
        for (auto & r : results)
        {
            r.status = LOOKUP_RESOLVED;
            r.sample = sample;
        }
        return results;
    }

    WeatherSample sample;
    std::vector<WeatherQuery> asked;
};

/* Every lookup fails as an unreachable service would. */
class UnreachableWeatherProvider : public WeatherProvider
{
public:
    std::vector<WeatherLookup> lookup(std::vector<WeatherQuery> const & queries)
    {
        std::vector<WeatherLookup> results(queries.size());
        for (auto & r : results)
        {
            r.status = LOOKUP_FAILED;
            r.detail = "connect: Connection refused";
        }
        return results;
    }
};

#endif /* FIXTURES_HPP */
