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

#include "formatting.hpp"
#include "weather.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace std;

vector<WeatherLookup> DisabledWeatherProvider::lookup(vector<WeatherQuery> const & queries)
{
    vector<WeatherLookup> results(queries.size());
    for (auto & r : results)
    {
        r.status = LOOKUP_NO_DATA;
        r.detail = "weather lookup disabled";
    }
    return results;
}

namespace weather
{

double weather_factor(WeatherSample const & sample, WeatherThresholds const & thresholds)
{
    double factor = 1.0;

    // Rain.
    if (sample.precipitation >= thresholds.rain_light_mm)
        factor += thresholds.rain_light_penalty;
    if (sample.precipitation >= thresholds.rain_heavy_mm)
        factor += thresholds.rain_heavy_penalty;

    // Snow.
    if (sample.snowfall >= thresholds.snow_light_cm)
        factor += thresholds.snow_light_penalty;
    if (sample.snowfall >= thresholds.snow_heavy_cm)
        factor += thresholds.snow_heavy_penalty;

    // Wind and gusts.
    if (sample.wind_speed >= thresholds.wind_kph)
        factor += thresholds.wind_penalty;
    if (sample.wind_gusts >= thresholds.gust_kph)
        factor += thresholds.gust_penalty;

    return max(factor, 1.0);
}

vector<StopFactor> get_stop_weather_factors(vector<Stop> const & stops,
        boost::posix_time::ptime const & fallback_when, WeatherProvider & provider,
        WeatherThresholds const & thresholds)
{
    vector<WeatherQuery> queries;
    queries.reserve(stops.size());
    for (auto & s : stops)
        queries.push_back({s.latitude, s.longitude, s.when ? *s.when : fallback_when});

    vector<WeatherLookup> lookups = provider.lookup(queries);
    if (lookups.size() != stops.size())
        throw logic_error("Weather provider answered " + to_string(lookups.size()) + " of " +
                to_string(stops.size()) + " queries");

    vector<StopFactor> factors(stops.size());
    for (auto i = 0u; i < stops.size(); i++)
    {
        WeatherLookup const & l = lookups[i];
        switch (l.status)
        {
            case LOOKUP_RESOLVED:
                factors[i].factor = weather_factor(l.sample, thresholds);
                break;
            case LOOKUP_NO_DATA:
                factors[i].degraded = true;
                factors[i].reason = "no forecast for " + format_date(queries[i].when) + " " +
                        format_hour(queries[i].when) + " UTC" + (l.detail.size() ? " (" + l.detail + ")" : "");
                break;
            case LOOKUP_FAILED:
                factors[i].degraded = true;
                factors[i].reason = "lookup failed: " + l.detail;
                break;
        }
    }
    return factors;
}

TimeMatrix apply_weather_to_matrix(TimeMatrix const & base, vector<double> const & factors)
{
    auto n = base.size();
    if (factors.size() != n)
        throw logic_error("Got " + to_string(factors.size()) + " weather factors for " + to_string(n) + " stops");
    for (auto i = 0u; i < n; i++)
        if (!(factors[i] >= 1.0) || std::isinf(factors[i]))
        {
            ostringstream ss;
            ss << "Weather factor for stop " << i << " is " << factors[i] << ", must be finite and >= 1.0";
            throw logic_error(ss.str());
        }

    TimeMatrix m(n, vector<double>(n, 0.0));
    for (auto i = 0u; i < n; i++)
        for (auto j = 0u; j < n; j++)
        {
            if (i == j)
                continue;
            m[i][j] = base[i][j] * max(factors[i], factors[j]);
        }
    return m;
}

vector<double> factor_values(vector<StopFactor> const & factors)
{
    vector<double> values;
    for (auto & f : factors)
        values.push_back(f.factor);
    return values;
}

}
