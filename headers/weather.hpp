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

#ifndef WEATHER_HPP
#define WEATHER_HPP

#include "stop.hpp"
#include "timematrix.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <string>
#include <vector>

/* Forecast values for one location and hour. */
struct WeatherSample
{
    double precipitation = 0;   // mm
    double snowfall = 0;        // cm
    double wind_speed = 0;      // km/h, sustained
    double wind_gusts = 0;      // km/h
};

/* Each threshold adds its penalty to a base factor of 1.0 when reached. */
struct WeatherThresholds
{
    double rain_light_mm = 0.5;
    double rain_light_penalty = 0.10;
    double rain_heavy_mm = 5.0;
    double rain_heavy_penalty = 0.10;
    double snow_light_cm = 0.1;
    double snow_light_penalty = 0.20;
    double snow_heavy_cm = 1.0;
    double snow_heavy_penalty = 0.30;
    double wind_kph = 30;
    double wind_penalty = 0.05;
    double gust_kph = 50;
    double gust_penalty = 0.10;
};

struct WeatherQuery
{
    double latitude;
    double longitude;
    boost::posix_time::ptime when;  // UTC
};

enum LookupStatus {LOOKUP_RESOLVED, LOOKUP_NO_DATA, LOOKUP_FAILED};

struct WeatherLookup
{
    LookupStatus status = LOOKUP_FAILED;
    WeatherSample sample;
    std::string detail;
};

/* Source of forecasts.  Transport and lookup problems are reported through the
   status of each WeatherLookup, never thrown. */
class WeatherProvider
{
public:
    virtual ~WeatherProvider() {}

    /* Result i answers queries[i]. */
    virtual std::vector<WeatherLookup> lookup(std::vector<WeatherQuery> const & queries) = 0;
};

/* Used when forecasts are switched off: every query has no data. */
class DisabledWeatherProvider : public WeatherProvider
{
public:
    std::vector<WeatherLookup> lookup(std::vector<WeatherQuery> const & queries);
};

/* The factor applied to one stop, and whether it is an estimate. */
struct StopFactor
{
    double factor = 1.0;
    bool degraded = false;
    std::string reason;
};

namespace weather
{

/* Slow-down factor >= 1.0 for a forecast sample. */
double weather_factor(WeatherSample const & sample, WeatherThresholds const & thresholds);

/* One factor per stop at the stop's expected arrival, or at fallback_when for stops without one.
   Failed or empty lookups give a degraded factor of exactly 1.0. */
std::vector<StopFactor> get_stop_weather_factors(std::vector<Stop> const & stops,
        boost::posix_time::ptime const & fallback_when, WeatherProvider & provider,
        WeatherThresholds const & thresholds);

/* time(i->j) * max(factor[i], factor[j]).  Throws std::logic_error on a factor
   below 1.0 or a factor count that does not match the matrix. */
TimeMatrix apply_weather_to_matrix(TimeMatrix const & base, std::vector<double> const & factors);

std::vector<double> factor_values(std::vector<StopFactor> const & factors);

}

#endif /* WEATHER_HPP */
