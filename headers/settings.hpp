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

// settings.hpp

#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "routesolver.hpp"
#include "weather.hpp"

#include<string>

#define DEFAULT_SPEED_KPH 35.0
#define DEFAULT_WEATHER_HOST "api.open-meteo.com"

struct Settings
{
    std::string stops_file = "stops.csv";
    std::string results_directory;          // Empty to skip the results log.
    double speed_kph = DEFAULT_SPEED_KPH;
    int start_index = 0;
    std::string start_time;                 // Fallback arrival for stops without one.
    bool weather = true;
    std::string weather_host = DEFAULT_WEATHER_HOST;
    int weather_timeout = 20;               // Seconds per forecast request.
    WeatherThresholds thresholds;
    SolverParams solver;
};

/* Read KEY VALUE pairs following the program name. */
Settings initialize(int argc, char** argv);

/* Apply one KEY VALUE pair.  Throws std::runtime_error on unknown keys or bad values. */
void set_option(Settings & settings, std::string const & key, std::string const & value);

/* One "KEY value" line per option, for the results log. */
std::string describe(Settings const & settings);

#endif
