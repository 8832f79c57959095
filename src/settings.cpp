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

#include "settings.hpp"

#include <boost/algorithm/string.hpp>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

using namespace std;

double read_double(string const & key, string const & value)
{
    size_t used = 0;
    double result = 0;
    try
    {
        result = stod(value, &used);
    }
    catch (logic_error const &)
    {
        used = 0;
    }
    if (!used || used != value.size())
        throw runtime_error("Argument " + key + " expects a number, got \"" + value + "\"");
    return result;
}

int read_int(string const & key, string const & value)
{
    size_t used = 0;
    int result = 0;
    try
    {
        result = stoi(value, &used);
    }
    catch (logic_error const &)
    {
        used = 0;
    }
    if (!used || used != value.size())
        throw runtime_error("Argument " + key + " expects an integer, got \"" + value + "\"");
    return result;
}

bool read_bool(string const & key, string const & value)
{
    string s = boost::algorithm::to_lower_copy(value);
    if (s == "true")
        return true;
    else if (s == "false")
        return false;
    cout << "For " << key << " trying to interpret \"" << value << "\"." << endl;
    throw runtime_error("Argument could not be converted into a boolean.");
}

string process_string(string s)
{
    if (s.size() && s[s.size() - 1] == '/')
        s.pop_back();
    return s;
}

/* Keys that only set a double, mapped to their field. */
map<string, double Settings::*> const settings_doubles {
    {"SPEED_KPH", &Settings::speed_kph}};
map<string, double WeatherThresholds::*> const threshold_doubles {
    {"RAIN_LIGHT_MM", &WeatherThresholds::rain_light_mm},
    {"RAIN_LIGHT_PENALTY", &WeatherThresholds::rain_light_penalty},
    {"RAIN_HEAVY_MM", &WeatherThresholds::rain_heavy_mm},
    {"RAIN_HEAVY_PENALTY", &WeatherThresholds::rain_heavy_penalty},
    {"SNOW_LIGHT_CM", &WeatherThresholds::snow_light_cm},
    {"SNOW_LIGHT_PENALTY", &WeatherThresholds::snow_light_penalty},
    {"SNOW_HEAVY_CM", &WeatherThresholds::snow_heavy_cm},
    {"SNOW_HEAVY_PENALTY", &WeatherThresholds::snow_heavy_penalty},
    {"WIND_KPH", &WeatherThresholds::wind_kph},
    {"WIND_PENALTY", &WeatherThresholds::wind_penalty},
    {"GUST_KPH", &WeatherThresholds::gust_kph},
    {"GUST_PENALTY", &WeatherThresholds::gust_penalty}};

void set_option(Settings & settings, string const & key, string const & value)
{
    if (key == "STOPS_FILE")
        settings.stops_file = value;
    else if (key == "RESULTS_DIRECTORY")
        settings.results_directory = process_string(value);
    else if (settings_doubles.count(key))
        settings.*settings_doubles.at(key) = read_double(key, value);
    else if (threshold_doubles.count(key))
    {
        double threshold = read_double(key, value);
        if (threshold < 0)
            throw runtime_error("Argument " + key + " must not be negative.");
        settings.thresholds.*threshold_doubles.at(key) = threshold;
    }
    else if (key == "START_INDEX")
        settings.start_index = read_int(key, value);
    else if (key == "START_TIME")
        settings.start_time = value;
    else if (key == "WEATHER")
        settings.weather = read_bool(key, value);
    else if (key == "WEATHER_HOST")
        settings.weather_host = value;
    else if (key == "WEATHER_TIMEOUT")
    {
        settings.weather_timeout = read_int(key, value);
        if (settings.weather_timeout <= 0)
            throw runtime_error("Argument WEATHER_TIMEOUT must be positive.");
    }
    else if (key == "TIME_LIMIT")
    {
        settings.solver.time_limit = read_double(key, value);
        if (!(settings.solver.time_limit >= 0) || std::isinf(settings.solver.time_limit))
            throw runtime_error("Argument TIME_LIMIT must be a finite number of seconds, not negative.");
    }
    else if (key == "EXACT_LIMIT")
        settings.solver.exact_limit = read_int(key, value);
    else if (key == "STALL_LIMIT")
        settings.solver.stall_limit = read_int(key, value);
    else if (key == "GLS_ALPHA")
        settings.solver.gls_alpha = read_double(key, value);
    else if (key == "COST_SCALE")
    {
        settings.solver.cost_scale = read_double(key, value);
        if (!(settings.solver.cost_scale > 0))
            throw runtime_error("Argument COST_SCALE must be positive.");
    }
    else
        throw runtime_error("Argument not recognized: " + key);
}

Settings initialize(int argc, char** argv)
{
    Settings settings;
    if (argc % 2 == 0)
        throw runtime_error("Arguments must be given as KEY VALUE pairs.");
    for (auto i = 1; i + 1 < argc; i += 2)  // Skip the program name.
        set_option(settings, string(argv[i]), string(argv[i + 1]));
    return settings;
}

string describe(Settings const & settings)
{
    WeatherThresholds const & t = settings.thresholds;
    ostringstream ss;
    ss << "STOPS_FILE " << settings.stops_file << endl;
    ss << "RESULTS_DIRECTORY " << settings.results_directory << endl;
    ss << "SPEED_KPH " << settings.speed_kph << endl;
    ss << "START_INDEX " << settings.start_index << endl;
    ss << "START_TIME " << settings.start_time << endl;
    ss << "WEATHER " << (settings.weather ? "true" : "false") << endl;
    ss << "WEATHER_HOST " << settings.weather_host << endl;
    ss << "WEATHER_TIMEOUT " << settings.weather_timeout << endl;
    ss << "RAIN " << t.rain_light_mm << "/" << t.rain_light_penalty << " "
       << t.rain_heavy_mm << "/" << t.rain_heavy_penalty << endl;
    ss << "SNOW " << t.snow_light_cm << "/" << t.snow_light_penalty << " "
       << t.snow_heavy_cm << "/" << t.snow_heavy_penalty << endl;
    ss << "WIND " << t.wind_kph << "/" << t.wind_penalty << " "
       << t.gust_kph << "/" << t.gust_penalty << endl;
    ss << "TIME_LIMIT " << settings.solver.time_limit << endl;
    ss << "EXACT_LIMIT " << settings.solver.exact_limit << endl;
    ss << "STALL_LIMIT " << settings.solver.stall_limit << endl;
    ss << "GLS_ALPHA " << settings.solver.gls_alpha << endl;
    ss << "COST_SCALE " << settings.solver.cost_scale << endl;
    return ss.str();
}
