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

#include "csvreader.hpp"
#include "formatting.hpp"
#include "openmeteo.hpp"
#include "planner.hpp"
#include "reporter.hpp"
#include "settings.hpp"
#include "stop.hpp"
#include "weather.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace std;

int main(int argc, char *argv[])
{
    info("Starting weather-aware route planner!", White);
    try
    {
        Settings settings = initialize(argc, argv);

        // Load the stops for this run.
        info("Loading stops...", White);
        vector<Stop> stops = csvreader::load_stops(settings.stops_file);
        info("Loaded " + to_string(stops.size()) + " stops!", Purple);

        // Set up the forecast source.
        unique_ptr<WeatherProvider> provider;
        if (settings.weather)
            provider.reset(new OpenMeteoProvider(settings.weather_host, chrono::seconds(settings.weather_timeout)));
        else
        {
            info("Warning!  Weather lookups are disabled, all factors are neutral.", Red);
            provider.reset(new DisabledWeatherProvider());
        }

        info("Planning route...", White);
        auto clock_start = chrono::high_resolution_clock::now();
        PlanResult plan = planner::plan_route(stops, settings, *provider);
        info(to_string(seconds_since(clock_start)) + " Planning completed", Purple);

        reporter::print_plan(cout, stops, plan);
        if (settings.results_directory.size())
        {
            reporter::write_results_log(settings.results_directory, settings, stops, plan);
            info("Results appended to " + settings.results_directory + "/results.log", Purple);
        }
    }
    catch (exception const & e)
    {
        info(string("Error!  ") + e.what(), Red);
        return 1;
    }

    info("Done!", Purple);
    return 0;
}
