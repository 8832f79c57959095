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
#include "formatting.hpp"
#include "planner.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <chrono>

using namespace std;

namespace planner
{

boost::posix_time::ptime fallback_time(vector<Stop> const & stops, Settings const & settings)
{
    if (settings.start_time.size())
        return parse_timestamp(settings.start_time);
    if (stops.size() && stops[0].when)
        return *stops[0].when;
    return boost::posix_time::second_clock::universal_time();
}

PlanResult plan_route(vector<Stop> const & stops, Settings const & settings, WeatherProvider & provider)
{
    if (stops.empty())
        throw InvalidInput("At least one stop is required");
    if (settings.start_index < 0 || settings.start_index >= (int) stops.size())
        throw InvalidInput("Start index " + to_string(settings.start_index) + " does not name one of the " +
                to_string(stops.size()) + " stops");

    PlanResult plan;
    plan.fallback_when = fallback_time(stops, settings);
    auto clock_start = chrono::high_resolution_clock::now();

    info("Building base travel time matrix", White);
    plan.base = timematrix::build_base_time_matrix(stops, settings.speed_kph);
    timematrix::check_matrix(plan.base);
    info(to_string(seconds_since(clock_start)) + " Base matrix built for " + to_string(stops.size()) + " stops",
            Purple);

    clock_start = chrono::high_resolution_clock::now();
    info("Looking up weather factors", White);
    plan.factors = weather::get_stop_weather_factors(stops, plan.fallback_when, provider, settings.thresholds);
    for (auto i = 0u; i < stops.size(); i++)
        if (plan.factors[i].degraded)
            info("Weather for " + stops[i].name + " is an estimate: " + plan.factors[i].reason, Red);
    info(to_string(seconds_since(clock_start)) + " Weather factors resolved", Purple);

    plan.adjusted = weather::apply_weather_to_matrix(plan.base, weather::factor_values(plan.factors));

    clock_start = chrono::high_resolution_clock::now();
    info("Solving route", White);
    plan.tour = routesolver::solve_tsp(plan.adjusted, settings.start_index, settings.solver);
    info(to_string(seconds_since(clock_start)) + " Route solved", Purple);
    if (plan.tour.time_budget_exhausted)
        info("Time budget exhausted, returning best route found", Red);

    return plan;
}

}
