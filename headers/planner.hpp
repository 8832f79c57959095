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

#ifndef PLANNER_HPP
#define PLANNER_HPP

#include "routesolver.hpp"
#include "settings.hpp"
#include "stop.hpp"
#include "timematrix.hpp"
#include "weather.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <vector>

struct PlanResult
{
    TimeMatrix base;
    TimeMatrix adjusted;
    std::vector<StopFactor> factors;
    boost::posix_time::ptime fallback_when;
    Tour tour;
};

namespace planner
{

/* Arrival time for stops without one: START_TIME, else the first stop's, else now. */
boost::posix_time::ptime fallback_time(std::vector<Stop> const & stops, Settings const & settings);

/* Base matrix, weather factors, adjusted matrix and tour for one planning run.
   Throws InvalidInput before any lookup when the stops or start index are unusable. */
PlanResult plan_route(std::vector<Stop> const & stops, Settings const & settings, WeatherProvider & provider);

}

#endif /* PLANNER_HPP */
