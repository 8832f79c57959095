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
#include "reporter.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

using namespace std;

namespace reporter
{

void print_factors(ostream & out, vector<StopFactor> const & factors)
{
    out << "[";
    for (auto i = 0u; i < factors.size(); i++)
        out << (i ? ", " : "") << fixed << setprecision(2) << factors[i].factor;
    out << "]";
}

void print_plan(ostream & out, vector<Stop> const & stops, PlanResult const & plan)
{
    out << "Visit order:" << endl;
    for (auto k : plan.tour.order)
        out << k << " " << stops[k].name << endl;
    out << "Total travel time (weather-adjusted): " << fixed << setprecision(1)
        << plan.tour.total_minutes << " min" << endl;
    out << "Node weather factors: ";
    print_factors(out, plan.factors);
    out << endl;

    for (auto i = 0u; i < plan.factors.size(); i++)
        if (plan.factors[i].degraded)
            out << "Estimated factor for " << i << " " << stops[i].name << ": " << plan.factors[i].reason << endl;
    if (plan.tour.time_budget_exhausted)
        out << "Search stopped at the time limit; the route is the best found." << endl;
}

void write_results_log(string const & directory, Settings const & settings,
        vector<Stop> const & stops, PlanResult const & plan)
{
    ofstream results(directory + "/results.log", ios_base::app);
    if (!results.is_open())
        throw runtime_error("Unable to open results log in " + directory);

    results << "SYSTEM TIME: " << current_time() << endl;
    results << describe(settings);
    results << "FALLBACK_TIME " << format_timestamp(plan.fallback_when) << endl;
    results << "\tOrder\t";
    for (auto k : plan.tour.order)
        results << k << " ";
    results << endl;
    results << "\tStops\t";
    for (auto k : plan.tour.order)
        results << stops[k].name << "; ";
    results << endl;
    results << fixed << setprecision(3);
    results << "\tTotal Minutes\t" << plan.tour.total_minutes << endl;
    results << "\tInitial Minutes\t" << plan.tour.initial_minutes << endl;
    results << "\tExact\t" << (plan.tour.exact ? "true" : "false") << endl;
    results << "\tTime Budget Exhausted\t" << (plan.tour.time_budget_exhausted ? "true" : "false") << endl;
    results << "\tPenalty Rounds\t" << plan.tour.penalty_rounds << endl;
    results << "\tFactors\t";
    print_factors(results, plan.factors);
    results << endl;
    for (auto i = 0u; i < plan.factors.size(); i++)
        if (plan.factors[i].degraded)
            results << "\tDegraded\t" << i << "\t" << plan.factors[i].reason << endl;
    results << endl;
}

}
