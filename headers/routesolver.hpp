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

#ifndef ROUTESOLVER_HPP
#define ROUTESOLVER_HPP

#include "timematrix.hpp"

#include <vector>

struct Tour
{
    std::vector<int> order;             // n + 1 stop indices, first and last are the start.
    double total_minutes = 0;
    double initial_minutes = 0;         // Cost of the constructed tour before improvement.
    bool exact = false;                 // Every order was considered.
    bool time_budget_exhausted = false;
    int penalty_rounds = 0;
};

struct SolverParams
{
    double time_limit = 10;     // Seconds of search.
    int exact_limit = 9;        // Largest instance searched exhaustively.
    int stall_limit = 2000;     // Penalty rounds without a new best before giving up.
    double gls_alpha = 0.1;
    double cost_scale = 100;    // Minutes to integer search cost.
};

namespace routesolver
{

/* Closed tour over every node of time_matrix, starting and ending at start_index.
   Throws NoFeasibleTour on an empty or disconnected matrix, InvalidInput on a bad
   start index and std::logic_error on a malformed matrix. */
Tour solve_tsp(TimeMatrix const & time_matrix, int start_index, SolverParams const & params);

/* Sum of time_matrix along consecutive entries of order. */
double tour_minutes(TimeMatrix const & time_matrix, std::vector<int> const & order);

/* True if order has n + 1 entries, begins and ends at start and visits every other index once. */
bool is_valid_tour(std::vector<int> const & order, int n, int start);

}

#endif /* ROUTESOLVER_HPP */
