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
#include "routesolver.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>

using namespace std;

namespace routesolver
{

typedef long long cost_t;
typedef vector<vector<cost_t>> CostMatrix;
typedef chrono::steady_clock::time_point Deadline;

CostMatrix scale_costs(TimeMatrix const & time_matrix, double scale)
{
    auto n = time_matrix.size();
    CostMatrix costs(n, vector<cost_t>(n, 0));
    for (auto i = 0u; i < n; i++)
        for (auto j = 0u; j < n; j++)
            costs[i][j] = llround(time_matrix[i][j] * scale);
    return costs;
}

/* Deadline that many seconds from now, saturating instead of overflowing the clock. */
Deadline make_deadline(double seconds)
{
    auto now = chrono::steady_clock::now();
    if (!(seconds > 0))
        return now;
    if (seconds >= chrono::duration<double>(Deadline::max() - now).count())
        return Deadline::max();
    return now + chrono::duration_cast<chrono::steady_clock::duration>(chrono::duration<double>(seconds));
}

/* Cost of a tour given as n nodes, closing back to the first. */
cost_t tour_cost(CostMatrix const & costs, vector<int> const & t)
{
    cost_t total = 0;
    for (auto k = 0u; k < t.size(); k++)
        total += costs[t[k]][t[(k + 1) % t.size()]];
    return total;
}

vector<int> close_tour(vector<int> const & t)
{
    vector<int> order = t;
    order.push_back(t[0]);
    return order;
}

/* Extend the path from its end along the cheapest arc to an unvisited node. */
vector<int> path_cheapest_arc(CostMatrix const & costs, int start)
{
    int n = costs.size();
    vector<bool> visited(n, false);
    vector<int> path {start};
    visited[start] = true;
    int here = start;
    for (auto step = 1; step < n; step++)
    {
        int best = -1;
        for (auto j = 0; j < n; j++)
            if (!visited[j] && (best == -1 || costs[here][j] < costs[here][best]))
                best = j;
        visited[best] = true;
        path.push_back(best);
        here = best;
    }
    return path;
}

/* Returns the cost and reverse path of the cheapest way to visit every unvisited node from
   here and return to start, or -1 if nothing beats best_cost.  Equal scaled costs are
   decided by unscaled minutes, with best_minutes holding the best complete tour so far.
   Stops early past the deadline. */
pair<cost_t,vector<int>> recursive_search(CostMatrix const & costs, TimeMatrix const & time_matrix,
        int start, int here, vector<bool> & visited, int remaining, cost_t cost, double minutes,
        cost_t best_cost, double & best_minutes, Deadline const & deadline, bool & timed_out)
{
    // Every node is placed, so close the loop.
    if (!remaining)
    {
        cost_t total = cost + costs[here][start];
        double total_minutes = minutes + time_matrix[here][start];
        if (total > best_cost || (total == best_cost && !(total_minutes < best_minutes)))
            return make_pair(-1LL, vector<int>());
        best_minutes = total_minutes;
        return make_pair(total, vector<int>());
    }

    if (timed_out || chrono::steady_clock::now() >= deadline)
    {
        timed_out = true;
        return make_pair(-1LL, vector<int>());
    }

    vector<int> best_tail;
    bool found = false;
    for (auto next = 0u; next < costs.size(); next++)
    {
        if (visited[next])
            continue;

        // Costs are non-negative, so a prefix already past the bound cannot win.
        cost_t arrival = cost + costs[here][next];
        if (arrival > best_cost)
            continue;

        visited[next] = true;
        pair<cost_t,vector<int>> tail = recursive_search(costs, time_matrix, start, next, visited,
                remaining - 1, arrival, minutes + time_matrix[here][next], best_cost, best_minutes,
                deadline, timed_out);
        visited[next] = false;

        // If this is the best we have seen so far, update!
        if (tail.first == -1)
            continue;
        best_cost = tail.first;
        best_tail = tail.second;
        best_tail.push_back(next);
        found = true;
    }

    if (!found)
        return make_pair(-1LL, vector<int>());
    return make_pair(best_cost, best_tail);
}

/* Guided local search over relocation and reversal moves.  Arcs of each local optimum with the
   highest cost / (1 + penalty) are penalized, and moves are taken on cost + lambda * penalty. */
class GuidedLocalSearch
{
public:
    GuidedLocalSearch(CostMatrix const & costs, vector<int> const & initial, SolverParams const & params,
            Deadline const & deadline) :
            costs (costs),
            n (initial.size()),
            params (params),
            deadline (deadline),
            penalties (initial.size(), vector<int>(initial.size(), 0)),
            lambda (0),
            tour (initial),
            best_tour (initial),
            best_cost (tour_cost(costs, initial)),
            improved (false),
            timed_out (false),
            rounds (0)
    {}

    void run()
    {
        int stall = 0;
        while (true)
        {
            // Descend to a local optimum of the augmented cost.
            while (improve())
            {
                record();
                if (chrono::steady_clock::now() >= deadline)
                {
                    timed_out = true;
                    return;
                }
            }
            rounds++;

            if (lambda == 0)
            {
                cost_t scaled = llround(params.gls_alpha * tour_cost(costs, tour) / n);
                lambda = max(scaled, 1LL);
            }

            stall = (improved ? 0 : stall + 1);
            improved = false;
            if (stall >= params.stall_limit)
                return;
            if (chrono::steady_clock::now() >= deadline)
            {
                timed_out = true;
                return;
            }

            penalize();
        }
    }

    vector<int> const & get_best_tour() const { return best_tour; }
    bool get_timed_out() const { return timed_out; }
    int get_rounds() const { return rounds; }

private:
    CostMatrix const & costs;
    int const n;
    SolverParams const & params;
    Deadline const deadline;
    vector<vector<int>> penalties;
    cost_t lambda;
    vector<int> tour;           // tour[0] is always the start.
    vector<int> best_tour;
    cost_t best_cost;
    bool improved;
    bool timed_out;
    int rounds;

    cost_t augmented(int i, int j) const
    {
        return costs[i][j] + lambda * penalties[i][j];
    }

    int at(int position) const
    {
        return tour[position % n];
    }

    /* Apply the first move that lowers the augmented cost.  False at a local optimum. */
    bool improve()
    {
        // Relocate the segment at positions a..b (1 to 3 nodes) to follow position k.
        for (auto a = 1; a < n; a++)
            for (auto b = a; b < n && b < a + 3; b++)
            {
                int prev = at(a - 1), first = at(a), last = at(b), next = at(b + 1);
                cost_t removal = augmented(prev, first) + augmented(last, next) - augmented(prev, next);
                for (auto k = 0; k < n; k++)
                {
                    if (k >= a - 1 && k <= b)
                        continue;
                    int u = at(k), v = at(k + 1);
                    cost_t insertion = augmented(u, first) + augmented(last, v) - augmented(u, v);
                    if (insertion - removal < 0)
                    {
                        relocate(a, b, u);
                        return true;
                    }
                }
            }

        // Reverse the segment at positions i..j.  The matrix may be asymmetric, so the
        // inner arcs are summed both ways.
        for (auto i = 1; i < n - 1; i++)
        {
            cost_t forward = 0, backward = 0;
            for (auto j = i + 1; j < n; j++)
            {
                forward += augmented(at(j - 1), at(j));
                backward += augmented(at(j), at(j - 1));
                int before = at(i - 1), after = at(j + 1);
                cost_t delta = augmented(before, at(j)) + augmented(at(i), after) + backward
                        - augmented(before, at(i)) - augmented(at(j), after) - forward;
                if (delta < 0)
                {
                    reverse(tour.begin() + i, tour.begin() + j + 1);
                    return true;
                }
            }
        }
        return false;
    }

    void relocate(int a, int b, int u)
    {
        vector<int> segment(tour.begin() + a, tour.begin() + b + 1);
        tour.erase(tour.begin() + a, tour.begin() + b + 1);
        auto position = find(tour.begin(), tour.end(), u);
        tour.insert(position + 1, segment.begin(), segment.end());
    }

    void record()
    {
        cost_t cost = tour_cost(costs, tour);
        if (cost < best_cost)
        {
            best_cost = cost;
            best_tour = tour;
            improved = true;
        }
    }

    void penalize()
    {
        double max_utility = -1;
        for (auto k = 0; k < n; k++)
        {
            int i = at(k), j = at(k + 1);
            max_utility = max(max_utility, costs[i][j] / (1.0 + penalties[i][j]));
        }
        for (auto k = 0; k < n; k++)
        {
            int i = at(k), j = at(k + 1);
            if (costs[i][j] / (1.0 + penalties[i][j]) == max_utility)
                penalties[i][j]++;
        }
    }
};

double tour_minutes(TimeMatrix const & time_matrix, vector<int> const & order)
{
    double total = 0.0;
    for (auto k = 0u; k + 1 < order.size(); k++)
        total += time_matrix[order[k]][order[k + 1]];
    return total;
}

bool is_valid_tour(vector<int> const & order, int n, int start)
{
    if (n < 1 || (int) order.size() != n + 1 || order.front() != start || order.back() != start)
        return false;
    vector<bool> seen(n, false);
    for (auto k = 0; k < n; k++)
    {
        int node = order[k];
        if (node < 0 || node >= n || seen[node])
            return false;
        seen[node] = true;
    }
    return true;
}

Tour solve_tsp(TimeMatrix const & time_matrix, int start_index, SolverParams const & params)
{
    int n = time_matrix.size();
    if (n == 0)
        throw NoFeasibleTour("There are no stops to route");
    timematrix::check_matrix(time_matrix, true);
    if (start_index < 0 || start_index >= n)
        throw InvalidInput("Start index " + to_string(start_index) + " is outside 0.." + to_string(n - 1));
    if (!(params.cost_scale > 0))
        throw InvalidInput("Cost scale must be positive");
    if (std::isnan(params.time_limit))
        throw InvalidInput("Time limit must be a number of seconds");
    for (auto i = 0; i < n; i++)
        for (auto j = 0; j < n; j++)
            if (std::isinf(time_matrix[i][j]))
                throw NoFeasibleTour("No finite travel time from stop " + to_string(i) + " to stop " + to_string(j));

    Deadline deadline = make_deadline(params.time_limit);

    Tour result;
    if (n == 1)
    {
        result.order = vector<int> {start_index, start_index};
        result.exact = true;
        return result;
    }

    CostMatrix costs = scale_costs(time_matrix, params.cost_scale);
    vector<int> initial = path_cheapest_arc(costs, start_index);
    vector<int> best = initial;
    result.initial_minutes = tour_minutes(time_matrix, close_tour(initial));

    if (n == 2)
        result.exact = true;
    else if (n <= params.exact_limit)
    {
        vector<bool> visited(n, false);
        visited[start_index] = true;
        bool timed_out = false;
        double best_minutes = result.initial_minutes;
        pair<cost_t,vector<int>> optimal = recursive_search(costs, time_matrix, start_index, start_index,
                visited, n - 1, 0, 0.0, tour_cost(costs, initial), best_minutes, deadline, timed_out);
        if (optimal.first != -1)
        {
            best = vector<int> {start_index};
            best.insert(best.end(), optimal.second.rbegin(), optimal.second.rend());
        }
        result.exact = !timed_out;
        result.time_budget_exhausted = timed_out;
    }
    else
    {
        GuidedLocalSearch search(costs, initial, params, deadline);
        search.run();
        best = search.get_best_tour();
        result.time_budget_exhausted = search.get_timed_out();
        result.penalty_rounds = search.get_rounds();
    }

    result.order = close_tour(best);
    result.total_minutes = tour_minutes(time_matrix, result.order);

    // Integer rounding can hide sub-unit differences; never report worse than the construction.
    if (result.total_minutes > result.initial_minutes)
    {
        result.order = close_tour(initial);
        result.total_minutes = result.initial_minutes;
    }
    return result;
}

}
