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

#ifndef TIMEMATRIX_HPP
#define TIMEMATRIX_HPP

#include "stop.hpp"

#include <vector>

/* Travel time in minutes, indexed [origin][destination]. */
typedef std::vector<std::vector<double>> TimeMatrix;

namespace timematrix
{

/* Haversine distance over an assumed average speed.  Throws InvalidSpeed if speed_kph <= 0. */
TimeMatrix build_base_time_matrix(std::vector<Stop> const & stops, double speed_kph);

/* Contract every travel time provider must satisfy: square, zero diagonal, entries >= 0.
   Infinite entries are allowed only when allow_infinite is set.
   Throws std::logic_error on violation. */
void check_matrix(TimeMatrix const & matrix, bool allow_infinite = false);

}

#endif /* TIMEMATRIX_HPP */
