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

#ifndef FORMATTING_HPP
#define FORMATTING_HPP

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include<chrono>
#include<iostream>
#include<string>

/* Parse an ISO-8601 timestamp such as 2025-11-10T08:00:00-05:00 and return it in UTC.
   A missing offset is read as UTC.  Throws InvalidInput on malformed text. */
boost::posix_time::ptime parse_timestamp(std::string const & s);

/* UTC calendar date as YYYY-MM-DD. */
std::string format_date(boost::posix_time::ptime const & t);

/* UTC hour bucket as HH:00. */
std::string format_hour(boost::posix_time::ptime const & t);

/* Full UTC timestamp as YYYY-MM-DDTHH:MM:SSZ. */
std::string format_timestamp(boost::posix_time::ptime const & t);

/* Return string representing the current system time. */
std::string current_time();

/* Seconds elapsed since the given clock reading. */
double seconds_since(std::chrono::high_resolution_clock::time_point start);

enum Color { Black, Red, Green, Yellow, Blue, Purple, Cyan, White };

void info(std::string const s, Color color);

#endif // FORMATTING_HPP
