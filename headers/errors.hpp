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

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/* Input rejected before any computation: bad coordinates, speed, stop list or start index. */
class InvalidInput : public std::invalid_argument
{
public:
    explicit InvalidInput(std::string const & what) : std::invalid_argument(what) {}
};

class InvalidCoordinate : public InvalidInput
{
public:
    explicit InvalidCoordinate(std::string const & what) : InvalidInput(what) {}
};

class InvalidSpeed : public InvalidInput
{
public:
    explicit InvalidSpeed(std::string const & what) : InvalidInput(what) {}
};

/* The solver could not produce any closed tour. */
class NoFeasibleTour : public std::runtime_error
{
public:
    explicit NoFeasibleTour(std::string const & what) : std::runtime_error(what) {}
};

#endif /* ERRORS_HPP */
