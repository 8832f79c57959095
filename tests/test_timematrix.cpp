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
#include "fixtures.hpp"
#include "timematrix.hpp"

#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(timematrix_tests)

BOOST_AUTO_TEST_CASE(base_matrix_shape)
{
    std::vector<Stop> stops = example_stops();
    for (double speed : {5.0, 35.0, 120.0})
    {
        TimeMatrix m = timematrix::build_base_time_matrix(stops, speed);
        BOOST_REQUIRE_EQUAL(m.size(), stops.size());
        for (auto i = 0u; i < m.size(); i++)
        {
            BOOST_REQUIRE_EQUAL(m[i].size(), stops.size());
            BOOST_CHECK_EQUAL(m[i][i], 0.0);
            for (auto j = 0u; j < m.size(); j++)
            {
                BOOST_CHECK(m[i][j] >= 0.0);
                BOOST_CHECK_EQUAL(m[i][j], m[j][i]);
            }
        }
        BOOST_CHECK_NO_THROW(timematrix::check_matrix(m));
    }
}

BOOST_AUTO_TEST_CASE(minutes_at_assumed_speed)
{
    TimeMatrix m = timematrix::build_base_time_matrix(example_stops(), 35.0);
    BOOST_CHECK_CLOSE(m[0][1], 15.8708794, 1e-4);
    BOOST_CHECK_CLOSE(m[2][3], 31.3021856, 1e-4);

    // Doubling the speed halves every time.
    TimeMatrix fast = timematrix::build_base_time_matrix(example_stops(), 70.0);
    BOOST_CHECK_CLOSE(fast[0][1] * 2, m[0][1], 1e-9);
}

BOOST_AUTO_TEST_CASE(empty_and_single_stop)
{
    BOOST_CHECK(timematrix::build_base_time_matrix(std::vector<Stop>(), 35.0).empty());
    std::vector<Stop> one {Stop(0, "Depot", 41.1176, -85.0689)};
    TimeMatrix m = timematrix::build_base_time_matrix(one, 35.0);
    BOOST_REQUIRE_EQUAL(m.size(), 1u);
    BOOST_CHECK_EQUAL(m[0][0], 0.0);
}

BOOST_AUTO_TEST_CASE(non_positive_speed_is_rejected)
{
    BOOST_CHECK_THROW(timematrix::build_base_time_matrix(example_stops(), 0.0), InvalidSpeed);
    BOOST_CHECK_THROW(timematrix::build_base_time_matrix(example_stops(), -20.0), InvalidSpeed);
    BOOST_CHECK_THROW(timematrix::build_base_time_matrix(example_stops(),
            std::numeric_limits<double>::quiet_NaN()), InvalidInput);
}

BOOST_AUTO_TEST_CASE(contract_violations)
{
    TimeMatrix ragged {{0, 1}, {1}};
    BOOST_CHECK_THROW(timematrix::check_matrix(ragged), std::logic_error);

    TimeMatrix negative {{0, -1}, {1, 0}};
    BOOST_CHECK_THROW(timematrix::check_matrix(negative), std::logic_error);

    TimeMatrix diagonal {{2, 1}, {1, 0}};
    BOOST_CHECK_THROW(timematrix::check_matrix(diagonal), std::logic_error);

    double inf = std::numeric_limits<double>::infinity();
    TimeMatrix disconnected {{0, inf}, {1, 0}};
    BOOST_CHECK_THROW(timematrix::check_matrix(disconnected), std::logic_error);
    BOOST_CHECK_NO_THROW(timematrix::check_matrix(disconnected, true));
}

BOOST_AUTO_TEST_SUITE_END()
