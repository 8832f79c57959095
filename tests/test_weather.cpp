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

#include "fixtures.hpp"
#include "openmeteo.hpp"
#include "timematrix.hpp"
#include "weather.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <stdexcept>
#include <vector>

namespace
{

WeatherSample sample(double precipitation, double snowfall, double wind_speed, double wind_gusts)
{
    WeatherSample s;
    s.precipitation = precipitation;
    s.snowfall = snowfall;
    s.wind_speed = wind_speed;
    s.wind_gusts = wind_gusts;
    return s;
}

}

BOOST_AUTO_TEST_SUITE(weather_tests)

BOOST_AUTO_TEST_CASE(calm_weather_is_neutral)
{
    WeatherThresholds t;
    BOOST_CHECK_EQUAL(weather::weather_factor(sample(0, 0, 0, 0), t), 1.0);
    BOOST_CHECK_EQUAL(weather::weather_factor(sample(0.4, 0.09, 29.9, 49.9), t), 1.0);
}

BOOST_AUTO_TEST_CASE(penalties_stack)
{
    WeatherThresholds t;
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0.5, 0, 0, 0), t), 1.10, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(5.0, 0, 0, 0), t), 1.20, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0, 0.1, 0, 0), t), 1.20, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0, 1.0, 0, 0), t), 1.50, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0, 0, 30, 0), t), 1.05, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0, 0, 0, 50), t), 1.10, 1e-9);

    // Heavy rain with strong gusts compounds.
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(7.2, 0, 12, 61), t), 1.30, 1e-9);
    // Everything at once.
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(10, 2, 40, 70), t), 1.85, 1e-9);
}

BOOST_AUTO_TEST_CASE(thresholds_are_tunable)
{
    WeatherThresholds t;
    t.wind_kph = 20;
    t.wind_penalty = 0.25;
    BOOST_CHECK_CLOSE(weather::weather_factor(sample(0, 0, 25, 0), t), 1.25, 1e-9);
}

BOOST_AUTO_TEST_CASE(neutral_factors_reproduce_base)
{
    TimeMatrix base = timematrix::build_base_time_matrix(example_stops(), 35.0);
    TimeMatrix adjusted = weather::apply_weather_to_matrix(base, std::vector<double>(base.size(), 1.0));
    BOOST_CHECK(adjusted == base);
}

BOOST_AUTO_TEST_CASE(adjusted_uses_larger_endpoint_factor)
{
    TimeMatrix base = timematrix::build_base_time_matrix(example_stops(), 35.0);
    std::vector<double> factors {1.0, 1.3, 1.1, 1.0};
    TimeMatrix adjusted = weather::apply_weather_to_matrix(base, factors);

    for (auto i = 0u; i < base.size(); i++)
    {
        BOOST_CHECK_EQUAL(adjusted[i][i], 0.0);
        for (auto j = 0u; j < base.size(); j++)
            BOOST_CHECK(adjusted[i][j] >= base[i][j]);
    }
    BOOST_CHECK_CLOSE(adjusted[0][1], base[0][1] * 1.3, 1e-9);
    BOOST_CHECK_CLOSE(adjusted[1][2], base[1][2] * 1.3, 1e-9);
    BOOST_CHECK_CLOSE(adjusted[2][3], base[2][3] * 1.1, 1e-9);
    BOOST_CHECK_EQUAL(adjusted[0][3], base[0][3]);
    BOOST_CHECK_NO_THROW(timematrix::check_matrix(adjusted));
}

BOOST_AUTO_TEST_CASE(bad_factors_are_contract_violations)
{
    TimeMatrix base = timematrix::build_base_time_matrix(example_stops(), 35.0);
    BOOST_CHECK_THROW(weather::apply_weather_to_matrix(base, std::vector<double> {1.0, 0.9, 1.0, 1.0}),
            std::logic_error);
    BOOST_CHECK_THROW(weather::apply_weather_to_matrix(base, std::vector<double> {1.0, 1.0}), std::logic_error);
}

BOOST_AUTO_TEST_CASE(resolved_lookups_use_arrival_time)
{
    std::vector<Stop> stops = example_stops();
    stops.push_back(Stop(4, "Stop D", 41.15, -85.10));
    boost::posix_time::ptime fallback = parse_timestamp("2025-11-10T13:00:00Z");

    FixedWeatherProvider provider(sample(6.0, 0, 0, 0));
    std::vector<StopFactor> factors = weather::get_stop_weather_factors(stops, fallback, provider, WeatherThresholds());

    BOOST_REQUIRE_EQUAL(factors.size(), stops.size());
    for (auto & f : factors)
    {
        BOOST_CHECK(!f.degraded);
        BOOST_CHECK_CLOSE(f.factor, 1.2, 1e-9);
    }
    BOOST_REQUIRE_EQUAL(provider.asked.size(), stops.size());
    BOOST_CHECK(provider.asked[1].when == parse_timestamp("2025-11-10T13:15:00Z"));
    BOOST_CHECK(provider.asked[4].when == fallback);
    BOOST_CHECK_EQUAL(provider.asked[4].latitude, 41.15);
    BOOST_CHECK_EQUAL(provider.asked[4].longitude, -85.10);
}

BOOST_AUTO_TEST_CASE(unreachable_service_gives_neutral_factors)
{
    std::vector<Stop> stops = example_stops();
    UnreachableWeatherProvider provider;
    std::vector<StopFactor> factors = weather::get_stop_weather_factors(stops, *stops[0].when, provider,
            WeatherThresholds());

    BOOST_REQUIRE_EQUAL(factors.size(), stops.size());
    for (auto & f : factors)
    {
        BOOST_CHECK_EQUAL(f.factor, 1.0);
        BOOST_CHECK(f.degraded);
        BOOST_CHECK(f.reason.find("Connection refused") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(disabled_provider_has_no_data)
{
    std::vector<Stop> stops = example_stops();
    DisabledWeatherProvider provider;
    std::vector<StopFactor> factors = weather::get_stop_weather_factors(stops, *stops[0].when, provider,
            WeatherThresholds());
    for (auto & f : factors)
    {
        BOOST_CHECK_EQUAL(f.factor, 1.0);
        BOOST_CHECK(f.degraded);
        BOOST_CHECK(f.reason.find("no forecast") != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(openmeteo_tests)

std::string const FORECAST =
    "{\"latitude\":41.12,\"longitude\":-85.07,\"hourly_units\":{\"time\":\"iso8601\"},"
    "\"hourly\":{\"time\":[\"2025-11-10T12:00\",\"2025-11-10T13:00\",\"2025-11-10T14:00\"],"
    "\"precipitation\":[0.0,6.2,0.1],"
    "\"snowfall\":[0.0,null,0.0],"
    "\"wind_speed_10m\":[10.0,31.5,8.0],"
    "\"wind_gusts_10m\":[20.0,55.0,15.0]}}";

BOOST_AUTO_TEST_CASE(forecast_target_names_the_utc_day)
{
    WeatherQuery q {41.1176, -85.0689, parse_timestamp("2025-11-10T20:30:00-05:00")};
    BOOST_CHECK_EQUAL(openmeteo::forecast_target(q),
            "/v1/forecast?latitude=41.1176&longitude=-85.0689"
            "&hourly=precipitation,snowfall,wind_speed_10m,wind_gusts_10m"
            "&start_date=2025-11-11&end_date=2025-11-11&timezone=UTC");
}

BOOST_AUTO_TEST_CASE(hour_bucket_is_selected)
{
    WeatherLookup l = openmeteo::parse_forecast(FORECAST, parse_timestamp("2025-11-10T08:15:00-05:00"));
    BOOST_REQUIRE_EQUAL(l.status, LOOKUP_RESOLVED);
    BOOST_CHECK_CLOSE(l.sample.precipitation, 6.2, 1e-9);
    BOOST_CHECK_EQUAL(l.sample.snowfall, 0.0);
    BOOST_CHECK_CLOSE(l.sample.wind_speed, 31.5, 1e-9);
    BOOST_CHECK_CLOSE(l.sample.wind_gusts, 55.0, 1e-9);
    BOOST_CHECK_CLOSE(weather::weather_factor(l.sample, WeatherThresholds()), 1.35, 1e-9);
}

BOOST_AUTO_TEST_CASE(missing_hour_is_no_data)
{
    WeatherLookup l = openmeteo::parse_forecast(FORECAST, parse_timestamp("2025-11-10T22:00:00Z"));
    BOOST_CHECK_EQUAL(l.status, LOOKUP_NO_DATA);

    l = openmeteo::parse_forecast("{\"error\":false}", parse_timestamp("2025-11-10T12:00:00Z"));
    BOOST_CHECK_EQUAL(l.status, LOOKUP_NO_DATA);
}

BOOST_AUTO_TEST_CASE(malformed_body_fails)
{
    WeatherLookup l = openmeteo::parse_forecast("<html>Bad Gateway</html>", parse_timestamp("2025-11-10T12:00:00Z"));
    BOOST_CHECK_EQUAL(l.status, LOOKUP_FAILED);
    BOOST_CHECK(l.detail.find("malformed") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(closed_port_fails_every_lookup)
{
    // Nothing listens on the loopback HTTPS port, so every session fails to connect.
    OpenMeteoProvider provider("127.0.0.1", std::chrono::seconds(2));
    std::vector<Stop> stops = example_stops();
    std::vector<WeatherQuery> queries;
    for (auto & s : stops)
        queries.push_back({s.latitude, s.longitude, *s.when});

    std::vector<WeatherLookup> lookups = provider.lookup(queries);
    BOOST_REQUIRE_EQUAL(lookups.size(), stops.size());
    for (auto & l : lookups)
    {
        BOOST_CHECK_EQUAL(l.status, LOOKUP_FAILED);
        BOOST_CHECK(!l.detail.empty());
    }

    std::vector<StopFactor> factors = weather::get_stop_weather_factors(stops, *stops[0].when, provider,
            WeatherThresholds());
    BOOST_REQUIRE_EQUAL(factors.size(), stops.size());
    for (auto & f : factors)
    {
        BOOST_CHECK_EQUAL(f.factor, 1.0);
        BOOST_CHECK(f.degraded);
        BOOST_CHECK(f.reason.find("lookup failed") == 0);
    }
}

BOOST_AUTO_TEST_CASE(no_queries_make_no_connections)
{
    OpenMeteoProvider provider("127.0.0.1", std::chrono::seconds(2));
    BOOST_CHECK(provider.lookup(std::vector<WeatherQuery>()).empty());
}

BOOST_AUTO_TEST_SUITE_END()
