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
#include "openmeteo.hpp"

#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <iomanip>
#include <memory>
#include <openssl/err.h>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using boost::property_tree::ptree;
using namespace std;

namespace openmeteo
{

string forecast_target(WeatherQuery const & query)
{
    string date = format_date(query.when);
    ostringstream ss;
    ss << setprecision(10);
    ss << "/v1/forecast"
       << "?latitude=" << query.latitude << "&longitude=" << query.longitude
       << "&hourly=precipitation,snowfall,wind_speed_10m,wind_gusts_10m"
       << "&start_date=" << date << "&end_date=" << date << "&timezone=UTC";
    return ss.str();
}

/* Value of an hourly series at index, with null or missing entries read as zero. */
double series_value(ptree const & hourly, string const & key, int index)
{
    auto series = hourly.get_child_optional(key);
    if (!series)
        return 0;
    int i = 0;
    for (auto & entry : *series)
        if (i++ == index)
        {
            auto value = entry.second.get_value_optional<double>();
            return value ? *value : 0;
        }
    return 0;
}

WeatherLookup parse_forecast(string const & body, boost::posix_time::ptime const & when)
{
    WeatherLookup result;
    ptree root;
    try
    {
        istringstream in(body);
        boost::property_tree::read_json(in, root);
    }
    catch (boost::property_tree::json_parser_error const & e)
    {
        result.status = LOOKUP_FAILED;
        result.detail = "malformed response: " + e.message();
        return result;
    }

    string bucket = format_date(when) + "T" + format_hour(when);
    auto hourly = root.get_child_optional("hourly");
    if (!hourly)
    {
        result.status = LOOKUP_NO_DATA;
        result.detail = "response has no hourly data";
        return result;
    }

    // Find index for our hour.
    int index = -1;
    auto times = hourly->get_child_optional("time");
    if (times)
    {
        int i = 0;
        for (auto & t : *times)
        {
            if (t.second.data() == bucket)
            {
                index = i;
                break;
            }
            i++;
        }
    }
    if (index < 0)
    {
        result.status = LOOKUP_NO_DATA;
        result.detail = "hour " + bucket + " not in response";
        return result;
    }

    result.sample.precipitation = series_value(*hourly, "precipitation", index);
    result.sample.snowfall = series_value(*hourly, "snowfall", index);
    result.sample.wind_speed = series_value(*hourly, "wind_speed_10m", index);
    result.sample.wind_gusts = series_value(*hourly, "wind_gusts_10m", index);
    result.status = LOOKUP_RESOLVED;
    return result;
}

/* One GET request.  Writes its outcome into the lookup slot it was given. */
class ForecastSession : public enable_shared_from_this<ForecastSession>
{
public:
    ForecastSession(net::io_context & ioc, ssl::context & ctx, WeatherLookup & result,
            boost::posix_time::ptime const & when, chrono::seconds timeout) :
            resolver(net::make_strand(ioc)),
            resolve_timer(resolver.get_executor()),
            stream(net::make_strand(ioc), ctx),
            result(result),
            when(when),
            timeout(timeout)
    {}

    void run(string const & host, string const & target)
    {
        // SNI, required by most TLS front ends.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
        {
            beast::error_code ec {static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            return fail(ec, "sni");
        }
        stream.set_verify_callback(ssl::host_name_verification(host));

        request.version(11);
        request.method(http::verb::get);
        request.target(target);
        request.set(http::field::host, host);
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);

        // The resolver has no deadline of its own.
        resolve_timer.expires_after(timeout);
        resolve_timer.async_wait(
                beast::bind_front_handler(&ForecastSession::on_resolve_timeout, shared_from_this()));
        resolver.async_resolve(host, "443",
                beast::bind_front_handler(&ForecastSession::on_resolve, shared_from_this()));
    }

private:
    tcp::resolver resolver;
    net::steady_timer resolve_timer;
    beast::ssl_stream<beast::tcp_stream> stream;
    beast::flat_buffer buffer;
    http::request<http::empty_body> request;
    http::response<http::string_body> response;
    WeatherLookup & result;
    boost::posix_time::ptime const when;
    chrono::seconds const timeout;

    void on_resolve_timeout(beast::error_code ec)
    {
        if (!ec)
            resolver.cancel();
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results)
    {
        resolve_timer.cancel();
        if (ec == net::error::operation_aborted)
            ec = beast::error::timeout;
        if (ec)
            return fail(ec, "resolve");
        beast::get_lowest_layer(stream).expires_after(timeout);
        beast::get_lowest_layer(stream).async_connect(results,
                beast::bind_front_handler(&ForecastSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
    {
        if (ec)
            return fail(ec, "connect");
        stream.async_handshake(ssl::stream_base::client,
                beast::bind_front_handler(&ForecastSession::on_handshake, shared_from_this()));
    }

    void on_handshake(beast::error_code ec)
    {
        if (ec)
            return fail(ec, "handshake");
        beast::get_lowest_layer(stream).expires_after(timeout);
        http::async_write(stream, request,
                beast::bind_front_handler(&ForecastSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, size_t)
    {
        if (ec)
            return fail(ec, "write");
        http::async_read(stream, buffer, response,
                beast::bind_front_handler(&ForecastSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, size_t)
    {
        if (ec)
            return fail(ec, "read");

        if (response.result() != http::status::ok)
        {
            result.status = LOOKUP_FAILED;
            result.detail = "HTTP status " + to_string(response.result_int());
        }
        else
            result = parse_forecast(response.body(), when);

        beast::get_lowest_layer(stream).expires_after(timeout);
        stream.async_shutdown(beast::bind_front_handler(&ForecastSession::on_shutdown, shared_from_this()));
    }

    void on_shutdown(beast::error_code ec)
    {
        // The outcome is already recorded.  Servers often close without close_notify.
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated)
            info("Forecast connection did not shut down cleanly: " + ec.message(), Yellow);
    }

    void fail(beast::error_code ec, char const * what)
    {
        result.status = LOOKUP_FAILED;
        result.detail = string(what) + ": " + ec.message();
    }
};

}

OpenMeteoProvider::OpenMeteoProvider(string const & host, chrono::seconds timeout) :
        host {host},
        timeout {timeout}
{}

vector<WeatherLookup> OpenMeteoProvider::lookup(vector<WeatherQuery> const & queries)
{
    vector<WeatherLookup> results(queries.size());
    if (queries.empty())
        return results;

    ssl::context ctx(ssl::context::tlsv12_client);
    beast::error_code ec;
    ctx.set_default_verify_paths(ec);
    if (!ec)
        ctx.set_verify_mode(ssl::verify_peer, ec);
    if (ec)
    {
        for (auto & r : results)
        {
            r.status = LOOKUP_FAILED;
            r.detail = "TLS setup: " + ec.message();
        }
        return results;
    }

    net::io_context ioc;
    for (auto i = 0u; i < queries.size(); i++)
        make_shared<openmeteo::ForecastSession>(ioc, ctx, results[i], queries[i].when, timeout)
                ->run(host, openmeteo::forecast_target(queries[i]));

    // Every request makes progress on this thread until all have finished or timed out.
    ioc.run();
    return results;
}
