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
#include "formatting.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace boost::posix_time;

ptime parse_timestamp(std::string const & s)
{
    std::string text = boost::algorithm::trim_copy(s);
    size_t separator = text.find_first_of("Tt ");
    if (separator == std::string::npos || separator < 10)
        throw InvalidInput("Timestamp has no time of day: \"" + s + "\"");

    std::string date_part = text.substr(0, separator);
    std::string rest = text.substr(separator + 1);

    // Split the clock from the zone designator.
    int offset_minutes = 0;
    size_t zone = rest.find_first_of("Zz+-");
    std::string clock_part = rest.substr(0, zone);
    if (zone != std::string::npos)
    {
        std::string zone_part = rest.substr(zone);
        if (zone_part != "Z" && zone_part != "z")
        {
            std::string digits = zone_part.substr(1);
            boost::algorithm::erase_all(digits, ":");
            if ((digits.size() != 2 && digits.size() != 4) ||
                    !boost::algorithm::all(digits, boost::algorithm::is_digit()))
                throw InvalidInput("Timestamp has a malformed UTC offset: \"" + s + "\"");
            int hours = std::stoi(digits.substr(0, 2));
            int mins = (digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0);
            offset_minutes = (hours * 60 + mins) * (zone_part[0] == '-' ? -1 : 1);
        }
    }
    if (clock_part.size() == 5)  // HH:MM
        clock_part += ":00";

    ptime local;
    try
    {
        local = time_from_string(date_part + " " + clock_part);
    }
    catch (std::exception const & e)
    {
        throw InvalidInput("Could not parse timestamp \"" + s + "\": " + e.what());
    }
    if (local.is_special())
        throw InvalidInput("Could not parse timestamp \"" + s + "\"");

    return local - minutes(offset_minutes);
}

std::string format_date(ptime const & t)
{
    return boost::gregorian::to_iso_extended_string(t.date());
}

std::string format_hour(ptime const & t)
{
    std::ostringstream ss;
    ss << std::setw(2) << std::setfill('0') << t.time_of_day().hours() << ":00";
    return ss.str();
}

std::string format_timestamp(ptime const & t)
{
    return to_iso_extended_string(t) + "Z";
}

void info(std::string s, Color color)
{
    std::cout << "[INFO] \033[;3";
    std::cout << color;
    std::cout << "m ";
    std::cout << s;
    std::cout << "\033[0m" << std::endl;
}

std::string current_time()
{
    time_t current_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string time_string = ctime(&current_time);
    time_string.pop_back();
    return time_string;
}

double seconds_since(std::chrono::high_resolution_clock::time_point start)
{
    auto stop = std::chrono::high_resolution_clock::now();
    return 0.000001 * std::chrono::duration_cast<std::chrono::microseconds>(stop - start).count();
}
