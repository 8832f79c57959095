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

#include "csvreader.hpp"
#include "errors.hpp"
#include "formatting.hpp"

#include <boost/algorithm/string.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;

namespace csvreader
{

double read_coordinate(string const & field, string const & what, int line_number)
{
    size_t used = 0;
    double value = 0;
    try
    {
        value = stod(field, &used);
    }
    catch (std::logic_error const &)
    {
        used = 0;
    }
    if (!used || used != field.size())
        throw InvalidInput("Line " + to_string(line_number) + ": " + what + " \"" + field + "\" is not a number");
    return value;
}

vector<Stop> read_stops(istream & in)
{
    vector<Stop> stops;
    string line;
    int line_number = 0;
    while (getline(in, line))
    {
        line_number++;
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        vector<string> fields;
        boost::split(fields, line, boost::is_any_of(","));
        for (auto & f : fields)
            boost::algorithm::trim(f);
        if (fields.size() < 3 || fields.size() > 4)
            throw InvalidInput("Line " + to_string(line_number) + ": expected name,latitude,longitude[,when]");

        double latitude = read_coordinate(fields[1], "latitude", line_number);
        double longitude = read_coordinate(fields[2], "longitude", line_number);
        boost::optional<boost::posix_time::ptime> when;
        try
        {
            if (fields.size() == 4 && fields[3].size())
                when = parse_timestamp(fields[3]);
            stops.push_back(Stop(stops.size(), fields[0], latitude, longitude, when));
        }
        catch (InvalidCoordinate const & e)
        {
            throw InvalidCoordinate("Line " + to_string(line_number) + ": " + e.what());
        }
        catch (InvalidInput const & e)
        {
            throw InvalidInput("Line " + to_string(line_number) + ": " + e.what());
        }
    }
    return stops;
}

vector<Stop> load_stops(string const & path)
{
    ifstream sfile(path);
    if (!sfile.is_open())
    {
        cout << "ERROR: Unable to open stops file." << endl;
        cout << "\tSearching for stops file at:" << endl;
        cout << "\t\t" << path << endl;
        throw runtime_error("Stops file not found!");
    }
    return read_stops(sfile);
}

}
