/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file cred/marketdata/csvloader.cpp
    \brief Market quote loader impl
    \ingroup marketdata
*/

#include <cred/marketdata/csvloader.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>

#include <fstream>

using namespace std;
using QuantLib::Date;
using QuantLib::Real;

namespace cre {
namespace data {

CSVLoader::CSVLoader(const string& marketFilename) : CSVLoader(vector<string>(1, marketFilename)) {}

CSVLoader::CSVLoader(const vector<string>& marketFiles) {
    for (auto const& marketFile : marketFiles)
        loadFile(marketFile);

    // log
    for (auto const& it : data_)
        LOG("CSVLoader loaded " << it.second.size() << " market data points for " << it.first);

    LOG("CSVLoader complete.");
}

void CSVLoader::loadFile(const string& filename) {
    LOG("CSVLoader loading from " << filename);

    ifstream file;
    file.open(filename.c_str());
    QL_REQUIRE(file.is_open(), "error opening file " << filename);

    string line;
    while (getline(file, line)) {
        boost::trim(line);
        // skip blank and comment lines
        if (line.empty() || line[0] == '#')
            continue;

        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(",;\t "), boost::token_compress_on);
        QL_REQUIRE(tokens.size() == 3, "Invalid CSVLoader line, 3 tokens expected " << line);

        Date date = parseDate(tokens[0]);
        const string& key = tokens[1];
        Real value;
        if (!tryParseReal(tokens[2], value)) {
            WLOG("Skipped MarketDatum " << key << " - invalid value '" << tokens[2] << "'");
            continue;
        }

        auto& quotes = data_[date];
        if (quotes.find(key) != quotes.end())
            WLOG("Overwriting MarketDatum " << key << "@" << QuantLib::io::iso_date(date));
        quotes[key] = value;
        TLOG("Added MarketDatum " << key << " " << value);
    }
    file.close();
    LOG("CSVLoader completed processing " << filename);
}

MarketQuotes CSVLoader::loadQuotes(const Date& d) const {
    auto it = data_.find(d);
    if (it == data_.end())
        return MarketQuotes(d);
    return MarketQuotes(d, it->second);
}

Real CSVLoader::get(const string& name, const Date& d) const {
    auto it = data_.find(d);
    QL_REQUIRE(it != data_.end(), "No datum for " << name << " on date " << d);
    auto it2 = it->second.find(name);
    QL_REQUIRE(it2 != it->second.end(), "No datum for " << name << " on date " << d);
    return it2->second;
}

bool CSVLoader::has(const string& name, const Date& d) const {
    auto it = data_.find(d);
    return it != data_.end() && it->second.count(name) > 0;
}

set<Date> CSVLoader::dates() const {
    set<Date> result;
    for (auto const& it : data_)
        result.insert(it.first);
    return result;
}

} // namespace data
} // namespace cre
