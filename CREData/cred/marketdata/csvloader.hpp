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

/*! \file cred/marketdata/csvloader.hpp
    \brief Market quote loader from csv files
    \ingroup marketdata
*/

#pragma once

#include <cred/marketdata/marketquotes.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! Utility class for loading market quotes from a file
/*!
  Each line holds a date, a quote id and a value separated by comma, semicolon, tab or blank,
  lines starting with # are comments. Data is loaded with the call to the constructor.
  Inspectors can be called to then retrieve the quotes of a date.

  \ingroup marketdata
 */
class CSVLoader {
public:
    //! Constructor
    CSVLoader() {}
    CSVLoader( //! Quote file name
        const std::string& marketFilename);
    CSVLoader( //! Quote file names, a quote in a later file overwrites one in an earlier file
        const std::vector<std::string>& marketFiles);

    //! all quotes of the given date, the snapshot is empty if there are none
    MarketQuotes loadQuotes(const QuantLib::Date& d) const;
    //! a single quote, throws if it is missing
    QuantLib::Real get(const std::string& name, const QuantLib::Date& d) const;
    bool has(const std::string& name, const QuantLib::Date& d) const;
    //! dates with at least one quote
    std::set<QuantLib::Date> dates() const;

private:
    void loadFile(const std::string& filename);
    std::map<QuantLib::Date, std::map<std::string, QuantLib::Real>> data_;
};

} // namespace data
} // namespace cre
