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

/*! \file cred/marketdata/marketquotes.hpp
    \brief Snapshot of market quotes for one valuation date or scenario
    \ingroup marketdata
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace data {

//! Market quotes keyed by quote id
/*! A snapshot is filled once and then only read, bumped or shifted copies are obtained from
    withQuote() and withBump(). A missing quote is an expected outcome of a lookup and is
    returned as an empty optional.

    \ingroup marketdata
*/
class MarketQuotes {
public:
    MarketQuotes() {}
    MarketQuotes(const QuantLib::Date& asof, const std::map<std::string, QuantLib::Real>& quotes = {})
        : asof_(asof), quotes_(quotes) {}

    const QuantLib::Date& asof() const { return asof_; }

    //! the quote, none if it is not in the snapshot
    boost::optional<QuantLib::Real> get(const std::string& id) const;
    bool has(const std::string& id) const { return quotes_.count(id) > 0; }
    //! adds or overwrites a quote
    void add(const std::string& id, QuantLib::Real value);

    QuantLib::Size size() const { return quotes_.size(); }
    bool empty() const { return quotes_.empty(); }
    //! quote ids in alphabetical order
    std::vector<std::string> ids() const;
    const std::map<std::string, QuantLib::Real>& quotes() const { return quotes_; }

    //! copy with the quote set to value
    MarketQuotes withQuote(const std::string& id, QuantLib::Real value) const;
    //! copy with the existing quote shifted by bump, throws if the quote is missing
    MarketQuotes withBump(const std::string& id, QuantLib::Real bump) const;

private:
    QuantLib::Date asof_;
    std::map<std::string, QuantLib::Real> quotes_;
};

} // namespace data
} // namespace cre
