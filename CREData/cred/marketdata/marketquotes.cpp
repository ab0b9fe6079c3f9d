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

#include <cred/marketdata/marketquotes.hpp>

#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>

#include <cmath>

using namespace QuantLib;
using std::string;

namespace cre {
namespace data {

boost::optional<Real> MarketQuotes::get(const string& id) const {
    auto it = quotes_.find(id);
    if (it == quotes_.end())
        return boost::none;
    return it->second;
}

void MarketQuotes::add(const string& id, Real value) {
    QL_REQUIRE(!id.empty(), "MarketQuotes: empty quote id");
    QL_REQUIRE(std::isfinite(value), "MarketQuotes: quote " << id << " is not finite (" << value << ")");
    quotes_[id] = value;
}

std::vector<string> MarketQuotes::ids() const {
    std::vector<string> result;
    result.reserve(quotes_.size());
    for (auto const& q : quotes_)
        result.push_back(q.first);
    return result;
}

MarketQuotes MarketQuotes::withQuote(const string& id, Real value) const {
    MarketQuotes result(*this);
    result.add(id, value);
    return result;
}

MarketQuotes MarketQuotes::withBump(const string& id, Real bump) const {
    auto it = quotes_.find(id);
    QL_REQUIRE(it != quotes_.end(), "MarketQuotes: can not bump quote " << id << ", it is not present");
    return withQuote(id, it->second + bump);
}

} // namespace data
} // namespace cre
