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

/*! \file cve/sensitivities/marketquotesensitivities.hpp
    \brief Sensitivities of a value to market quotes
    \ingroup sensitivities
*/

#ifndef curveext_marketquotesensitivities_hpp
#define curveext_marketquotesensitivities_hpp

#include <ql/types.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>
#include <utility>

namespace CurveExt {

//! Derivatives of a value w.r.t. market quotes, keyed by quote id and currency of the value
class MarketQuoteSensitivities {
public:
    typedef std::pair<std::string, std::string> Key;

    MarketQuoteSensitivities() {}

    //! adds s to the sensitivity of (quoteId, currency)
    void add(const std::string& quoteId, const std::string& currency, QuantLib::Real s) {
        data_[Key(quoteId, currency)] += s;
    }

    boost::optional<QuantLib::Real> find(const std::string& quoteId, const std::string& currency) const {
        auto it = data_.find(Key(quoteId, currency));
        if (it == data_.end())
            return boost::none;
        return it->second;
    }

    const std::map<Key, QuantLib::Real>& data() const { return data_; }
    QuantLib::Size size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    QuantLib::Real total() const {
        QuantLib::Real sum = 0.0;
        for (auto const& d : data_)
            sum += d.second;
        return sum;
    }

private:
    std::map<Key, QuantLib::Real> data_;
};

} // namespace CurveExt

#endif
