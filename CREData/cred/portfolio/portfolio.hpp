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

/*! \file cred/portfolio/portfolio.hpp
    \brief Serializable collection of trades
    \ingroup portfolio
*/

#pragma once

#include <cred/portfolio/trade.hpp>

#include <map>
#include <set>

namespace cre {
namespace data {

//! Serializable portfolio
/*!
  \ingroup portfolio
*/
class Portfolio : public XMLSerializable {
public:
    Portfolio() {}

    //! Add a trade to the portfolio, throws if the id is already used
    void add(const QuantLib::ext::shared_ptr<Trade>& trade);

    //! Check if a trade id is already in the portfolio
    bool has(const string& id) const { return trades_.find(id) != trades_.end(); }

    /*! Get a Trade with the given \p id from the portfolio

        \remark returns a `nullptr` if no trade found with the given \p id
    */
    QuantLib::ext::shared_ptr<Trade> get(const string& id) const;

    void clear() { trades_.clear(); }
    QuantLib::Size size() const { return trades_.size(); }
    bool empty() const { return trades_.empty(); }

    //! Remove specified trade from the portfolio
    bool remove(const string& tradeId);

    /*! Build all trades, a trade that fails to build is removed from the portfolio and reported
        as a structured error. Returns the number of removed trades. */
    QuantLib::Size build(const CalibrationInstrumentBuilder& builder, const Date& valuationDate);

    const std::map<string, QuantLib::ext::shared_ptr<Trade>>& trades() const { return trades_; }
    std::set<string> ids() const;

    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;

private:
    std::map<string, QuantLib::ext::shared_ptr<Trade>> trades_;
};

} // namespace data
} // namespace cre
