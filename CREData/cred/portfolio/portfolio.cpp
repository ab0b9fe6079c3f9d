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

#include <cred/portfolio/portfolio.hpp>
#include <cred/utilities/log.hpp>

#include <ql/errors.hpp>

namespace cre {
namespace data {

void Portfolio::add(const QuantLib::ext::shared_ptr<Trade>& trade) {
    QL_REQUIRE(trade, "Portfolio: can not add empty trade");
    QL_REQUIRE(!has(trade->id()), "Attempted to add a trade to the portfolio with an id, which already exists.");
    trades_[trade->id()] = trade;
}

QuantLib::ext::shared_ptr<Trade> Portfolio::get(const string& id) const {
    auto it = trades_.find(id);
    if (it == trades_.end())
        return nullptr;
    return it->second;
}

bool Portfolio::remove(const string& tradeId) { return trades_.erase(tradeId) > 0; }

QuantLib::Size Portfolio::build(const CalibrationInstrumentBuilder& builder, const Date& valuationDate) {
    LOG("Building Portfolio of size " << trades_.size());
    QuantLib::Size removed = 0;
    auto trade = trades_.begin();
    while (trade != trades_.end()) {
        try {
            trade->second->build(builder, valuationDate);
            TLOG("Built trade " << trade->first << " (" << trade->second->tradeType() << "), maturity "
                                << QuantLib::io::iso_date(trade->second->maturity()));
            ++trade;
        } catch (const std::exception& e) {
            StructuredMessage(StructuredMessage::Category::Error, StructuredMessage::Group::Trade, e.what(),
                              std::map<string, string>({{"tradeId", trade->first},
                                                        {"tradeType", trade->second->tradeType()},
                                                        {"exceptionType", "Trade Build Error"}}))
                .log();
            trade = trades_.erase(trade);
            ++removed;
        }
    }
    LOG("Built Portfolio. Initial size = " << trades_.size() + removed << ", size now " << trades_.size());
    return removed;
}

std::set<string> Portfolio::ids() const {
    std::set<string> result;
    for (auto const& t : trades_)
        result.insert(t.first);
    return result;
}

void Portfolio::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Portfolio");
    for (XMLNode* child : XMLUtils::getChildrenNodes(node, "Trade")) {
        auto trade = QuantLib::ext::make_shared<Trade>();
        trade->fromXML(child);
        add(trade);
    }
    DLOG("Loaded portfolio of size " << trades_.size());
}

XMLNode* Portfolio::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Portfolio");
    for (auto const& t : trades_)
        XMLUtils::appendNode(node, t.second->toXML(doc));
    return node;
}

} // namespace data
} // namespace cre
