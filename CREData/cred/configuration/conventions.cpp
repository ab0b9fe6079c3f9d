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

/*! \file cred/configuration/conventions.cpp
    \brief Currency and instrument specific conventions
    \ingroup configuration
*/

#include <cred/configuration/conventions.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/parsers.hpp>
#include <cred/utilities/to_string.hpp>

#include <boost/algorithm/string.hpp>

#include <vector>

using namespace QuantLib;
using std::string;
using std::vector;

namespace cre {
namespace data {

namespace {
vector<string> splitId(const string& id) {
    vector<string> tokens;
    boost::split(tokens, id, boost::is_any_of("-"));
    return tokens;
}
} // namespace

Convention::Convention(const string& id, Type type) : type_(type), id_(id) {}

std::ostream& operator<<(std::ostream& out, Convention::Type type) {
    switch (type) {
    case Convention::Type::IborIndex:
        return out << "IborIndex";
    case Convention::Type::OvernightIndex:
        return out << "OvernightIndex";
    case Convention::Type::Deposit:
        return out << "Deposit";
    case Convention::Type::FRA:
        return out << "FRA";
    case Convention::Type::Swap:
        return out << "Swap";
    case Convention::Type::TenorBasisSwap:
        return out << "TenorBasisSwap";
    case Convention::Type::Future:
        return out << "Future";
    }
    QL_FAIL("unknown convention type " << static_cast<int>(type));
}

IborIndexConvention::IborIndexConvention(const string& id, const string& fixingCalendar, const string& dayCounter,
                                         const Natural settlementDays, const string& businessDayConvention,
                                         const bool endOfMonth)
    : Convention(id, Type::IborIndex), strFixingCalendar_(fixingCalendar), strDayCounter_(dayCounter),
      settlementDays_(settlementDays), strBusinessDayConvention_(businessDayConvention), endOfMonth_(endOfMonth) {
    build();
}

void IborIndexConvention::build() {
    vector<string> tokens = splitId(id_);
    QL_REQUIRE(tokens.size() >= 3,
               "Two or more separators required in IborIndex convention id " << id_ << ", e.g. EUR-EURIBOR-6M");
    currency_ = tokens.front();
    tenor_ = parsePeriod(tokens.back());
    fixingCalendar_ = parseCalendar(strFixingCalendar_);
    dayCounter_ = parseDayCounter(strDayCounter_);
    businessDayConvention_ = parseBusinessDayConvention(strBusinessDayConvention_);
}

void IborIndexConvention::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "IborIndex");
    type_ = Type::IborIndex;
    id_ = XMLUtils::getChildValue(node, "Id", true);
    strFixingCalendar_ = XMLUtils::getChildValue(node, "FixingCalendar", true);
    strDayCounter_ = XMLUtils::getChildValue(node, "DayCounter", true);
    settlementDays_ = XMLUtils::getChildValueAsInt(node, "SettlementDays", true);
    strBusinessDayConvention_ = XMLUtils::getChildValue(node, "BusinessDayConvention", true);
    endOfMonth_ = XMLUtils::getChildValueAsBool(node, "EndOfMonth", true);
    build();
}

XMLNode* IborIndexConvention::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("IborIndex");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "FixingCalendar", strFixingCalendar_);
    XMLUtils::addChild(doc, node, "DayCounter", strDayCounter_);
    XMLUtils::addChild(doc, node, "SettlementDays", static_cast<int>(settlementDays_));
    XMLUtils::addChild(doc, node, "BusinessDayConvention", strBusinessDayConvention_);
    XMLUtils::addChild(doc, node, "EndOfMonth", endOfMonth_);
    return node;
}

OvernightIndexConvention::OvernightIndexConvention(const string& id, const string& fixingCalendar,
                                                   const string& dayCounter, const Natural settlementDays)
    : Convention(id, Type::OvernightIndex), strFixingCalendar_(fixingCalendar), strDayCounter_(dayCounter),
      settlementDays_(settlementDays) {
    build();
}

void OvernightIndexConvention::build() {
    vector<string> tokens = splitId(id_);
    QL_REQUIRE(tokens.size() >= 2,
               "One or more separators required in OvernightIndex convention id " << id_ << ", e.g. EUR-ESTR");
    currency_ = tokens.front();
    fixingCalendar_ = parseCalendar(strFixingCalendar_);
    dayCounter_ = parseDayCounter(strDayCounter_);
}

void OvernightIndexConvention::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "OvernightIndex");
    type_ = Type::OvernightIndex;
    id_ = XMLUtils::getChildValue(node, "Id", true);
    strFixingCalendar_ = XMLUtils::getChildValue(node, "FixingCalendar", true);
    strDayCounter_ = XMLUtils::getChildValue(node, "DayCounter", true);
    settlementDays_ = XMLUtils::getChildValueAsInt(node, "SettlementDays", true);
    build();
}

XMLNode* OvernightIndexConvention::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("OvernightIndex");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "FixingCalendar", strFixingCalendar_);
    XMLUtils::addChild(doc, node, "DayCounter", strDayCounter_);
    XMLUtils::addChild(doc, node, "SettlementDays", static_cast<int>(settlementDays_));
    return node;
}

DepositConvention::DepositConvention(const string& id, const string& currency, const string& calendar,
                                     const string& convention, const string& eom, const string& dayCounter,
                                     const string& settlementDays)
    : Convention(id, Type::Deposit), currency_(currency), strCalendar_(calendar), strConvention_(convention),
      strEom_(eom), strDayCounter_(dayCounter), strSettlementDays_(settlementDays) {
    build();
}

void DepositConvention::build() {
    calendar_ = parseCalendar(strCalendar_);
    convention_ = parseBusinessDayConvention(strConvention_);
    eom_ = parseBool(strEom_);
    dayCounter_ = parseDayCounter(strDayCounter_);
    Integer sd = parseInteger(strSettlementDays_);
    QL_REQUIRE(sd >= 0, "Deposit convention " << id_ << ": negative settlement days " << sd);
    settlementDays_ = static_cast<Natural>(sd);
}

void DepositConvention::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "Deposit");
    type_ = Type::Deposit;
    id_ = XMLUtils::getChildValue(node, "Id", true);

    // Get string values from xml
    currency_ = XMLUtils::getChildValue(node, "Currency", true);
    strCalendar_ = XMLUtils::getChildValue(node, "Calendar", true);
    strConvention_ = XMLUtils::getChildValue(node, "Convention", true);
    strEom_ = XMLUtils::getChildValue(node, "EOM", false, "false");
    strDayCounter_ = XMLUtils::getChildValue(node, "DayCounter", true);
    strSettlementDays_ = XMLUtils::getChildValue(node, "SettlementDays", true);
    build();
}

XMLNode* DepositConvention::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("Deposit");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "Currency", currency_);
    XMLUtils::addChild(doc, node, "Calendar", strCalendar_);
    XMLUtils::addChild(doc, node, "Convention", strConvention_);
    XMLUtils::addChild(doc, node, "EOM", strEom_);
    XMLUtils::addChild(doc, node, "DayCounter", strDayCounter_);
    XMLUtils::addChild(doc, node, "SettlementDays", strSettlementDays_);

    return node;
}

FraConvention::FraConvention(const string& id, const string& index) : Convention(id, Type::FRA), strIndex_(index) {}

void FraConvention::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "FRA");
    type_ = Type::FRA;
    id_ = XMLUtils::getChildValue(node, "Id", true);
    strIndex_ = XMLUtils::getChildValue(node, "Index", true);
}

XMLNode* FraConvention::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("FRA");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "Index", strIndex_);
    return node;
}

IRSwapConvention::IRSwapConvention(const string& id, const string& fixedCalendar, const string& fixedFrequency,
                                   const string& fixedConvention, const string& fixedDayCounter, const string& index,
                                   const string& floatFrequency)
    : Convention(id, Type::Swap), strFixedCalendar_(fixedCalendar), strFixedFrequency_(fixedFrequency),
      strFixedConvention_(fixedConvention), strFixedDayCounter_(fixedDayCounter), strIndex_(index),
      strFloatFrequency_(floatFrequency) {
    build();
}

void IRSwapConvention::build() {
    fixedCalendar_ = parseCalendar(strFixedCalendar_);
    fixedFrequency_ = parseFrequency(strFixedFrequency_);
    fixedConvention_ = parseBusinessDayConvention(strFixedConvention_);
    fixedDayCounter_ = parseDayCounter(strFixedDayCounter_);
    floatFrequency_ = strFloatFrequency_.empty() ? NoFrequency : parseFrequency(strFloatFrequency_);
}

void IRSwapConvention::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "Swap");
    type_ = Type::Swap;
    id_ = XMLUtils::getChildValue(node, "Id", true);

    // Get string values from xml
    strFixedCalendar_ = XMLUtils::getChildValue(node, "FixedCalendar", true);
    strFixedFrequency_ = XMLUtils::getChildValue(node, "FixedFrequency", true);
    strFixedConvention_ = XMLUtils::getChildValue(node, "FixedConvention", true);
    strFixedDayCounter_ = XMLUtils::getChildValue(node, "FixedDayCounter", true);
    strIndex_ = XMLUtils::getChildValue(node, "Index", true);

    // optional
    strFloatFrequency_ = XMLUtils::getChildValue(node, "FloatFrequency", false);

    build();
}

XMLNode* IRSwapConvention::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("Swap");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "FixedCalendar", strFixedCalendar_);
    XMLUtils::addChild(doc, node, "FixedFrequency", strFixedFrequency_);
    XMLUtils::addChild(doc, node, "FixedConvention", strFixedConvention_);
    XMLUtils::addChild(doc, node, "FixedDayCounter", strFixedDayCounter_);
    XMLUtils::addChild(doc, node, "Index", strIndex_);
    if (!strFloatFrequency_.empty())
        XMLUtils::addChild(doc, node, "FloatFrequency", strFloatFrequency_);

    return node;
}

TenorBasisSwapConvention::TenorBasisSwapConvention(const string& id, const string& payIndex,
                                                   const string& receiveIndex, const string& payFrequency,
                                                   const string& receiveFrequency, const string& calendar,
                                                   const string& convention)
    : Convention(id, Type::TenorBasisSwap), strPayIndex_(payIndex), strReceiveIndex_(receiveIndex),
      strPayFrequency_(payFrequency), strReceiveFrequency_(receiveFrequency), strCalendar_(calendar),
      strConvention_(convention) {
    build();
}

void TenorBasisSwapConvention::build() {
    payFrequency_ = strPayFrequency_.empty() ? Period() : parsePeriod(strPayFrequency_);
    receiveFrequency_ = strReceiveFrequency_.empty() ? Period() : parsePeriod(strReceiveFrequency_);
    calendar_ = strCalendar_.empty() ? Calendar() : parseCalendar(strCalendar_);
    convention_ = strConvention_.empty() ? ModifiedFollowing : parseBusinessDayConvention(strConvention_);
}

void TenorBasisSwapConvention::fromXML(XMLNode* node) {

    XMLUtils::checkNode(node, "TenorBasisSwap");
    type_ = Type::TenorBasisSwap;
    id_ = XMLUtils::getChildValue(node, "Id", true);

    // Get string values from xml
    strPayIndex_ = XMLUtils::getChildValue(node, "PayIndex", true);
    strReceiveIndex_ = XMLUtils::getChildValue(node, "ReceiveIndex", true);

    // optional
    strPayFrequency_ = XMLUtils::getChildValue(node, "PayFrequency", false);
    strReceiveFrequency_ = XMLUtils::getChildValue(node, "ReceiveFrequency", false);
    strCalendar_ = XMLUtils::getChildValue(node, "Calendar", false);
    strConvention_ = XMLUtils::getChildValue(node, "Convention", false);

    build();
}

XMLNode* TenorBasisSwapConvention::toXML(XMLDocument& doc) const {

    XMLNode* node = doc.allocNode("TenorBasisSwap");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "PayIndex", strPayIndex_);
    XMLUtils::addChild(doc, node, "ReceiveIndex", strReceiveIndex_);
    if (!strPayFrequency_.empty())
        XMLUtils::addChild(doc, node, "PayFrequency", strPayFrequency_);
    if (!strReceiveFrequency_.empty())
        XMLUtils::addChild(doc, node, "ReceiveFrequency", strReceiveFrequency_);
    if (!strCalendar_.empty())
        XMLUtils::addChild(doc, node, "Calendar", strCalendar_);
    if (!strConvention_.empty())
        XMLUtils::addChild(doc, node, "Convention", strConvention_);

    return node;
}

FutureConvention::FutureConvention(const string& id, const string& index)
    : Convention(id, Type::Future), strIndex_(index) {}

void FutureConvention::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Future");
    type_ = Type::Future;
    id_ = XMLUtils::getChildValue(node, "Id", true);
    strIndex_ = XMLUtils::getChildValue(node, "Index", true);
}

XMLNode* FutureConvention::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("Future");
    XMLUtils::addChild(doc, node, "Id", id_);
    XMLUtils::addChild(doc, node, "Index", strIndex_);
    return node;
}

void Conventions::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "Conventions");

    for (XMLNode* child = XMLUtils::getChildNode(node); child; child = XMLUtils::getNextSibling(child)) {

        string type = XMLUtils::getNodeName(child);
        QuantLib::ext::shared_ptr<Convention> convention;

        if (type == "IborIndex") {
            convention = QuantLib::ext::make_shared<IborIndexConvention>();
        } else if (type == "OvernightIndex") {
            convention = QuantLib::ext::make_shared<OvernightIndexConvention>();
        } else if (type == "Deposit") {
            convention = QuantLib::ext::make_shared<DepositConvention>();
        } else if (type == "FRA") {
            convention = QuantLib::ext::make_shared<FraConvention>();
        } else if (type == "Swap") {
            convention = QuantLib::ext::make_shared<IRSwapConvention>();
        } else if (type == "TenorBasisSwap") {
            convention = QuantLib::ext::make_shared<TenorBasisSwapConvention>();
        } else if (type == "Future") {
            convention = QuantLib::ext::make_shared<FutureConvention>();
        } else {
            QL_FAIL("Convention type '" << type << "' not recognized.");
        }

        string id = "unknown";
        try {
            id = XMLUtils::getChildValue(child, "Id", true);
            DLOG("Building Convention " << id);
            convention->fromXML(child);
            add(convention);
        } catch (const std::exception& e) {
            WLOG("Exception parsing convention "
                 << id << ": " << e.what() << ". This is only a problem if this convention is used later on.");
        }
    }
}

XMLNode* Conventions::toXML(XMLDocument& doc) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);

    XMLNode* conventionsNode = doc.allocNode("Conventions");
    for (auto const& c : data_)
        XMLUtils::appendNode(conventionsNode, c.second->toXML(doc));
    return conventionsNode;
}

void Conventions::clear() {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    data_.clear();
}

QuantLib::ext::shared_ptr<Convention> Conventions::get(const string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = data_.find(id);
    QL_REQUIRE(it != data_.end(), "Convention '" << id << "' not found.");
    return it->second;
}

std::pair<bool, QuantLib::ext::shared_ptr<Convention>> Conventions::get(const string& id,
                                                                        const Convention::Type& type) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto it = data_.find(id);
    if (it == data_.end() || it->second->type() != type)
        return std::make_pair(false, nullptr);
    return std::make_pair(true, it->second);
}

bool Conventions::has(const string& id) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return data_.find(id) != data_.end();
}

bool Conventions::has(const string& id, const Convention::Type& type) const { return get(id, type).first; }

QuantLib::Size Conventions::size() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return data_.size();
}

void Conventions::add(const QuantLib::ext::shared_ptr<Convention>& convention) {
    QL_REQUIRE(convention, "Conventions::add(): convention is null");
    boost::unique_lock<boost::shared_mutex> lock(mutex_);
    const string& id = convention->id();
    if (data_.find(id) != data_.end())
        WLOG("Overwriting convention " << id);
    data_[id] = convention;
}

} // namespace data
} // namespace cre
