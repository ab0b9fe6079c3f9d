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

#include <cred/builders/calibrationinstrumentbuilder.hpp>
#include <cred/utilities/log.hpp>
#include <cred/utilities/to_string.hpp>

#include <cve/instruments/forwardrateagreement.hpp>
#include <cve/instruments/iborfixingdeposit.hpp>
#include <cve/instruments/iborfuture.hpp>
#include <cve/instruments/interestrateswap.hpp>
#include <cve/instruments/termdeposit.hpp>
#include <cve/utilities/calibrationerror.hpp>

#include <ql/time/daycounters/actual365fixed.hpp>
#include <ql/time/schedule.hpp>
#include <ql/utilities/null.hpp>

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

using namespace QuantLib;
using namespace CurveExt;
using std::string;
using std::vector;

namespace cre {
namespace data {

namespace {

// instrument of a node together with the dates needed for the node date rules
struct NodeInstrument {
    QuantLib::ext::shared_ptr<CalibrationInstrument> instrument;
    Date endDate;
    //! end of the period of the last fixing, null if the instrument has no fixing
    Date lastFixingDate;
    string defaultLabel;
    //! time used for the initial guess, null to use the time to the node date
    Time guessTime = Null<Time>();
};

template <class T>
QuantLib::ext::shared_ptr<T> convention(const Conventions& conventions, const string& id, Convention::Type type) {
    std::pair<bool, QuantLib::ext::shared_ptr<Convention>> c = conventions.get(id, type);
    if (!c.first) {
        std::ostringstream msg;
        msg << "convention " << id << " of type " << type << " not found";
        throw InvalidCurveNodeError(msg.str());
    }
    return QuantLib::ext::dynamic_pointer_cast<T>(c.second);
}

string fraLabel(const Period& periodToStart, const Period& tenor) {
    auto months = [](const Period& p) { return p.units() == Years ? 12 * p.length() : p.length(); };
    bool monthly = (periodToStart.units() == Months || periodToStart.units() == Years) &&
                   (tenor.units() == Months || tenor.units() == Years);
    if (monthly)
        return to_string(periodToStart) + "x" + to_string(Period(months(periodToStart) + months(tenor), Months));
    return to_string(periodToStart) + "x" + to_string(tenor);
}

string futureLabel(Month month, Year year) {
    static const char* names[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::ostringstream oss;
    oss << names[static_cast<int>(month) - 1] << (year % 100 < 10 ? "0" : "") << year % 100;
    return oss.str();
}

// floating leg on an ibor or overnight index
SwapLeg floatLeg(const Conventions& conventions, const string& index, const Date& start, const Date& end,
                 Period frequency, Calendar calendar, BusinessDayConvention bdc, Real spread = 0.0) {
    vector<SwapPeriod> periods;
    if (conventions.has(index, Convention::Type::IborIndex)) {
        auto ic = convention<IborIndexConvention>(conventions, index, Convention::Type::IborIndex);
        if (frequency == Period())
            frequency = ic->tenor();
        if (calendar.empty())
            calendar = ic->fixingCalendar();
        Schedule schedule(start, end, frequency, calendar, bdc, bdc, DateGeneration::Backward, false);
        for (Size i = 0; i + 1 < schedule.size(); ++i) {
            Date fixingEnd = ic->fixingCalendar().advance(schedule[i], ic->tenor(), ic->businessDayConvention(),
                                                          ic->endOfMonth());
            periods.push_back(SwapPeriod(schedule[i], schedule[i + 1], schedule[i + 1],
                                         ic->dayCounter().yearFraction(schedule[i], schedule[i + 1]), schedule[i],
                                         fixingEnd, ic->dayCounter().yearFraction(schedule[i], fixingEnd)));
        }
        return SwapLeg(SwapLeg::Type::Ibor, periods, index, spread);
    }
    auto oc = convention<OvernightIndexConvention>(conventions, index, Convention::Type::OvernightIndex);
    if (frequency == Period())
        throw InvalidCurveNodeError("a frequency is required for the overnight index " + index);
    if (calendar.empty())
        calendar = oc->fixingCalendar();
    Schedule schedule(start, end, frequency, calendar, bdc, bdc, DateGeneration::Backward, false);
    for (Size i = 0; i + 1 < schedule.size(); ++i) {
        Time yf = oc->dayCounter().yearFraction(schedule[i], schedule[i + 1]);
        periods.push_back(SwapPeriod(schedule[i], schedule[i + 1], schedule[i + 1], yf, schedule[i], schedule[i + 1],
                                     yf));
    }
    return SwapLeg(SwapLeg::Type::Overnight, periods, index, spread);
}

Natural indexSettlementDays(const Conventions& conventions, const string& index) {
    if (conventions.has(index, Convention::Type::IborIndex))
        return convention<IborIndexConvention>(conventions, index, Convention::Type::IborIndex)->settlementDays();
    return convention<OvernightIndexConvention>(conventions, index, Convention::Type::OvernightIndex)
        ->settlementDays();
}

string indexCurrency(const Conventions& conventions, const string& index) {
    if (conventions.has(index, Convention::Type::IborIndex))
        return convention<IborIndexConvention>(conventions, index, Convention::Type::IborIndex)->currency();
    return convention<OvernightIndexConvention>(conventions, index, Convention::Type::OvernightIndex)->currency();
}

Date lastFixing(const SwapLeg& leg) {
    Date d;
    if (leg.isFloating()) {
        for (auto const& p : leg.periods())
            d = std::max(d, p.fixingEnd);
    }
    return d;
}

class NodeInstrumentBuilder : public boost::static_visitor<NodeInstrument> {
public:
    NodeInstrumentBuilder(const Conventions& conventions, const Date& asof, Real rate)
        : conventions_(conventions), asof_(asof), rate_(rate) {}

    NodeInstrument operator()(const TermDepositNode& n) const {
        auto c = convention<DepositConvention>(conventions_, n.convention, Convention::Type::Deposit);
        Date start = c->calendar().advance(asof_, c->settlementDays() * Days);
        Date end = c->calendar().advance(start, n.tenor, c->convention(), c->eom());
        NodeInstrument r;
        r.instrument = QuantLib::ext::make_shared<TermDeposit>(c->currency(), start, end,
                                                               c->dayCounter().yearFraction(start, end), rate_);
        r.endDate = end;
        r.defaultLabel = to_string(n.tenor);
        return r;
    }

    NodeInstrument operator()(const IborFixingDepositNode& n) const {
        auto c = convention<IborIndexConvention>(conventions_, n.convention, Convention::Type::IborIndex);
        Date fixing = c->fixingCalendar().adjust(asof_);
        Date start = c->fixingCalendar().advance(fixing, c->settlementDays() * Days);
        Date end = c->fixingCalendar().advance(start, c->tenor(), c->businessDayConvention(), c->endOfMonth());
        NodeInstrument r;
        r.instrument = QuantLib::ext::make_shared<IborFixingDeposit>(
            c->currency(), c->id(), start, end, c->dayCounter().yearFraction(start, end), rate_);
        r.endDate = end;
        r.lastFixingDate = end;
        r.defaultLabel = to_string(c->tenor());
        return r;
    }

    NodeInstrument operator()(const FraNode& n) const {
        auto c = convention<FraConvention>(conventions_, n.convention, Convention::Type::FRA);
        auto ic = convention<IborIndexConvention>(conventions_, c->indexName(), Convention::Type::IborIndex);
        const Calendar& cal = ic->fixingCalendar();
        Date spot = cal.advance(asof_, ic->settlementDays() * Days);
        Date start = cal.advance(spot, n.periodToStart, ic->businessDayConvention(), ic->endOfMonth());
        Date end = cal.advance(start, ic->tenor(), ic->businessDayConvention(), ic->endOfMonth());
        NodeInstrument r;
        r.instrument = QuantLib::ext::make_shared<ForwardRateAgreement>(
            ic->currency(), ic->id(), start, end, ic->dayCounter().yearFraction(start, end), rate_);
        r.endDate = end;
        r.lastFixingDate = end;
        r.defaultLabel = fraLabel(n.periodToStart, ic->tenor());
        return r;
    }

    NodeInstrument operator()(const FixedFloatSwapNode& n) const {
        auto c = convention<IRSwapConvention>(conventions_, n.convention, Convention::Type::Swap);
        const Calendar& cal = c->fixedCalendar();
        Date spot = cal.advance(asof_, indexSettlementDays(conventions_, c->indexName()) * Days);
        Date start = n.forwardStart.length() == 0 ? spot : cal.advance(spot, n.forwardStart, c->fixedConvention());
        Date end = start + n.tenor;

        Schedule fixedSchedule(start, end, Period(c->fixedFrequency()), cal, c->fixedConvention(),
                               c->fixedConvention(), DateGeneration::Backward, false);
        vector<SwapPeriod> fixedPeriods;
        for (Size i = 0; i + 1 < fixedSchedule.size(); ++i)
            fixedPeriods.push_back(SwapPeriod(fixedSchedule[i], fixedSchedule[i + 1], fixedSchedule[i + 1],
                                              c->fixedDayCounter().yearFraction(fixedSchedule[i],
                                                                                fixedSchedule[i + 1])));
        SwapLeg fixedLeg(SwapLeg::Type::Fixed, fixedPeriods);

        // an overnight leg pays with the fixed frequency unless given otherwise
        Period floatFrequency;
        if (c->floatFrequency() != NoFrequency)
            floatFrequency = Period(c->floatFrequency());
        else if (!conventions_.has(c->indexName(), Convention::Type::IborIndex))
            floatFrequency = Period(c->fixedFrequency());
        SwapLeg floating =
            floatLeg(conventions_, c->indexName(), start, end, floatFrequency, cal, c->fixedConvention());

        auto swap = QuantLib::ext::make_shared<InterestRateSwap>(indexCurrency(conventions_, c->indexName()),
                                                                 fixedLeg, floating, rate_);
        NodeInstrument r;
        r.instrument = swap;
        r.endDate = swap->maturityDate();
        r.lastFixingDate = lastFixing(floating);
        r.defaultLabel = n.forwardStart.length() == 0 ? to_string(n.tenor)
                                                      : to_string(n.forwardStart) + "x" + to_string(n.tenor);
        return r;
    }

    NodeInstrument operator()(const BasisSwapNode& n) const {
        auto c = convention<TenorBasisSwapConvention>(conventions_, n.convention, Convention::Type::TenorBasisSwap);
        Calendar cal = c->calendar();
        if (cal.empty()) {
            cal = conventions_.has(c->payIndexName(), Convention::Type::IborIndex)
                      ? convention<IborIndexConvention>(conventions_, c->payIndexName(), Convention::Type::IborIndex)
                            ->fixingCalendar()
                      : convention<OvernightIndexConvention>(conventions_, c->payIndexName(),
                                                             Convention::Type::OvernightIndex)
                            ->fixingCalendar();
        }
        Date start = cal.advance(asof_, indexSettlementDays(conventions_, c->payIndexName()) * Days);
        Date end = start + n.tenor;
        SwapLeg pay = floatLeg(conventions_, c->payIndexName(), start, end, c->payFrequency(), cal, c->convention());
        SwapLeg receive =
            floatLeg(conventions_, c->receiveIndexName(), start, end, c->receiveFrequency(), cal, c->convention());
        string ccy = indexCurrency(conventions_, c->payIndexName());
        if (indexCurrency(conventions_, c->receiveIndexName()) != ccy)
            throw InvalidCurveNodeError("basis swap " + c->id() + " has indices in different currencies");

        auto swap = QuantLib::ext::make_shared<InterestRateSwap>(ccy, pay, receive, rate_);
        NodeInstrument r;
        r.instrument = swap;
        r.endDate = swap->maturityDate();
        r.lastFixingDate = std::max(lastFixing(pay), lastFixing(receive));
        r.defaultLabel = to_string(n.tenor);
        return r;
    }

    NodeInstrument operator()(const IborFutureNode& n) const {
        auto c = convention<FutureConvention>(conventions_, n.convention, Convention::Type::Future);
        auto ic = convention<IborIndexConvention>(conventions_, c->indexName(), Convention::Type::IborIndex);
        Date reference = Date::nthWeekday(3, Wednesday, n.month, n.year);
        if (reference <= asof_) {
            std::ostringstream msg;
            msg << "future " << futureLabel(n.month, n.year) << " has reference date " << to_string(reference)
                << " which is not after the valuation date " << to_string(asof_);
            throw InvalidCurveNodeError(msg.str());
        }
        const Calendar& cal = ic->fixingCalendar();
        Date start = cal.adjust(reference);
        Date lastTrade = cal.advance(start, -static_cast<Integer>(ic->settlementDays()) * Days);
        Date end = cal.advance(start, ic->tenor(), ic->businessDayConvention(), ic->endOfMonth());
        NodeInstrument r;
        r.instrument = QuantLib::ext::make_shared<IborFuture>(ic->currency(), ic->id(), lastTrade, start, end,
                                                              ic->dayCounter().yearFraction(start, end), rate_);
        r.endDate = end;
        r.lastFixingDate = end;
        r.defaultLabel = futureLabel(n.month, n.year);
        // months to the end of the reference month
        Integer months = (n.year - asof_.year()) * 12 + (static_cast<Integer>(n.month) - asof_.month()) + 1;
        r.guessTime = months / 12.0;
        return r;
    }

private:
    const Conventions& conventions_;
    Date asof_;
    Real rate_;
};

bool isFuture(const CurveNode& node) { return boost::get<IborFutureNode>(&node.instrument()) != nullptr; }

NodeInstrument buildNodeInstrument(const Conventions& conventions, const CurveNode& node, const Date& asof,
                                   Real rate) {
    QL_REQUIRE(asof != Date(), "no valuation date given to build curve node " << node.quoteId());
    try {
        return boost::apply_visitor(NodeInstrumentBuilder(conventions, asof, rate), node.instrument());
    } catch (const CalibrationError& e) {
        throw InvalidCurveNodeError("Curve node " + node.quoteId() + ": " + e.what());
    } catch (const std::exception& e) {
        throw InvalidCurveNodeError("Curve node " + node.quoteId() + " (" + node.instrumentType() +
                                    ") could not be built: " + e.what());
    }
}

Date applyNodeDate(const CurveNode& node, const NodeInstrument& ni) {
    switch (node.nodeDate().type()) {
    case NodeDate::Type::End:
        return ni.endDate;
    case NodeDate::Type::LastFixing:
        if (ni.lastFixingDate == Date())
            throw InvalidCurveNodeError("Curve node " + node.quoteId() + ": node date LastFixing requires an " +
                                        "instrument with an index fixing, " + node.instrumentType() + " has none");
        return ni.lastFixingDate;
    case NodeDate::Type::Fixed:
        return node.nodeDate().date();
    }
    QL_FAIL("unknown node date type");
}

} // namespace

Real initialGuess(CurveValueType valueType, Real rate, Time t) {
    switch (valueType) {
    case CurveValueType::ZeroRate:
        return rate;
    case CurveValueType::DiscountFactor:
        return std::exp(-rate * t);
    case CurveValueType::LogDiscountFactor:
        return -rate * t;
    }
    QL_FAIL("unknown curve value type");
}

CalibrationInstrumentBuilder::CalibrationInstrumentBuilder(const QuantLib::ext::shared_ptr<Conventions>& conventions)
    : conventions_(conventions) {
    QL_REQUIRE(conventions_, "CalibrationInstrumentBuilder: no conventions given");
}

BuiltInstrument CalibrationInstrumentBuilder::build(const CurveNode& node, const Date& valuationDate,
                                                    const MarketQuotes& quotes, CurveValueType valueType) const {
    boost::optional<Real> quote = quotes.get(node.quoteId());
    if (!quote)
        throw MissingMarketDataError(node.quoteId(), "Market quote " + node.quoteId() + " not found for " +
                                                         to_string(valuationDate));

    // futures are quoted as prices in percent
    Real rate = isFuture(node) ? *quote / 100.0 + node.spread() : *quote + node.spread();
    NodeInstrument ni = buildNodeInstrument(*conventions_, node, valuationDate, rate);

    BuiltInstrument result;
    result.instrument = ni.instrument;
    result.nodeDate = applyNodeDate(node, ni);
    result.metadata = CurveExt::ParameterMetadata(node.label().empty() ? ni.defaultLabel : node.label(),
                                                  result.nodeDate);
    Real guessRate = isFuture(node) ? 1.0 - rate : rate;
    Time t = ni.guessTime != Null<Time>() ? ni.guessTime
                                          : Actual365Fixed().yearFraction(valuationDate, result.nodeDate);
    result.initialGuess = initialGuess(valueType, guessRate, t);

    TLOG("Built " << node.instrumentType() << " for " << node.quoteId() << ": rate " << rate << ", node date "
                  << to_string(result.nodeDate) << ", initial guess " << result.initialGuess);
    return result;
}

QuantLib::ext::shared_ptr<CalibrationInstrument>
CalibrationInstrumentBuilder::instrument(const CurveNodeInstrument& instrument, const Date& valuationDate,
                                         Real rate) const {
    QL_REQUIRE(valuationDate != Date(), "CalibrationInstrumentBuilder: no valuation date given");
    return boost::apply_visitor(NodeInstrumentBuilder(*conventions_, valuationDate, rate), instrument).instrument;
}

Date CalibrationInstrumentBuilder::nodeDate(const CurveNode& node, const Date& valuationDate) const {
    // the dates do not depend on the rate
    return applyNodeDate(node, buildNodeInstrument(*conventions_, node, valuationDate, 0.0));
}

CurveExt::ParameterMetadata CalibrationInstrumentBuilder::metadata(const CurveNode& node,
                                                                   const Date& valuationDate) const {
    NodeInstrument ni = buildNodeInstrument(*conventions_, node, valuationDate, 0.0);
    return CurveExt::ParameterMetadata(node.label().empty() ? ni.defaultLabel : node.label(),
                                       applyNodeDate(node, ni));
}

} // namespace data
} // namespace cre
