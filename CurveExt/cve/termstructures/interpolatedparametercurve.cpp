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

#include <cve/termstructures/interpolatedparametercurve.hpp>

#include <ql/errors.hpp>

#include <cmath>

using namespace QuantLib;

namespace CurveExt {

namespace {
// time step used for the zero rate at the reference date
const Time zeroRateDt = 0.0001;
} // namespace

std::ostream& operator<<(std::ostream& out, CurveValueType t) {
    switch (t) {
    case CurveValueType::ZeroRate:
        return out << "ZeroRate";
    case CurveValueType::DiscountFactor:
        return out << "DiscountFactor";
    case CurveValueType::LogDiscountFactor:
        return out << "LogDiscountFactor";
    }
    QL_FAIL("unknown curve value type");
}

InterpolatedParameterCurve::InterpolatedParameterCurve(
    const std::string& name, const std::string& currency, const Date& referenceDate, const DayCounter& dayCounter,
    CurveValueType valueType, Interpolator interpolator, Extrapolator leftExtrapolator,
    Extrapolator rightExtrapolator, const std::vector<Date>& nodeDates, const Array& parameters,
    const std::vector<ParameterMetadata>& metadata)
    : name_(name), currency_(currency), referenceDate_(referenceDate), dayCounter_(dayCounter),
      valueType_(valueType), interpolator_(interpolator), leftExtrapolator_(leftExtrapolator),
      rightExtrapolator_(rightExtrapolator), nodeDates_(nodeDates), parameters_(parameters), metadata_(metadata) {

    QL_REQUIRE(!nodeDates_.empty(), "InterpolatedParameterCurve " << name_ << ": no node dates given");
    QL_REQUIRE(nodeDates_.size() == parameters_.size(), "InterpolatedParameterCurve "
                                                            << name_ << ": number of node dates (" << nodeDates_.size()
                                                            << ") does not match number of parameters ("
                                                            << parameters_.size() << ")");
    QL_REQUIRE(!isLogInterpolator(interpolator_) || valueType_ == CurveValueType::DiscountFactor,
               "InterpolatedParameterCurve " << name_ << ": interpolator " << interpolator_
                                             << " requires value type DiscountFactor, got " << valueType_);

    if (metadata_.empty()) {
        for (Size i = 0; i < nodeDates_.size(); ++i)
            metadata_.push_back(ParameterMetadata(io::iso_date(nodeDates_[i]), nodeDates_[i]));
    }
    QL_REQUIRE(metadata_.size() == parameters_.size(), "InterpolatedParameterCurve "
                                                           << name_ << ": number of metadata entries ("
                                                           << metadata_.size() << ") does not match number of "
                                                           << "parameters (" << parameters_.size() << ")");

    std::vector<Real> x;
    if (anchored())
        x.push_back(0.0);
    for (Size i = 0; i < nodeDates_.size(); ++i) {
        Time t = timeFromReference(nodeDates_[i]);
        QL_REQUIRE(!anchored() || t > 0.0, "InterpolatedParameterCurve "
                                               << name_ << ": node date " << io::iso_date(nodeDates_[i])
                                               << " must be after the reference date "
                                               << io::iso_date(referenceDate_));
        nodeTimes_.push_back(t);
        x.push_back(t);
    }
    interpolation_ = makeParameterInterpolation(interpolator_, x, leftExtrapolator_, rightExtrapolator_);
}

Time InterpolatedParameterCurve::timeFromReference(const Date& d) const {
    return dayCounter_.yearFraction(referenceDate_, d);
}

Array InterpolatedParameterCurve::ordinates() const {
    Array y(parameters_.size() + offset());
    // the anchor is DF(0) = 1, i.e. 0 for log discount factors and for log interpolation
    if (anchored())
        y[0] = (valueType_ == CurveValueType::DiscountFactor && !isLogInterpolator(interpolator_)) ? 1.0 : 0.0;
    for (Size i = 0; i < parameters_.size(); ++i)
        y[i + offset()] = isLogInterpolator(interpolator_) ? std::log(parameters_[i]) : parameters_[i];
    return y;
}

Real InterpolatedParameterCurve::value(Time t) const {
    Real v = (*interpolation_)(t, ordinates());
    return isLogInterpolator(interpolator_) ? std::exp(v) : v;
}

Real InterpolatedParameterCurve::discountFactor(Time t) const {
    Real y = value(t);
    switch (valueType_) {
    case CurveValueType::ZeroRate:
        return std::exp(-y * t);
    case CurveValueType::DiscountFactor:
        return y;
    case CurveValueType::LogDiscountFactor:
        return std::exp(y);
    }
    QL_FAIL("unknown curve value type");
}

Real InterpolatedParameterCurve::zeroRate(Time t) const {
    if (valueType_ == CurveValueType::ZeroRate)
        return value(t);
    Time tt = t > 0.0 ? t : zeroRateDt;
    return -std::log(discountFactor(tt)) / tt;
}

Array InterpolatedParameterCurve::valueParameterSensitivity(Time t) const {
    Array w = interpolation_->weights(t);
    Array result(parameters_.size());
    Real v = isLogInterpolator(interpolator_) ? value(t) : 1.0;
    for (Size i = 0; i < parameters_.size(); ++i) {
        result[i] = w[i + offset()];
        // d exp(sum w ln p) / dp_i = y w_i / p_i
        if (isLogInterpolator(interpolator_))
            result[i] *= v / parameters_[i];
    }
    return result;
}

Real InterpolatedParameterCurve::derivativeWrtParameter(const Date& d, Size i) const {
    QL_REQUIRE(i < parameters_.size(), "InterpolatedParameterCurve " << name_ << ": parameter index " << i
                                                                     << " out of range [0," << parameters_.size()
                                                                     << ")");
    return valueParameterSensitivity(d)[i];
}

Array InterpolatedParameterCurve::discountFactorParameterSensitivity(Time t) const {
    Array dy = valueParameterSensitivity(t);
    switch (valueType_) {
    case CurveValueType::ZeroRate:
        dy *= -t * discountFactor(t);
        break;
    case CurveValueType::DiscountFactor:
        break;
    case CurveValueType::LogDiscountFactor:
        dy *= discountFactor(t);
        break;
    }
    return dy;
}

InterpolatedParameterCurve InterpolatedParameterCurve::withParameter(Size i, Real value) const {
    QL_REQUIRE(i < parameters_.size(), "InterpolatedParameterCurve " << name_ << ": parameter index " << i
                                                                     << " out of range [0," << parameters_.size()
                                                                     << ")");
    Array p = parameters_;
    p[i] = value;
    return withParameters(p);
}

InterpolatedParameterCurve InterpolatedParameterCurve::withParameters(const Array& parameters) const {
    QL_REQUIRE(parameters.size() == parameters_.size(), "InterpolatedParameterCurve "
                                                            << name_ << ": expected " << parameters_.size()
                                                            << " parameters, got " << parameters.size());
    // the abscissas are unchanged, so the interpolation can be shared
    InterpolatedParameterCurve c(*this);
    c.parameters_ = parameters;
    return c;
}

} // namespace CurveExt
