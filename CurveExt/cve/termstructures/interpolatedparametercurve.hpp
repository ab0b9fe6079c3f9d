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

/*! \file cve/termstructures/interpolatedparametercurve.hpp
    \brief Interest rate curve defined by interpolated node parameters
    \ingroup termstructures
*/

#ifndef curveext_interpolatedparametercurve_hpp
#define curveext_interpolatedparametercurve_hpp

#include <cve/math/parameterinterpolation.hpp>
#include <cve/sensitivities/parametermetadata.hpp>

#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>
#include <ql/types.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace CurveExt {
using QuantLib::Date;
using QuantLib::DayCounter;
using QuantLib::Time;

//! Meaning of the interpolated values of a curve
enum class CurveValueType { ZeroRate, DiscountFactor, LogDiscountFactor };

std::ostream& operator<<(std::ostream& out, CurveValueType t);

//! Interest rate curve whose parameters are the interpolated values at the node dates
/*! The curve interpolates the values \f$ p_j \f$ at the node times \f$ t_j \f$ given by the
    day counter from the reference date. Depending on the value type the interpolated value
    \f$ y(t) \f$ is a continuously compounded zero rate, a discount factor or the logarithm of a
    discount factor, i.e.
    \f[
        DF(t) = e^{-y(t) t}, \quad DF(t) = y(t), \quad DF(t) = e^{y(t)}.
    \f]

    Discount factor and log discount factor curves are anchored at \f$ t = 0 \f$ with
    \f$ DF(0) = 1 \f$. The anchor is an additional abscissa of the interpolation but not a
    parameter of the curve. The log interpolators interpolate \f$ \ln y \f$ and are only
    allowed on discount factor curves.

    The derivatives of the curve values w.r.t. the parameters are computed in closed form from
    the interpolation weights. Instances are immutable, withParameter() and withParameters()
    return a new curve.

    \ingroup termstructures
*/
class InterpolatedParameterCurve {
public:
    InterpolatedParameterCurve(const std::string& name, const std::string& currency, const Date& referenceDate,
                               const DayCounter& dayCounter, CurveValueType valueType, Interpolator interpolator,
                               Extrapolator leftExtrapolator, Extrapolator rightExtrapolator,
                               const std::vector<Date>& nodeDates, const Array& parameters,
                               const std::vector<ParameterMetadata>& metadata = std::vector<ParameterMetadata>());

    //! \name Inspectors
    //@{
    const std::string& name() const { return name_; }
    const std::string& currency() const { return currency_; }
    const Date& referenceDate() const { return referenceDate_; }
    const DayCounter& dayCounter() const { return dayCounter_; }
    CurveValueType valueType() const { return valueType_; }
    Interpolator interpolator() const { return interpolator_; }
    Extrapolator leftExtrapolator() const { return leftExtrapolator_; }
    Extrapolator rightExtrapolator() const { return rightExtrapolator_; }
    const std::vector<Date>& nodeDates() const { return nodeDates_; }
    const std::vector<Time>& nodeTimes() const { return nodeTimes_; }
    const Array& parameters() const { return parameters_; }
    Size parameterCount() const { return parameters_.size(); }
    const std::vector<ParameterMetadata>& parameterMetadata() const { return metadata_; }
    //@}

    //! year fraction of the curve's day counter from the reference date
    Time timeFromReference(const Date& d) const;

    //! \name Curve values
    //@{
    Real value(const Date& d) const { return value(timeFromReference(d)); }
    Real value(Time t) const;
    Real discountFactor(const Date& d) const { return discountFactor(timeFromReference(d)); }
    Real discountFactor(Time t) const;
    //! continuously compounded zero rate
    Real zeroRate(const Date& d) const { return zeroRate(timeFromReference(d)); }
    Real zeroRate(Time t) const;
    //@}

    //! \name Parameter sensitivities
    //@{
    //! derivative of value(d) w.r.t. parameter i
    Real derivativeWrtParameter(const Date& d, Size i) const;
    //! derivatives of value(t) w.r.t. all parameters
    Array valueParameterSensitivity(Time t) const;
    Array valueParameterSensitivity(const Date& d) const { return valueParameterSensitivity(timeFromReference(d)); }
    //! derivatives of discountFactor(t) w.r.t. all parameters
    Array discountFactorParameterSensitivity(Time t) const;
    Array discountFactorParameterSensitivity(const Date& d) const {
        return discountFactorParameterSensitivity(timeFromReference(d));
    }
    //@}

    //! \name Functional updates
    //@{
    InterpolatedParameterCurve withParameter(Size i, Real value) const;
    InterpolatedParameterCurve withParameters(const Array& parameters) const;
    //@}

private:
    //! ordinates of the interpolation, including the anchor if any
    Array ordinates() const;
    bool anchored() const { return valueType_ != CurveValueType::ZeroRate; }
    //! index of the first parameter in the interpolation abscissas
    Size offset() const { return anchored() ? 1 : 0; }

    std::string name_, currency_;
    Date referenceDate_;
    DayCounter dayCounter_;
    CurveValueType valueType_;
    Interpolator interpolator_;
    Extrapolator leftExtrapolator_, rightExtrapolator_;
    std::vector<Date> nodeDates_;
    std::vector<Time> nodeTimes_;
    Array parameters_;
    std::vector<ParameterMetadata> metadata_;
    QuantLib::ext::shared_ptr<ParameterInterpolation> interpolation_;
};

} // namespace CurveExt

#endif
