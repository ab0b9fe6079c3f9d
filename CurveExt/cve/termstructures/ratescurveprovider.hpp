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

/*! \file cve/termstructures/ratescurveprovider.hpp
    \brief Lookup of discount and forwarding curves by currency and index
    \ingroup termstructures
*/

#ifndef curveext_ratescurveprovider_hpp
#define curveext_ratescurveprovider_hpp

#include <cve/termstructures/interpolatedparametercurve.hpp>

#include <ql/shared_ptr.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>
#include <vector>

namespace CurveExt {

//! Set of curves used to price calibration instruments
/*! Each curve is registered under its name together with the currencies it discounts and the
    indices it projects. The curves themselves are immutable, withCurves() returns a provider in
    which some curves are replaced by new parameter values.

    \ingroup termstructures
*/
class RatesCurveProvider {
public:
    explicit RatesCurveProvider(const Date& valuationDate = Date()) : valuationDate_(valuationDate) {}

    //! registers a curve, a currency or index can only be mapped to one curve
    void addCurve(const InterpolatedParameterCurve& curve, const std::vector<std::string>& discountCurrencies,
                  const std::vector<std::string>& indices);

    //! \name Inspectors
    //@{
    const Date& valuationDate() const { return valuationDate_; }
    bool hasCurve(const std::string& name) const { return curves_.count(name) > 0; }
    const InterpolatedParameterCurve& curve(const std::string& name) const;
    const InterpolatedParameterCurve& discountCurve(const std::string& currency) const;
    const InterpolatedParameterCurve& indexCurve(const std::string& index) const;
    boost::optional<std::string> discountCurveName(const std::string& currency) const;
    boost::optional<std::string> indexCurveName(const std::string& index) const;
    //! curve names in alphabetical order
    std::vector<std::string> curveNames() const;
    //@}

    //! copy of this provider with the given curves replaced, each must already be registered
    RatesCurveProvider withCurves(const std::vector<InterpolatedParameterCurve>& curves) const;

private:
    Date valuationDate_;
    std::map<std::string, QuantLib::ext::shared_ptr<const InterpolatedParameterCurve>> curves_;
    std::map<std::string, std::string> discountCurves_, indexCurves_;
};

} // namespace CurveExt

#endif
