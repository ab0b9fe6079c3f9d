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

#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

void RatesCurveProvider::addCurve(const InterpolatedParameterCurve& curve,
                                  const std::vector<std::string>& discountCurrencies,
                                  const std::vector<std::string>& indices) {
    QL_REQUIRE(curves_.count(curve.name()) == 0, "RatesCurveProvider: curve " << curve.name() << " already added");
    for (auto const& c : discountCurrencies) {
        auto it = discountCurves_.find(c);
        QL_REQUIRE(it == discountCurves_.end(), "RatesCurveProvider: currency " << c << " is discounted by curve "
                                                                                << it->second << ", can not add "
                                                                                << curve.name());
        discountCurves_[c] = curve.name();
    }
    for (auto const& i : indices) {
        auto it = indexCurves_.find(i);
        QL_REQUIRE(it == indexCurves_.end(), "RatesCurveProvider: index " << i << " is projected by curve "
                                                                          << it->second << ", can not add "
                                                                          << curve.name());
        indexCurves_[i] = curve.name();
    }
    curves_[curve.name()] = QuantLib::ext::make_shared<InterpolatedParameterCurve>(curve);
}

const InterpolatedParameterCurve& RatesCurveProvider::curve(const std::string& name) const {
    auto it = curves_.find(name);
    QL_REQUIRE(it != curves_.end(), "RatesCurveProvider: curve " << name << " not found");
    return *it->second;
}

const InterpolatedParameterCurve& RatesCurveProvider::discountCurve(const std::string& currency) const {
    auto it = discountCurves_.find(currency);
    QL_REQUIRE(it != discountCurves_.end(), "RatesCurveProvider: no discount curve for currency " << currency);
    return curve(it->second);
}

const InterpolatedParameterCurve& RatesCurveProvider::indexCurve(const std::string& index) const {
    auto it = indexCurves_.find(index);
    QL_REQUIRE(it != indexCurves_.end(), "RatesCurveProvider: no forwarding curve for index " << index);
    return curve(it->second);
}

boost::optional<std::string> RatesCurveProvider::discountCurveName(const std::string& currency) const {
    auto it = discountCurves_.find(currency);
    if (it == discountCurves_.end())
        return boost::none;
    return it->second;
}

boost::optional<std::string> RatesCurveProvider::indexCurveName(const std::string& index) const {
    auto it = indexCurves_.find(index);
    if (it == indexCurves_.end())
        return boost::none;
    return it->second;
}

std::vector<std::string> RatesCurveProvider::curveNames() const {
    std::vector<std::string> names;
    for (auto const& c : curves_)
        names.push_back(c.first);
    return names;
}

RatesCurveProvider RatesCurveProvider::withCurves(const std::vector<InterpolatedParameterCurve>& curves) const {
    RatesCurveProvider result(*this);
    for (auto const& c : curves) {
        auto it = result.curves_.find(c.name());
        QL_REQUIRE(it != result.curves_.end(), "RatesCurveProvider: can not replace unknown curve " << c.name());
        it->second = QuantLib::ext::make_shared<InterpolatedParameterCurve>(c);
    }
    return result;
}

} // namespace CurveExt
