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

#include <cve/sensitivities/parametersensitivities.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace CurveExt {

CurrencyParameterSensitivity::CurrencyParameterSensitivity(const std::string& curveName, const std::string& currency,
                                                           const std::vector<ParameterMetadata>& metadata,
                                                           const Array& sensitivity)
    : curveName(curveName), currency(currency), metadata(metadata), sensitivity(sensitivity) {
    QL_REQUIRE(metadata.size() == sensitivity.size(), "CurrencyParameterSensitivity "
                                                          << curveName << "/" << currency << ": " << metadata.size()
                                                          << " metadata entries for " << sensitivity.size()
                                                          << " sensitivities");
}

Real CurrencyParameterSensitivity::total() const {
    Real sum = 0.0;
    for (Size i = 0; i < sensitivity.size(); ++i)
        sum += sensitivity[i];
    return sum;
}

void CurrencyParameterSensitivities::add(const CurrencyParameterSensitivity& s) {
    Key key(s.curveName, s.currency);
    auto it = data_.find(key);
    if (it == data_.end()) {
        data_[key] = s;
        return;
    }
    QL_REQUIRE(it->second.sensitivity.size() == s.sensitivity.size(),
               "CurrencyParameterSensitivities: can not combine sensitivities of size "
                   << it->second.sensitivity.size() << " and " << s.sensitivity.size() << " for curve "
                   << s.curveName << " and currency " << s.currency);
    it->second.sensitivity += s.sensitivity;
}

boost::optional<CurrencyParameterSensitivity> CurrencyParameterSensitivities::find(const std::string& curveName,
                                                                                  const std::string& currency) const {
    auto it = data_.find(Key(curveName, currency));
    if (it == data_.end())
        return boost::none;
    return it->second;
}

std::vector<CurrencyParameterSensitivity> CurrencyParameterSensitivities::sensitivities() const {
    std::vector<CurrencyParameterSensitivity> result;
    for (auto const& d : data_)
        result.push_back(d.second);
    return result;
}

Real CurrencyParameterSensitivities::total() const {
    Real sum = 0.0;
    for (auto const& d : data_)
        sum += d.second.total();
    return sum;
}

CurrencyParameterSensitivities
CurrencyParameterSensitivities::combinedWith(const CurrencyParameterSensitivities& other) const {
    CurrencyParameterSensitivities result(*this);
    for (auto const& d : other.data_)
        result.add(d.second);
    return result;
}

CurrencyParameterSensitivities CurrencyParameterSensitivities::multipliedBy(Real factor) const {
    CurrencyParameterSensitivities result(*this);
    for (auto& d : result.data_)
        d.second.sensitivity *= factor;
    return result;
}

} // namespace CurveExt
