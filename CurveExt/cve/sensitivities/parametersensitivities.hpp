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

/*! \file cve/sensitivities/parametersensitivities.hpp
    \brief Sensitivities of a value to curve parameters, grouped by curve and currency
    \ingroup sensitivities
*/

#ifndef curveext_parametersensitivities_hpp
#define curveext_parametersensitivities_hpp

#include <cve/sensitivities/parametermetadata.hpp>

#include <ql/math/array.hpp>

#include <boost/optional.hpp>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace CurveExt {

//! Sensitivity of a value in one currency to all parameters of one curve
struct CurrencyParameterSensitivity {
    CurrencyParameterSensitivity() {}
    CurrencyParameterSensitivity(const std::string& curveName, const std::string& currency,
                                 const std::vector<ParameterMetadata>& metadata, const QuantLib::Array& sensitivity);

    std::string curveName;
    std::string currency;
    std::vector<ParameterMetadata> metadata;
    QuantLib::Array sensitivity;

    QuantLib::Real total() const;
};

//! Parameter sensitivities keyed by curve name and currency
/*! Adding a sensitivity for a key which is already present sums the two vectors.
*/
class CurrencyParameterSensitivities {
public:
    typedef std::pair<std::string, std::string> Key;

    CurrencyParameterSensitivities() {}

    void add(const CurrencyParameterSensitivity& s);

    boost::optional<CurrencyParameterSensitivity> find(const std::string& curveName,
                                                       const std::string& currency) const;
    //! all sensitivities in key order
    std::vector<CurrencyParameterSensitivity> sensitivities() const;
    QuantLib::Size size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    //! sum over all curves and parameters
    QuantLib::Real total() const;

    CurrencyParameterSensitivities combinedWith(const CurrencyParameterSensitivities& other) const;
    CurrencyParameterSensitivities multipliedBy(QuantLib::Real factor) const;

private:
    std::map<Key, CurrencyParameterSensitivity> data_;
};

} // namespace CurveExt

#endif
