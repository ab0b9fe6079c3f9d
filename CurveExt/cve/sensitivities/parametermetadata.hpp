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

/*! \file cve/sensitivities/parametermetadata.hpp
    \brief Description of a single curve parameter
    \ingroup sensitivities
*/

#ifndef curveext_parametermetadata_hpp
#define curveext_parametermetadata_hpp

#include <ql/time/date.hpp>

#include <ostream>
#include <string>

namespace CurveExt {

//! Label and date of a curve parameter, e.g. "1Y" and the maturity of the 1Y swap node
struct ParameterMetadata {
    ParameterMetadata() {}
    ParameterMetadata(const std::string& label, const QuantLib::Date& date) : label(label), date(date) {}
    std::string label;
    QuantLib::Date date;
};

inline bool operator==(const ParameterMetadata& a, const ParameterMetadata& b) {
    return a.label == b.label && a.date == b.date;
}

inline std::ostream& operator<<(std::ostream& out, const ParameterMetadata& m) {
    return out << m.label << " (" << QuantLib::io::iso_date(m.date) << ")";
}

} // namespace CurveExt

#endif
