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

/*! \file crea/engine/residualjacobianassembler.hpp
    \brief Residuals of calibration instruments and their Jacobian w.r.t. the curve parameters
    \ingroup engine
*/

#pragma once

#include <cve/instruments/calibrationinstrument.hpp>
#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/math/array.hpp>
#include <ql/math/matrix.hpp>
#include <ql/shared_ptr.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace analytics {
using QuantLib::Array;
using QuantLib::Matrix;
using QuantLib::Real;
using QuantLib::Size;

//! Assembles the residuals and the Jacobian of a set of calibration instruments
/*! The residual of instrument k is its calibration measure under the given curves, the target
    is zero. The columns of the Jacobian are the parameters of the calibrated curves, ordered by
    curve (in the given order) and then by parameter index. The entries are obtained from the
    point sensitivities of the measure and the discount factor sensitivities of the curves,

    \f[
        J_{k,(c,i)} = \sum_{t} \frac{\partial r_k}{\partial DF_c(t)} \frac{\partial DF_c(t)}{\partial p_{c,i}}.
    \f]

    Curves that are not calibrated (seed curves, curves of earlier layers) are used for pricing
    but have no columns.

    \ingroup engine
*/
class ResidualJacobianAssembler {
public:
    ResidualJacobianAssembler(
        const std::vector<QuantLib::ext::shared_ptr<const CurveExt::CalibrationInstrument>>& instruments,
        const std::vector<std::string>& calibratedCurves, const std::vector<Size>& parameterCounts,
        CurveExt::CalibrationMeasure measure);

    //! residuals and Jacobian under the given curves, the outputs are resized
    void assemble(const CurveExt::RatesCurveProvider& curves, Array& residuals, Matrix& jacobian) const;
    //! residuals only
    Array residuals(const CurveExt::RatesCurveProvider& curves) const;
    //! derivative of each residual w.r.t. the market quote of its instrument
    Array quoteDerivatives(const CurveExt::RatesCurveProvider& curves) const;

    Size rows() const { return instruments_.size(); }
    Size columns() const { return columns_; }
    //! first column of the given curve
    Size offset(const std::string& curveName) const;
    const std::vector<std::string>& calibratedCurves() const { return curves_; }

private:
    std::vector<QuantLib::ext::shared_ptr<const CurveExt::CalibrationInstrument>> instruments_;
    std::vector<std::string> curves_;
    std::map<std::string, Size> offsets_;
    Size columns_;
    CurveExt::CalibrationMeasure measure_;
};

} // namespace analytics
} // namespace cre
