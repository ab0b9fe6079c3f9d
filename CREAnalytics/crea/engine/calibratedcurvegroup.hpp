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

/*! \file crea/engine/calibratedcurvegroup.hpp
    \brief Result of the calibration of a curve group
    \ingroup engine
*/

#pragma once

#include <cve/instruments/calibrationinstrument.hpp>
#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/math/array.hpp>
#include <ql/math/matrix.hpp>
#include <ql/shared_ptr.hpp>
#include <ql/time/date.hpp>

#include <map>
#include <string>
#include <vector>

namespace cre {
namespace analytics {
using QuantLib::Array;
using QuantLib::Matrix;
using QuantLib::Real;
using QuantLib::Size;

//! Calibrated curves of a group together with the calibration Jacobian
/*! The Jacobian is square, its rows are the calibration instruments and its columns the curve
    parameters, both ordered by the curves of the group definition and then by node. Together
    with the derivatives of the residuals w.r.t. their market quotes it yields the derivatives
    of the parameters w.r.t. the quotes

    \f[
        \frac{\partial p}{\partial q} = -J^{-1} \mathrm{diag}\left(\frac{\partial r}{\partial q}\right)
    \f]

    which are computed once and kept. The provider holds the calibrated curves and the seed
    curves. Instances are immutable.

    \ingroup engine
*/
class CalibratedCurveGroup {
public:
    CalibratedCurveGroup(
        const std::string& name, const CurveExt::RatesCurveProvider& curves,
        const std::vector<std::string>& calibratedCurves, const std::vector<std::vector<std::string>>& layers,
        const std::vector<std::string>& quoteIds,
        const std::vector<QuantLib::ext::shared_ptr<const CurveExt::CalibrationInstrument>>& instruments,
        CurveExt::CalibrationMeasure measure, const Matrix& jacobian, const Array& quoteDerivatives,
        const std::vector<Size>& iterations);

    //! \name Inspectors
    //@{
    const std::string& name() const { return name_; }
    const QuantLib::Date& valuationDate() const { return curves_.valuationDate(); }
    //! calibrated and seed curves
    const CurveExt::RatesCurveProvider& curves() const { return curves_; }
    const CurveExt::InterpolatedParameterCurve& curve(const std::string& name) const { return curves_.curve(name); }
    //! calibrated curves in the order of the group definition
    const std::vector<std::string>& calibratedCurves() const { return calibratedCurves_; }
    bool isCalibrated(const std::string& curveName) const { return offsets_.count(curveName) > 0; }
    //! curves in calibration order, one vector per layer
    const std::vector<std::vector<std::string>>& layers() const { return layers_; }
    //! Newton iterations per layer
    const std::vector<Size>& iterations() const { return iterations_; }
    //! quote ids in the order of the Jacobian rows
    const std::vector<std::string>& quoteIds() const { return quoteIds_; }
    const std::vector<QuantLib::ext::shared_ptr<const CurveExt::CalibrationInstrument>>& instruments() const {
        return instruments_;
    }
    CurveExt::CalibrationMeasure measure() const { return measure_; }
    //@}

    //! \name Jacobian
    //@{
    Size parameterCount() const { return jacobian_.columns(); }
    //! first column of the given calibrated curve
    Size parameterOffset(const std::string& curveName) const;
    const Matrix& jacobian() const { return jacobian_; }
    const Array& quoteDerivatives() const { return quoteDerivatives_; }
    //! derivatives of the parameters (rows) w.r.t. the market quotes (columns)
    const Matrix& parameterQuoteDerivatives() const { return dParamsdQuotes_; }
    //@}

private:
    std::string name_;
    CurveExt::RatesCurveProvider curves_;
    std::vector<std::string> calibratedCurves_;
    std::map<std::string, Size> offsets_;
    std::vector<std::vector<std::string>> layers_;
    std::vector<std::string> quoteIds_;
    std::vector<QuantLib::ext::shared_ptr<const CurveExt::CalibrationInstrument>> instruments_;
    CurveExt::CalibrationMeasure measure_;
    Matrix jacobian_;
    Array quoteDerivatives_;
    Matrix dParamsdQuotes_;
    std::vector<Size> iterations_;
};

} // namespace analytics
} // namespace cre
