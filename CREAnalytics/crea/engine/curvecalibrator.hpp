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

/*! \file crea/engine/curvecalibrator.hpp
    \brief Calibration of a curve group to market quotes
    \ingroup engine
*/

#pragma once

#include <crea/engine/calibratedcurvegroup.hpp>
#include <crea/engine/calibrationoutcome.hpp>

#include <cred/builders/calibrationinstrumentbuilder.hpp>
#include <cred/configuration/calibrationconfig.hpp>
#include <cred/configuration/conventions.hpp>
#include <cred/configuration/curvedefinition.hpp>
#include <cred/marketdata/marketquotes.hpp>

#include <cve/termstructures/ratescurveprovider.hpp>

#include <ql/shared_ptr.hpp>

namespace cre {
namespace analytics {

//! Calibrates the curves of a group to market quotes
/*! The nodes of each curve are turned into calibration instruments, the curves are ordered by
    their dependencies and each layer of curves is solved jointly by a Newton solver with the
    curves of earlier layers and the seed curves frozen. Once all layers are solved the Jacobian
    of all instruments w.r.t. all parameters of the group is assembled at the solution and kept
    with the calibrated curves.

    The valuation date is the as of date of the quotes. A missing quote, an invalid node, a
    cyclic dependency, a singular Jacobian or a failure of the solver aborts the calibration of
    the whole group, no partially calibrated curves are returned.

    \ingroup engine
*/
class CurveCalibrator {
public:
    CurveCalibrator(const QuantLib::ext::shared_ptr<data::Conventions>& conventions,
                    const data::CalibrationConfig& config = data::CalibrationConfig());

    //! calibrates the group, throws a CalibrationError on failure
    QuantLib::ext::shared_ptr<const CalibratedCurveGroup>
    calibrate(const data::CurveGroupDefinition& group, const data::MarketQuotes& quotes,
              const CurveExt::RatesCurveProvider& seeds = CurveExt::RatesCurveProvider()) const;

    //! calibrates the group, a failure is logged and returned in the outcome
    CalibrationOutcome tryCalibrate(const data::CurveGroupDefinition& group, const data::MarketQuotes& quotes,
                                    const CurveExt::RatesCurveProvider& seeds = CurveExt::RatesCurveProvider()) const;

    const data::CalibrationConfig& config() const { return config_; }
    const data::CalibrationInstrumentBuilder& builder() const { return builder_; }

private:
    data::CalibrationInstrumentBuilder builder_;
    data::CalibrationConfig config_;
};

} // namespace analytics
} // namespace cre
