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

/*! \file cred/configuration/calibrationconfig.hpp
    \brief Class for holding the settings of the curve calibration
    \ingroup configuration
*/

#pragma once

#include <cred/utilities/xmlutils.hpp>

#include <cve/instruments/calibrationinstrument.hpp>

#include <ql/types.hpp>

namespace cre {
namespace data {

/*! Serializable calibration configuration

    Holds the settings of the Newton solver used to calibrate a curve group and the measure which is set to zero
    for each calibration instrument.

    \ingroup configuration
*/
class CalibrationConfig : public XMLSerializable {
public:
    //! Constructor
    CalibrationConfig(QuantLib::Real tolerance = 1.0e-12, QuantLib::Size maxIterations = 100,
                      QuantLib::Real maxConditionNumber = 1.0e12, QuantLib::Size maxStepHalvings = 10,
                      CurveExt::CalibrationMeasure measure = CurveExt::CalibrationMeasure::ParSpread);

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Inspectors
    //@{
    QuantLib::Real tolerance() const { return tolerance_; }
    QuantLib::Size maxIterations() const { return maxIterations_; }
    QuantLib::Real maxConditionNumber() const { return maxConditionNumber_; }
    QuantLib::Size maxStepHalvings() const { return maxStepHalvings_; }
    CurveExt::CalibrationMeasure measure() const { return measure_; }
    //@}

private:
    QuantLib::Real tolerance_;
    QuantLib::Size maxIterations_;
    QuantLib::Real maxConditionNumber_;
    QuantLib::Size maxStepHalvings_;
    CurveExt::CalibrationMeasure measure_;
};

} // namespace data
} // namespace cre
