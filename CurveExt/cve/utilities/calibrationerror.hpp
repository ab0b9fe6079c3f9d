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

/*! \file cve/utilities/calibrationerror.hpp
    \brief Typed errors raised by curve calibration
    \ingroup utilities
*/

#ifndef curveext_calibrationerror_hpp
#define curveext_calibrationerror_hpp

#include <ql/errors.hpp>

#include <ostream>
#include <string>

namespace CurveExt {

//! Base class of all errors that abort the calibration of a curve group
/*! The errors derive from QuantLib::Error, so that callers which only deal with the
    QuantLib error hierarchy still see them, while the kind allows for typed handling.

    \ingroup utilities
*/
class CalibrationError : public QuantLib::Error {
public:
    enum class Kind {
        MissingMarketData,
        CyclicCurveDependency,
        SingularJacobian,
        MaxIterationsExceeded,
        InvalidCurveNode,
        Diverged,
        Cancelled,
        Other
    };

    CalibrationError(Kind kind, const std::string& message) : QuantLib::Error("", 0, "", message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

//! A quote required by a curve node is not present in the market data
class MissingMarketDataError : public CalibrationError {
public:
    MissingMarketDataError(const std::string& quoteId, const std::string& message)
        : CalibrationError(Kind::MissingMarketData, message), quoteId_(quoteId) {}
    const std::string& quoteId() const { return quoteId_; }

private:
    std::string quoteId_;
};

//! Two or more curves of a group depend on each other
class CyclicCurveDependencyError : public CalibrationError {
public:
    explicit CyclicCurveDependencyError(const std::string& message)
        : CalibrationError(Kind::CyclicCurveDependency, message) {}
};

//! The calibration Jacobian is singular or too ill-conditioned to be inverted
class SingularJacobianError : public CalibrationError {
public:
    explicit SingularJacobianError(const std::string& message) : CalibrationError(Kind::SingularJacobian, message) {}
};

//! The Newton iteration did not converge within the configured number of iterations
class MaxIterationsExceededError : public CalibrationError {
public:
    explicit MaxIterationsExceededError(const std::string& message)
        : CalibrationError(Kind::MaxIterationsExceeded, message) {}
};

//! The Newton iteration produced non-finite residuals that step halving could not recover from
class DivergedError : public CalibrationError {
public:
    explicit DivergedError(const std::string& message) : CalibrationError(Kind::Diverged, message) {}
};

//! A curve node can not be turned into a calibration instrument
class InvalidCurveNodeError : public CalibrationError {
public:
    explicit InvalidCurveNodeError(const std::string& message) : CalibrationError(Kind::InvalidCurveNode, message) {}
};

inline std::ostream& operator<<(std::ostream& out, CalibrationError::Kind k) {
    switch (k) {
    case CalibrationError::Kind::MissingMarketData:
        return out << "MissingMarketData";
    case CalibrationError::Kind::CyclicCurveDependency:
        return out << "CyclicCurveDependency";
    case CalibrationError::Kind::SingularJacobian:
        return out << "SingularJacobian";
    case CalibrationError::Kind::MaxIterationsExceeded:
        return out << "MaxIterationsExceeded";
    case CalibrationError::Kind::InvalidCurveNode:
        return out << "InvalidCurveNode";
    case CalibrationError::Kind::Diverged:
        return out << "Diverged";
    case CalibrationError::Kind::Cancelled:
        return out << "Cancelled";
    case CalibrationError::Kind::Other:
        return out << "Other";
    }
    return out << "Unknown";
}

} // namespace CurveExt

#endif
