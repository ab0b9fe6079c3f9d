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

/*! \file cve/math/parameterinterpolation.hpp
    \brief Interpolation schemes which are linear in their ordinates
    \ingroup math
*/

#ifndef curveext_parameterinterpolation_hpp
#define curveext_parameterinterpolation_hpp

#include <ql/math/array.hpp>
#include <ql/math/matrix.hpp>
#include <ql/shared_ptr.hpp>

#include <ostream>
#include <vector>

namespace CurveExt {
using QuantLib::Array;
using QuantLib::Matrix;
using QuantLib::Real;
using QuantLib::Size;

//! Interpolation method of a calibrated curve
/*! The log variants interpolate the logarithm of the ordinates with the underlying linear
    or natural cubic scheme.
*/
enum class Interpolator { Linear, LogLinear, NaturalCubic, LogNaturalCubic };

//! Extrapolation beyond the first or last abscissa
/*! Flat keeps the end value of the interpolated variable, Linear continues with the
    gradient of the interpolant at the end point.
*/
enum class Extrapolator { Flat, Linear };

std::ostream& operator<<(std::ostream& out, Interpolator i);
std::ostream& operator<<(std::ostream& out, Extrapolator e);

//! true for LogLinear and LogNaturalCubic
bool isLogInterpolator(Interpolator i);

//! Interpolation whose value is a linear function of the ordinates
/*! For fixed abscissas \f$ x_j \f$ the interpolated value is
    \f[
        y(x) = \sum_j w_j(x) y_j
    \f]
    both inside the abscissa range and in the extrapolated region. The weights \f$ w_j(x) \f$
    are therefore the exact derivatives of the interpolated value w.r.t. the ordinates.

    \ingroup math
*/
class ParameterInterpolation {
public:
    ParameterInterpolation(const std::vector<Real>& x, Extrapolator left, Extrapolator right);
    virtual ~ParameterInterpolation() {}

    //! the weights w_j(x), j = 0 ... size()-1
    Array weights(Real x) const;
    //! the interpolated value for ordinates y
    Real operator()(Real x, const Array& y) const;

    Size size() const { return x_.size(); }
    const std::vector<Real>& abscissas() const { return x_; }
    Extrapolator leftExtrapolator() const { return left_; }
    Extrapolator rightExtrapolator() const { return right_; }

protected:
    //! weights of the interpolant on the segment [x_i, x_{i+1}] evaluated at x, w has the right size and is zero
    virtual void segmentWeights(Size i, Real x, Array& w) const = 0;
    //! weights of the first derivative of the interpolant at the first (right = false) or last abscissa
    virtual void endGradientWeights(bool right, Array& w) const = 0;

    std::vector<Real> x_;

private:
    Extrapolator left_, right_;
};

//! Piecewise linear interpolation
class LinearParameterInterpolation : public ParameterInterpolation {
public:
    LinearParameterInterpolation(const std::vector<Real>& x, Extrapolator left, Extrapolator right);

protected:
    void segmentWeights(Size i, Real x, Array& w) const override;
    void endGradientWeights(bool right, Array& w) const override;
};

//! Natural cubic spline interpolation
/*! The second derivatives \f$ M = S y \f$ of the spline are linear in the ordinates, the matrix
    \f$ S \f$ is computed once on construction by solving the spline's tridiagonal system for each
    unit ordinate vector. With two abscissas the scheme reduces to linear interpolation.
*/
class NaturalCubicParameterInterpolation : public ParameterInterpolation {
public:
    NaturalCubicParameterInterpolation(const std::vector<Real>& x, Extrapolator left, Extrapolator right);

    //! the matrix mapping ordinates to second derivatives at the abscissas
    const Matrix& secondDerivativeMatrix() const { return s_; }

protected:
    void segmentWeights(Size i, Real x, Array& w) const override;
    void endGradientWeights(bool right, Array& w) const override;

private:
    Matrix s_;
};

//! factory, the log variants map to their underlying scheme
QuantLib::ext::shared_ptr<ParameterInterpolation> makeParameterInterpolation(Interpolator interpolator,
                                                                             const std::vector<Real>& x,
                                                                             Extrapolator left, Extrapolator right);

} // namespace CurveExt

#endif
