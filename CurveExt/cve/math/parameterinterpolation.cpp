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

#include <cve/math/parameterinterpolation.hpp>

#include <ql/errors.hpp>

#include <algorithm>

using namespace QuantLib;

namespace CurveExt {

std::ostream& operator<<(std::ostream& out, Interpolator i) {
    switch (i) {
    case Interpolator::Linear:
        return out << "Linear";
    case Interpolator::LogLinear:
        return out << "LogLinear";
    case Interpolator::NaturalCubic:
        return out << "NaturalCubic";
    case Interpolator::LogNaturalCubic:
        return out << "LogNaturalCubic";
    }
    QL_FAIL("unknown interpolator");
}

std::ostream& operator<<(std::ostream& out, Extrapolator e) {
    switch (e) {
    case Extrapolator::Flat:
        return out << "Flat";
    case Extrapolator::Linear:
        return out << "Linear";
    }
    QL_FAIL("unknown extrapolator");
}

bool isLogInterpolator(Interpolator i) { return i == Interpolator::LogLinear || i == Interpolator::LogNaturalCubic; }

ParameterInterpolation::ParameterInterpolation(const std::vector<Real>& x, Extrapolator left, Extrapolator right)
    : x_(x), left_(left), right_(right) {
    QL_REQUIRE(!x_.empty(), "ParameterInterpolation: at least one abscissa required");
    for (Size i = 1; i < x_.size(); ++i) {
        QL_REQUIRE(x_[i] > x_[i - 1], "ParameterInterpolation: abscissas must be strictly increasing, x["
                                          << i - 1 << "]=" << x_[i - 1] << ", x[" << i << "]=" << x_[i]);
    }
}

Array ParameterInterpolation::weights(Real x) const {
    Size n = x_.size();
    Array w(n, 0.0);

    // a single point is flat everywhere
    if (n == 1) {
        w[0] = 1.0;
        return w;
    }

    if (x < x_.front()) {
        if (left_ == Extrapolator::Linear) {
            endGradientWeights(false, w);
            w *= x - x_.front();
        }
        w[0] += 1.0;
        return w;
    }

    if (x > x_.back()) {
        if (right_ == Extrapolator::Linear) {
            endGradientWeights(true, w);
            w *= x - x_.back();
        }
        w[n - 1] += 1.0;
        return w;
    }

    Size i = std::upper_bound(x_.begin(), x_.end(), x) - x_.begin();
    i = std::min<Size>(std::max<Size>(i, 1), n - 1) - 1;
    segmentWeights(i, x, w);
    return w;
}

Real ParameterInterpolation::operator()(Real x, const Array& y) const {
    QL_REQUIRE(y.size() == x_.size(),
               "ParameterInterpolation: ordinate size (" << y.size() << ") does not match abscissas (" << x_.size()
                                                         << ")");
    Array w = weights(x);
    return DotProduct(w, y);
}

LinearParameterInterpolation::LinearParameterInterpolation(const std::vector<Real>& x, Extrapolator left,
                                                           Extrapolator right)
    : ParameterInterpolation(x, left, right) {}

void LinearParameterInterpolation::segmentWeights(Size i, Real x, Array& w) const {
    Real h = x_[i + 1] - x_[i];
    w[i] = (x_[i + 1] - x) / h;
    w[i + 1] = (x - x_[i]) / h;
}

void LinearParameterInterpolation::endGradientWeights(bool right, Array& w) const {
    Size i = right ? x_.size() - 2 : 0;
    Real h = x_[i + 1] - x_[i];
    w[i] = -1.0 / h;
    w[i + 1] = 1.0 / h;
}

NaturalCubicParameterInterpolation::NaturalCubicParameterInterpolation(const std::vector<Real>& x,
                                                                       Extrapolator left, Extrapolator right)
    : ParameterInterpolation(x, left, right) {

    Size n = x_.size();
    s_ = Matrix(n, n, 0.0);
    if (n < 3)
        return;

    // tridiagonal system for the interior second derivatives M_1, ..., M_{n-2}, natural boundary M_0 = M_{n-1} = 0
    Size m = n - 2;
    std::vector<Real> h(n - 1);
    for (Size i = 0; i < n - 1; ++i)
        h[i] = x_[i + 1] - x_[i];

    std::vector<Real> lower(m), diag(m), upper(m);
    for (Size r = 0; r < m; ++r) {
        Size i = r + 1;
        lower[r] = h[i - 1];
        diag[r] = 2.0 * (h[i - 1] + h[i]);
        upper[r] = h[i];
    }

    // forward elimination is independent of the right hand side
    std::vector<Real> c(m), d(m);
    d[0] = diag[0];
    for (Size r = 1; r < m; ++r) {
        c[r] = lower[r] / d[r - 1];
        d[r] = diag[r] - c[r] * upper[r - 1];
    }

    std::vector<Real> rhs(m), sol(m);
    for (Size j = 0; j < n; ++j) {
        // right hand side of the system for the unit ordinate vector e_j
        for (Size r = 0; r < m; ++r) {
            Size i = r + 1;
            Real v = 0.0;
            if (j == i - 1)
                v += 6.0 / h[i - 1];
            if (j == i)
                v -= 6.0 / h[i - 1] + 6.0 / h[i];
            if (j == i + 1)
                v += 6.0 / h[i];
            rhs[r] = v;
        }
        for (Size r = 1; r < m; ++r)
            rhs[r] -= c[r] * rhs[r - 1];
        sol[m - 1] = rhs[m - 1] / d[m - 1];
        for (Size r = m - 1; r > 0; --r)
            sol[r - 1] = (rhs[r - 1] - upper[r - 1] * sol[r]) / d[r - 1];
        for (Size r = 0; r < m; ++r)
            s_[r + 1][j] = sol[r];
    }
}

void NaturalCubicParameterInterpolation::segmentWeights(Size i, Real x, Array& w) const {
    Real h = x_[i + 1] - x_[i];
    Real a = (x_[i + 1] - x) / h;
    Real b = (x - x_[i]) / h;
    Real ca = (a * a * a - a) * h * h / 6.0;
    Real cb = (b * b * b - b) * h * h / 6.0;
    for (Size j = 0; j < w.size(); ++j)
        w[j] = ca * s_[i][j] + cb * s_[i + 1][j];
    w[i] += a;
    w[i + 1] += b;
}

void NaturalCubicParameterInterpolation::endGradientWeights(bool right, Array& w) const {
    Size n = x_.size();
    if (right) {
        Real h = x_[n - 1] - x_[n - 2];
        for (Size j = 0; j < n; ++j)
            w[j] = h / 6.0 * s_[n - 2][j] + h / 3.0 * s_[n - 1][j];
        w[n - 2] -= 1.0 / h;
        w[n - 1] += 1.0 / h;
    } else {
        Real h = x_[1] - x_[0];
        for (Size j = 0; j < n; ++j)
            w[j] = -h / 3.0 * s_[0][j] - h / 6.0 * s_[1][j];
        w[0] -= 1.0 / h;
        w[1] += 1.0 / h;
    }
}

QuantLib::ext::shared_ptr<ParameterInterpolation> makeParameterInterpolation(Interpolator interpolator,
                                                                             const std::vector<Real>& x,
                                                                             Extrapolator left, Extrapolator right) {
    switch (interpolator) {
    case Interpolator::Linear:
    case Interpolator::LogLinear:
        return QuantLib::ext::make_shared<LinearParameterInterpolation>(x, left, right);
    case Interpolator::NaturalCubic:
    case Interpolator::LogNaturalCubic:
        return QuantLib::ext::make_shared<NaturalCubicParameterInterpolation>(x, left, right);
    }
    QL_FAIL("makeParameterInterpolation: unknown interpolator");
}

} // namespace CurveExt
