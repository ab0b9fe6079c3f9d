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

#include <cve/math/newtonsolver.hpp>
#include <cve/utilities/calibrationerror.hpp>

#include <ql/errors.hpp>
#include <ql/math/matrixutilities/qrdecomposition.hpp>
#include <ql/math/matrixutilities/svd.hpp>

#include <cmath>
#include <limits>
#include <sstream>

using namespace QuantLib;

namespace CurveExt {

std::ostream& operator<<(std::ostream& out, NewtonSolver::State s) {
    switch (s) {
    case NewtonSolver::State::Initializing:
        return out << "Initializing";
    case NewtonSolver::State::Iterating:
        return out << "Iterating";
    case NewtonSolver::State::Converged:
        return out << "Converged";
    case NewtonSolver::State::Diverged:
        return out << "Diverged";
    case NewtonSolver::State::MaxIterationsExceeded:
        return out << "MaxIterationsExceeded";
    }
    QL_FAIL("unknown newton solver state");
}

Real maxAbsolute(const Array& a) {
    Real m = 0.0;
    for (Size i = 0; i < a.size(); ++i) {
        if (!std::isfinite(a[i]))
            return std::numeric_limits<Real>::infinity();
        m = std::max(m, std::fabs(a[i]));
    }
    return m;
}

NewtonSolver::NewtonSolver(Real tolerance, Size maxIterations, Real maxConditionNumber, Size maxStepHalvings)
    : tolerance_(tolerance), maxIterations_(maxIterations), maxConditionNumber_(maxConditionNumber),
      maxStepHalvings_(maxStepHalvings), state_(State::Initializing), iterations_(0),
      residualNorm_(std::numeric_limits<Real>::infinity()) {
    QL_REQUIRE(tolerance_ > 0.0, "NewtonSolver: tolerance (" << tolerance_ << ") must be positive");
    QL_REQUIRE(maxIterations_ > 0, "NewtonSolver: maxIterations must be positive");
    QL_REQUIRE(maxConditionNumber_ > 1.0,
               "NewtonSolver: max condition number (" << maxConditionNumber_ << ") must be greater than 1");
}

void NewtonSolver::evaluate(const System& system, const Array& x, Array& residuals, Matrix& jacobian) const {
    residuals = Array(x.size(), 0.0);
    jacobian = Matrix(x.size(), x.size(), 0.0);
    system(x, residuals, jacobian);
    QL_REQUIRE(residuals.size() == x.size(), "NewtonSolver: system returned " << residuals.size()
                                                                              << " residuals for " << x.size()
                                                                              << " variables");
    QL_REQUIRE(jacobian.rows() == x.size() && jacobian.columns() == x.size(),
               "NewtonSolver: system returned a " << jacobian.rows() << "x" << jacobian.columns()
                                                  << " Jacobian for " << x.size() << " variables");
}

void NewtonSolver::checkCondition(const Matrix& jacobian) const {
    for (Size i = 0; i < jacobian.rows(); ++i) {
        for (Size j = 0; j < jacobian.columns(); ++j) {
            if (!std::isfinite(jacobian[i][j])) {
                std::ostringstream msg;
                msg << "Jacobian entry (" << i << "," << j << ") is not finite after " << iterations_
                    << " iterations";
                throw SingularJacobianError(msg.str());
            }
        }
    }
    SVD svd(jacobian);
    Real cond = svd.cond();
    if (!std::isfinite(cond) || cond > maxConditionNumber_) {
        std::ostringstream msg;
        msg << "Jacobian is singular or ill-conditioned after " << iterations_ << " iterations, condition number "
            << cond << " exceeds " << maxConditionNumber_;
        throw SingularJacobianError(msg.str());
    }
}

NewtonSolver::State NewtonSolver::solve(const System& system, Array& x) {

    state_ = State::Initializing;
    iterations_ = 0;
    QL_REQUIRE(!x.empty(), "NewtonSolver: empty initial state");

    evaluate(system, x, residuals_, jacobian_);
    residualNorm_ = maxAbsolute(residuals_);
    if (!std::isfinite(residualNorm_)) {
        state_ = State::Diverged;
        return state_;
    }

    state_ = State::Iterating;

    while (residualNorm_ >= tolerance_) {

        if (iterations_ >= maxIterations_) {
            state_ = State::MaxIterationsExceeded;
            return state_;
        }

        checkCondition(jacobian_);
        Array step = qrSolve(jacobian_, -residuals_);

        // damped update, halve the step while the maximum residual does not decrease
        Array trial, trialResiduals;
        Matrix trialJacobian;
        Real trialNorm = std::numeric_limits<Real>::infinity();
        bool finite = false;
        for (Size h = 0; h <= maxStepHalvings_; ++h) {
            trial = x + step;
            evaluate(system, trial, trialResiduals, trialJacobian);
            trialNorm = maxAbsolute(trialResiduals);
            finite = std::isfinite(trialNorm);
            if (finite && trialNorm < residualNorm_)
                break;
            step *= 0.5;
        }

        if (!finite) {
            state_ = State::Diverged;
            return state_;
        }

        x = trial;
        residuals_ = trialResiduals;
        jacobian_ = trialJacobian;
        residualNorm_ = trialNorm;
        ++iterations_;
    }

    state_ = State::Converged;
    return state_;
}

void NewtonSolver::solveOrThrow(const System& system, Array& x) {
    State s = solve(system, x);
    if (s == State::Converged)
        return;
    std::ostringstream msg;
    msg << "Newton solver ended in state " << s << " after " << iterations_ << " iterations, max residual "
        << residualNorm_ << ", tolerance " << tolerance_;
    if (s == State::MaxIterationsExceeded)
        throw MaxIterationsExceededError(msg.str());
    throw DivergedError(msg.str());
}

} // namespace CurveExt
