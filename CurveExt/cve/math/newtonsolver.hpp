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

/*! \file cve/math/newtonsolver.hpp
    \brief Multi-dimensional damped Newton root finder
    \ingroup math
*/

#ifndef curveext_newtonsolver_hpp
#define curveext_newtonsolver_hpp

#include <ql/math/array.hpp>
#include <ql/math/matrix.hpp>

#include <functional>
#include <ostream>

namespace CurveExt {
using QuantLib::Array;
using QuantLib::Matrix;
using QuantLib::Real;
using QuantLib::Size;

//! Damped Newton solver for square systems \f$ r(x) = 0 \f$
/*! Each iteration evaluates the residuals and the Jacobian at the current state, checks the
    condition number of the Jacobian (SVD), solves \f$ J \Delta = -r \f$ by a QR decomposition
    and updates the state. If the full step does not reduce the maximum absolute residual, the
    step is halved up to maxStepHalvings times. If no finite residual can be reached the solver
    ends in state Diverged, if the residual does not decrease the last halved step is taken and
    the iteration continues.

    The solver converges when the maximum absolute residual is below the tolerance, the
    Jacobian from the converged state is kept. The iteration is serial and does not depend on
    any unordered container, so identical inputs give bit-identical results.

    A singular or ill-conditioned Jacobian raises a SingularJacobianError, non-convergence and
    divergence are reported through the final state and also raised by solveOrThrow().

    \ingroup math
*/
class NewtonSolver {
public:
    enum class State { Initializing, Iterating, Converged, Diverged, MaxIterationsExceeded };

    //! evaluates the residuals and the Jacobian (rows = residuals, columns = state variables) at x
    typedef std::function<void(const Array& x, Array& residuals, Matrix& jacobian)> System;

    NewtonSolver(Real tolerance = 1.0e-12, Size maxIterations = 100, Real maxConditionNumber = 1.0e12,
                 Size maxStepHalvings = 10);

    /*! runs the iteration starting from x, on return x holds the last state; the returned state
        is Converged, Diverged or MaxIterationsExceeded */
    State solve(const System& system, Array& x);

    //! as solve(), but raises MaxIterationsExceededError or DivergedError unless converged
    void solveOrThrow(const System& system, Array& x);

    //! \name Inspectors
    //@{
    State state() const { return state_; }
    //! number of Newton updates performed
    Size iterations() const { return iterations_; }
    //! maximum absolute residual at the last evaluated state
    Real residualNorm() const { return residualNorm_; }
    const Array& residuals() const { return residuals_; }
    //! Jacobian at the last state, for a converged solve the Jacobian at the solution
    const Matrix& jacobian() const { return jacobian_; }
    Real tolerance() const { return tolerance_; }
    Size maxIterations() const { return maxIterations_; }
    //@}

private:
    void evaluate(const System& system, const Array& x, Array& residuals, Matrix& jacobian) const;
    void checkCondition(const Matrix& jacobian) const;

    Real tolerance_;
    Size maxIterations_;
    Real maxConditionNumber_;
    Size maxStepHalvings_;

    State state_;
    Size iterations_;
    Real residualNorm_;
    Array residuals_;
    Matrix jacobian_;
};

std::ostream& operator<<(std::ostream& out, NewtonSolver::State s);

//! maximum absolute entry, infinity if any entry is not finite
Real maxAbsolute(const Array& a);

} // namespace CurveExt

#endif
