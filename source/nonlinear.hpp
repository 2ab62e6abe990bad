#pragma once

#include <functional>

#include "ss.hpp"
#include "timebase.hpp"
#include "types.hpp"

namespace ltikit {

/**
 * @brief Compute numerical Jacobian using forward finite differences
 *
 * @param func Function to differentiate: ColVec func(ColVec)
 * @param x    Point at which to compute the Jacobian
 * @param eps  Finite difference step size
 * @return Matrix Jacobian matrix (m x n) where m = func(x).size(), n = x.size()
 */
template <typename Func>
Matrix numericalJacobian(Func&& func, const ColVec& x, double eps = 1e-8) {
    const ColVec f0 = func(x);
    const auto   n  = x.size();
    const auto   m  = f0.size();

    Matrix J(m, n);
    for (Eigen::Index j = 0; j < n; ++j) {
        ColVec x_plus = x;
        x_plus(j) += eps;
        const ColVec f_plus = func(x_plus);
        J.col(j)            = (f_plus - f0) / eps;
    }

    return J;
}

/**
 * @brief Representation of a nonlinear system
 *
 * x' = f(x, u)
 * y  = h(x, u)
 *
 * where x' is dx/dt or x[k+1] depending on the timebase.
 */
class NonlinearSystem {
   public:
    using StateTransitionFcn = std::function<ColVec(const ColVec& x, const ColVec& u)>;
    using MeasurementFcn     = std::function<ColVec(const ColVec& x, const ColVec& u)>;

    NonlinearSystem(StateTransitionFcn f, MeasurementFcn h, size_t nx, size_t nu, size_t ny, Timebase Ts = Timebase::continuous())
        : Ts(Ts), f_(std::move(f)), h_(std::move(h)), nx_(nx), nu_(nu), ny_(ny) {}

    // Linearize around operating point; the result shares this system's timebase
    StateSpace linearize(const ColVec& x0, const ColVec& u0) const;

    size_t getNumStates() const { return nx_; }
    size_t getNumInputs() const { return nu_; }
    size_t getNumOutputs() const { return ny_; }

    Timebase Ts;

   private:
    StateTransitionFcn f_;
    MeasurementFcn     h_;
    size_t             nx_, nu_, ny_;
};

}  // namespace ltikit
