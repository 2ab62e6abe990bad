#include "nonlinear.hpp"

#include <stdexcept>

#include "fmt/core.h"
#include "ss.hpp"
#include "types.hpp"

namespace ltikit {

StateSpace NonlinearSystem::linearize(const ColVec& x0, const ColVec& u0) const {
    if (static_cast<size_t>(x0.size()) != nx_ || static_cast<size_t>(u0.size()) != nu_) {
        throw std::invalid_argument(fmt::format("NonlinearSystem: operating point has {} states and {} inputs, expected {} and {}",
                                                x0.size(), u0.size(), nx_, nu_));
    }

    auto   f_x = [&](const ColVec& x) { return f_(x, u0); };
    Matrix A   = numericalJacobian(f_x, x0);

    auto   f_u = [&](const ColVec& u) { return f_(x0, u); };
    Matrix B   = numericalJacobian(f_u, u0);

    auto   h_x = [&](const ColVec& x) { return h_(x, u0); };
    Matrix C   = numericalJacobian(h_x, x0);

    auto   h_u = [&](const ColVec& u) { return h_(x0, u); };
    Matrix D   = numericalJacobian(h_u, u0);

    return StateSpace(std::move(A), std::move(B), std::move(C), std::move(D), Ts);
}

}  // namespace ltikit
