#pragma once

#include <complex>
#include <initializer_list>

#include "Eigen/Dense"

namespace ltikit {

using Matrix = Eigen::MatrixXd;

// Roots of a characteristic or numerator polynomial
using Pole = std::complex<double>;
using Zero = std::complex<double>;

// Column vector constructible from a brace list, e.g. ColVec{x(1), -x(0)}
struct ColVec : public Eigen::VectorXd {
    using Eigen::VectorXd::VectorXd;

    ColVec(std::initializer_list<double> values)
        : Eigen::VectorXd(static_cast<Eigen::Index>(values.size())) {
        Eigen::Index i = 0;
        for (const double v : values) {
            (*this)(i++) = v;
        }
    }
};

}  // namespace ltikit

namespace Eigen::internal {

template <>
struct traits<ltikit::ColVec> : traits<Eigen::VectorXd> {};

}  // namespace Eigen::internal
