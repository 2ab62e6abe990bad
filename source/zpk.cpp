#include "zpk.hpp"

#include "LTI.hpp"
#include "ss.hpp"
#include "tf.hpp"
#include "types.hpp"

namespace ltikit {

ZeroPoleGain::ZeroPoleGain(const StateSpace& ss)
    : ZeroPoleGain(ss.toZeroPoleGain()) {}

ZeroPoleGain::ZeroPoleGain(const TransferFunction& tf)
    : ZeroPoleGain(tf.toZeroPoleGain()) {}

double ZeroPoleGain::dcgain() const {
    const std::complex<double> x = dc_point(Ts);

    std::complex<double> value = gain_;
    for (const auto& z : zeros_) {
        value *= (x - z);
    }
    for (const auto& p : poles_) {
        value /= (x - p);
    }
    return value.real();
}

// Build state-space from zeros, poles, and gain
StateSpace ZeroPoleGain::toStateSpace() const {
    return this->toTransferFunction().toStateSpace();
}

// Convert to TransferFunction
TransferFunction ZeroPoleGain::toTransferFunction() const {
    // G(s) = K * (s - z1)(s - z2)... / (s - p1)(s - p2)...
    auto expand_poly = [](const std::vector<std::complex<double>>& roots) -> std::vector<double> {
        std::vector<std::complex<double>> coeffs = {1.0};

        for (const auto& root : roots) {
            std::vector<std::complex<double>> new_coeffs(coeffs.size() + 1, 0.0);
            for (size_t i = 0; i < coeffs.size(); ++i) {
                new_coeffs[i] += coeffs[i];
                new_coeffs[i + 1] -= coeffs[i] * root;
            }
            coeffs = std::move(new_coeffs);
        }

        // Conjugate pairs leave only rounding noise in the imaginary parts
        std::vector<double> real_coeffs;
        real_coeffs.reserve(coeffs.size());
        for (const auto& c : coeffs) {
            real_coeffs.push_back(c.real());
        }
        return real_coeffs;
    };

    std::vector<double> num_coeffs = expand_poly(zeros_);
    std::vector<double> den_coeffs = expand_poly(poles_);

    for (auto& c : num_coeffs) {
        c *= gain_;
    }

    return TransferFunction(std::move(num_coeffs), std::move(den_coeffs), Ts);
}

StateSpace ZeroPoleGain::discretize(double                Ts,
                                    DiscretizationMethod  method,
                                    std::optional<double> prewarp) const {
    return toStateSpace().discretize(Ts, method, prewarp);
}

ZeroPoleGain ZeroPoleGain::toZeroPoleGain() const {
    return *this;
}

}  // namespace ltikit
