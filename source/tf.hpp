#pragma once

#include <complex>

#include "LTI.hpp"
#include "types.hpp"

namespace ltikit {

/**
 * @brief SISO transfer function LTI system (continuous or discrete).
 *
 * Coefficients are stored in descending powers of s (or z). The timebase decides
 * the domain.
 */
class TransferFunction : public LTI {
   public:
    std::vector<double> num, den;

    std::vector<Pole> poles() const override;
    std::vector<Zero> zeros() const override;
    double            dcgain() const override;

    // Evaluate num(x) / den(x) at a point of the s- or z-plane
    std::complex<double> evaluate(std::complex<double> x) const;

    StateSpace discretize(double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt) const override;

    StateSpace       toStateSpace() const override;
    TransferFunction toTransferFunction() const;
    ZeroPoleGain     toZeroPoleGain() const;

    // Default constructor - creates a zero transfer function
    TransferFunction()
        : num({0.0}), den({1.0}) {}

    TransferFunction(std::vector<double> num,
                     std::vector<double> den,
                     Timebase            Ts = Timebase::continuous());

    TransferFunction(const StateSpace& ss);
    TransferFunction(const ZeroPoleGain& zpk);
};
}  // namespace ltikit
