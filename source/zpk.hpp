#pragma once

#include "LTI.hpp"
#include "types.hpp"

namespace ltikit {

/**
 * @brief SISO system in factored form: G = k * prod(x - z_i) / prod(x - p_i).
 */
class ZeroPoleGain : public LTI {
   public:
    std::vector<Zero> zeros_;
    std::vector<Pole> poles_;
    double            gain_;

    std::vector<Pole> poles() const override { return poles_; };
    std::vector<Zero> zeros() const override { return zeros_; };
    double            gain() const { return gain_; }
    double            dcgain() const override;

    StateSpace discretize(double                Ts,
                          DiscretizationMethod  method  = DiscretizationMethod::ZOH,
                          std::optional<double> prewarp = std::nullopt) const override;

    StateSpace       toStateSpace() const override;
    TransferFunction toTransferFunction() const;
    ZeroPoleGain     toZeroPoleGain() const;

    ZeroPoleGain(const StateSpace& ss);
    ZeroPoleGain(const TransferFunction& tf);

    ZeroPoleGain(std::vector<Zero> zeros,
                 std::vector<Pole> poles,
                 double            gain,
                 Timebase          Ts = Timebase::continuous())
        : zeros_(std::move(zeros)), poles_(std::move(poles)), gain_(gain) {
        this->Ts = Ts;
    }
};

}  // namespace ltikit
