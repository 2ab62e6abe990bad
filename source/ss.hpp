#pragma once

#include "LTI.hpp"
#include "types.hpp"

namespace ltikit {

/**
 * @brief State-space LTI system (continuous or discrete, MIMO).
 *
 * x' = A*x + B*u, y = C*x + D*u, where x' is dx/dt or x[k+1] depending on the timebase.
 */
class StateSpace : public LTI {
   public:
    Matrix A = {}, B = {}, C = {}, D = {};

    size_t ninputs() const override { return static_cast<size_t>(B.cols()); }
    size_t noutputs() const override { return static_cast<size_t>(C.rows()); }

    StateSpace discretize(double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt) const override;

    std::vector<Pole> poles() const override;
    std::vector<Zero> zeros() const override;

    /**
     * @brief  Steady-state gain of a SISO system.
     *
     * @throws std::invalid_argument for MIMO systems; use dcgainMatrix()
     */
    double dcgain() const override;

    /**
     * @brief  Steady-state gain matrix (outputs x inputs).
     *
     * D - C*A^-1*B for continuous systems, D + C*(I - A)^-1*B for discrete systems.
     *
     * @throws std::runtime_error if the system has a pole at the DC point
     */
    Matrix dcgainMatrix() const;

    StateSpace       toStateSpace() const override;
    TransferFunction toTransferFunction(int output_idx = 0, int input_idx = 0) const;
    ZeroPoleGain     toZeroPoleGain() const;

    StateSpace() = default;
    StateSpace(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D, Timebase Ts = Timebase::continuous());
    StateSpace(Matrix&& A, Matrix&& B, Matrix&& C, Matrix&& D, Timebase Ts = Timebase::continuous());

    StateSpace(const TransferFunction& tf);
    StateSpace(const ZeroPoleGain& zpk);

    bool operator==(const StateSpace& other) const {
        return A.isApprox(other.A) && B.isApprox(other.B) &&
               C.isApprox(other.C) && D.isApprox(other.D) && Ts == other.Ts;
    }
};

}  // namespace ltikit
