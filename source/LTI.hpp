#pragma once

#include <optional>
#include <vector>

#include "spectral.hpp"
#include "timebase.hpp"
#include "types.hpp"

namespace ltikit {

// Forward declarations
class StateSpace;
class TransferFunction;
class ZeroPoleGain;

enum class DiscretizationMethod {
    ZOH,
    FOH,
    Bilinear,
    Tustin,
    Matched,
};

enum class SystemType {
    Continuous,
    Discrete,
};

/**
 * @brief Abstract base class for all LTI systems (Linear Time-Invariant).
 *
 * Provides a common interface for transfer functions, zero-pole-gain models and
 * state-space representations. The timebase decides whether the model is
 * continuous, discrete or not yet committed to either domain.
 */
class LTI {
   public:
    virtual ~LTI() = default;

    virtual size_t ninputs() const { return 1; }
    virtual size_t noutputs() const { return 1; }

    /**
     * @brief  Compute damping information of the system.
     *
     * Discrete-time poles are mapped to the s-plane before computing frequency
     * and damping.
     *
     * @return DampingInfo  Natural frequency, damping ratio and pole per mode
     */
    virtual DampingInfo damp() const;

    /**
     * @brief  Steady-state gain of a SISO system.
     *
     * Evaluates the system at s = 0 (continuous) or z = 1 (discrete).
     */
    virtual double dcgain() const;

    /**
     * @brief  Check if the system is stable.
     *
     * A system is stable if all poles have negative real parts (continuous) or lie inside the unit circle (discrete).
     */
    virtual bool is_stable() const;

    /**
     * @brief  Get the complex poles of the system.
     */
    virtual std::vector<Pole> poles() const;

    /**
     * @brief  Get the complex zeros of the system.
     */
    virtual std::vector<Zero> zeros() const;

    /**
     * @brief  Discretize the LTI system
     *
     * @param Ts            Sampling time
     * @param method        Discretization method (ZOH, FOH, Bilinear, Tustin, Matched)
     * @param prewarp       Prewarp frequency for bilinear/Tustin method (optional)
     * @return StateSpace   Discretized StateSpace system
     */
    virtual StateSpace discretize(double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt) const;

    /**
     * @brief  Get the System Type object (Continuous or Discrete)
     *
     * An unspecified timebase reports Continuous.
     */
    SystemType systemType() const { return isdtime(Ts, true) ? SystemType::Discrete : SystemType::Continuous; }

    virtual StateSpace toStateSpace() const = 0;

    bool isDiscrete(bool strict = false) const { return isdtime(Ts, strict); }
    bool isContinuous(bool strict = false) const { return isctime(Ts, strict); }

    Timebase Ts = {};  // Sampling timebase; continuous unless set
};

}  // namespace ltikit
