#pragma once

#include <stdexcept>
#include <vector>

#include "timebase.hpp"
#include "types.hpp"

namespace ltikit {

struct DampingInfo {
    std::vector<double> naturalFrequency;  // Natural frequency (rad/s) per pole
    std::vector<double> dampingRatio;      // Damping ratio per pole
    std::vector<Pole>   poles;             // Poles as given, in the model's own domain
};

/**
 * @brief Raised when a spectral quantity is undefined for the given pole.
 */
class DomainError : public std::domain_error {
   public:
    using std::domain_error::domain_error;
};

/**
 * @brief Map a pole to its continuous-time (s-plane) equivalent.
 *
 * Continuous and unspecified timebases return the pole unchanged. A discrete pole z
 * with sample period T maps to log(z) / T using the principal branch; a discrete
 * timebase without a fixed period uses T = 1.
 *
 * @throws DomainError if a discrete pole is exactly zero
 */
Pole splane_pole(const Pole& p, const Timebase& Ts);

/**
 * @brief Natural frequency and damping ratio of every pole.
 *
 * Output order and multiplicity follow the input exactly. A pole at the origin has
 * zero natural frequency and unit damping.
 *
 * @throws DomainError if a discrete pole is exactly zero
 */
DampingInfo damp(const std::vector<Pole>& poles, const Timebase& Ts);

/**
 * @brief Evaluation point for the DC gain: s = 0 for continuous, z = 1 for discrete.
 */
std::complex<double> dc_point(const Timebase& Ts);

/**
 * @brief Poles strictly in the left half plane (continuous) or inside the unit circle (discrete).
 */
bool is_stable(const std::vector<Pole>& poles, const Timebase& Ts);

}  // namespace ltikit
