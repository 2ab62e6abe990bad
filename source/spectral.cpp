#include "spectral.hpp"

#include <cmath>

namespace ltikit {

Pole splane_pole(const Pole& p, const Timebase& Ts) {
    if (!isdtime(Ts, true)) {
        return p;
    }

    if (p == Pole(0.0, 0.0)) {
        throw DomainError("damp: discrete-time pole at z = 0 has no continuous-time equivalent");
    }

    const double T = Ts.period().value_or(1.0);
    return std::log(p) / T;
}

DampingInfo damp(const std::vector<Pole>& poles, const Timebase& Ts) {
    DampingInfo info;
    info.naturalFrequency.reserve(poles.size());
    info.dampingRatio.reserve(poles.size());
    info.poles = poles;

    for (const auto& p : poles) {
        const Pole   s  = splane_pole(p, Ts);
        const double wn = std::abs(s);
        if (wn == 0.0) {
            info.naturalFrequency.push_back(0.0);
            info.dampingRatio.push_back(1.0);
        } else {
            info.naturalFrequency.push_back(wn);
            // + 0.0 turns a -0.0 ratio (pole on the imaginary axis) into +0.0
            info.dampingRatio.push_back(-s.real() / wn + 0.0);
        }
    }
    return info;
}

std::complex<double> dc_point(const Timebase& Ts) {
    return isdtime(Ts, true) ? std::complex<double>(1.0, 0.0) : std::complex<double>(0.0, 0.0);
}

bool is_stable(const std::vector<Pole>& poles, const Timebase& Ts) {
    if (isdtime(Ts, true)) {
        // Discrete: unstable if any |pole| >= 1
        for (const auto& p : poles) {
            if (std::abs(p) >= 1.0) {
                return false;
            }
        }
    } else {
        // Continuous: unstable if any Re(pole) >= 0
        for (const auto& p : poles) {
            if (p.real() >= 0.0) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace ltikit
