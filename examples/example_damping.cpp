#include "fmt/core.h"

#include "ltikit.hpp"

using namespace ltikit;

namespace {

void printDamping(const char* title, const LTI& sys) {
    const auto info = damp(sys);

    fmt::print("{} ({})\n", title, sys.Ts);
    fmt::print("   {:>24} {:>12} {:>12}\n", "pole", "wn (rad/s)", "zeta");
    for (size_t i = 0; i < info.poles.size(); ++i) {
        fmt::print("   {:>11.6f} {:+11.6f}j {:>12.4f} {:>12.4f}\n",
                   info.poles[i].real(), info.poles[i].imag(), info.naturalFrequency[i], info.dampingRatio[i]);
    }
    fmt::print("   DC gain: {:.4f}, stable: {}\n\n", dcgain(sys), is_stable(sys));
}

}  // namespace

int main() {
    fmt::print("=== Damping of Continuous and Discrete Models ===\n\n");

    // G(s) = wn^2 / (s^2 + 2*zeta*wn*s + wn^2) with zeta = 0.1, wn = 42
    const double wn   = 42.0;
    const double zeta = 0.1;
    const auto   sysc = tf({wn * wn}, {1.0, 2.0 * zeta * wn, wn * wn});
    printDamping("Continuous second-order system", sysc);

    // The same system discretized three ways; damping is computed in the s-plane
    const double dt = 0.001;
    printDamping("Matched pole-zero", c2d(sysc, dt, DiscretizationMethod::Matched));
    printDamping("Zero-order hold", c2d(sysc, dt, DiscretizationMethod::ZOH));
    printDamping("Tustin", c2d(sysc, dt, DiscretizationMethod::Tustin));

    // A discrete pole at the origin has no continuous-time equivalent
    const auto delay = tf({1.0}, {1.0, 0.0}, dt);
    try {
        printDamping("Pure delay", delay);
    } catch (const DomainError& e) {
        fmt::print("Pure delay: {}\n", e.what());
    }

    return 0;
}
