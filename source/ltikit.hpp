#pragma once

#include <stdexcept>

#include "LTI.hpp"              // IWYU pragma: keep
#include "diagnostics.hpp"      // IWYU pragma: keep
#include "format.hpp"           // IWYU pragma: keep
#include "nonlinear.hpp"        // IWYU pragma: keep
#include "spectral.hpp"         // IWYU pragma: keep
#include "ss.hpp"               // IWYU pragma: keep
#include "tf.hpp"               // IWYU pragma: keep
#include "timebase.hpp"         // IWYU pragma: keep
#include "timebase_legacy.hpp"  // IWYU pragma: keep
#include "types.hpp"            // IWYU pragma: keep
#include "zpk.hpp"              // IWYU pragma: keep

// Free functions for creating LTI systems and performing operations
namespace ltikit {

template <class T>
concept SSConvertible = requires(const T& t) { { t.toStateSpace() }; };

template <class T>
concept TFConvertible = requires(const T& t) { { t.toTransferFunction() }; };

template <class T>
concept ZPKConvertible = requires(const T& t) { { t.toZeroPoleGain() }; };

template <SSConvertible T>
StateSpace ss(const T& sys) {
    return sys.toStateSpace();
}

template <TFConvertible T>
TransferFunction tf(const T& sys) {
    return sys.toTransferFunction();
}

// Handle MIMO case with specified input/output indices
inline TransferFunction tf(const StateSpace& sys, int output_idx, int input_idx) {
    return sys.toTransferFunction(output_idx, input_idx);
}

inline TransferFunction tf(std::vector<double> num, std::vector<double> den, Timebase Ts = Timebase::continuous()) {
    return TransferFunction{std::move(num), std::move(den), Ts};
}

inline StateSpace tf2ss(std::vector<double> num, std::vector<double> den, Timebase Ts = Timebase::continuous()) {
    return TransferFunction{std::move(num), std::move(den), Ts}.toStateSpace();
}

inline TransferFunction ss2tf(Matrix A, Matrix B, Matrix C, Matrix D, Timebase Ts = Timebase::continuous()) {
    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts}.toTransferFunction();
}

template <ZPKConvertible T>
ZeroPoleGain zpk(const T& sys) {
    return sys.toZeroPoleGain();
}

inline ZeroPoleGain zpk(const std::vector<Zero>& zeros,
                        const std::vector<Pole>& poles,
                        double                   gain,
                        Timebase                 Ts = Timebase::continuous()) {
    return ZeroPoleGain{zeros, poles, gain, Ts};
}

// ============================================================================
// Spectral characterization
// ============================================================================

inline std::vector<Pole> poles(const LTI& sys) {
    return sys.poles();
}

inline std::vector<Zero> zeros(const LTI& sys) {
    return sys.zeros();
}

inline DampingInfo damp(const LTI& sys) {
    return sys.damp();
}

inline double dcgain(const LTI& sys) {
    return sys.dcgain();
}

inline bool is_stable(const LTI& sys) {
    return sys.is_stable();
}

/**
 * @brief Check whether a system has a single input and a single output.
 *
 * A plain scalar counts as SISO unless strict is set, in which case it is
 * rejected because it is not a system at all.
 *
 * @throws std::invalid_argument for a scalar in strict mode
 */
bool issiso(const LTI& sys, bool strict = false);
bool issiso(double gain, bool strict = false);

// ============================================================================
// Discretization
// ============================================================================

/**
 * @brief Convert a continuous-time LTI system to discrete-time using specified method.
 *
 * A system with an unspecified timebase is treated as continuous. A system that is
 * already discrete is returned unchanged (with its period fixed to Ts) when its
 * timebase reconciles with a Ts sample period.
 *
 * @param sys           Continuous-time LTI system
 * @param Ts            Sampling time (> 0)
 * @param method        Discretization method (default: ZOH)
 * @param prewarp       Optional pre-warp frequency (rad/s) for Tustin method
 *
 * @throws IncompatibleTimebase if sys is discrete with a different sample period
 */
StateSpace       c2d(const StateSpace& sys, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt);
TransferFunction c2d(const TransferFunction& sys, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt);
ZeroPoleGain     c2d(const ZeroPoleGain& sys, double Ts, DiscretizationMethod method = DiscretizationMethod::ZOH, std::optional<double> prewarp = std::nullopt);

/**
 * @brief Pole-zero matched discretization: every pole and finite zero s maps to exp(s*Ts).
 *
 * The gain is chosen so both models have the same DC gain when it is finite and
 * nonzero; otherwise the continuous gain is kept.
 */
ZeroPoleGain c2d_matched(const ZeroPoleGain& sys, double Ts);

// ============================================================================
// LTI System Interconnections
// ============================================================================
// Every interconnection reconciles the operand timebases with common_timebase()
// first; the result carries the reconciled timebase.
//
//   auto open_loop    = controller * plant;          // Series connection
//   auto parallel_sys = sys1 + sys2;                 // Parallel (sum)
//   auto error_sys    = reference - measurement;     // Parallel (difference)
//   auto closed_loop  = feedback(fwd_path, fb_path); // Negative feedback
//   auto closed_loop  = fwd_path / fb_path;          // Negative feedback (same as above)
// ============================================================================

// Type-preserving series connections
StateSpace       series(const StateSpace& sys1, const StateSpace& sys2);
TransferFunction series(const TransferFunction& sys1, const TransferFunction& sys2);

// Type-preserving parallel connections
StateSpace       parallel(const StateSpace& sys1, const StateSpace& sys2);
TransferFunction parallel(const TransferFunction& sys1, const TransferFunction& sys2);

// Type-preserving feedback connections
StateSpace       feedback(const StateSpace& sys_forward, const StateSpace& sys_feedback, int sign = -1);
TransferFunction feedback(const TransferFunction& sys_forward, const TransferFunction& sys_feedback, int sign = -1);

// LTI operations on mixed types always return StateSpace representation
template <SSConvertible A, SSConvertible B>
StateSpace series(const A& a, const B& b) {
    return series(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace parallel(const A& a, const B& b) {
    return parallel(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace feedback(const A& a, const B& b, int sign = -1) {
    return feedback(a.toStateSpace(), b.toStateSpace(), sign);
}

template <SSConvertible A, SSConvertible B>
StateSpace operator*(const A& a, const B& b) {
    return series(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace operator+(const A& a, const B& b) {
    return parallel(a.toStateSpace(), b.toStateSpace());
}

template <SSConvertible A, SSConvertible B>
StateSpace operator-(const A& a, const B& b) {
    StateSpace neg_b = b.toStateSpace();
    neg_b.C          = -neg_b.C;
    neg_b.D          = -neg_b.D;

    return parallel(a.toStateSpace(), neg_b);
}

template <SSConvertible A, SSConvertible B>
StateSpace operator/(const A& a, const B& b) {
    return feedback(a.toStateSpace(), b.toStateSpace(), -1);
}

StateSpace       operator*(const StateSpace& sys1, const StateSpace& sys2);
TransferFunction operator*(const TransferFunction& sys1, const TransferFunction& sys2);

StateSpace       operator+(const StateSpace& sys1, const StateSpace& sys2);
TransferFunction operator+(const TransferFunction& sys1, const TransferFunction& sys2);

StateSpace       operator-(const StateSpace& sys1, const StateSpace& sys2);
TransferFunction operator-(const TransferFunction& sys1, const TransferFunction& sys2);

StateSpace       operator/(const StateSpace& sys_forward, const StateSpace& sys_feedback);
TransferFunction operator/(const TransferFunction& sys_forward, const TransferFunction& sys_feedback);

}  // namespace ltikit
