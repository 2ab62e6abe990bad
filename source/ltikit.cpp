#include "ltikit.hpp"

#include <algorithm>
#include <cmath>

#include "LTI.hpp"
#include "ss.hpp"
#include "tf.hpp"
#include "types.hpp"
#include "unsupported/Eigen/MatrixFunctions"  // IWYU pragma: keep
#include "zpk.hpp"

// Free Function Interface
namespace ltikit {

// Polynomial product (descending powers)
static std::vector<double> polymul(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> result(a.size() + b.size() - 1, 0.0);
    for (size_t i = 0; i < a.size(); ++i) {
        for (size_t j = 0; j < b.size(); ++j) {
            result[i + j] += a[i] * b[j];
        }
    }
    return result;
}

// Polynomial sum (descending powers, aligned at the constant term)
static std::vector<double> polyadd(const std::vector<double>& a, const std::vector<double>& b) {
    const size_t        n = std::max(a.size(), b.size());
    std::vector<double> result(n, 0.0);
    for (size_t i = 0; i < a.size(); ++i) {
        result[n - a.size() + i] += a[i];
    }
    for (size_t i = 0; i < b.size(); ++i) {
        result[n - b.size() + i] += b[i];
    }

    // Cancellation can leave a zero leading coefficient
    while (result.size() > 1 && result[0] == 0.0) {
        result.erase(result.begin());
    }
    return result;
}

bool issiso(const LTI& sys, bool /*strict*/) {
    return sys.ninputs() == 1 && sys.noutputs() == 1;
}

bool issiso(double /*gain*/, bool strict) {
    if (strict) {
        throw std::invalid_argument("issiso: a scalar is not a system");
    }
    return true;
}

/* Discretization */
StateSpace c2d(const StateSpace& sys, double Ts, DiscretizationMethod method, std::optional<double> prewarp) {
    const Timebase target = Timebase::discrete(Ts);

    if (isdtime(sys.Ts, true)) {
        StateSpace result = sys;
        result.Ts         = common_timebase(sys.Ts, target);
        return result;
    }

    const auto n = sys.A.rows();
    const auto m = sys.B.cols();
    const auto I = Matrix::Identity(n, n);

    switch (method) {
        case DiscretizationMethod::ZOH: {
            // exp([A B; 0 0] * Ts) = [Ad Bd; 0 I]
            Matrix M               = Matrix::Zero(n + m, n + m);
            M.block(0, 0, n, n)    = sys.A * Ts;
            M.block(0, n, n, m)    = sys.B * Ts;
            const Matrix E         = M.exp();
            return StateSpace{
                E.block(0, 0, n, n),  // A
                E.block(0, n, n, m),  // B
                sys.C,                // C
                sys.D,                // D
                target};
        }
        case DiscretizationMethod::FOH: {
            // exp([A B 0; 0 0 I/Ts; 0 0 0] * Ts) = [Phi Gamma1 Gamma2; ...]
            Matrix M            = Matrix::Zero(n + 2 * m, n + 2 * m);
            M.block(0, 0, n, n) = sys.A * Ts;
            M.block(0, n, n, m) = sys.B * Ts;
            M.block(n, n + m, m, m).setIdentity();
            const Matrix E      = M.exp();
            const Matrix Phi    = E.block(0, 0, n, n);
            const Matrix Gamma1 = E.block(0, n, n, m);
            const Matrix Gamma2 = E.block(0, n + m, n, m);
            return StateSpace{
                Phi,                               // A
                Gamma1 - Gamma2 + Phi * Gamma2,    // B
                sys.C,                             // C
                sys.D + sys.C * Gamma2,            // D
                target};
        }
        case DiscretizationMethod::Tustin:  // Fallthrough
        case DiscretizationMethod::Bilinear: {
            // Prewarping replaces 2/Ts by w / tan(w*Ts/2)
            double T = Ts;
            if (prewarp.has_value()) {
                T = 2.0 * std::tan(prewarp.value() * Ts / 2.0) / prewarp.value();
            }

            const auto   lu = (I - 0.5 * T * sys.A).partialPivLu();
            const Matrix Ad = lu.solve(I + 0.5 * T * sys.A);
            const Matrix Bd = lu.solve(T * sys.B);
            const Matrix Cd = (I - 0.5 * T * sys.A).transpose().partialPivLu().solve(sys.C.transpose()).transpose();
            return StateSpace{
                Ad,                          // A
                Bd,                          // B
                Cd,                          // C
                sys.D + 0.5 * sys.C * Bd,    // D
                target};
        }
        case DiscretizationMethod::Matched: {
            if (sys.ninputs() != 1 || sys.noutputs() != 1) {
                throw std::invalid_argument("c2d: matched discretization only works for SISO systems");
            }
            return c2d_matched(sys.toZeroPoleGain(), Ts).toStateSpace();
        }
    }
    throw std::invalid_argument("c2d: unknown discretization method");
}

TransferFunction c2d(const TransferFunction& sys, double Ts, DiscretizationMethod method, std::optional<double> prewarp) {
    if (method == DiscretizationMethod::Matched) {
        if (isdtime(sys.Ts, true)) {
            return c2d(sys.toStateSpace(), Ts, method, prewarp).toTransferFunction();
        }
        return c2d_matched(sys.toZeroPoleGain(), Ts).toTransferFunction();
    }
    return c2d(sys.toStateSpace(), Ts, method, prewarp).toTransferFunction();
}

ZeroPoleGain c2d(const ZeroPoleGain& sys, double Ts, DiscretizationMethod method, std::optional<double> prewarp) {
    if (method == DiscretizationMethod::Matched && !isdtime(sys.Ts, true)) {
        return c2d_matched(sys, Ts);
    }
    return c2d(sys.toStateSpace(), Ts, method, prewarp).toZeroPoleGain();
}

ZeroPoleGain c2d_matched(const ZeroPoleGain& sys, double Ts) {
    const Timebase target = Timebase::discrete(Ts);

    if (isdtime(sys.Ts, true)) {
        ZeroPoleGain result = sys;
        result.Ts           = common_timebase(sys.Ts, target);
        return result;
    }

    std::vector<Zero> zd;
    std::vector<Pole> pd;
    zd.reserve(sys.zeros_.size());
    pd.reserve(sys.poles_.size());
    for (const auto& z : sys.zeros_) {
        zd.push_back(std::exp(z * Ts));
    }
    for (const auto& p : sys.poles_) {
        pd.push_back(std::exp(p * Ts));
    }

    ZeroPoleGain result{std::move(zd), std::move(pd), 1.0, target};

    const double dc_continuous = sys.dcgain();
    const double dc_unit       = result.dcgain();
    if (std::isfinite(dc_continuous) && std::isfinite(dc_unit) && dc_continuous != 0.0 && dc_unit != 0.0) {
        result.gain_ = dc_continuous / dc_unit;
    } else {
        result.gain_ = sys.gain_;
    }
    return result;
}

/* Series Connections */
StateSpace series(const StateSpace& sys1, const StateSpace& sys2) {
    const Timebase Ts = common_timebase(sys1, sys2);

    if (sys1.C.rows() != sys2.B.cols()) {
        throw std::invalid_argument("series: outputs of the first system must match inputs of the second");
    }

    // Series connection: sys2 follows sys1 (sys1 -> sys2)
    // x = [x1; x2]
    // A = [A1,    0  ]    B = [B1]
    //     [B2*C1, A2 ]        [B2*D1]
    // C = [D2*C1, C2]    D = [D2*D1]
    const auto n1 = sys1.A.rows();
    const auto n2 = sys2.A.rows();
    const auto m  = sys1.B.cols();
    const auto p  = sys2.C.rows();

    Matrix A = Matrix::Zero(n1 + n2, n1 + n2);
    Matrix B = Matrix::Zero(n1 + n2, m);
    Matrix C = Matrix::Zero(p, n1 + n2);
    Matrix D = Matrix::Zero(p, m);

    A.block(0, 0, n1, n1)   = sys1.A;
    A.block(n1, 0, n2, n1)  = sys2.B * sys1.C;
    A.block(n1, n1, n2, n2) = sys2.A;

    B.block(0, 0, n1, m)  = sys1.B;
    B.block(n1, 0, n2, m) = sys2.B * sys1.D;

    C.block(0, 0, p, n1)  = sys2.D * sys1.C;
    C.block(0, n1, p, n2) = sys2.C;

    D = sys2.D * sys1.D;

    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts};
}

TransferFunction series(const TransferFunction& sys1, const TransferFunction& sys2) {
    const Timebase Ts = common_timebase(sys1, sys2);
    return TransferFunction(polymul(sys1.num, sys2.num), polymul(sys1.den, sys2.den), Ts);
}

StateSpace operator*(const StateSpace& sys1, const StateSpace& sys2) {
    return series(sys1, sys2);
}

TransferFunction operator*(const TransferFunction& sys1, const TransferFunction& sys2) {
    return series(sys1, sys2);
}

/* Parallel Connections */
StateSpace parallel(const StateSpace& sys1, const StateSpace& sys2) {
    const Timebase Ts = common_timebase(sys1, sys2);

    if (sys1.B.cols() != sys2.B.cols() || sys1.C.rows() != sys2.C.rows()) {
        throw std::invalid_argument("parallel: systems must have the same number of inputs and outputs");
    }

    // Parallel connection: outputs are added
    // x = [x1; x2]
    // A = [A1, 0 ]    B = [B1]
    //     [0,  A2]        [B2]
    // C = [C1, C2]    D = [D1 + D2]
    const auto n1 = sys1.A.rows();
    const auto n2 = sys2.A.rows();
    const auto m  = sys1.B.cols();
    const auto p  = sys1.C.rows();

    Matrix A = Matrix::Zero(n1 + n2, n1 + n2);
    Matrix B = Matrix::Zero(n1 + n2, m);
    Matrix C = Matrix::Zero(p, n1 + n2);

    A.block(0, 0, n1, n1)   = sys1.A;
    A.block(n1, n1, n2, n2) = sys2.A;

    B.block(0, 0, n1, m)  = sys1.B;
    B.block(n1, 0, n2, m) = sys2.B;

    C.block(0, 0, p, n1)  = sys1.C;
    C.block(0, n1, p, n2) = sys2.C;

    Matrix D = sys1.D + sys2.D;

    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts};
}

TransferFunction parallel(const TransferFunction& sys1, const TransferFunction& sys2) {
    const Timebase Ts = common_timebase(sys1, sys2);
    return TransferFunction(polyadd(polymul(sys1.num, sys2.den), polymul(sys2.num, sys1.den)),
                            polymul(sys1.den, sys2.den), Ts);
}

StateSpace operator+(const StateSpace& sys1, const StateSpace& sys2) {
    return parallel(sys1, sys2);
}

TransferFunction operator+(const TransferFunction& sys1, const TransferFunction& sys2) {
    return parallel(sys1, sys2);
}

StateSpace operator-(const StateSpace& sys1, const StateSpace& sys2) {
    StateSpace neg = sys2;
    neg.C          = -neg.C;
    neg.D          = -neg.D;
    return parallel(sys1, neg);
}

TransferFunction operator-(const TransferFunction& sys1, const TransferFunction& sys2) {
    TransferFunction neg = sys2;
    for (auto& c : neg.num) {
        c = -c;
    }
    return parallel(sys1, neg);
}

/* Feedback Connections */
StateSpace feedback(const StateSpace& sys_forward, const StateSpace& sys_feedback, int sign) {
    const Timebase Ts = common_timebase(sys_forward, sys_feedback);

    const StateSpace& G = sys_forward;
    const StateSpace& H = sys_feedback;

    if (H.B.cols() != G.C.rows() || H.C.rows() != G.B.cols()) {
        throw std::invalid_argument("feedback: feedback path dimensions do not match the forward path");
    }

    // Closed loop: e = r + sign*y_H, y = G(e), y_H = H(y)
    //   E = (I - sign*D_G*D_H)^-1,  F = I + sign*D_H*E*D_G
    // A_cl = [A_G + sign*B_G*D_H*E*C_G,  sign*B_G*F*C_H          ]
    //        [B_H*E*C_G,                 A_H + sign*B_H*E*D_G*C_H ]
    // B_cl = [B_G*F; B_H*E*D_G]
    // C_cl = [E*C_G,  sign*E*D_G*C_H]
    // D_cl = E*D_G
    const auto   nG = G.A.rows();
    const auto   nH = H.A.rows();
    const auto   m  = G.B.cols();
    const auto   p  = G.C.rows();
    const double s  = static_cast<double>(sign);

    const Matrix I_p = Matrix::Identity(p, p);
    const Matrix I_m = Matrix::Identity(m, m);

    const auto lu = (I_p - s * G.D * H.D).fullPivLu();
    if (!lu.isInvertible()) {
        throw std::runtime_error("feedback: algebraic loop is singular (I - sign*D_G*D_H is not invertible)");
    }
    const Matrix E = lu.inverse();
    const Matrix F = I_m + s * H.D * E * G.D;

    Matrix A_cl = Matrix::Zero(nG + nH, nG + nH);
    Matrix B_cl = Matrix::Zero(nG + nH, m);
    Matrix C_cl = Matrix::Zero(p, nG + nH);

    A_cl.block(0, 0, nG, nG)   = G.A + s * G.B * H.D * E * G.C;
    A_cl.block(0, nG, nG, nH)  = s * G.B * F * H.C;
    A_cl.block(nG, 0, nH, nG)  = H.B * E * G.C;
    A_cl.block(nG, nG, nH, nH) = H.A + s * H.B * E * G.D * H.C;

    B_cl.block(0, 0, nG, m)  = G.B * F;
    B_cl.block(nG, 0, nH, m) = H.B * E * G.D;

    C_cl.block(0, 0, p, nG)  = E * G.C;
    C_cl.block(0, nG, p, nH) = s * E * G.D * H.C;

    Matrix D_cl = E * G.D;

    return StateSpace{std::move(A_cl), std::move(B_cl), std::move(C_cl), std::move(D_cl), Ts};
}

TransferFunction feedback(const TransferFunction& sys_forward, const TransferFunction& sys_feedback, int sign) {
    const Timebase Ts = common_timebase(sys_forward, sys_feedback);

    // G / (1 - sign*G*H) = nG*dH / (dG*dH - sign*nG*nH)
    std::vector<double> loop = polymul(sys_forward.num, sys_feedback.num);
    for (auto& c : loop) {
        c *= -static_cast<double>(sign);
    }
    return TransferFunction(polymul(sys_forward.num, sys_feedback.den),
                            polyadd(polymul(sys_forward.den, sys_feedback.den), loop), Ts);
}

StateSpace operator/(const StateSpace& sys_forward, const StateSpace& sys_feedback) {
    return feedback(sys_forward, sys_feedback, -1);
}

TransferFunction operator/(const TransferFunction& sys_forward, const TransferFunction& sys_feedback) {
    return feedback(sys_forward, sys_feedback, -1);
}

}  // namespace ltikit
