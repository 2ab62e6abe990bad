#include "tf.hpp"

#include <cmath>

#include "LTI.hpp"
#include "ss.hpp"
#include "types.hpp"
#include "zpk.hpp"

namespace ltikit {

static void validateTransferFunctionVectors(const std::vector<double>& num, const std::vector<double>& den) {
    if (den.empty() || std::abs(den[0]) < 1e-15) {
        throw std::invalid_argument("TransferFunction: Denominator must have nonzero leading coefficient");
    }
    if (num.empty()) {
        throw std::invalid_argument("TransferFunction: Numerator must not be empty");
    }
}

// Roots of a polynomial given in descending powers
static std::vector<std::complex<double>> roots(const std::vector<double>& coeffs) {
    const int n = static_cast<int>(coeffs.size()) - 1;

    if (n <= 0) {
        return {};
    }

    // First order: solved directly so the root is exact
    if (n == 1) {
        return {std::complex<double>(-coeffs[1] / coeffs[0], 0.0)};
    }

    // Companion matrix of a_0*x^n + a_1*x^(n-1) + ... + a_n:
    // [  -a_1/a_0   -a_2/a_0  ...  -a_n/a_0 ]
    // [    1          0       ...     0     ]
    // [   ...                               ]
    // [    0          0       ...     1   0 ]
    Matrix companion = Matrix::Zero(n, n);
    for (int i = 0; i < n; ++i) {
        companion(0, i) = -coeffs[i + 1] / coeffs[0];
    }
    for (int i = 1; i < n; ++i) {
        companion(i, i - 1) = 1.0;
    }

    const Eigen::VectorXcd eigenvalues = companion.eigenvalues();
    return std::vector<std::complex<double>>(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());
}

TransferFunction::TransferFunction(std::vector<double> num,
                                   std::vector<double> den,
                                   Timebase            Ts)
    : num(std::move(num)), den(std::move(den)) {
    validateTransferFunctionVectors(this->num, this->den);

    // Drop leading zeros from the numerator (but keep at least one coefficient)
    while (this->num.size() > 1 && this->num[0] == 0.0) {
        this->num.erase(this->num.begin());
    }
    this->Ts = Ts;
}

TransferFunction::TransferFunction(const StateSpace& ss)
    : TransferFunction(ss.toTransferFunction()) {}

TransferFunction::TransferFunction(const ZeroPoleGain& zpk)
    : TransferFunction(zpk.toTransferFunction()) {}

// Convert to StateSpace in controllable canonical form
StateSpace TransferFunction::toStateSpace() const {
    const int n = static_cast<int>(den.size()) - 1;  // Order of the system
    const int m = static_cast<int>(num.size()) - 1;  // Order of the numerator

    if (m > n) {
        throw std::invalid_argument("TransferFunction: improper transfer function has no state-space realization");
    }

    // Normalize by the leading denominator coefficient and left-pad the numerator to n + 1 terms
    const double        den_lead = den[0];
    std::vector<double> a(den.size());
    std::vector<double> b(n + 1, 0.0);
    for (int i = 0; i <= n; ++i) {
        a[i] = den[i] / den_lead;
    }
    for (int i = 0; i <= m; ++i) {
        b[n - m + i] = num[i] / den_lead;
    }

    // Pure gain (no dynamics)
    if (n == 0) {
        return StateSpace{Matrix::Zero(0, 0), Matrix::Zero(0, 1), Matrix::Zero(1, 0),
                          Matrix::Constant(1, 1, b[0]), Ts};
    }

    Matrix A = Matrix::Zero(n, n);
    Matrix B = Matrix::Zero(n, 1);
    Matrix C = Matrix::Zero(1, n);
    Matrix D = Matrix::Constant(1, 1, b[0]);

    for (int i = 0; i < n - 1; ++i) {
        A(i, i + 1) = 1.0;
    }
    for (int i = 0; i < n; ++i) {
        A(n - 1, i) = -a[n - i];
    }
    B(n - 1, 0) = 1.0;

    // C(i) multiplies s^i of the strictly proper remainder num - D*den
    for (int i = 0; i < n; ++i) {
        C(0, i) = b[n - i] - D(0, 0) * a[n - i];
    }

    return StateSpace{std::move(A), std::move(B), std::move(C), std::move(D), Ts};
}

std::vector<Pole> TransferFunction::poles() const {
    return roots(den);
}

std::vector<Zero> TransferFunction::zeros() const {
    if (num.size() == 1) {
        return {};
    }
    return roots(num);
}

std::complex<double> TransferFunction::evaluate(std::complex<double> x) const {
    // Horner's method
    std::complex<double> num_val = num[0];
    for (size_t k = 1; k < num.size(); ++k) {
        num_val = num_val * x + num[k];
    }

    std::complex<double> den_val = den[0];
    for (size_t k = 1; k < den.size(); ++k) {
        den_val = den_val * x + den[k];
    }

    return num_val / den_val;
}

double TransferFunction::dcgain() const {
    return evaluate(dc_point(Ts)).real();
}

StateSpace TransferFunction::discretize(double Ts, DiscretizationMethod method, std::optional<double> prewarp) const {
    return toStateSpace().discretize(Ts, method, prewarp);
}

TransferFunction TransferFunction::toTransferFunction() const {
    return *this;
}

ZeroPoleGain TransferFunction::toZeroPoleGain() const {
    // Gain is the ratio of leading coefficients once the denominator is monic
    const double gain = num[0] / den[0];
    return ZeroPoleGain(zeros(), poles(), gain, Ts);
}
}  // namespace ltikit
