#include "ss.hpp"

#include <cmath>
#include <string>

#include "LTI.hpp"
#include "ltikit.hpp"
#include "tf.hpp"
#include "types.hpp"
#include "zpk.hpp"

namespace ltikit {

static void validateStateSpaceMatrices(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D) {
    if (A.rows() != A.cols()) {
        throw std::invalid_argument("StateSpace: A must be square");
    }
    if (B.rows() != A.rows()) {
        throw std::invalid_argument("StateSpace: B.rows() must match A.rows()");
    }
    if (C.cols() != A.cols()) {
        throw std::invalid_argument("StateSpace: C.cols() must match A.cols()");
    }
    if (D.rows() != C.rows() || D.cols() != B.cols()) {
        throw std::invalid_argument("StateSpace: D shape must be (C.rows(), B.cols())");
    }
}

StateSpace::StateSpace(const Matrix& A, const Matrix& B, const Matrix& C, const Matrix& D, Timebase Ts)
    : A(A), B(B), C(C), D(D) {
    validateStateSpaceMatrices(A, B, C, D);
    this->Ts = Ts;
}

StateSpace::StateSpace(Matrix&& A, Matrix&& B, Matrix&& C, Matrix&& D, Timebase Ts)
    : A(std::move(A)), B(std::move(B)), C(std::move(C)), D(std::move(D)) {
    validateStateSpaceMatrices(this->A, this->B, this->C, this->D);
    this->Ts = Ts;
}

StateSpace::StateSpace(const TransferFunction& tf)
    : StateSpace(tf.toStateSpace()) {}

StateSpace::StateSpace(const ZeroPoleGain& zpk)
    : StateSpace(zpk.toStateSpace()) {}

std::vector<Pole> StateSpace::poles() const {
    const Eigen::VectorXcd eigenvalues = A.eigenvalues();
    return std::vector<Pole>(eigenvalues.data(), eigenvalues.data() + eigenvalues.size());
}

std::vector<Zero> StateSpace::zeros() const {
    // Zeros are the roots of the numerator of the transfer function
    if (B.cols() != 1 || C.rows() != 1) {
        throw std::invalid_argument("zeros() only works for SISO systems");
    }
    return toTransferFunction().zeros();
}

double StateSpace::dcgain() const {
    if (B.cols() != 1 || C.rows() != 1) {
        throw std::invalid_argument("dcgain() only works for SISO systems; use dcgainMatrix()");
    }
    return toTransferFunction().dcgain();
}

Matrix StateSpace::dcgainMatrix() const {
    const auto n = A.rows();
    if (n == 0) {
        return D;
    }

    // Continuous: solve (0*I - A) X = B; discrete: solve (I - A) X = B
    const Matrix M  = dc_point(Ts).real() * Matrix::Identity(n, n) - A;
    const auto   lu = M.fullPivLu();
    if (!lu.isInvertible()) {
        throw std::runtime_error("dcgain: system has a pole at the DC point");
    }
    return D + C * lu.solve(B);
}

StateSpace StateSpace::discretize(double Ts, DiscretizationMethod method, std::optional<double> prewarp) const {
    return ltikit::c2d(*this, Ts, method, prewarp);
}

/**
 * @brief Extract a SISO transfer function from a MIMO StateSpace system.
 *
 * G_ij(s) = C_i(sI-A)^(-1)B_j + D_ij where i is the output index and j is the
 * input index (0-based).
 *
 * @throws std::out_of_range if indices are out of bounds
 */
TransferFunction StateSpace::toTransferFunction(int output_idx, int input_idx) const {
    const int num_outputs = static_cast<int>(C.rows());
    const int num_inputs  = static_cast<int>(B.cols());

    if (output_idx < 0 || output_idx >= num_outputs) {
        throw std::out_of_range("Output index " + std::to_string(output_idx) +
                                " is out of range [0, " + std::to_string(num_outputs - 1) + "]");
    }

    if (input_idx < 0 || input_idx >= num_inputs) {
        throw std::out_of_range("Input index " + std::to_string(input_idx) +
                                " is out of range [0, " + std::to_string(num_inputs - 1) + "]");
    }

    const int n = static_cast<int>(A.rows());

    const Eigen::RowVectorXd C_i = C.row(output_idx);
    const ColVec B_j  = B.col(input_idx);
    const double D_ij = D(output_idx, input_idx);

    if (n == 0) {
        return TransferFunction({D_ij}, {1.0}, Ts);
    }

    // Faddeev-LeVerrier:
    //   M_1 = I,             c_1 = -tr(A M_1)
    //   M_k = A M_{k-1} + c_{k-1} I,  c_k = -tr(A M_k) / k
    // gives det(sI - A) = s^n + c_1 s^(n-1) + ... + c_n and
    // adj(sI - A) = sum_k s^(n-k) M_k
    const Matrix        I = Matrix::Identity(n, n);
    std::vector<double> den(n + 1, 0.0);
    std::vector<Matrix> M(n + 1);
    den[0] = 1.0;
    M[1]   = I;
    den[1] = -(A * M[1]).trace();
    for (int k = 2; k <= n; ++k) {
        M[k]   = A * M[k - 1] + den[k - 1] * I;
        den[k] = -(A * M[k]).trace() / static_cast<double>(k);
    }

    // num = C adj(sI - A) B + D det(sI - A)
    std::vector<double> num(n + 1, 0.0);
    for (int k = 0; k <= n; ++k) {
        num[k] = D_ij * den[k];
    }
    for (int k = 1; k <= n; ++k) {
        num[k] += C_i.dot(M[k] * B_j);
    }

    // Strip numerically-zero leading terms (but keep at least one coefficient)
    while (num.size() > 1 && std::abs(num[0]) < 1e-10) {
        num.erase(num.begin());
    }

    return TransferFunction(std::move(num), std::move(den), Ts);
}

StateSpace StateSpace::toStateSpace() const {
    return *this;
}

ZeroPoleGain StateSpace::toZeroPoleGain() const {
    // Convert via SS->TF->ZPK path
    return toTransferFunction().toZeroPoleGain();
}

}  // namespace ltikit
