#include "doctest/doctest.h"

#include <algorithm>
#include <cmath>

#include "ltikit.hpp"

using namespace ltikit;

namespace {

// dx/dt = -2x + u, y = 3x
StateSpace firstOrder(Timebase Ts = Timebase::continuous()) {
    return StateSpace{
        Matrix::Constant(1, 1, -2.0),
        Matrix::Constant(1, 1, 1.0),
        Matrix::Constant(1, 1, 3.0),
        Matrix::Constant(1, 1, 0.0),
        Ts,
    };
}

// Two inputs, two outputs, two decoupled first-order states
StateSpace twoByTwo() {
    Matrix A(2, 2), B(2, 2), C(2, 2), D(2, 2);
    A << -1.0, 0.0,
          0.0, -2.0;
    B << 1.0, 0.0,
         0.0, 1.0;
    C << 1.0, 0.0,
         0.0, 4.0;
    D << 0.0, 0.5,
         0.0, 0.0;
    return StateSpace{A, B, C, D};
}

}  // namespace

TEST_CASE("StateSpace Construction and Validation") {
    SUBCASE("Valid construction") {
        Matrix A = Matrix::Constant(2, 2, -1.0);
        Matrix B = Matrix::Constant(2, 1, 1.0);
        Matrix C = Matrix::Constant(1, 2, 1.0);
        Matrix D = Matrix::Constant(1, 1, 0.0);

        StateSpace sys(A, B, C, D);
        CHECK(sys.ninputs() == 1);
        CHECK(sys.noutputs() == 1);
        CHECK(sys.Ts == Timebase::continuous());
    }

    SUBCASE("Discrete-time system") {
        StateSpace sys{
            Matrix::Constant(1, 1, 0.9),
            Matrix::Constant(1, 1, 0.1),
            Matrix::Constant(1, 1, 1.0),
            Matrix::Constant(1, 1, 0.0),
            0.1  // Ts
        };
        CHECK(sys.Ts == Timebase::discrete(0.1));
        CHECK(sys.isDiscrete(true));
    }

    SUBCASE("Invalid matrix dimensions throw") {
        CHECK_THROWS_AS(StateSpace(Matrix::Zero(2, 3), Matrix::Zero(2, 1), Matrix::Zero(1, 2), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(Matrix::Zero(2, 2), Matrix::Zero(3, 1), Matrix::Zero(1, 2), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(Matrix::Zero(2, 2), Matrix::Zero(2, 1), Matrix::Zero(1, 3), Matrix::Zero(1, 1)), std::invalid_argument);
        CHECK_THROWS_AS(StateSpace(Matrix::Zero(2, 2), Matrix::Zero(2, 1), Matrix::Zero(1, 2), Matrix::Zero(2, 1)), std::invalid_argument);
    }

    SUBCASE("Equality includes the timebase") {
        CHECK(firstOrder() == firstOrder());
        CHECK_FALSE(firstOrder() == firstOrder(Timebase::unspecified()));
    }
}

TEST_CASE("StateSpace Poles and Zeros") {
    SUBCASE("Oscillator poles (complex conjugate)") {
        Matrix A(2, 2);
        A << 0.0, 1.0,
            -4.0, 0.0;
        StateSpace sys{A, Matrix::Constant(2, 1, 1.0), Matrix::Constant(1, 2, 1.0), Matrix::Zero(1, 1)};

        const auto p = sys.poles();
        REQUIRE(p.size() == 2);
        CHECK(p[0].real() == doctest::Approx(0.0));
        CHECK(std::abs(p[0].imag()) == doctest::Approx(2.0));
        CHECK_FALSE(sys.is_stable());
    }

    SUBCASE("SISO system zeros") {
        // (s + 3) / (s^2 + 3s + 2) in controllable canonical form
        const auto sys = tf2ss({1.0, 3.0}, {1.0, 3.0, 2.0});
        const auto z   = sys.zeros();
        REQUIRE(z.size() == 1);
        CHECK(z[0].real() == doctest::Approx(-3.0));
    }

    SUBCASE("MIMO system throws on zeros()") {
        CHECK_THROWS_AS(twoByTwo().zeros(), std::invalid_argument);
    }

    SUBCASE("Discrete system poles are eigenvalues of A") {
        const auto sys = firstOrder(0.1);
        REQUIRE(sys.poles().size() == 1);
        CHECK(sys.poles()[0].real() == doctest::Approx(-2.0));
        CHECK_FALSE(sys.is_stable());
    }
}

TEST_CASE("StateSpace DC gain") {
    SUBCASE("Continuous SISO") {
        CHECK(firstOrder().dcgain() == doctest::Approx(1.5));
    }

    SUBCASE("Discrete SISO evaluates at z = 1") {
        StateSpace sys{
            Matrix::Constant(1, 1, 0.5),
            Matrix::Constant(1, 1, 1.0),
            Matrix::Constant(1, 1, 1.0),
            Matrix::Constant(1, 1, 0.0),
            Timebase::discrete(),
        };
        CHECK(sys.dcgain() == doctest::Approx(2.0));
        CHECK(sys.dcgainMatrix()(0, 0) == doctest::Approx(2.0));
    }

    SUBCASE("MIMO gain matrix") {
        const auto   sys = twoByTwo();
        const Matrix K   = sys.dcgainMatrix();
        REQUIRE(K.rows() == 2);
        REQUIRE(K.cols() == 2);
        CHECK(K(0, 0) == doctest::Approx(1.0));
        CHECK(K(0, 1) == doctest::Approx(0.5));
        CHECK(K(1, 0) == doctest::Approx(0.0));
        CHECK(K(1, 1) == doctest::Approx(2.0));

        CHECK_THROWS_AS(sys.dcgain(), std::invalid_argument);
    }

    SUBCASE("Integrator has no finite DC gain matrix") {
        StateSpace sys{Matrix::Zero(1, 1), Matrix::Constant(1, 1, 1.0), Matrix::Constant(1, 1, 1.0), Matrix::Zero(1, 1)};
        CHECK_THROWS_AS(sys.dcgainMatrix(), std::runtime_error);
    }
}

TEST_CASE("StateSpace to TransferFunction Conversion") {
    SUBCASE("SISO first-order system") {
        const auto sys = tf(firstOrder(0.25));
        CHECK(sys.num == std::vector<double>{3.0});
        REQUIRE(sys.den.size() == 2);
        CHECK(sys.den[0] == doctest::Approx(1.0));
        CHECK(sys.den[1] == doctest::Approx(2.0));
        CHECK(sys.Ts == Timebase::discrete(0.25));
    }

    SUBCASE("Second-order system with full A matrix") {
        // det(sI - A) = s^2 + 5s + 6 - 1 = s^2 + 5s + 5
        Matrix A(2, 2);
        A << -2.0, 1.0,
              1.0, -3.0;
        Matrix B(2, 1);
        B << 1.0, 0.0;
        Matrix C(1, 2);
        C << 0.0, 1.0;

        const auto sys = ss2tf(A, B, C, Matrix::Zero(1, 1));
        REQUIRE(sys.den.size() == 3);
        CHECK(sys.den[1] == doctest::Approx(5.0));
        CHECK(sys.den[2] == doctest::Approx(5.0));

        // C adj(sI - A) B = 1
        REQUIRE(sys.num.size() == 1);
        CHECK(sys.num[0] == doctest::Approx(1.0));
    }

    SUBCASE("Feedthrough adds D times the characteristic polynomial") {
        StateSpace plant = firstOrder();
        plant.D(0, 0)    = 2.0;

        // 3/(s+2) + 2 = (2s + 7)/(s + 2)
        const auto sys = tf(plant);
        REQUIRE(sys.num.size() == 2);
        CHECK(sys.num[0] == doctest::Approx(2.0));
        CHECK(sys.num[1] == doctest::Approx(7.0));
    }

    SUBCASE("Extract SISO channel from MIMO") {
        const auto sys = twoByTwo();

        // Output 1, input 1: 4/(s+2)
        const auto g11 = tf(sys, 1, 1);
        CHECK(g11.dcgain() == doctest::Approx(2.0));

        // Output 0, input 1: pure feedthrough 0.5
        const auto g01 = tf(sys, 0, 1);
        CHECK(g01.dcgain() == doctest::Approx(0.5));
    }

    SUBCASE("Invalid indices throw out_of_range") {
        CHECK_THROWS_AS(tf(twoByTwo(), 2, 0), std::out_of_range);
        CHECK_THROWS_AS(tf(twoByTwo(), 0, -1), std::out_of_range);
    }
}

TEST_CASE("issiso") {
    CHECK(issiso(firstOrder()));
    CHECK(issiso(tf({1.0}, {1.0, 1.0})));
    CHECK(issiso(zpk({}, {Pole(-1.0, 0.0)}, 1.0)));
    CHECK_FALSE(issiso(twoByTwo()));

    // A plain gain counts unless strict mode rejects it
    CHECK(issiso(2.0));
    CHECK_THROWS_AS(issiso(2.0, true), std::invalid_argument);
    CHECK(issiso(firstOrder(), true));
    CHECK(issiso(tf({1.0}, {1.0, 1.0}), true));
    CHECK_FALSE(issiso(twoByTwo(), true));
}

TEST_CASE("StateSpace formatting") {
    const auto text = fmt::format("{}", firstOrder(Timebase::discrete()));
    CHECK(text.find("A =") != std::string::npos);
    CHECK(text.find("Ts = discrete") != std::string::npos);
}
