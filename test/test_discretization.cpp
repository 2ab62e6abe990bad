#include "doctest/doctest.h"

#include <cmath>

#include "ltikit.hpp"

using namespace ltikit;

namespace {

// dx/dt = -a x + u, y = x
StateSpace firstOrderLag(double a) {
    return StateSpace{
        Matrix::Constant(1, 1, -a),
        Matrix::Constant(1, 1, 1.0),
        Matrix::Constant(1, 1, 1.0),
        Matrix::Constant(1, 1, 0.0),
    };
}

}  // namespace

TEST_CASE("c2d - Continuous to Discrete Conversion") {
    const double a  = 2.0;
    const double Ts = 0.1;
    const auto   sys = firstOrderLag(a);

    SUBCASE("ZOH discretization of first-order system") {
        const auto sysd = c2d(sys, Ts);

        CHECK(sysd.Ts == Timebase::discrete(Ts));
        CHECK(sysd.A(0, 0) == doctest::Approx(std::exp(-a * Ts)));
        CHECK(sysd.B(0, 0) == doctest::Approx((1.0 - std::exp(-a * Ts)) / a));
        CHECK(sysd.C(0, 0) == doctest::Approx(1.0));
        CHECK(sysd.D(0, 0) == doctest::Approx(0.0));

        // Member form goes through the same path
        CHECK(sys.discretize(Ts) == sysd);
    }

    SUBCASE("FOH discretization keeps the DC gain") {
        const auto sysd = c2d(sys, Ts, DiscretizationMethod::FOH);
        CHECK(sysd.A(0, 0) == doctest::Approx(std::exp(-a * Ts)));
        CHECK(sysd.dcgain() == doctest::Approx(sys.dcgain()));
    }

    SUBCASE("Bilinear discretization") {
        const auto sysd = c2d(sys, Ts, DiscretizationMethod::Bilinear);

        // s -> (2/T)(z-1)/(z+1) puts the pole at (1 - aT/2) / (1 + aT/2)
        CHECK(sysd.A(0, 0) == doctest::Approx((1.0 - a * Ts / 2.0) / (1.0 + a * Ts / 2.0)));
        CHECK(sysd.dcgain() == doctest::Approx(sys.dcgain()));
        CHECK(c2d(sys, Ts, DiscretizationMethod::Tustin) == sysd);
    }

    SUBCASE("Tustin with prewarp") {
        const double w    = 5.0;
        const auto   sysd = c2d(sys, Ts, DiscretizationMethod::Tustin, w);
        const double T    = 2.0 * std::tan(w * Ts / 2.0) / w;
        CHECK(sysd.A(0, 0) == doctest::Approx((1.0 - a * T / 2.0) / (1.0 + a * T / 2.0)));
        CHECK(sysd.Ts == Timebase::discrete(Ts));
    }

    SUBCASE("Stability preservation") {
        for (auto method : {DiscretizationMethod::ZOH, DiscretizationMethod::FOH,
                            DiscretizationMethod::Tustin, DiscretizationMethod::Matched}) {
            CHECK(c2d(sys, Ts, method).is_stable());
        }
    }
}

TEST_CASE("Matched pole-zero discretization") {
    const double Ts = 0.05;

    SUBCASE("Poles and zeros map through exp(s*Ts)") {
        const auto sysc = zpk({Zero(-1.0)}, {Pole(-2.0), Pole(-3.0)}, 6.0);
        const auto sysd = c2d_matched(sysc, Ts);

        REQUIRE(sysd.zeros().size() == 1);
        REQUIRE(sysd.poles().size() == 2);
        CHECK(sysd.zeros()[0].real() == doctest::Approx(std::exp(-1.0 * Ts)));
        CHECK(sysd.poles()[0].real() == doctest::Approx(std::exp(-2.0 * Ts)));
        CHECK(sysd.poles()[1].real() == doctest::Approx(std::exp(-3.0 * Ts)));
        CHECK(sysd.Ts == Timebase::discrete(Ts));

        // Gain is chosen so the DC gains agree
        CHECK(sysd.dcgain() == doctest::Approx(sysc.dcgain()));
    }

    SUBCASE("Integrator keeps the continuous gain") {
        const auto sysc = zpk({}, {Pole(0.0)}, 3.0);
        const auto sysd = c2d_matched(sysc, Ts);
        CHECK(sysd.gain() == 3.0);
        CHECK(sysd.poles()[0].real() == doctest::Approx(1.0));
    }

    SUBCASE("Transfer function and state-space go through the same mapping") {
        const auto sysc = tf({2.0}, {1.0, 2.0});
        const auto tfd  = c2d(sysc, Ts, DiscretizationMethod::Matched);
        const auto ssd  = c2d(ss(sysc), Ts, DiscretizationMethod::Matched);

        REQUIRE(tfd.poles().size() == 1);
        CHECK(tfd.poles()[0].real() == doctest::Approx(std::exp(-2.0 * Ts)));
        CHECK(tfd.dcgain() == doctest::Approx(1.0));
        CHECK(ssd.dcgain() == doctest::Approx(1.0));
        CHECK(ssd.Ts == Timebase::discrete(Ts));
    }

    SUBCASE("MIMO systems cannot be matched") {
        StateSpace mimo{Matrix::Identity(2, 2) * -1.0, Matrix::Identity(2, 2), Matrix::Identity(2, 2), Matrix::Zero(2, 2)};
        CHECK_THROWS_AS(c2d(mimo, Ts, DiscretizationMethod::Matched), std::invalid_argument);
    }
}

TEST_CASE("c2d honors the source timebase") {
    SUBCASE("Unspecified source is treated as continuous") {
        StateSpace sys = firstOrderLag(1.0);
        sys.Ts         = Timebase::unspecified();
        const auto sysd = c2d(sys, 0.1);
        CHECK(sysd.Ts == Timebase::discrete(0.1));
        CHECK(sysd.A(0, 0) == doctest::Approx(std::exp(-0.1)));
    }

    SUBCASE("Discrete source with the same period is returned unchanged") {
        const auto sysd  = c2d(firstOrderLag(1.0), 0.1);
        const auto again = c2d(sysd, 0.1);
        CHECK(again == sysd);
    }

    SUBCASE("Discrete source without a period adopts the requested one") {
        const auto sys  = tf({1.0}, {1.0, -0.5}, Timebase::discrete());
        const auto sysd = c2d(sys, 0.2);
        CHECK(sysd.Ts == Timebase::discrete(0.2));
        REQUIRE(sysd.poles().size() == 1);
        CHECK(sysd.poles()[0].real() == doctest::Approx(0.5));
    }

    SUBCASE("Discrete source with a different period is rejected") {
        const auto sysd = c2d(firstOrderLag(1.0), 0.1);
        CHECK_THROWS_AS(c2d(sysd, 0.2), IncompatibleTimebase);
        CHECK_THROWS_AS(c2d_matched(zpk({}, {Pole(0.5)}, 1.0, 0.1), 0.2), IncompatibleTimebase);
    }

    SUBCASE("Sample period must be positive") {
        CHECK_THROWS_AS(c2d(firstOrderLag(1.0), 0.0), std::invalid_argument);
        CHECK_THROWS_AS(c2d(firstOrderLag(1.0), -0.1), std::invalid_argument);
    }
}
