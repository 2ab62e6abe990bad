#pragma once

#include <string>

#include "ss.hpp"
#include "tf.hpp"
#include "timebase.hpp"

// ============================================================================
// Formatting for fmt::format
#include "fmt/core.h"

namespace ltikit {

inline std::string formatMatrix(const char* name, const Matrix& M) {
    std::string result = fmt::format("{} = \n", name);
    for (Eigen::Index i = 0; i < M.rows(); ++i) {
        for (Eigen::Index j = 0; j < M.cols(); ++j) {
            result += fmt::format("{:>10.4f}", M(i, j));
        }
        result += "\n";
    }
    return result;
}

inline std::string formatStateSpaceMatrices(const StateSpace& sys) {
    return formatMatrix("A", sys.A) + "\n" + formatMatrix("B", sys.B) + "\n" +
           formatMatrix("C", sys.C) + "\n" + formatMatrix("D", sys.D) + "\n" +
           fmt::format("Ts = {}\n", to_string(sys.Ts));
}

inline std::string formatPolynomial(const std::vector<double>& coeffs) {
    std::string result;
    for (size_t i = 0; i < coeffs.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += fmt::format("{:g}", coeffs[i]);
    }
    return "[" + result + "]";
}

}  // namespace ltikit

template <>
struct fmt::formatter<ltikit::Timebase> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ltikit::Timebase& Ts, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ltikit::to_string(Ts));
    }
};

template <>
struct fmt::formatter<ltikit::StateSpace> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ltikit::StateSpace& sys, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ltikit::formatStateSpaceMatrices(sys));
    }
};

template <>
struct fmt::formatter<ltikit::TransferFunction> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const ltikit::TransferFunction& sys, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "num = {}\nden = {}\nTs = {}\n",
                              ltikit::formatPolynomial(sys.num), ltikit::formatPolynomial(sys.den), ltikit::to_string(sys.Ts));
    }
};
