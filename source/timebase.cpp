#include "timebase.hpp"

#include <cmath>

#include "fmt/core.h"

namespace ltikit {

Timebase::Timebase(double Ts)
    : value_(ContinuousExplicit{}) {
    if (!std::isfinite(Ts) || Ts < 0.0) {
        throw std::invalid_argument(fmt::format("Timebase: sample period must be finite and non-negative, got {}", Ts));
    }
    if (Ts > 0.0) {
        value_ = DiscretePeriod{Ts};
    }
}

Timebase Timebase::discrete(double Ts) {
    if (!(Ts > 0.0)) {
        throw std::invalid_argument(fmt::format("Timebase: discrete sample period must be positive, got {}", Ts));
    }
    return Timebase(Ts);
}

std::optional<double> Timebase::period() const {
    if (const auto* p = std::get_if<DiscretePeriod>(&value_)) {
        return p->period;
    }
    return std::nullopt;
}

std::string to_string(const Timebase& Ts) {
    if (Ts.isUnspecified()) {
        return "unspecified";
    }
    if (Ts.isContinuousExplicit()) {
        return "continuous";
    }
    if (Ts.isDiscreteUnspecifiedPeriod()) {
        return "discrete";
    }
    return fmt::format("discrete(Ts={})", *Ts.period());
}

namespace {

std::string incompatibleMessage(const Timebase& a, const Timebase& b) {
    std::string msg = fmt::format("Incompatible timebases: {} and {}.", to_string(a), to_string(b));
    if (a.isContinuousExplicit() || b.isContinuousExplicit()) {
        msg += " Use c2d() to discretize continuous systems first.";
    }
    return msg;
}

}  // namespace

IncompatibleTimebase::IncompatibleTimebase(const Timebase& a, const Timebase& b)
    : std::invalid_argument(incompatibleMessage(a, b)),
      first_(a),
      second_(b) {}

bool isdtime(const Timebase& Ts, bool strict) {
    if (Ts.isUnspecified()) {
        return !strict;
    }
    return Ts.isDiscreteUnspecifiedPeriod() || Ts.hasPeriod();
}

bool isctime(const Timebase& Ts, bool strict) {
    // Unspecified is both domains when permissive and neither when strict
    if (Ts.isUnspecified()) {
        return !strict;
    }
    return !isdtime(Ts, strict);
}

Timebase common_timebase(const Timebase& a, const Timebase& b) {
    if (a == b) {
        return a;
    }
    if (a.isUnspecified()) {
        return b;
    }
    if (b.isUnspecified()) {
        return a;
    }

    // A fixed period wins over an unfixed one
    if (a.isDiscreteUnspecifiedPeriod() && b.hasPeriod()) {
        return b;
    }
    if (b.isDiscreteUnspecifiedPeriod() && a.hasPeriod()) {
        return a;
    }

    throw IncompatibleTimebase(a, b);
}

}  // namespace ltikit
