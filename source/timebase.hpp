#pragma once

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ltikit {

/**
 * @brief Sampling-domain classification of a model.
 *
 * Exactly one of four cases holds:
 *  - Unspecified:               no commitment, compatible with either domain
 *  - ContinuousExplicit:        explicitly continuous-time
 *  - DiscreteUnspecifiedPeriod: discrete-time, sample period not yet fixed
 *  - DiscretePeriod:            discrete-time with a fixed sample period > 0
 */
class Timebase {
   public:
    struct Unspecified {
        bool operator==(const Unspecified&) const = default;
    };
    struct ContinuousExplicit {
        bool operator==(const ContinuousExplicit&) const = default;
    };
    struct DiscreteUnspecifiedPeriod {
        bool operator==(const DiscreteUnspecifiedPeriod&) const = default;
    };
    struct DiscretePeriod {
        double period;
        bool   operator==(const DiscretePeriod&) const = default;
    };

    using Value = std::variant<Unspecified, ContinuousExplicit, DiscreteUnspecifiedPeriod, DiscretePeriod>;

    // Default timebase of a freshly constructed model
    Timebase()
        : value_(ContinuousExplicit{}) {}

    /**
     * @brief Timebase from a numeric sample period.
     *
     * 0 selects continuous time, a positive finite value a fixed sample period.
     *
     * @throws std::invalid_argument for negative, NaN or infinite periods
     */
    Timebase(double Ts);
    Timebase(int Ts)
        : Timebase(static_cast<double>(Ts)) {}

    // A boolean is not a sample period; use Timebase::discrete() instead.
    Timebase(bool) = delete;

    static Timebase unspecified() { return Timebase(Value{Unspecified{}}); }
    static Timebase continuous() { return Timebase(Value{ContinuousExplicit{}}); }
    static Timebase discrete() { return Timebase(Value{DiscreteUnspecifiedPeriod{}}); }
    static Timebase discrete(double Ts);

    bool isUnspecified() const { return std::holds_alternative<Unspecified>(value_); }
    bool isContinuousExplicit() const { return std::holds_alternative<ContinuousExplicit>(value_); }
    bool isDiscreteUnspecifiedPeriod() const { return std::holds_alternative<DiscreteUnspecifiedPeriod>(value_); }
    bool hasPeriod() const { return std::holds_alternative<DiscretePeriod>(value_); }

    // Sample period if fixed, nullopt otherwise
    std::optional<double> period() const;

    const Value& value() const { return value_; }

    bool operator==(const Timebase& other) const = default;

   private:
    explicit Timebase(Value v)
        : value_(std::move(v)) {}

    Value value_;
};

/**
 * @brief Raised when two timebases name different, non-wildcard sampling domains.
 */
class IncompatibleTimebase : public std::invalid_argument {
   public:
    IncompatibleTimebase(const Timebase& a, const Timebase& b);

    const Timebase& first() const { return first_; }
    const Timebase& second() const { return second_; }

   private:
    Timebase first_;
    Timebase second_;
};

std::string to_string(const Timebase& Ts);

// Anything carrying a public timebase member (LTI models, nonlinear systems)
template <class T>
concept HasTimebase = requires(const T& t) {
    { t.Ts } -> std::convertible_to<const Timebase&>;
};

template <class T>
concept TimebaseSource = std::same_as<T, Timebase> || HasTimebase<T>;

inline const Timebase& timebase_of(const Timebase& Ts) {
    return Ts;
}

template <HasTimebase T>
const Timebase& timebase_of(const T& sys) {
    return sys.Ts;
}

/**
 * @brief Check whether a timebase is discrete-time.
 *
 * Permissive mode treats an unspecified timebase as discrete. Strict mode only
 * accepts timebases that explicitly commit to discrete time.
 */
bool isdtime(const Timebase& Ts, bool strict = false);

/**
 * @brief Check whether a timebase is continuous-time.
 *
 * The complement of isdtime() for every committed timebase. An unspecified
 * timebase is continuous in permissive mode and not continuous in strict mode.
 */
bool isctime(const Timebase& Ts, bool strict = false);

template <HasTimebase T>
bool isdtime(const T& sys, bool strict = false) {
    return isdtime(timebase_of(sys), strict);
}

template <HasTimebase T>
bool isctime(const T& sys, bool strict = false) {
    return isctime(timebase_of(sys), strict);
}

/**
 * @brief Reconcile the timebases of two operands being combined.
 *
 * Equal timebases reconcile to themselves, an unspecified timebase yields to the
 * other operand, and a fixed sample period wins over an unspecified one.
 *
 * @throws IncompatibleTimebase for any other combination
 */
Timebase common_timebase(const Timebase& a, const Timebase& b);

template <TimebaseSource A, TimebaseSource B>
Timebase common_timebase(const A& a, const B& b) {
    return common_timebase(timebase_of(a), timebase_of(b));
}

}  // namespace ltikit
