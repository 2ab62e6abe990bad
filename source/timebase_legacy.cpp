#include "timebase_legacy.hpp"

#include "diagnostics.hpp"

namespace ltikit {

bool timebase_equal(const Timebase& a, const Timebase& b) {
    warn("timebase_equal() is deprecated; use common_timebase() instead");

    if (a.isDiscreteUnspecifiedPeriod() || b.isDiscreteUnspecifiedPeriod()) {
        return a.isDiscreteUnspecifiedPeriod() && b.isDiscreteUnspecifiedPeriod();
    }

    try {
        common_timebase(a, b);
    } catch (const IncompatibleTimebase&) {
        return false;
    }
    return true;
}

}  // namespace ltikit
