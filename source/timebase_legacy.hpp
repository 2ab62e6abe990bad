#pragma once

#include "timebase.hpp"

namespace ltikit {

/**
 * @brief Legacy timebase equality check.
 *
 * Kept for backward compatibility only; emits a deprecation warning on every call
 * and never throws IncompatibleTimebase. A discrete timebase without a fixed period
 * only equals another such timebase, even where common_timebase() would reconcile
 * it. Use common_timebase() instead.
 */
[[deprecated("timebase_equal() is deprecated; use common_timebase() instead")]]
bool timebase_equal(const Timebase& a, const Timebase& b);

template <TimebaseSource A, TimebaseSource B>
[[deprecated("timebase_equal() is deprecated; use common_timebase() instead")]]
bool timebase_equal(const A& a, const B& b) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    return timebase_equal(timebase_of(a), timebase_of(b));
#pragma GCC diagnostic pop
}

}  // namespace ltikit
