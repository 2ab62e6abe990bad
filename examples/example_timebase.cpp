#include "fmt/core.h"

#include "ltikit.hpp"

using namespace ltikit;

int main() {
    fmt::print("=== Timebase Classification and Reconciliation Example ===\n\n");

    // Example 1: Classify every kind of timebase
    fmt::print("1. Classifying timebases:\n");
    fmt::print("   {:<20} {:>8} {:>15} {:>8} {:>15}\n", "timebase", "isdtime", "isdtime(strict)", "isctime", "isctime(strict)");

    const Timebase timebases[] = {
        Timebase::unspecified(),
        Timebase::continuous(),
        Timebase::discrete(),
        Timebase::discrete(0.01),
    };
    for (const auto& Ts : timebases) {
        fmt::print("   {:<20} {:>8} {:>15} {:>8} {:>15}\n", to_string(Ts),
                   isdtime(Ts), isdtime(Ts, true), isctime(Ts), isctime(Ts, true));
    }
    fmt::print("\n");

    // Example 2: Reconcile timebases of systems that are combined
    fmt::print("2. Reconciling timebases:\n");
    const auto plant      = tf({1.0}, {1.0, -0.9}, 0.01);
    const auto controller = tf({2.0, -1.8}, {1.0, -1.0}, Timebase::discrete());
    const auto filter     = tf({1.0}, {1.0, 0.0}, Timebase::unspecified());

    fmt::print("   plant:      {}\n", plant.Ts);
    fmt::print("   controller: {}\n", controller.Ts);
    fmt::print("   filter:     {}\n", filter.Ts);
    fmt::print("   common_timebase(controller, plant) = {}\n", common_timebase(controller, plant));
    fmt::print("   common_timebase(filter, controller) = {}\n", common_timebase(filter, controller));

    const auto loop = feedback(controller * plant, filter);
    fmt::print("   Closed loop:\n{}\n", loop);

    // Example 3: Combining continuous and discrete systems is rejected
    fmt::print("3. Illegal interconnection:\n");
    const auto continuous_plant = tf({1.0}, {1.0, 1.0});
    try {
        const auto bad = continuous_plant * controller;
        fmt::print("   unexpectedly combined into {}\n", bad.Ts);
        return 1;
    } catch (const IncompatibleTimebase& e) {
        fmt::print("   {}\n", e.what());
    }
    fmt::print("\n");

    // Example 4: Discretize first, then combine
    fmt::print("4. Discretize first, then combine:\n");
    const auto discretized = c2d(continuous_plant, 0.01);
    const auto combined    = discretized * controller;
    fmt::print("   c2d(continuous_plant, 0.01) * controller -> {}\n", combined.Ts);

    return 0;
}
