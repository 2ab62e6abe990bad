#include "diagnostics.hpp"

#include <cstdio>
#include <mutex>
#include <utility>

#include "fmt/core.h"

namespace ltikit {

namespace {

void print_to_stderr(std::string_view message) {
    fmt::print(stderr, "ltikit: warning: {}\n", message);
}

std::mutex     handler_mutex;
WarningHandler handler = print_to_stderr;

}  // namespace

void set_warning_handler(WarningHandler new_handler) {
    std::lock_guard lock(handler_mutex);
    handler = new_handler ? std::move(new_handler) : WarningHandler(print_to_stderr);
}

void warn(std::string_view message) {
    WarningHandler current;
    {
        std::lock_guard lock(handler_mutex);
        current = handler;
    }
    current(message);
}

}  // namespace ltikit
