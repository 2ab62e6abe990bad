#pragma once

#include <functional>
#include <string_view>

namespace ltikit {

using WarningHandler = std::function<void(std::string_view message)>;

/**
 * @brief Replace the sink that receives library warnings.
 *
 * The default sink prints "ltikit: warning: <message>" to stderr. Passing an
 * empty handler restores the default.
 */
void set_warning_handler(WarningHandler handler);

// Emit a warning through the current sink
void warn(std::string_view message);

}  // namespace ltikit
