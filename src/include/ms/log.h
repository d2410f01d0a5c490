#pragma once

#include <functional>
#include <string>

namespace ms {
namespace log {

    // True when the MS_SCHEMA_DEBUG environment variable is set.
    bool debug_enabled();

    // Writes to std::cerr when debug_enabled().
    void debug(const std::string& msg);

    struct Warning {
        std::string category;
        std::string message;
    };

    using WarningHandler = std::function<void(const Warning&)>;

    // Installs a handler for warn(); returns the previous one. An empty handler
    // restores the default, which prints "warning: [category] message" to std::cerr.
    WarningHandler set_warning_handler(WarningHandler handler);

    void warn(const std::string& category, const std::string& message);

}  // namespace log
}  // namespace ms
