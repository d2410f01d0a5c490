#include <ms/log.h>

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace ms {
namespace log {

    namespace {
        std::mutex& handler_mutex() {
            static std::mutex m;
            return m;
        }

        WarningHandler& handler_slot() {
            static WarningHandler handler;
            return handler;
        }
    }  // namespace

    bool debug_enabled() { return std::getenv("MS_SCHEMA_DEBUG") != nullptr; }

    void debug(const std::string& msg) {
        if (!debug_enabled()) return;
        std::cerr << "[marshal] " << msg << "\n";
    }

    WarningHandler set_warning_handler(WarningHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex());
        WarningHandler previous = std::move(handler_slot());
        handler_slot() = std::move(handler);
        return previous;
    }

    void warn(const std::string& category, const std::string& message) {
        WarningHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex());
            handler = handler_slot();
        }
        if (handler) {
            handler(Warning{category, message});
            return;
        }
        std::cerr << "warning: [" << category << "] " << message << std::endl;
    }

}  // namespace log
}  // namespace ms
