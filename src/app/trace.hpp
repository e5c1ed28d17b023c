#ifndef POINTSPRITE_APP_TRACE_HPP
#define POINTSPRITE_APP_TRACE_HPP

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

namespace pointsprite::app {

class TraceLogger {
public:
    static void SetEnabled(bool enabled) noexcept {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    static bool Enabled() noexcept {
        return enabled_.load(std::memory_order_relaxed);
    }

    static void Log(const char* message) {
        if (Enabled()) {
            std::cout << "[TRACE] " << message << '\n';
        }
    }

    template <typename T>
    static void LogVariable(const char* name, const T& value) {
        if (Enabled()) {
            std::ostringstream oss;
            oss << name << " = " << value;
            Log(oss.str().c_str());
        }
    }

private:
    static inline std::atomic_bool enabled_{false};
};

class TraceScope {
public:
    explicit TraceScope(const char* name) : name_(name) {
        TraceLogger::Log(name_);
    }

private:
    const char* name_;
};

} // namespace pointsprite::app

#define POINTSPRITE_TRACE_CONCAT_INNER(a, b) a##b
#define POINTSPRITE_TRACE_CONCAT(a, b) POINTSPRITE_TRACE_CONCAT_INNER(a, b)

#define TRACE_FUNCTION() \
    pointsprite::app::TraceScope POINTSPRITE_TRACE_CONCAT(traceScope, __COUNTER__) { __func__ }
#define TRACE_VAR(var) pointsprite::app::TraceLogger::LogVariable(#var, var)

#endif // POINTSPRITE_APP_TRACE_HPP
