#ifndef STORES_UTIL_TRACE_H
#define STORES_UTIL_TRACE_H

#include <stores/stores_export.h>

#include <fmt/format.h>

#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace stores {
    /**
     * Environment variable that switches on notification tracing. Any value enables it; the variable is read once,
     * on first use.
     */
    inline constexpr const char *TRACE_ENV_VAR = "STORES_DEBUG_NOTIFY";

    using trace_sink_t = std::function<void(std::string_view)>;

    /**
     * Force tracing on or off, overriding the environment.
     */
    STORES_EXPORT void set_trace_notifications(bool enabled);

    /**
     * Drop any programmatic override and fall back to the environment setting.
     */
    STORES_EXPORT void reset_trace_notifications();

    [[nodiscard]] STORES_EXPORT bool trace_notifications();

    /**
     * Redirect trace lines. Passing an empty function restores the default (stderr).
     *
     * The sink is called without any library lock held and may use entities. Trace points sit on unsubscribe paths
     * reached from destructors, so a std::exception thrown by the sink is reported to stderr and dropped; anything
     * else escaping the sink terminates.
     */
    STORES_EXPORT void set_trace_sink(trace_sink_t sink);

    namespace detail {
        STORES_EXPORT void write_trace(std::string_view line) noexcept;
    }

    template<typename... Ts>
    void trace(fmt::format_string<Ts...> fmt_str, Ts &&... xs) noexcept {
        if (!trace_notifications()) { return; }
        std::string line;
        try {
            line = fmt::format(fmt_str, std::forward<Ts>(xs)...);
        } catch (const std::exception &) {
            return;
        }
        detail::write_trace(line);
    }
} // namespace stores

#endif  // STORES_UTIL_TRACE_H
