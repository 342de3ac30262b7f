#include <stores/util/trace.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <mutex>

namespace stores {
    namespace {
        enum class TraceOverride : int { none = -1, off = 0, on = 1 };

        std::atomic<TraceOverride> &trace_override() {
            static std::atomic<TraceOverride> value{TraceOverride::none};
            return value;
        }

        bool trace_from_environment() {
            static const bool enabled = std::getenv(TRACE_ENV_VAR) != nullptr;
            return enabled;
        }

        std::mutex &sink_lock() {
            static std::mutex lock;
            return lock;
        }

        trace_sink_t &sink() {
            static trace_sink_t value;
            return value;
        }
    } // namespace

    void set_trace_notifications(bool enabled) {
        trace_override().store(enabled ? TraceOverride::on : TraceOverride::off, std::memory_order_relaxed);
    }

    void reset_trace_notifications() { trace_override().store(TraceOverride::none, std::memory_order_relaxed); }

    bool trace_notifications() {
        switch (trace_override().load(std::memory_order_relaxed)) {
            case TraceOverride::on: return true;
            case TraceOverride::off: return false;
            case TraceOverride::none: break;
        }
        return trace_from_environment();
    }

    void set_trace_sink(trace_sink_t new_sink) {
        std::lock_guard<std::mutex> guard(sink_lock());
        sink() = std::move(new_sink);
    }

    namespace detail {
        void write_trace(std::string_view line) noexcept {
            try {
                trace_sink_t current;
                {
                    std::lock_guard<std::mutex> guard(sink_lock());
                    current = sink();
                }
                if (current) {
                    current(line);
                    return;
                }
                fmt::print(stderr, "[stores] {}\n", line);
            } catch (const std::exception &e) {
                std::fputs("[stores] trace sink failed: ", stderr);
                std::fputs(e.what(), stderr);
                std::fputs("\n", stderr);
            }
        }
    } // namespace detail
} // namespace stores
