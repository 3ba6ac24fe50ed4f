#pragma once

// Master switch for the trace layer (default: enabled)
// Build with NUMSORT_TRACE_ENABLED=0 to compile every trace macro away
#ifndef NUMSORT_TRACE_ENABLED
#define NUMSORT_TRACE_ENABLED 1
#endif

// Initial state of newly registered trace points
#ifndef NUMSORT_TRACE_DEFAULT_ON
#define NUMSORT_TRACE_DEFAULT_ON 0
#endif

#if NUMSORT_TRACE_ENABLED

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Output backend:
// - NUMSORT_USE_SPDLOG: hand formatted messages to spdlog
// - default: snprintf into the trace handler
#if defined(NUMSORT_USE_SPDLOG)
    #include <spdlog/spdlog.h>
#endif

namespace numsort::trace {

// One registered trace point; `enabled` points at the static flag owned by the call site
struct TracePointInfo {
    bool* enabled;
    const char* file;
    int line;
    const char* function;
    const char* level;      // "trace", "debug", "info", "warn", "func-entry", "func-exit", "timer"
    const char* message;    // format string
};

inline std::string format_duration(double ns) {
    char buf[64];
    if (ns < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%.1f ns", ns);
    } else if (ns < 1000000.0) {
        std::snprintf(buf, sizeof(buf), "%.1f us", ns / 1000.0);
    } else if (ns < 1000000000.0) {
        std::snprintf(buf, sizeof(buf), "%.1f ms", ns / 1000000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.3f s", ns / 1000000000.0);
    }
    return buf;
}

struct TimerStats {
    uint64_t count = 0;
    double avg = 0.0;
    double min = 0.0;
    double max = 0.0;
};

// Collects scope timer samples per label
class TimerManager {
public:
    static TimerManager& instance() {
        static TimerManager mgr;
        return mgr;
    }

    void record(const std::string& label, double duration_ns) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& s = stats_[label];
        s.count++;
        if (s.count == 1) {
            s.avg = s.min = s.max = duration_ns;
            return;
        }
        s.avg += (duration_ns - s.avg) / static_cast<double>(s.count);
        if (duration_ns < s.min) s.min = duration_ns;
        if (duration_ns > s.max) s.max = duration_ns;
    }

    std::optional<TimerStats> stats(const std::string& label) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(label);
        if (it == stats_.end()) return std::nullopt;
        return it->second;
    }

    std::string summary() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        for (const auto& [label, s] : stats_) {
            char line[256];
            std::snprintf(line, sizeof(line), "  %-32s  count=%" PRIu64 "  avg=%s  min=%s  max=%s\n",
                label.c_str(), s.count,
                format_duration(s.avg).c_str(),
                format_duration(s.min).c_str(),
                format_duration(s.max).c_str());
            oss << line;
        }
        return oss.str();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.clear();
    }

private:
    TimerManager() = default;
    std::mutex mutex_;
    std::map<std::string, TimerStats> stats_;
};

// Registry of every trace point reached so far
class TraceManager {
public:
    static TraceManager& instance() {
        static TraceManager mgr;
        return mgr;
    }

    void register_trace_point(bool* enabled, const char* file, int line, const char* function,
                              const char* level, const char* message) {
        std::lock_guard<std::mutex> lock(mutex_);
        points_.push_back(TracePointInfo{enabled, file, line, function, level, message});
    }

    void set_level_enabled(const char* level, bool state) {
        set_matching(state, [lv = std::string_view(level)](const TracePointInfo& p) {
            return std::string_view(p.level) == lv;
        });
    }

    void set_function_enabled(const char* function, bool state) {
        set_matching(state, [fn = std::string_view(function)](const TracePointInfo& p) {
            return std::string_view(p.function) == fn;
        });
    }

    void set_all_enabled(bool state) {
        set_matching(state, [](const TracePointInfo&) { return true; });
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return points_.size();
    }

    template<typename Func>
    void for_each(Func&& func) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& info : points_) {
            func(info);
        }
    }

    std::string list_trace_points() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        size_t idx = 0;
        for (const auto& info : points_) {
            oss << idx++ << " " << (*info.enabled ? "[ON] " : "[OFF]")
                << " [" << info.level << "] "
                << info.file << ":" << info.line
                << " (" << info.function << ") \"" << info.message << "\"\n";
        }
        return oss.str();
    }

private:
    TraceManager() = default;

    template<typename Pred>
    void set_matching(bool state, Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& info : points_) {
            if (pred(info)) *info.enabled = state;
        }
    }

    std::mutex mutex_;
    std::vector<TracePointInfo> points_;
};

using TraceHandler = std::function<void(const char*, const char*, int, const char*, const char*)>;

inline void default_trace_handler(const char* level, const char* file, int line, const char* function, const char* msg) {
#if defined(NUMSORT_USE_SPDLOG)
    std::string_view lv(level);
    auto spd_level = spdlog::level::debug;
    if (lv == "trace") spd_level = spdlog::level::trace;
    else if (lv == "info" || lv == "timer") spd_level = spdlog::level::info;
    else if (lv == "warn") spd_level = spdlog::level::warn;
    spdlog::log(spdlog::source_loc{file, line, function}, spd_level, "[{}] {}", level, msg);
#else
    std::fprintf(stderr, "[%s] %s:%d (%s): %s\n", level, file, line, function, msg);
#endif
}

inline TraceHandler& trace_handler() {
    static TraceHandler handler = default_trace_handler;
    return handler;
}

inline void set_trace_handler(TraceHandler handler) {
    trace_handler() = std::move(handler);
}

namespace detail {
    inline bool register_trace_point(bool* enabled, const char* file, int line, const char* function,
                                     const char* level, const char* message) {
        *enabled = NUMSORT_TRACE_DEFAULT_ON != 0;
        TraceManager::instance().register_trace_point(enabled, file, line, function, level, message);
        return *enabled;
    }

    template<typename... Args>
    void trace_impl(const char* level, const char* file, int line, const char* function, const char* fmt, Args&&... args) {
        char buffer[1024];
        if constexpr (sizeof...(args) == 0) {
            std::snprintf(buffer, sizeof(buffer), "%s", fmt);
        } else {
            std::snprintf(buffer, sizeof(buffer), fmt, std::forward<Args>(args)...);
        }
        trace_handler()(level, file, line, function, buffer);
    }
}

// Emits func-entry on construction and func-exit on destruction
class ScopeTracer {
public:
    ScopeTracer(bool* exit_enabled, const char* file, int line, const char* function)
        : exit_enabled_(exit_enabled), file_(file), line_(line), function_(function) {
        trace_handler()("func-entry", file_, line_, function_, "");
    }

    ~ScopeTracer() {
        if (*exit_enabled_) {
            trace_handler()("func-exit", file_, line_, function_, "");
        }
    }

private:
    bool* exit_enabled_;
    const char* file_;
    int line_;
    const char* function_;
};

// Measures its own lifetime and records it under `label`
class ScopeTimer {
public:
    ScopeTimer(const char* label, const char* file, int line, const char* function)
        : label_(label), file_(file), line_(line), function_(function),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopeTimer() {
        auto end = std::chrono::steady_clock::now();
        double elapsed_ns = static_cast<double>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count());
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%s elapsed: %s", label_, format_duration(elapsed_ns).c_str());
        trace_handler()("timer", file_, line_, function_, buf);
        TimerManager::instance().record(label_, elapsed_ns);
    }

private:
    const char* label_;
    const char* file_;
    int line_;
    const char* function_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace numsort::trace

#define NUMSORT_LOG(lvl, fmt, ...) \
    do { \
        static bool _numsort_enabled_ = numsort::trace::detail::register_trace_point(&_numsort_enabled_, __FILE__, __LINE__, __func__, lvl, fmt); \
        if (_numsort_enabled_) { \
            numsort::trace::detail::trace_impl(lvl, __FILE__, __LINE__, __func__, fmt __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while(0)

#define NUMSORT_TRACE(fmt, ...) NUMSORT_LOG("trace", fmt __VA_OPT__(,) __VA_ARGS__)
#define NUMSORT_DEBUG(fmt, ...) NUMSORT_LOG("debug", fmt __VA_OPT__(,) __VA_ARGS__)
#define NUMSORT_INFO(fmt, ...)  NUMSORT_LOG("info", fmt __VA_OPT__(,) __VA_ARGS__)
#define NUMSORT_WARN(fmt, ...)  NUMSORT_LOG("warn", fmt __VA_OPT__(,) __VA_ARGS__)

#define NUMSORT_FUNC() \
    static bool _numsort_entry_enabled_ = numsort::trace::detail::register_trace_point(&_numsort_entry_enabled_, __FILE__, __LINE__, __func__, "func-entry", ""); \
    static bool _numsort_exit_enabled_ = numsort::trace::detail::register_trace_point(&_numsort_exit_enabled_, __FILE__, __LINE__, __func__, "func-exit", ""); \
    std::optional<numsort::trace::ScopeTracer> _numsort_scope_guard_; \
    if (_numsort_entry_enabled_) _numsort_scope_guard_.emplace(&_numsort_exit_enabled_, __FILE__, __LINE__, __func__)

#define NUMSORT_TIMEIT(label) \
    static bool _numsort_timer_enabled_ = numsort::trace::detail::register_trace_point(&_numsort_timer_enabled_, __FILE__, __LINE__, __func__, "timer", label); \
    std::optional<numsort::trace::ScopeTimer> _numsort_timer_guard_; \
    if (_numsort_timer_enabled_) _numsort_timer_guard_.emplace(label, __FILE__, __LINE__, __func__)

#else // !NUMSORT_TRACE_ENABLED

#define NUMSORT_LOG(lvl, fmt, ...) do {} while(0)
#define NUMSORT_TRACE(fmt, ...)    do {} while(0)
#define NUMSORT_DEBUG(fmt, ...)    do {} while(0)
#define NUMSORT_INFO(fmt, ...)     do {} while(0)
#define NUMSORT_WARN(fmt, ...)     do {} while(0)
#define NUMSORT_FUNC()             do {} while(0)
#define NUMSORT_TIMEIT(label)      do {} while(0)

#endif // NUMSORT_TRACE_ENABLED
