#include <slurp/log.hpp>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace slurp {

namespace {

log_level initial_level() noexcept {
    const char* env = std::getenv("SLURP_LOG_LEVEL");
    if (!env)
        return log_level::warn;
    return parse_log_level(env, log_level::warn);
}

void default_handler(log_level level, std::string_view message) {
    fmt::print(stderr, "slurp [{}] {}\n", log_level_name(level), message);
}

struct logger_state {
    std::atomic<log_level> level{initial_level()};
    std::mutex mutex;
    log_handler handler;
};

logger_state& state() {
    static logger_state s;
    return s;
}

} // namespace

const char* log_level_name(log_level level) noexcept {
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        return "off";
    }
    return "???";
}

log_level parse_log_level(std::string_view name, log_level fallback) noexcept {
    for (log_level l : {log_level::trace, log_level::debug, log_level::info, log_level::warn,
                        log_level::error, log_level::off}) {
        if (name == log_level_name(l))
            return l;
    }
    return fallback;
}

void set_log_handler(log_handler handler) {
    logger_state& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.handler = std::move(handler);
}

void set_log_level(log_level level) noexcept {
    state().level.store(level, std::memory_order_relaxed);
}

log_level get_log_level() noexcept {
    return state().level.load(std::memory_order_relaxed);
}

bool log_enabled(log_level level) noexcept {
    log_level current = get_log_level();
    return current != log_level::off && level >= current;
}

void log_emit(log_level level, std::string_view message) {
    logger_state& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.handler) {
        s.handler(level, message);
    } else {
        default_handler(level, message);
    }
}

} // namespace slurp
