#ifndef SLURP_LOG_HPP
#define SLURP_LOG_HPP

#include <fmt/format.h>

#include <functional>
#include <string_view>
#include <utility>

namespace slurp {

/// Severity of a log message. Messages below the current level are dropped
/// before they are formatted.
enum class log_level { trace = 0, debug, info, warn, error, off };

/// Returns a short name for the given level ("trace", "debug", ...).
const char* log_level_name(log_level level) noexcept;

/// Parses a level name as returned by `log_level_name`. Unknown names
/// yield `fallback`.
log_level parse_log_level(std::string_view name, log_level fallback) noexcept;

/// Receives every message that passed the level filter.
/// Handlers are called from whatever thread emitted the message.
using log_handler = std::function<void(log_level, std::string_view)>;

/// Replaces the process wide log handler. An empty handler restores the
/// default handler, which writes to stderr.
void set_log_handler(log_handler handler);

/// Sets the minimum level of messages that reach the handler.
/// The initial level is read from the `SLURP_LOG_LEVEL` environment variable
/// and defaults to `warn`.
void set_log_level(log_level level) noexcept;

/// Returns the current minimum level.
log_level get_log_level() noexcept;

/// True if messages of the given level would currently be emitted.
bool log_enabled(log_level level) noexcept;

/// Hands a finished message to the log handler, regardless of the current level.
void log_emit(log_level level, std::string_view message);

/// Formats and emits a message if its level is enabled.
template<typename... Args>
void log(log_level level, const char* format, Args&&... args) {
    if (!log_enabled(level))
        return;
    log_emit(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
}

} // namespace slurp

#define SLURP_LOG_TRACE(...) (::slurp::log(::slurp::log_level::trace, __VA_ARGS__))
#define SLURP_LOG_DEBUG(...) (::slurp::log(::slurp::log_level::debug, __VA_ARGS__))
#define SLURP_LOG_INFO(...) (::slurp::log(::slurp::log_level::info, __VA_ARGS__))
#define SLURP_LOG_WARN(...) (::slurp::log(::slurp::log_level::warn, __VA_ARGS__))
#define SLURP_LOG_ERROR(...) (::slurp::log(::slurp::log_level::error, __VA_ARGS__))

#ifdef SLURP_TRACE_IO
#    define SLURP_PRINT_READ(name, n) (fmt::print("Read {} bytes from `{}`\n", (n), (name)))
#    define SLURP_PRINT_WRITE(name, n) (fmt::print("Wrote {} bytes to `{}`\n", (n), (name)))
#else
#    define SLURP_PRINT_READ(name, n)
#    define SLURP_PRINT_WRITE(name, n)
#endif

#endif // SLURP_LOG_HPP
