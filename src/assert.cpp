#include <slurp/assert.hpp>

#include <slurp/log.hpp>

#include <cstdlib>
#include <cstring>

namespace slurp::detail {

assertion_failure_impl_::assertion_failure_impl_(const char* file, int line, const char* cond,
                                                 const char* message) {
    assert_impl(file, line, cond, message);
}

// Failed assertions go through the log handler so that applications which
// redirect slurp's output also see the last message before the abort.
void assert_impl(const char* file, int line, const char* condition, const char* message) {
    if (message && std::strlen(message) > 0) {
        log_emit(log_level::error,
                 fmt::format("Assertion `{}` failed: {}\n    (in {}:{})", condition, message,
                             file, line));
    } else {
        log_emit(log_level::error,
                 fmt::format("Assertion `{}` failed\n    (in {}:{})", condition, file, line));
    }
    std::abort();
}

void unreachable_impl_(const char* file, int line, const char* message) {
    if (message && std::strlen(message) > 0) {
        log_emit(log_level::error, fmt::format("Unreachable code executed: {}.\n    (in {}:{})",
                                               message, file, line));
    } else {
        log_emit(log_level::error,
                 fmt::format("Unreachable code executed.\n    (in {}:{})", file, line));
    }
    std::abort();
}

} // namespace slurp::detail
